#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: tag_hash.hpp
    MODULE: core
    PURPOSE: Content hash used to address packaged assets.
*/


#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>

namespace alk
{
    struct TagHash
    {
        static constexpr uint32_t kNone = 0xFFFFFFFFu;

        uint32_t value = kNone;

        constexpr bool is_some() const { return value != kNone && value != 0; }
        constexpr bool is_none() const { return !is_some(); }

        friend constexpr bool operator==(TagHash a, TagHash b) { return a.value == b.value; }
        friend constexpr bool operator!=(TagHash a, TagHash b) { return a.value != b.value; }
    };

    inline std::string to_string(TagHash h)
    {
        char buf[16]{};
        std::snprintf(buf, sizeof(buf), "%08X", h.value);
        return std::string(buf);
    }
}

template<>
struct std::hash<alk::TagHash>
{
    size_t operator()(alk::TagHash h) const noexcept
    {
        return std::hash<uint32_t>{}(h.value);
    }
};

#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: variant_table.hpp
    MODULE: tfx
    PURPOSE: Per-model technique map. A part's variant selector picks an entry;
            the drawable's variant index cycles through the entry's techniques.
*/


#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "alk/core/tag_hash.hpp"

namespace alk
{
    constexpr uint16_t kNoVariant = 0xFFFF;

    struct TechniqueMapEntry
    {
        uint32_t technique_start = 0;
        uint32_t technique_count = 0;
        uint32_t variant_set = 0;
    };

    class VariantTable
    {
    public:
        VariantTable() = default;

        VariantTable(std::vector<TechniqueMapEntry> map, std::vector<TagHash> techniques)
            : map_(std::move(map)), techniques_(std::move(techniques))
        {}

        // Index into the flat technique list, or nullopt for "no variant".
        std::optional<size_t> resolve_index(uint16_t variant_shader_index, uint32_t variant) const
        {
            if (variant_shader_index == kNoVariant) return std::nullopt;
            if (variant_shader_index >= map_.size()) return std::nullopt;

            const TechniqueMapEntry& e = map_[variant_shader_index];
            if (e.technique_count == 0) return std::nullopt;

            const size_t index = (size_t)e.technique_start + (size_t)(variant % e.technique_count);
            if (index >= techniques_.size()) return std::nullopt;
            return index;
        }

        TagHash resolve(uint16_t variant_shader_index, uint32_t variant) const
        {
            const auto index = resolve_index(variant_shader_index, variant);
            return index ? techniques_[*index] : TagHash{};
        }

        // Number of selectable variants: the count of the first primary-set entry.
        uint32_t variant_count() const
        {
            for (const TechniqueMapEntry& e : map_)
            {
                if (e.variant_set == 0) return e.technique_count;
            }
            return 0;
        }

        bool empty() const { return map_.empty(); }
        const std::vector<TechniqueMapEntry>& entries() const { return map_; }
        const std::vector<TagHash>& techniques() const { return techniques_; }

    private:
        std::vector<TechniqueMapEntry> map_{};
        std::vector<TagHash> techniques_{};
    };
}

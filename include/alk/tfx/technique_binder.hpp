#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: technique_binder.hpp
    MODULE: tfx
    PURPOSE: Base-then-variant technique binding for one drawable part.
*/


#include <string>
#include <vector>

#include "alk/tfx/scope.hpp"
#include "alk/tfx/technique.hpp"

namespace alk
{
    struct PartBindResult
    {
        ScopeBits scopes{};
        uint32_t bound = 0;
        std::vector<std::string> errors{};

        bool ok() const { return errors.empty(); }
    };

    // Variant constants are written last so they take precedence. A failed base
    // bind is reported and the variant is still attempted.
    inline PartBindResult bind_part_techniques(
        TechniqueBindContext& ctx,
        const Technique* base,
        const Technique* variant,
        const ObjectChannels* channels)
    {
        PartBindResult out{};

        for (const Technique* t : {base, variant})
        {
            if (!t) continue;
            out.scopes |= t->used_scopes();
            const Status st = t->bind(ctx, channels);
            if (st.ok) ++out.bound;
            else out.errors.push_back(st.error);
        }

        return out;
    }
}

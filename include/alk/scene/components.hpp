#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: components.hpp
    MODULE: scene
    PURPOSE: Generic scene components shared by every drawable kind.
*/


#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace alk
{
    struct Transform
    {
        glm::vec3 translation{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 scale{1.0f};

        glm::mat4 local_to_world() const
        {
            glm::mat4 m = glm::mat4_cast(rotation);
            m[0] *= scale.x;
            m[1] *= scale.y;
            m[2] *= scale.z;
            m[3] = glm::vec4(translation, 1.0f);
            return m;
        }

        friend bool operator==(const Transform& a, const Transform& b)
        {
            return a.translation == b.translation && a.rotation == b.rotation && a.scale == b.scale;
        }
    };

    constexpr uint32_t kMainView = 0;
    constexpr uint32_t kMaxViews = 64;

    // Per-view culling result written by the visibility system. Views that were
    // never evaluated count as visible.
    struct ViewVisibility
    {
        uint64_t evaluated = 0;
        uint64_t visible = 0;

        void set(uint32_t view, bool is_visible)
        {
            if (view >= kMaxViews) return;
            const uint64_t bit = 1ull << view;
            evaluated |= bit;
            if (is_visible) visible |= bit;
            else visible &= ~bit;
        }

        bool is_visible(uint32_t view) const
        {
            if (view >= kMaxViews) return true;
            const uint64_t bit = 1ull << view;
            return (evaluated & bit) == 0 || (visible & bit) != 0;
        }
    };

    inline bool is_visible_in(const ViewVisibility* vis, uint32_t view)
    {
        return !vis || vis->is_visible(view);
    }

    enum class Mobility : uint8_t
    {
        Stationary = 0,
        Moving = 1
    };

    // Overrides the default shadow mobility of a drawable.
    struct MobilityOverride
    {
        Mobility value = Mobility::Stationary;
    };
}

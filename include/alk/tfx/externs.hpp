#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: externs.hpp
    MODULE: tfx
    PURPOSE: Per-frame render-global data that techniques pull into their scopes.
            An unset extern makes any technique depending on it fail to bind.
*/


#include <cstdint>
#include <optional>

#include <glm/glm.hpp>

#include "alk/gfx/gpu_handles.hpp"

namespace alk
{
    struct FrameExtern
    {
        float game_time = 0.0f;
        float render_time = 0.0f;
        float delta_game_time = 0.0f;
        float exposure_scale = 1.0f;
    };

    struct ViewExtern
    {
        glm::mat4 world_to_camera{1.0f};
        glm::mat4 camera_to_projective{1.0f};
        glm::mat4 world_to_projective{1.0f};
        glm::mat4 projective_to_world{1.0f};
        glm::mat4 camera_to_world{1.0f};
        glm::vec4 position{0.0f, 0.0f, 0.0f, 1.0f};
        // (width, height, 1/width, 1/height)
        glm::vec4 target_resolution{1.0f, 1.0f, 1.0f, 1.0f};
    };

    struct TransparentExtern
    {
        ViewHandle atmos_far_lookup{};
        ViewHandle atmos_near_lookup{};
        ViewHandle depth_angle_density_lookup{};
        glm::vec4 atmosphere_params{0.0f};
    };

    struct DeferredExtern
    {
        ViewHandle deferred_depth{};
        ViewHandle deferred_rt0{};
        ViewHandle deferred_rt1{};
        ViewHandle deferred_rt2{};
    };

    struct FxaaExtern
    {
        ViewHandle source{};
        glm::vec4 source_resolution{1.0f};
        float noise_time = 0.0f;
    };

    struct Externs
    {
        std::optional<FrameExtern> frame{};
        std::optional<ViewExtern> view{};
        std::optional<TransparentExtern> transparent{};
        std::optional<DeferredExtern> deferred{};
        std::optional<FxaaExtern> fxaa{};
    };
}

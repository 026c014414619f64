#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: gbuffer.hpp
    MODULE: gfx
    PURPOSE: Every output-size dependent target of the deferred renderer, the
            ping/pong post-process pair and the CPU depth readback surface.
*/


#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "alk/core/log.hpp"
#include "alk/core/result.hpp"
#include "alk/gfx/depth_state.hpp"
#include "alk/gfx/extent.hpp"
#include "alk/gfx/render_target.hpp"
#include "alk/gfx/staging_buffer.hpp"

namespace alk
{
    enum class PingPong : uint8_t
    {
        Ping = 0,
        Pong = 1
    };

    constexpr uint32_t kDepthAngleDensityLookupSize = 512;

    struct GBufferTargets
    {
        RenderTarget rt0{};
        RenderTarget rt1{};
        RenderTarget rt1_read{};
        RenderTarget rt2{};
        RenderTarget rt3{};

        RenderTarget light_diffuse{};
        RenderTarget light_specular{};
        RenderTarget light_ibl_specular{};

        RenderTarget shading_result{};
        RenderTarget shading_result_read{};

        DepthState depth{};
        CpuStagingBuffer depth_staging{};

        RenderTarget ssao_intermediate{};

        RenderTarget atmos_ss_far_lookup{};
        RenderTarget atmos_ss_near_lookup{};
        RenderTarget depth_angle_density_lookup{};

        RenderTarget postprocess_ping{};
        RenderTarget postprocess_pong{};
    };

    struct GBufferResourceDesc
    {
        std::string name{};
        Extent2D size{};
        PixelFormat format = PixelFormat::Unknown;

        friend bool operator==(const GBufferResourceDesc& a, const GBufferResourceDesc& b)
        {
            return a.name == b.name && a.size == b.size && a.format == b.format;
        }
    };

    struct PostprocessTargets
    {
        const RenderTarget* source = nullptr;
        const RenderTarget* destination = nullptr;
    };

    struct DepthProbe
    {
        float distance = 0.0f;
        glm::vec3 position{0.0f};
    };

    class GBuffer : public GBufferTargets
    {
    public:
        GBuffer() = default;

        static Result<GBuffer> create(IGpuDevice& gpu, Extent2D size)
        {
            size = clamp_extent(size, 1, "GBuffer");
            auto targets = create_targets(gpu, size);
            if (!targets.ok) return Result<GBuffer>::failure(targets.error);

            GBuffer out{};
            out.gpu_ = &gpu;
            static_cast<GBufferTargets&>(out) = std::move(targets.value);
            out.current_size_ = size;
            return Result<GBuffer>::success(std::move(out));
        }

        // Builds a complete replacement set first and commits it only when every
        // allocation succeeded. On failure the previous set stays in place.
        Status resize(Extent2D size)
        {
            if (!gpu_) return Status::failure("gbuffer: resize before create");
            size = clamp_extent(size, 1, "GBuffer");

            auto staged = create_targets(*gpu_, size);
            if (!staged.ok)
            {
                log_error("GBuffer resize to " + to_string(size) + " failed, keeping " + to_string(current_size_) +
                    ": " + staged.error);
                return Status::failure(staged.error);
            }

            static_cast<GBufferTargets&>(*this) = std::move(staged.value);
            current_size_ = size;
            current_pp_ = PingPong::Ping;
            return Status::success();
        }

        // Returns (source, destination) for the current parity. With swap_after_use
        // the destination becomes the next caller's source.
        PostprocessTargets get_postprocess_rt(bool swap_after_use)
        {
            PostprocessTargets out{};
            if (current_pp_ == PingPong::Ping)
            {
                out.source = &postprocess_ping;
                out.destination = &postprocess_pong;
            }
            else
            {
                out.source = &postprocess_pong;
                out.destination = &postprocess_ping;
            }

            if (same_handle(out.source->texture(), out.destination->texture()))
            {
                throw std::logic_error("gbuffer: postprocess ping and pong alias the same texture");
            }

            if (swap_after_use)
            {
                current_pp_ = current_pp_ == PingPong::Ping ? PingPong::Pong : PingPong::Ping;
            }
            return out;
        }

        const RenderTarget& get_postprocess_output() const
        {
            return current_pp_ == PingPong::Ping ? postprocess_ping : postprocess_pong;
        }

        PingPong current_postprocess_slot() const { return current_pp_; }

        // Copies live depth into the CPU staging surface ahead of a probe.
        void stage_depth_readback() const
        {
            depth.copy_to_staging(depth_staging);
        }

        // Blocking GPU to CPU read of one staged depth texel. Returns 0 when the
        // staging surface cannot be mapped.
        float depth_buffer_read(uint32_t x, uint32_t y) const
        {
            float value = 0.0f;
            const Status st = depth_staging.map([&](const MappedTexture& m)
            {
                if (m.width == 0 || m.height == 0 || !m.data) return;
                const uint32_t cx = x < m.width ? x : m.width - 1;
                const uint32_t cy = y < m.height ? y : m.height - 1;
                std::memcpy(&value, m.data + (size_t)cy * m.row_pitch + (size_t)cx * sizeof(float), sizeof(float));
            });
            if (!st.ok)
            {
                log_warn("depth_buffer_read: " + st.error);
                return 0.0f;
            }
            return value;
        }

        float depth_buffer_read_center() const
        {
            return depth_buffer_read(current_size_.width / 2, current_size_.height / 2);
        }

        // Distance from the camera to the surface under the screen centre.
        DepthProbe depth_buffer_distance_pos_center(const glm::mat4& projective_to_world, const glm::vec3& camera_position) const
        {
            const float raw_depth = depth_buffer_read_center();
            const glm::vec4 p = projective_to_world * glm::vec4(0.0f, 0.0f, raw_depth, 1.0f);

            DepthProbe out{};
            if (std::abs(p.w) <= std::numeric_limits<float>::epsilon())
            {
                out.distance = std::numeric_limits<float>::infinity();
                out.position = camera_position;
                return out;
            }
            out.position = glm::vec3(p) / p.w;
            out.distance = glm::length(out.position - camera_position);
            return out;
        }

        std::vector<GBufferResourceDesc> descriptors() const
        {
            std::vector<GBufferResourceDesc> out{};
            const auto add = [&out](const RenderTarget& rt)
            {
                out.push_back(GBufferResourceDesc{rt.name(), rt.size(), rt.format()});
            };
            add(rt0);
            add(rt1);
            add(rt1_read);
            add(rt2);
            add(rt3);
            add(light_diffuse);
            add(light_specular);
            add(light_ibl_specular);
            add(shading_result);
            add(shading_result_read);
            out.push_back(GBufferResourceDesc{depth.name(), depth.size(), PixelFormat::R32_TYPELESS});
            out.push_back(GBufferResourceDesc{depth_staging.name(), depth_staging.size(), depth_staging.format()});
            add(ssao_intermediate);
            add(atmos_ss_far_lookup);
            add(atmos_ss_near_lookup);
            add(depth_angle_density_lookup);
            add(postprocess_ping);
            add(postprocess_pong);
            return out;
        }

        Extent2D size() const { return current_size_; }

    private:
        static Result<GBufferTargets> create_targets(IGpuDevice& gpu, Extent2D size)
        {
            GBufferTargets t{};
            std::string err{};

            const auto make = [&](RenderTarget& dst, Extent2D sz, PixelFormat fmt, const char* name) -> bool
            {
                auto r = RenderTarget::create(gpu, sz, fmt, name);
                if (!r.ok)
                {
                    err = r.error;
                    return false;
                }
                dst = std::move(r.value);
                return true;
            };

            const Extent2D quarter{size.width / 4, size.height / 4};
            const Extent2D lookup{kDepthAngleDensityLookupSize, kDepthAngleDensityLookupSize};

            bool ok =
                make(t.rt0, size, PixelFormat::B8G8R8A8_UNORM_SRGB, "RT0") &&
                make(t.rt1, size, PixelFormat::R10G10B10A2_UNORM, "RT1") &&
                make(t.rt1_read, size, PixelFormat::R10G10B10A2_UNORM, "RT1_Clone") &&
                make(t.rt2, size, PixelFormat::B8G8R8A8_UNORM, "RT2") &&
                make(t.rt3, size, PixelFormat::B8G8R8A8_UNORM, "RT3") &&
                make(t.light_diffuse, size, PixelFormat::R11G11B10_FLOAT, "Light_Diffuse") &&
                make(t.light_specular, size, PixelFormat::R11G11B10_FLOAT, "Light_Specular") &&
                make(t.light_ibl_specular, size, PixelFormat::R11G11B10_FLOAT, "Specular_IBL") &&
                make(t.shading_result, size, PixelFormat::R11G11B10_FLOAT, "Staging") &&
                make(t.shading_result_read, size, PixelFormat::R11G11B10_FLOAT, "Staging_Clone");
            if (!ok) return Result<GBufferTargets>::failure(err);

            auto depth = DepthState::create(gpu, size, "gbuffer_depth");
            if (!depth.ok) return Result<GBufferTargets>::failure(depth.error);
            t.depth = std::move(depth.value);

            // Staging mirrors the depth extent, which clamps to a larger minimum.
            auto staging = CpuStagingBuffer::create(gpu, t.depth.size(), PixelFormat::R32_TYPELESS, "Depth_Buffer_Staging");
            if (!staging.ok) return Result<GBufferTargets>::failure(staging.error);
            t.depth_staging = std::move(staging.value);

            ok =
                make(t.ssao_intermediate, size, PixelFormat::R8_UNORM, "SSAO_Intermediate") &&
                make(t.atmos_ss_far_lookup, quarter, PixelFormat::R16G16B16A16_FLOAT, "Atmos_SS_Far_Lookup") &&
                make(t.atmos_ss_near_lookup, quarter, PixelFormat::R16G16B16A16_FLOAT, "Atmos_SS_Near_Lookup") &&
                make(t.depth_angle_density_lookup, lookup, PixelFormat::R16G16B16A16_FLOAT, "Depth_Angle_Density_Lookup") &&
                make(t.postprocess_ping, size, PixelFormat::R8G8B8A8_UNORM_SRGB, "Postprocess_Ping") &&
                make(t.postprocess_pong, size, PixelFormat::R8G8B8A8_UNORM_SRGB, "Postprocess_Pong");
            if (!ok) return Result<GBufferTargets>::failure(err);

            return Result<GBufferTargets>::success(std::move(t));
        }

        IGpuDevice* gpu_ = nullptr;
        Extent2D current_size_{};
        PingPong current_pp_ = PingPong::Ping;
    };
}

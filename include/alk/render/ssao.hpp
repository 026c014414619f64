#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: ssao.hpp
    MODULE: render
    PURPOSE: Screen-space ambient occlusion. Generates occlusion into the
            intermediate target, then blurs and multiplies it into diffuse
            lighting.
*/


#include <array>
#include <cstdint>
#include <random>
#include <utility>

#include <glm/glm.hpp>

#include "alk/core/log.hpp"
#include "alk/core/result.hpp"
#include "alk/render/render_context.hpp"

namespace alk
{
    constexpr uint32_t kSsaoKernelSize = 32;
    constexpr uint32_t kSsaoNoiseSize = 4;
    constexpr uint64_t kSsaoNoiseSeed = 0xcb65a5a72901bc71ull;
    constexpr uint64_t kSsaoKernelSeed = 0xbc65a5a72901bc71ull;

    struct SsaoScope
    {
        glm::mat4 target_pixel_to_world{1.0f};
        // (radius, bias, kernel size, unused)
        glm::vec4 params{1.0f, 0.1f, (float)kSsaoKernelSize, 0.0f};
        std::array<glm::vec4, kSsaoKernelSize> samples{};
    };

    // Hemisphere samples in tangent space, denser near the origin.
    inline std::array<glm::vec4, kSsaoKernelSize> make_ssao_kernel(uint64_t seed = kSsaoKernelSeed)
    {
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<float> unit(0.0f, 1.0f);

        std::array<glm::vec4, kSsaoKernelSize> out{};
        for (uint32_t i = 0; i < kSsaoKernelSize; ++i)
        {
            glm::vec3 s(unit(rng) * 2.0f - 1.0f, unit(rng) * 2.0f - 1.0f, 0.0f);
            const float len = glm::length(s);
            if (len > 0.0f) s /= len;
            s *= unit(rng);

            float t = (float)i / (float)kSsaoKernelSize;
            t *= t;
            s *= 0.1f + (1.0f - 0.1f) * t;
            out[i] = glm::vec4(s, 1.0f);
        }
        return out;
    }

    inline std::array<glm::vec4, kSsaoNoiseSize * kSsaoNoiseSize> make_ssao_noise(uint64_t seed = kSsaoNoiseSeed)
    {
        std::mt19937_64 rng(seed);
        std::uniform_real_distribution<float> unit(0.0f, 1.0f);

        std::array<glm::vec4, kSsaoNoiseSize * kSsaoNoiseSize> out{};
        for (glm::vec4& n : out)
        {
            const float x = unit(rng) * 2.0f - 1.0f;
            const float y = unit(rng) * 2.0f - 1.0f;
            n = glm::vec4(x, y, 0.0f, 0.0f);
        }
        return out;
    }

    // Maps target pixel coordinates to world space through the inverse projection.
    inline glm::mat4 target_pixel_to_world(const ViewExtern& view)
    {
        const float w = view.target_resolution.x > 0.0f ? view.target_resolution.x : 1.0f;
        const float h = view.target_resolution.y > 0.0f ? view.target_resolution.y : 1.0f;

        glm::mat4 pixel_to_ndc{1.0f};
        pixel_to_ndc[0][0] = 2.0f / w;
        pixel_to_ndc[1][1] = -2.0f / h;
        pixel_to_ndc[3][0] = -1.0f;
        pixel_to_ndc[3][1] = 1.0f;
        return view.projective_to_world * pixel_to_ndc;
    }

    class SsaoRenderer
    {
    public:
        SsaoRenderer() = default;

        static Result<SsaoRenderer> create(IGpuDevice& gpu)
        {
            SsaoRenderer out{};
            out.gpu_ = &gpu;
            out.scope_.samples = make_ssao_kernel();

            TextureDesc nd{};
            nd.width = kSsaoNoiseSize;
            nd.height = kSsaoNoiseSize;
            nd.format = PixelFormat::R32G32B32A32_FLOAT;
            nd.usage = TextureUsage_ShaderResource;
            nd.debug_name = "SSAO_Noise";
            auto tex = gpu.create_texture(nd);
            if (!tex.ok) return Result<SsaoRenderer>::failure(nd.debug_name + ": " + tex.error);
            out.noise_ = tex.value;

            const auto noise = make_ssao_noise();
            const Status up = gpu.write_texture(out.noise_, 0, noise.data(), sizeof(noise));
            if (!up.ok) return Result<SsaoRenderer>::failure(nd.debug_name + ": " + up.error);

            auto srv = gpu.create_view(ViewDesc{out.noise_, ViewKind::ShaderResource, nd.format, 0, 1});
            if (!srv.ok) return Result<SsaoRenderer>::failure(nd.debug_name + ": view: " + srv.error);
            out.noise_srv_ = srv.value;

            BufferDesc bd{};
            bd.kind = BufferKind::Constant;
            bd.size_bytes = sizeof(SsaoScope);
            bd.debug_name = "SSAO_Scope";
            auto buf = gpu.create_buffer(bd, &out.scope_);
            if (!buf.ok) return Result<SsaoRenderer>::failure(bd.debug_name + ": " + buf.error);
            out.cbuffer_ = buf.value;

            return Result<SsaoRenderer>::success(std::move(out));
        }

        ~SsaoRenderer() { release(); }

        SsaoRenderer(SsaoRenderer&& o) noexcept { take(std::move(o)); }
        SsaoRenderer& operator=(SsaoRenderer&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        SsaoRenderer(const SsaoRenderer&) = delete;
        SsaoRenderer& operator=(const SsaoRenderer&) = delete;

        // Returns false when the view or deferred inputs are not available.
        bool draw(RenderContext& ctx)
        {
            GpuEventScope event(ctx.gpu, "ssao");
            auto d = ctx.data.lock();
            d->gbuffer.ssao_intermediate.clear(glm::vec4(0.0f));

            if (!d->externs.view || !d->externs.deferred) return false;
            const DeferredExtern& deferred = *d->externs.deferred;

            scope_.target_pixel_to_world = target_pixel_to_world(*d->externs.view);
            const Status st = ctx.gpu.write_buffer(cbuffer_, &scope_, sizeof(SsaoScope));
            if (!st.ok)
            {
                log_error("ssao: " + st.error);
                return false;
            }

            IGpuDevice& gpu = ctx.gpu;
            gpu.unbind_render_targets();
            gpu.unbind_shader_resources();

            gpu.bind_shader_resource(ShaderStage::Pixel, 0, deferred.deferred_depth);
            gpu.bind_shader_resource(ShaderStage::Pixel, 1, deferred.deferred_rt1);
            gpu.bind_shader_resource(ShaderStage::Pixel, 2, noise_srv_);
            gpu.bind_constant_buffer(ShaderStage::Pixel, 0, cbuffer_);

            const RenderTarget& intermediate = d->gbuffer.ssao_intermediate;
            intermediate.bind();
            gpu.set_depth_stencil_state(DepthStencilStateHandle{});
            gpu.set_blend_mode(BlendMode::Opaque);
            gpu.set_topology(PrimitiveTopology::TriangleList);
            gpu.bind_shader(ShaderStage::Vertex, ctx.shaders.fullscreen_vs);
            gpu.bind_shader(ShaderStage::Pixel, ctx.shaders.ssao_ps);
            gpu.draw(3, 0);

            // Blur and multiply into diffuse lighting.
            gpu.unbind_render_targets();
            d->gbuffer.light_diffuse.bind();
            gpu.set_blend_mode(BlendMode::Multiply);
            gpu.bind_shader(ShaderStage::Pixel, ctx.shaders.ssao_blur_ps);
            gpu.bind_shader_resource(ShaderStage::Pixel, 0, intermediate.srv());
            gpu.draw(3, 0);

            gpu.set_blend_mode(BlendMode::Opaque);
            gpu.unbind_render_targets();
            gpu.unbind_shader_resources();
            return true;
        }

        const SsaoScope& scope() const { return scope_; }
        ViewHandle noise_srv() const { return noise_srv_; }

    private:
        void release()
        {
            if (!gpu_) return;
            if (cbuffer_.valid()) gpu_->destroy_buffer(cbuffer_);
            if (noise_srv_.valid()) gpu_->destroy_view(noise_srv_);
            if (noise_.valid()) gpu_->destroy_texture(noise_);
            gpu_ = nullptr;
        }

        void take(SsaoRenderer&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            noise_ = std::exchange(o.noise_, TextureHandle{});
            noise_srv_ = std::exchange(o.noise_srv_, ViewHandle{});
            cbuffer_ = std::exchange(o.cbuffer_, BufferHandle{});
            scope_ = o.scope_;
        }

        IGpuDevice* gpu_ = nullptr;
        TextureHandle noise_{};
        ViewHandle noise_srv_{};
        BufferHandle cbuffer_{};
        SsaoScope scope_{};
    };
}

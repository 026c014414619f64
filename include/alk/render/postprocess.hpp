#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: postprocess.hpp
    MODULE: render
    PURPOSE: Fixed full-screen chain over the ping/pong targets: copy the
            shading result in, optional FXAA, copy the latest slot back.
*/


#include <cstdint>
#include <utility>

#include <glm/glm.hpp>

#include "alk/core/log.hpp"
#include "alk/core/result.hpp"
#include "alk/render/render_context.hpp"

namespace alk
{
    struct FxaaScope
    {
        // (width, height, 1/width, 1/height)
        glm::vec4 source_resolution{1.0f};
        glm::vec4 noise_time{0.0f};
    };

    struct PostprocessReport
    {
        uint32_t fullscreen_passes = 0;
        bool fxaa = false;
        PingPong output_slot = PingPong::Ping;
    };

    class PostprocessCompositor
    {
    public:
        PostprocessCompositor() = default;

        static Result<PostprocessCompositor> create(IGpuDevice& gpu)
        {
            PostprocessCompositor out{};
            out.gpu_ = &gpu;

            BufferDesc bd{};
            bd.kind = BufferKind::Constant;
            bd.size_bytes = sizeof(FxaaScope);
            bd.debug_name = "FXAA_Scope";
            FxaaScope init{};
            auto buf = gpu.create_buffer(bd, &init);
            if (!buf.ok) return Result<PostprocessCompositor>::failure(bd.debug_name + ": " + buf.error);
            out.cbuffer_ = buf.value;
            return Result<PostprocessCompositor>::success(std::move(out));
        }

        ~PostprocessCompositor()
        {
            if (gpu_ && cbuffer_.valid()) gpu_->destroy_buffer(cbuffer_);
        }

        PostprocessCompositor(PostprocessCompositor&& o) noexcept
            : gpu_(std::exchange(o.gpu_, nullptr)),
              cbuffer_(std::exchange(o.cbuffer_, BufferHandle{}))
        {}

        PostprocessCompositor& operator=(PostprocessCompositor&& o) noexcept
        {
            if (this != &o)
            {
                if (gpu_ && cbuffer_.valid()) gpu_->destroy_buffer(cbuffer_);
                gpu_ = std::exchange(o.gpu_, nullptr);
                cbuffer_ = std::exchange(o.cbuffer_, BufferHandle{});
            }
            return *this;
        }

        PostprocessCompositor(const PostprocessCompositor&) = delete;
        PostprocessCompositor& operator=(const PostprocessCompositor&) = delete;

        PostprocessReport execute(RenderContext& ctx, float noise_time)
        {
            PostprocessReport report{};
            IGpuDevice& gpu = ctx.gpu;
            GpuEventScope event(gpu, "postprocess");

            unbind_all(gpu);
            {
                auto d = ctx.data.lock();
                const PostprocessTargets t = d->gbuffer.get_postprocess_rt(true);
                gpu.blit(d->gbuffer.shading_result.srv(), t.destination->rtv());
                ++report.fullscreen_passes;
            }

            if (ctx.settings.feature_fxaa)
            {
                GpuEventScope fxaa_event(gpu, "fxaa");
                auto d = ctx.data.lock();
                const PostprocessTargets t = d->gbuffer.get_postprocess_rt(true);

                const Extent2D size = t.source->size();
                FxaaExtern fx{};
                fx.source = t.source->srv();
                fx.source_resolution = glm::vec4(
                    (float)size.width,
                    (float)size.height,
                    1.0f / (float)size.width,
                    1.0f / (float)size.height);
                fx.noise_time = noise_time;
                d->externs.fxaa = fx;

                const FxaaScope scope{fx.source_resolution, glm::vec4(noise_time, 0.0f, 0.0f, 0.0f)};
                const Status st = gpu.write_buffer(cbuffer_, &scope, sizeof(scope));
                if (!st.ok) log_error("fxaa: " + st.error);

                unbind_all(gpu);
                t.destination->bind();
                gpu.set_depth_stencil_state(DepthStencilStateHandle{});
                gpu.set_blend_mode(BlendMode::Opaque);
                gpu.set_topology(PrimitiveTopology::TriangleList);
                gpu.bind_shader(ShaderStage::Vertex, ctx.shaders.fullscreen_vs);
                gpu.bind_shader(ShaderStage::Pixel, ctx.settings.fxaa_noise ? ctx.shaders.fxaa_noise_ps : ctx.shaders.fxaa_ps);
                gpu.bind_shader_resource(ShaderStage::Pixel, 0, fx.source);
                gpu.bind_constant_buffer(ShaderStage::Pixel, 0, cbuffer_);
                gpu.draw(3, 0);

                report.fxaa = true;
                ++report.fullscreen_passes;
            }

            unbind_all(gpu);
            {
                auto d = ctx.data.lock();
                const RenderTarget& output = d->gbuffer.get_postprocess_output();
                gpu.blit(output.srv(), d->gbuffer.shading_result.rtv());
                report.output_slot = d->gbuffer.current_postprocess_slot();
                ++report.fullscreen_passes;
            }
            return report;
        }

    private:
        static void unbind_all(IGpuDevice& gpu)
        {
            gpu.unbind_render_targets();
            gpu.unbind_shader_resources();
        }

        IGpuDevice* gpu_ = nullptr;
        BufferHandle cbuffer_{};
    };
}

#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: renderer.hpp
    MODULE: render
    PURPOSE: Frame driver. Owns the render context and the pass objects and
            sequences one frame: shadows, depth prepass, gbuffer, decals,
            SSAO, transparents with sky, debug shapes, postprocess.
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <glm/glm.hpp>

#include "alk/core/log.hpp"
#include "alk/core/result.hpp"
#include "alk/render/debug_shapes.hpp"
#include "alk/render/postprocess.hpp"
#include "alk/render/render_context.hpp"
#include "alk/render/shadow_scheduler.hpp"
#include "alk/render/ssao.hpp"
#include "alk/render/stage_dispatcher.hpp"

namespace alk
{
    struct FrameInput
    {
        ViewExtern view{};
        FrameExtern frame{};
    };

    struct FrameReport
    {
        uint64_t frame_index = 0;
        ShadowUpdateReport shadows{};
        PostprocessReport postprocess{};
        bool ssao = false;
        std::optional<DepthProbe> depth_probe{};
    };

    class Renderer
    {
    public:
        static Result<std::unique_ptr<Renderer>> create(IGpuDevice& gpu, IAssetSource& assets, Extent2D size)
        {
            auto scopes = ScopeRegistry::create(gpu);
            if (!scopes.ok) return Result<std::unique_ptr<Renderer>>::failure("scope registry: " + scopes.error);
            auto gbuffer = GBuffer::create(gpu, size);
            if (!gbuffer.ok) return Result<std::unique_ptr<Renderer>>::failure("gbuffer: " + gbuffer.error);
            auto ssao = SsaoRenderer::create(gpu);
            if (!ssao.ok) return Result<std::unique_ptr<Renderer>>::failure("ssao: " + ssao.error);
            auto post = PostprocessCompositor::create(gpu);
            if (!post.ok) return Result<std::unique_ptr<Renderer>>::failure("postprocess: " + post.error);
            auto debug = DebugShapeRenderer::create(gpu);
            if (!debug.ok) return Result<std::unique_ptr<Renderer>>::failure("debug shapes: " + debug.error);

            std::unique_ptr<Renderer> out(new Renderer(gpu, assets, std::move(scopes.value), std::move(gbuffer.value)));
            out->ssao_ = std::move(ssao.value);
            out->postprocess_ = std::move(post.value);
            out->debug_shapes_ = std::move(debug.value);
            return Result<std::unique_ptr<Renderer>>::success(std::move(out));
        }

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;

        FrameReport render_frame(Scene& scene, const FrameInput& input)
        {
            FrameReport report{};
            report.frame_index = ++ctx_.frame_index;
            IGpuDevice& gpu = ctx_.gpu;
            GpuEventScope frame_event(gpu, "frame");

            prepare_externs(input);

            report.shadows = shadows_.update_shadow_maps(scene);

            clear_targets();

            // Depth prepass.
            {
                auto d = ctx_.data.lock();
                gpu.set_render_targets({}, d->gbuffer.depth.dsv());
                gpu.set_depth_stencil_state(d->gbuffer.depth.state());
                gpu.set_viewport(d->gbuffer.rt0.viewport());
            }
            dispatcher_.run_stage(scene, RenderStage::DepthPrepass);

            // Gbuffer fill.
            {
                auto d = ctx_.data.lock();
                const ViewHandle targets[] = {d->gbuffer.rt0.rtv(), d->gbuffer.rt1.rtv(), d->gbuffer.rt2.rtv(), d->gbuffer.rt3.rtv()};
                gpu.set_render_targets(targets, d->gbuffer.depth.dsv());
                gpu.set_depth_stencil_state(d->gbuffer.depth.state());
            }
            dispatcher_.run_stage(scene, RenderStage::GenerateGbuffer);
            {
                auto d = ctx_.data.lock();
                gpu.unbind_render_targets();
                d->gbuffer.depth.copy_depth();
                d->gbuffer.rt1.copy_to(d->gbuffer.rt1_read);
            }

            bind_decal_targets();
            dispatcher_.run_stage(scene, RenderStage::Decals);
            bind_decal_targets();
            gpu.set_blend_mode(BlendMode::Additive);
            dispatcher_.run_stage(scene, RenderStage::DecalsAdditive);
            gpu.set_blend_mode(BlendMode::Opaque);

            if (ctx_.settings.ssao && !ctx_.settings.matcap)
            {
                report.ssao = ssao_.draw(ctx_);
            }

            // Transparents and sky over the shading result.
            {
                auto d = ctx_.data.lock();
                d->gbuffer.shading_result.copy_to(d->gbuffer.shading_result_read);
                const ViewHandle targets[] = {d->gbuffer.shading_result.rtv()};
                gpu.set_render_targets(targets, d->gbuffer.depth.dsv_readonly());
                gpu.set_depth_stencil_state(d->gbuffer.depth.state_readonly());
                gpu.set_blend_mode(BlendMode::AlphaBlend);
            }
            dispatcher_.run_stage(scene, RenderStage::Transparents);
            dispatcher_.draw_sky_objects(scene, RenderStage::Transparents);
            gpu.set_blend_mode(BlendMode::Opaque);

            if (ctx_.settings.debug_view)
            {
                GpuEventScope event(gpu, "debug_shapes");
                scene.each<DebugShape>([&](Entity, const DebugShape& shape)
                {
                    debug_shapes_.draw(ctx_, shape);
                });
            }

            report.postprocess = postprocess_.execute(ctx_, input.frame.render_time);

            if (depth_probe_requested_)
            {
                depth_probe_requested_ = false;
                auto d = ctx_.data.lock();
                d->gbuffer.stage_depth_readback();
                report.depth_probe = d->gbuffer.depth_buffer_distance_pos_center(
                    input.view.projective_to_world,
                    glm::vec3(input.view.position));
            }
            return report;
        }

        Status resize(uint32_t width, uint32_t height)
        {
            auto d = ctx_.data.lock();
            return d->gbuffer.resize(Extent2D{width, height}).with_context("renderer resize");
        }

        void set_render_settings(const RendererSettings& settings)
        {
            if (shadows_active(settings) && settings.shadow_quality != ctx_.settings.shadow_quality)
            {
                log_info(std::string("Shadow quality changed to ") + shadow_quality_name(settings.shadow_quality));
            }
            ctx_.settings = settings;
        }

        // The next frame ends with a blocking read of the centre depth texel.
        void request_depth_probe() { depth_probe_requested_ = true; }

        RenderContext& context() { return ctx_; }
        const RendererSettings& settings() const { return ctx_.settings; }
        StageDispatcher& dispatcher() { return dispatcher_; }

    private:
        Renderer(IGpuDevice& gpu, IAssetSource& assets, ScopeRegistry scopes, GBuffer gbuffer)
            : ctx_(gpu, assets, std::move(scopes), std::move(gbuffer)),
              dispatcher_(ctx_),
              shadows_(ctx_, dispatcher_)
        {}

        void prepare_externs(const FrameInput& input)
        {
            ViewExtern view = input.view;
            {
                auto d = ctx_.data.lock();
                const Extent2D size = d->gbuffer.size();
                view.target_resolution = glm::vec4(
                    (float)size.width,
                    (float)size.height,
                    1.0f / (float)size.width,
                    1.0f / (float)size.height);

                d->externs.frame = input.frame;

                DeferredExtern deferred{};
                deferred.deferred_depth = d->gbuffer.depth.texture_copy_srv();
                deferred.deferred_rt0 = d->gbuffer.rt0.srv();
                deferred.deferred_rt1 = d->gbuffer.rt1_read.srv();
                deferred.deferred_rt2 = d->gbuffer.rt2.srv();
                d->externs.deferred = deferred;

                TransparentExtern transparent{};
                transparent.atmos_far_lookup = d->gbuffer.atmos_ss_far_lookup.srv();
                transparent.atmos_near_lookup = d->gbuffer.atmos_ss_near_lookup.srv();
                transparent.depth_angle_density_lookup = d->gbuffer.depth_angle_density_lookup.srv();
                d->externs.transparent = transparent;
            }
            ctx_.bind_view(kMainView, view);
        }

        void clear_targets()
        {
            auto d = ctx_.data.lock();
            const glm::vec4 black{0.0f};
            d->gbuffer.rt0.clear(black);
            d->gbuffer.rt1.clear(black);
            d->gbuffer.rt2.clear(black);
            d->gbuffer.rt3.clear(black);
            d->gbuffer.light_diffuse.clear(glm::vec4(1.0f));
            d->gbuffer.light_specular.clear(black);
            d->gbuffer.shading_result.clear(black);
            // Reverse-Z: far plane is 0.
            d->gbuffer.depth.clear(0.0f, 0);
        }

        void bind_decal_targets()
        {
            auto d = ctx_.data.lock();
            const ViewHandle targets[] = {d->gbuffer.rt0.rtv(), d->gbuffer.rt1.rtv()};
            ctx_.gpu.set_render_targets(targets, d->gbuffer.depth.dsv_readonly());
            ctx_.gpu.set_depth_stencil_state(d->gbuffer.depth.state_readonly());
        }

        RenderContext ctx_;
        StageDispatcher dispatcher_;
        ShadowUpdateScheduler shadows_;
        SsaoRenderer ssao_{};
        PostprocessCompositor postprocess_{};
        DebugShapeRenderer debug_shapes_{};
        bool depth_probe_requested_ = false;
    };
}

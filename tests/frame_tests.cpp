#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "alk/render/renderer.hpp"
#include "alk/render/renderer_settings.hpp"

#include "alk_test_fixtures.hpp"

namespace
{
    using namespace alk;
    using alk_test::hash;

    struct FrameHarness
    {
        SoftwareGpuDevice gpu{};
        InMemoryAssetSource assets{gpu};
        Scene scene{};
        std::unique_ptr<Renderer> renderer{};

        bool init()
        {
            alk_test::add_mesh_buffers(assets);
            auto r = Renderer::create(gpu, assets, Extent2D{8, 8});
            if (!r.ok) return false;
            renderer = std::move(r.value);

            UtilityShaders& s = renderer->context().shaders;
            s.fullscreen_vs = alk_test::shader(300);
            s.fxaa_ps = alk_test::shader(301);
            s.fxaa_noise_ps = alk_test::shader(302);
            s.ssao_ps = alk_test::shader(303);
            s.ssao_blur_ps = alk_test::shader(304);
            return true;
        }

        void set(const std::function<void(RendererSettings&)>& fn)
        {
            RendererSettings s = renderer->settings();
            fn(s);
            renderer->set_render_settings(s);
        }
    };

    size_t first_draw_in_event(const SoftwareGpuDevice& gpu, const std::string& event)
    {
        const std::vector<SwDrawRecord>& draws = gpu.draws();
        for (size_t i = 0; i < draws.size(); ++i)
        {
            if (draws[i].event == event) return i;
        }
        return draws.size();
    }

    bool test_postprocess_chain_with_and_without_fxaa()
    {
        FrameHarness h{};
        if (!h.init()) return false;
        auto post = PostprocessCompositor::create(h.gpu);
        if (!post.ok) return false;
        RenderContext& ctx = h.renderer->context();

        const uint64_t blits = h.gpu.stats().blits;
        const PostprocessReport with = post.value.execute(ctx, 0.25f);
        if (with.fullscreen_passes != 3 || !with.fxaa) return false;
        if (h.gpu.stats().blits != blits + 2) return false;
        if (h.gpu.draws().size() != 1 || h.gpu.draws()[0].pixel_shader.id != 301 || h.gpu.draws()[0].event != "fxaa") return false;
        {
            auto d = ctx.data.lock();
            if (with.output_slot != d->gbuffer.current_postprocess_slot()) return false;
            if (!d->externs.fxaa || !alk_test::approx_eq(d->externs.fxaa->noise_time, 0.25f)) return false;
        }

        h.gpu.clear_draw_log();
        h.set([](RendererSettings& s) { s.fxaa_noise = true; });
        (void)post.value.execute(ctx, 0.0f);
        if (h.gpu.draws().size() != 1 || h.gpu.draws()[0].pixel_shader.id != 302) return false;

        h.gpu.clear_draw_log();
        h.set([](RendererSettings& s) { s.feature_fxaa = false; });
        const PostprocessReport without = post.value.execute(ctx, 0.0f);
        return without.fullscreen_passes == 2 && !without.fxaa && h.gpu.draws().empty();
    }

    bool test_ssao_requires_inputs()
    {
        FrameHarness h{};
        if (!h.init()) return false;
        auto ssao = SsaoRenderer::create(h.gpu);
        if (!ssao.ok) return false;
        RenderContext& ctx = h.renderer->context();

        // No frame has published the view or the deferred inputs yet.
        if (ssao.value.draw(ctx) || !h.gpu.draws().empty()) return false;

        const FrameReport frame = h.renderer->render_frame(h.scene, FrameInput{});
        if (!frame.ssao) return false;
        if (alk_test::count_draws_in_event(h.gpu, "ssao") != 2) return false;

        h.gpu.clear_draw_log();
        if (!ssao.value.draw(ctx)) return false;
        const std::vector<SwDrawRecord>& draws = h.gpu.draws();
        if (draws.size() != 2) return false;
        if (draws[0].pixel_shader.id != 303 || draws[0].blend != BlendMode::Opaque) return false;
        return draws[1].pixel_shader.id == 304 && draws[1].blend == BlendMode::Multiply;
    }

    bool test_ssao_skipped_in_matcap()
    {
        FrameHarness h{};
        if (!h.init()) return false;
        h.set([](RendererSettings& s) { s.matcap = true; });
        const FrameReport matcap = h.renderer->render_frame(h.scene, FrameInput{});
        if (matcap.ssao || alk_test::count_draws_in_event(h.gpu, "ssao") != 0) return false;

        h.set([](RendererSettings& s) { s.matcap = false; s.ssao = false; });
        const FrameReport off = h.renderer->render_frame(h.scene, FrameInput{});
        return !off.ssao && alk_test::count_draws_in_event(h.gpu, "ssao") == 0;
    }

    bool test_ssao_noise_is_deterministic()
    {
        SoftwareGpuDevice gpu{};
        auto ssao = SsaoRenderer::create(gpu);
        if (!ssao.ok) return false;

        const auto noise = make_ssao_noise();
        float texel[4]{};
        const TextureHandle tex = gpu.view_texture(ssao.value.noise_srv());
        if (!gpu.read_texel(tex, 0, 1, 0, texel)) return false;
        if (!alk_test::approx_eq(texel[0], noise[1].x) || !alk_test::approx_eq(texel[1], noise[1].y)) return false;

        const auto a = make_ssao_kernel();
        const auto b = make_ssao_kernel();
        for (uint32_t i = 0; i < kSsaoKernelSize; ++i)
        {
            if (a[i] != b[i]) return false;
            if (glm::length(glm::vec3(a[i])) > 1.0f + 1e-4f) return false;
        }
        return ssao.value.scope().samples[0] == a[0];
    }

    bool test_debug_shapes_need_technique()
    {
        FrameHarness h{};
        if (!h.init()) return false;
        h.set([](RendererSettings& s) { s.debug_view = true; });

        DebugShape cube{};
        h.scene.insert(h.scene.create(), cube);
        DebugShape line{};
        line.kind = DebugShapeKind::Line;
        line.to = glm::vec3(1.0f, 2.0f, 3.0f);
        h.scene.insert(h.scene.create(), line);

        h.renderer->context().shaders.debug_shape_technique = hash(900);
        bool threw = false;
        try
        {
            (void)h.renderer->render_frame(h.scene, FrameInput{});
        }
        catch (const std::logic_error&)
        {
            threw = true;
        }
        if (!threw) return false;

        alk_test::add_technique(h.assets, hash(900), 310, 311);
        h.gpu.clear_draw_log();
        (void)h.renderer->render_frame(h.scene, FrameInput{});
        if (alk_test::count_draws_in_event(h.gpu, "debug_shapes") != 2) return false;

        const size_t first = first_draw_in_event(h.gpu, "debug_shapes");
        const std::vector<SwDrawRecord>& draws = h.gpu.draws();
        if (draws[first].count != 36 || draws[first + 1].topology != PrimitiveTopology::LineList) return false;

        // Hidden while the debug view is off.
        h.set([](RendererSettings& s) { s.debug_view = false; });
        h.gpu.clear_draw_log();
        (void)h.renderer->render_frame(h.scene, FrameInput{});
        return alk_test::count_draws_in_event(h.gpu, "debug_shapes") == 0;
    }

    bool test_frame_order_and_depth_probe()
    {
        FrameHarness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(10), 1, 10);
        alk_test::add_technique(h.assets, hash(11), 1, 11);
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(100), hash(10),
                {RenderStage::DepthPrepass, RenderStage::GenerateGbuffer, RenderStage::Transparents}));

        auto ball = ShaderBallComponent::create(h.gpu, h.assets, ShaderBallMesh{hash(1), hash(2), 24}, hash(11), Transform{});
        if (!ball.ok) return false;
        h.scene.insert(h.scene.create(), std::move(ball.value));

        h.renderer->request_depth_probe();
        const FrameReport first = h.renderer->render_frame(h.scene, FrameInput{});
        if (first.frame_index != 1 || !first.depth_probe) return false;
        // Reverse-Z clear leaves the far plane at 0.
        if (!alk_test::approx_eq(first.depth_probe->distance, 0.0f)) return false;

        const size_t prepass = first_draw_in_event(h.gpu, "depth_prepass");
        const size_t gbuffer = first_draw_in_event(h.gpu, "generate_gbuffer");
        const size_t ssao = first_draw_in_event(h.gpu, "ssao");
        const size_t transparents = first_draw_in_event(h.gpu, "transparents");
        const size_t fxaa = first_draw_in_event(h.gpu, "fxaa");
        if (!(prepass < gbuffer && gbuffer < ssao && ssao < transparents && transparents < fxaa)) return false;
        if (fxaa >= h.gpu.draws().size()) return false;

        // Shader balls join the geometry stages only.
        if (alk_test::count_draws_with_ps(h.gpu, 11) != 2) return false;

        const FrameReport second = h.renderer->render_frame(h.scene, FrameInput{});
        return second.frame_index == 2 && !second.depth_probe;
    }

    bool test_resize_updates_target_resolution()
    {
        FrameHarness h{};
        if (!h.init()) return false;
        if (!h.renderer->resize(16, 4).ok) return false;
        (void)h.renderer->render_frame(h.scene, FrameInput{});

        {
            auto d = h.renderer->context().data.lock();
            if (!d->externs.view) return false;
            const glm::vec4 res = d->externs.view->target_resolution;
            if (!(res.x == 16.0f && res.y == 4.0f && alk_test::approx_eq(res.w, 0.25f) &&
                d->gbuffer.size() == Extent2D{16, 4})) return false;
        }

        // A minimised window still publishes a finite resolution.
        if (!h.renderer->resize(0, 0).ok) return false;
        (void)h.renderer->render_frame(h.scene, FrameInput{});
        auto m = h.renderer->context().data.lock();
        if (!m->externs.view) return false;
        const glm::vec4 min_res = m->externs.view->target_resolution;
        return min_res == glm::vec4(1.0f, 1.0f, 1.0f, 1.0f);
    }

    bool test_settings_env_overrides()
    {
        setenv("ALK_SHADOW_QUALITY", "HIGH", 1);
        setenv("ALK_FXAA", "off", 1);
        setenv("ALK_SSAO", "maybe", 1);
        setenv("ALK_SHADOW_UPDATES_PER_FRAME", "0", 1);
        setenv("ALK_STAGE_TRANSPARENT", "0", 1);

        RendererSettings s{};
        apply_renderer_settings_env(s);
        const bool applied = s.shadow_quality == ShadowQuality::High && !s.feature_fxaa && s.ssao &&
            s.shadow_updates_per_frame == 1 && !s.stage_transparent;

        setenv("ALK_SHADOW_QUALITY", "ultra", 1);
        RendererSettings kept{};
        kept.shadow_quality = ShadowQuality::Low;
        apply_renderer_settings_env(kept);

        unsetenv("ALK_SHADOW_QUALITY");
        unsetenv("ALK_FXAA");
        unsetenv("ALK_SSAO");
        unsetenv("ALK_SHADOW_UPDATES_PER_FRAME");
        unsetenv("ALK_STAGE_TRANSPARENT");

        return applied && kept.shadow_quality == ShadowQuality::Low &&
            parse_shadow_quality("highest") == ShadowQuality::Highest &&
            !parse_shadow_quality("ultra").has_value() &&
            shadow_pcf_samples(ShadowQuality::Medium) == ShadowPcfSamples::Samples17 &&
            shadow_resolution(ShadowQuality::Highest) == 4096;
    }
}

int main()
{
    const bool ok_post = test_postprocess_chain_with_and_without_fxaa();
    const bool ok_ssao = test_ssao_requires_inputs();
    const bool ok_matcap = test_ssao_skipped_in_matcap();
    const bool ok_noise = test_ssao_noise_is_deterministic();
    const bool ok_debug = test_debug_shapes_need_technique();
    const bool ok_frame = test_frame_order_and_depth_probe();
    const bool ok_resize = test_resize_updates_target_resolution();
    const bool ok_env = test_settings_env_overrides();

    if (!ok_post) std::fprintf(stderr, "[alk-tests] postprocess chain failed\n");
    if (!ok_ssao) std::fprintf(stderr, "[alk-tests] ssao input gating failed\n");
    if (!ok_matcap) std::fprintf(stderr, "[alk-tests] ssao matcap skip failed\n");
    if (!ok_noise) std::fprintf(stderr, "[alk-tests] ssao noise determinism failed\n");
    if (!ok_debug) std::fprintf(stderr, "[alk-tests] debug shape technique check failed\n");
    if (!ok_frame) std::fprintf(stderr, "[alk-tests] frame order / depth probe failed\n");
    if (!ok_resize) std::fprintf(stderr, "[alk-tests] resize target resolution failed\n");
    if (!ok_env) std::fprintf(stderr, "[alk-tests] settings env overrides failed\n");

    if (!(ok_post && ok_ssao && ok_matcap && ok_noise && ok_debug && ok_frame && ok_resize && ok_env)) return 1;
    std::fprintf(stderr, "[alk-tests] frame tests passed\n");
    return 0;
}

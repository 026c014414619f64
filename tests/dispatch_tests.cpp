#include <cstdio>
#include <memory>
#include <vector>

#include "alk/render/renderer.hpp"

#include "alk_test_fixtures.hpp"

namespace
{
    using namespace alk;
    using alk_test::hash;

    struct Harness
    {
        SoftwareGpuDevice gpu{};
        InMemoryAssetSource assets{gpu};
        Scene scene{};
        std::unique_ptr<Renderer> renderer{};

        bool init()
        {
            alk_test::add_mesh_buffers(assets);
            auto r = Renderer::create(gpu, assets, Extent2D{8, 8});
            if (!r.ok)
            {
                std::fprintf(stderr, "[alk-tests] renderer create: %s\n", r.error.c_str());
                return false;
            }
            renderer = std::move(r.value);
            return true;
        }

        RenderContext& ctx() { return renderer->context(); }
        StageDispatcher& dispatcher() { return renderer->dispatcher(); }
    };

    bool test_lower_lods_never_submitted()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(10), 1, 10);
        alk_test::add_technique(h.assets, hash(11), 1, 11);
        alk_test::add_technique(h.assets, hash(12), 1, 12);

        const RenderStage stages[] = {RenderStage::GenerateGbuffer, RenderStage::ShadowGenerate, RenderStage::Transparents};
        std::vector<alk_test::StagedPart> parts{};
        for (RenderStage s : stages)
        {
            MeshPartDesc high = alk_test::part(hash(10));
            MeshPartDesc low1 = alk_test::part(hash(11));
            low1.lod_category = LodCategory::LowPolyGeom1;
            MeshPartDesc low3 = alk_test::part(hash(12));
            low3.lod_category = LodCategory::LowPolyGeom3;
            parts.push_back({s, low1});
            parts.push_back({s, high});
            parts.push_back({s, low3});
        }

        DynamicModelDesc dyn{};
        dyn.hash = hash(500);
        dyn.meshes.push_back(alk_test::make_mesh(hash(1), hash(2), parts));
        if (!alk_test::add_dynamic(h.scene, h.gpu, h.assets, dyn).valid()) return false;

        StaticModelDesc st{};
        st.hash = hash(501);
        st.meshes.push_back(alk_test::make_mesh(hash(1), hash(2), parts));
        auto model = StaticModel::load(h.assets, st);
        if (!model.ok) return false;
        auto instances = StaticInstancesComponent::create(h.gpu, model.value, {glm::mat4(1.0f)});
        if (!instances.ok) return false;
        h.scene.insert(h.scene.create(), std::move(instances.value));

        for (uint32_t s = 0; s < kRenderStageCount; ++s)
        {
            h.ctx().active_shadow_generation_mode = ShadowGenerationMode::MovingOnly;
            h.dispatcher().run_stage(h.scene, static_cast<RenderStage>(s));
            h.ctx().active_shadow_generation_mode = ShadowGenerationMode::StationaryOnly;
            h.dispatcher().run_stage(h.scene, static_cast<RenderStage>(s));
        }

        return alk_test::count_draws_with_ps(h.gpu, 11) == 0 &&
            alk_test::count_draws_with_ps(h.gpu, 12) == 0 &&
            alk_test::count_draws_with_ps(h.gpu, 10) > 0;
    }

    bool test_transparents_toggle_issues_no_draws()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(20), 1, 20);
        alk_test::add_technique(h.assets, hash(21), 1, 21);
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(600), hash(20), {RenderStage::Transparents, RenderStage::GenerateGbuffer}));
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(601), hash(21), {RenderStage::Transparents}, FeatureRenderer::SkyTransparent));
        alk_test::add_static(h.scene, h.gpu, h.assets, hash(602), hash(20), {RenderStage::Transparents});

        RendererSettings settings = h.renderer->settings();
        settings.stage_transparent = false;
        h.renderer->set_render_settings(settings);

        h.dispatcher().run_stage(h.scene, RenderStage::Transparents);
        h.dispatcher().draw_sky_objects(h.scene, RenderStage::Transparents);
        if (h.gpu.stats().draw_calls != 0) return false;

        (void)h.renderer->render_frame(h.scene, FrameInput{});
        if (alk_test::count_draws_in_event(h.gpu, "transparents") != 0) return false;
        if (alk_test::count_draws_in_event(h.gpu, "sky") != 0) return false;
        if (alk_test::count_draws_in_event(h.gpu, "generate_gbuffer") == 0) return false;

        settings.stage_transparent = true;
        h.renderer->set_render_settings(settings);
        h.gpu.clear_draw_log();
        (void)h.renderer->render_frame(h.scene, FrameInput{});
        return alk_test::count_draws_in_event(h.gpu, "transparents") == 2 &&
            alk_test::count_draws_in_event(h.gpu, "sky") == 1;
    }

    bool test_water_drawn_before_rigid_objects()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(30), 1, 30);
        alk_test::add_technique(h.assets, hash(31), 1, 31);
        alk_test::add_technique(h.assets, hash(32), 1, 32);
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(700), hash(30), {RenderStage::GenerateGbuffer}, FeatureRenderer::Cubemaps));
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(701), hash(31), {RenderStage::GenerateGbuffer}, FeatureRenderer::RigidObject));
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(702), hash(32), {RenderStage::GenerateGbuffer}, FeatureRenderer::Water));

        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        const std::vector<SwDrawRecord>& draws = h.gpu.draws();
        return draws.size() == 3 &&
            draws[0].pixel_shader.id == 32 &&
            draws[1].pixel_shader.id == 31 &&
            draws[2].pixel_shader.id == 30;
    }

    bool test_sky_drawn_back_to_front()
    {
        Harness h{};
        if (!h.init()) return false;
        const float distances[] = {1.0f, 10.0f, 5.0f};
        for (uint32_t i = 0; i < 3; ++i)
        {
            alk_test::add_technique(h.assets, hash(40 + i), 1, 40 + i);
            Transform t{};
            t.translation = glm::vec3(0.0f, 0.0f, distances[i]);
            alk_test::add_dynamic(h.scene, h.gpu, h.assets,
                alk_test::dynamic_desc(hash(800 + i), hash(40 + i), {RenderStage::Transparents}, FeatureRenderer::SkyTransparent),
                t);
        }

        ViewExtern view{};
        view.position = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
        h.ctx().bind_view(kMainView, view);

        // The generic dispatcher leaves sky objects to the dedicated pass.
        h.dispatcher().run_stage(h.scene, RenderStage::Transparents);
        if (!h.gpu.draws().empty()) return false;

        h.dispatcher().draw_sky_objects(h.scene, RenderStage::Transparents);
        const std::vector<SwDrawRecord>& draws = h.gpu.draws();
        return draws.size() == 3 &&
            draws[0].pixel_shader.id == 41 &&
            draws[1].pixel_shader.id == 42 &&
            draws[2].pixel_shader.id == 40;
    }

    bool test_visibility_and_feature_gating()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(50), 1, 50);
        alk_test::add_technique(h.assets, hash(51), 1, 51);
        const Entity hidden = alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(900), hash(50), {RenderStage::GenerateGbuffer}));
        const Entity other_view = alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(901), hash(51), {RenderStage::GenerateGbuffer}));

        ViewVisibility v0{};
        v0.set(kMainView, false);
        h.scene.insert(hidden, v0);
        ViewVisibility v3{};
        v3.set(3, false);
        h.scene.insert(other_view, v3);

        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        if (alk_test::count_draws_with_ps(h.gpu, 50) != 0 || alk_test::count_draws_with_ps(h.gpu, 51) != 1) return false;

        RendererSettings settings = h.renderer->settings();
        settings.feature_dynamics = false;
        h.renderer->set_render_settings(settings);
        h.gpu.clear_draw_log();
        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        return h.gpu.draws().empty();
    }

    bool test_shadow_pass_filters_by_mobility()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(60), 1, 60);
        alk_test::add_technique(h.assets, hash(61), 1, 61);
        alk_test::add_technique(h.assets, hash(62), 1, 62);
        alk_test::add_static(h.scene, h.gpu, h.assets, hash(1000), hash(60), {RenderStage::ShadowGenerate});
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1001), hash(61), {RenderStage::ShadowGenerate}));
        const Entity parked = alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1002), hash(62), {RenderStage::ShadowGenerate}));
        h.scene.insert(parked, MobilityOverride{Mobility::Stationary});

        h.ctx().active_shadow_generation_mode = ShadowGenerationMode::StationaryOnly;
        h.dispatcher().run_stage(h.scene, RenderStage::ShadowGenerate);
        if (alk_test::count_draws_with_ps(h.gpu, 60) != 1) return false;
        if (alk_test::count_draws_with_ps(h.gpu, 61) != 0) return false;
        if (alk_test::count_draws_with_ps(h.gpu, 62) != 1) return false;

        h.gpu.clear_draw_log();
        h.ctx().active_shadow_generation_mode = ShadowGenerationMode::MovingOnly;
        h.dispatcher().run_stage(h.scene, RenderStage::ShadowGenerate);
        if (alk_test::count_draws_with_ps(h.gpu, 60) != 0) return false;
        if (alk_test::count_draws_with_ps(h.gpu, 61) != 1) return false;
        if (alk_test::count_draws_with_ps(h.gpu, 62) != 0) return false;

        // Mobility only filters shadow generation.
        h.gpu.clear_draw_log();
        h.ctx().active_shadow_generation_mode = ShadowGenerationMode::StationaryOnly;
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1003), hash(61), {RenderStage::GenerateGbuffer}));
        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        return alk_test::count_draws_with_ps(h.gpu, 61) == 1;
    }

    bool test_variant_selection_and_bounds()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(70), 1, 70);
        alk_test::add_technique(h.assets, hash(71), 1, 71);
        alk_test::add_technique(h.assets, hash(72), 1, 72);

        MeshPartDesc p = alk_test::part(hash(70));
        p.variant_shader_index = 0;
        DynamicModelDesc desc{};
        desc.hash = hash(1100);
        desc.meshes.push_back(alk_test::make_mesh(hash(1), hash(2), {{RenderStage::GenerateGbuffer, p}}));
        desc.variants = VariantTable({TechniqueMapEntry{0, 2, 0}}, {hash(71), hash(72)});
        const Entity e = alk_test::add_dynamic(h.scene, h.gpu, h.assets, desc);
        DynamicModelComponent* c = h.scene.get<DynamicModelComponent>(e);
        if (!c) return false;

        if (c->model.select_mesh(1).ok) return false;
        if (c->model.select_variant(2).ok) return false;
        if (!c->model.select_variant(1).ok) return false;

        // The variant binds after the base and wins.
        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        if (h.gpu.draws().size() != 1 || h.gpu.draws()[0].pixel_shader.id != 72) return false;

        h.gpu.clear_draw_log();
        if (!c->model.select_variant(0).ok) return false;
        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        return h.gpu.draws().size() == 1 && h.gpu.draws()[0].pixel_shader.id == 71;
    }

    bool test_identifier_restricts_parts()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(75), 1, 75);
        alk_test::add_technique(h.assets, hash(76), 1, 76);

        MeshPartDesc body = alk_test::part(hash(75));
        body.external_identifier = 0;
        MeshPartDesc door = alk_test::part(hash(76));
        door.external_identifier = 1;
        DynamicModelDesc desc{};
        desc.hash = hash(1150);
        desc.meshes.push_back(alk_test::make_mesh(hash(1), hash(2),
            {{RenderStage::GenerateGbuffer, body}, {RenderStage::GenerateGbuffer, door}}));
        const Entity e = alk_test::add_dynamic(h.scene, h.gpu, h.assets, desc);
        DynamicModelComponent* c = h.scene.get<DynamicModelComponent>(e);
        if (!c || c->model.identifier_count() != 2) return false;

        c->identifier = 1;
        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        if (h.gpu.draws().size() != 1 || alk_test::count_draws_with_ps(h.gpu, 76) != 1) return false;

        h.gpu.clear_draw_log();
        c->identifier = kAllIdentifiers;
        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        return alk_test::count_draws_with_ps(h.gpu, 75) == 1 && alk_test::count_draws_with_ps(h.gpu, 76) == 1;
    }

    bool test_skinned_parts_use_entity_vertex_shader()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(80), 1, 80, ScopeBits::of(Scope::Skinning));
        alk_test::add_technique(h.assets, hash(81), 1, 81);
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1200), hash(80), {RenderStage::GenerateGbuffer}));
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1201), hash(81), {RenderStage::GenerateGbuffer}));
        h.ctx().shaders.entity_vs_override = alk_test::shader(99);

        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        const std::vector<SwDrawRecord>& draws = h.gpu.draws();
        return draws.size() == 2 &&
            draws[0].vertex_shader_overridden && draws[0].vertex_shader.id == 99 &&
            !draws[1].vertex_shader_overridden && draws[1].vertex_shader.id == 1;
    }

    bool test_bind_failure_still_draws()
    {
        Harness h{};
        if (!h.init()) return false;
        // The view extern is unset until a frame binds the camera.
        alk_test::add_technique(h.assets, hash(90), 1, 90, ScopeBits::of(Scope::View));
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1300), hash(90), {RenderStage::GenerateGbuffer}));
        // Unknown technique hash: the part is skipped.
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1301), hash(0xDEAD), {RenderStage::GenerateGbuffer}));

        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        return h.gpu.draws().size() == 1 && h.gpu.draws()[0].pixel_shader.id == 90;
    }

    bool test_terrain_draws_highest_detail_in_geometry_stages()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(110), 1, 110);

        TerrainDesc desc{};
        desc.hash = hash(1400);
        desc.vertex0 = hash(1);
        desc.index = hash(2);
        desc.groups.push_back(TerrainGroupDesc{hash(110)});
        desc.parts.push_back(TerrainPartDesc{0, 12, 0, 0});
        desc.parts.push_back(TerrainPartDesc{12, 6, 0, 1});
        desc.parts.push_back(TerrainPartDesc{18, 6, 4, 0});
        auto terrain = TerrainPatchesComponent::create(h.gpu, h.assets, desc);
        if (!terrain.ok || terrain.value.group_count() != 1) return false;
        h.scene.insert(h.scene.create(), std::move(terrain.value));

        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        const std::vector<SwDrawRecord>& draws = h.gpu.draws();
        if (draws.size() != 1 || draws[0].count != 12 || draws[0].topology != PrimitiveTopology::TriangleStrip) return false;

        h.gpu.clear_draw_log();
        h.dispatcher().run_stage(h.scene, RenderStage::Transparents);
        if (!h.gpu.draws().empty()) return false;

        RendererSettings settings = h.renderer->settings();
        settings.feature_terrain = false;
        h.renderer->set_render_settings(settings);
        h.dispatcher().run_stage(h.scene, RenderStage::DepthPrepass);
        return h.gpu.draws().empty();
    }

    bool test_decorators_follow_dynamic_models()
    {
        Harness h{};
        if (!h.init()) return false;
        alk_test::add_technique(h.assets, hash(120), 1, 120);
        alk_test::add_technique(h.assets, hash(121), 1, 121);

        StaticModelDesc st{};
        st.hash = hash(1500);
        st.meshes.push_back(alk_test::make_mesh(hash(1), hash(2), {{RenderStage::GenerateGbuffer, alk_test::part(hash(120))}}));
        auto model = StaticModel::load(h.assets, st);
        if (!model.ok) return false;
        auto decorator = DecoratorComponent::create(h.gpu, model.value, {glm::mat4(1.0f), glm::mat4(1.0f), glm::mat4(1.0f)});
        if (!decorator.ok) return false;
        h.scene.insert(h.scene.create(), std::move(decorator.value));
        alk_test::add_dynamic(h.scene, h.gpu, h.assets,
            alk_test::dynamic_desc(hash(1501), hash(121), {RenderStage::GenerateGbuffer}));

        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        const std::vector<SwDrawRecord>& draws = h.gpu.draws();
        if (draws.size() != 2 || draws[0].pixel_shader.id != 121) return false;
        if (draws[1].kind != SwDrawKind::IndexedInstanced || draws[1].instance_count != 3) return false;

        RendererSettings settings = h.renderer->settings();
        settings.feature_decorators = false;
        h.renderer->set_render_settings(settings);
        h.gpu.clear_draw_log();
        h.dispatcher().run_stage(h.scene, RenderStage::GenerateGbuffer);
        return alk_test::count_draws_with_ps(h.gpu, 120) == 0;
    }
}

int main()
{
    const bool ok_lod = test_lower_lods_never_submitted();
    const bool ok_toggle = test_transparents_toggle_issues_no_draws();
    const bool ok_water = test_water_drawn_before_rigid_objects();
    const bool ok_sky = test_sky_drawn_back_to_front();
    const bool ok_gating = test_visibility_and_feature_gating();
    const bool ok_mobility = test_shadow_pass_filters_by_mobility();
    const bool ok_variant = test_variant_selection_and_bounds();
    const bool ok_identifier = test_identifier_restricts_parts();
    const bool ok_skinning = test_skinned_parts_use_entity_vertex_shader();
    const bool ok_bind = test_bind_failure_still_draws();
    const bool ok_terrain = test_terrain_draws_highest_detail_in_geometry_stages();
    const bool ok_decorators = test_decorators_follow_dynamic_models();

    if (!ok_lod) std::fprintf(stderr, "[alk-tests] lower LOD parts were submitted\n");
    if (!ok_toggle) std::fprintf(stderr, "[alk-tests] transparents toggle still drew\n");
    if (!ok_water) std::fprintf(stderr, "[alk-tests] water priority ordering failed\n");
    if (!ok_sky) std::fprintf(stderr, "[alk-tests] sky back-to-front ordering failed\n");
    if (!ok_gating) std::fprintf(stderr, "[alk-tests] visibility/feature gating failed\n");
    if (!ok_mobility) std::fprintf(stderr, "[alk-tests] shadow mobility filter failed\n");
    if (!ok_variant) std::fprintf(stderr, "[alk-tests] variant selection failed\n");
    if (!ok_identifier) std::fprintf(stderr, "[alk-tests] part identifier filter failed\n");
    if (!ok_skinning) std::fprintf(stderr, "[alk-tests] skinned vertex shader override failed\n");
    if (!ok_bind) std::fprintf(stderr, "[alk-tests] non-fatal bind failure handling failed\n");
    if (!ok_terrain) std::fprintf(stderr, "[alk-tests] terrain detail filtering failed\n");
    if (!ok_decorators) std::fprintf(stderr, "[alk-tests] decorator ordering failed\n");

    if (!(ok_lod && ok_toggle && ok_water && ok_sky && ok_gating && ok_mobility && ok_variant && ok_identifier &&
          ok_skinning && ok_bind && ok_terrain && ok_decorators)) return 1;
    std::fprintf(stderr, "[alk-tests] dispatch tests passed\n");
    return 0;
}

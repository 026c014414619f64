#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: stage_dispatcher.hpp
    MODULE: render
    PURPOSE: Runs one render stage over every drawable collection in the scene
            in fixed order, with stage/feature gating, view visibility and the
            shadow mobility filter.
*/


#include <algorithm>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "alk/render/dynamic_model.hpp"
#include "alk/render/render_context.hpp"
#include "alk/render/shader_ball.hpp"
#include "alk/render/static_instances.hpp"
#include "alk/render/terrain.hpp"
#include "alk/scene/components.hpp"
#include "alk/scene/scene.hpp"
#include "alk/tfx/feature_renderer.hpp"
#include "alk/tfx/render_stage.hpp"

namespace alk
{
    inline Mobility default_mobility(const Scene& scene, Entity e, Mobility fallback)
    {
        if (const MobilityOverride* m = scene.get<MobilityOverride>(e)) return m->value;
        return fallback;
    }

    class StageDispatcher
    {
    public:
        explicit StageDispatcher(RenderContext& ctx) : ctx_(ctx) {}

        void run_stage(Scene& scene, RenderStage stage)
        {
            if (!stage_enabled(ctx_.settings, stage)) return;

            GpuEventScope event(ctx_.gpu, render_stage_name(stage));

            if (is_geometry_stage(stage))
            {
                draw_terrain(scene, stage);
                draw_shader_balls(scene, stage);
            }
            draw_static_instances(scene, stage);
            draw_dynamic_models(scene, stage);
            if (should_render(ctx_.settings, stage, FeatureRenderer::SpeedtreeTrees))
            {
                draw_decorators(scene, stage);
            }
        }

        // Sky volumes back to front so only the nearest one wins the depth test.
        void draw_sky_objects(Scene& scene, RenderStage stage)
        {
            if (!should_render(ctx_.settings, stage, FeatureRenderer::SkyTransparent)) return;

            struct SkyEntry
            {
                float distance_sq = 0.0f;
                Entity entity{};
            };
            std::vector<SkyEntry> entries{};

            const glm::vec3 view_pos = ctx_.active_view_position;
            scene.each<DynamicModelComponent>([&](Entity e, DynamicModelComponent& c)
            {
                if (c.model.feature_type() != FeatureRenderer::SkyTransparent) return;
                if (!visible(scene, e)) return;
                const Transform* t = scene.get<Transform>(e);
                const glm::vec3 pos = t ? t->translation : glm::vec3(0.0f);
                const glm::vec3 d = pos - view_pos;
                entries.push_back(SkyEntry{glm::dot(d, d), e});
            });

            std::stable_sort(entries.begin(), entries.end(), [](const SkyEntry& a, const SkyEntry& b)
            {
                return a.distance_sq > b.distance_sq;
            });

            GpuEventScope event(ctx_.gpu, "sky");
            for (const SkyEntry& entry : entries)
            {
                draw_dynamic(scene, entry.entity, stage);
            }
        }

    private:
        bool visible(const Scene& scene, Entity e) const
        {
            return is_visible_in(scene.get<ViewVisibility>(e), ctx_.active_view);
        }

        bool passes_mobility(const Scene& scene, Entity e, RenderStage stage, Mobility fallback) const
        {
            if (stage != RenderStage::ShadowGenerate) return true;
            const Mobility m = default_mobility(scene, e, fallback);
            return ctx_.active_shadow_generation_mode == ShadowGenerationMode::StationaryOnly
                ? m == Mobility::Stationary
                : m == Mobility::Moving;
        }

        bool eligible(const Scene& scene, Entity e, RenderStage stage, Mobility fallback) const
        {
            return visible(scene, e) && passes_mobility(scene, e, stage, fallback);
        }

        void draw_terrain(Scene& scene, RenderStage stage)
        {
            if (!feature_enabled(ctx_.settings, FeatureRenderer::TerrainPatch)) return;

            scene.each<TerrainPatchesComponent>([&](Entity e, const TerrainPatchesComponent& terrain)
            {
                if (!eligible(scene, e, stage, Mobility::Stationary)) return;
                auto d = ctx_.data.lock();
                TechniqueBindContext bind{ctx_.gpu, ctx_.scopes, d->externs};
                DrawContext dc{ctx_.gpu, ctx_.assets, bind, ctx_.shaders.entity_vs_override, e};
                terrain.draw(dc, stage);
            });
        }

        void draw_shader_balls(Scene& scene, RenderStage stage)
        {
            scene.each<ShaderBallComponent>([&](Entity e, const ShaderBallComponent& ball)
            {
                if (!eligible(scene, e, stage, Mobility::Stationary)) return;
                auto d = ctx_.data.lock();
                TechniqueBindContext bind{ctx_.gpu, ctx_.scopes, d->externs};
                DrawContext dc{ctx_.gpu, ctx_.assets, bind, ctx_.shaders.entity_vs_override, e};
                ball.draw(dc);
            });
        }

        void draw_static_instances(Scene& scene, RenderStage stage)
        {
            struct Entry
            {
                uint32_t priority = 0;
                Entity entity{};
            };
            std::vector<Entry> entries{};

            scene.each<StaticInstancesComponent>([&](Entity e, const StaticInstancesComponent& c)
            {
                if (!should_render(ctx_.settings, stage, c.feature_type)) return;
                if (!eligible(scene, e, stage, Mobility::Stationary)) return;
                entries.push_back(Entry{feature_draw_priority(c.feature_type), e});
            });

            std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b)
            {
                return a.priority < b.priority;
            });

            for (const Entry& entry : entries)
            {
                const StaticInstancesComponent* c = scene.get<StaticInstancesComponent>(entry.entity);
                auto d = ctx_.data.lock();
                TechniqueBindContext bind{ctx_.gpu, ctx_.scopes, d->externs};
                DrawContext dc{ctx_.gpu, ctx_.assets, bind, ctx_.shaders.entity_vs_override, entry.entity};
                c->draw(dc, stage, scene.get<ObjectChannels>(entry.entity));
            }
        }

        void draw_dynamic_models(Scene& scene, RenderStage stage)
        {
            struct Entry
            {
                uint32_t priority = 0;
                Entity entity{};
            };
            std::vector<Entry> entries{};

            scene.each<DynamicModelComponent>([&](Entity e, const DynamicModelComponent& c)
            {
                const FeatureRenderer feature = c.model.feature_type();
                if (feature == FeatureRenderer::SkyTransparent) return;
                if (!should_render(ctx_.settings, stage, feature)) return;
                if (!eligible(scene, e, stage, Mobility::Moving)) return;
                entries.push_back(Entry{feature_draw_priority(feature), e});
            });

            std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b)
            {
                return a.priority < b.priority;
            });

            for (const Entry& entry : entries)
            {
                draw_dynamic(scene, entry.entity, stage);
            }
        }

        void draw_dynamic(Scene& scene, Entity e, RenderStage stage)
        {
            DynamicModelComponent* c = scene.get<DynamicModelComponent>(e);
            if (!c) return;
            const Transform* t = scene.get<Transform>(e);
            const Transform transform = t ? *t : Transform{};

            auto d = ctx_.data.lock();
            TechniqueBindContext bind{ctx_.gpu, ctx_.scopes, d->externs};
            DrawContext dc{ctx_.gpu, ctx_.assets, bind, ctx_.shaders.entity_vs_override, e};
            c->draw(dc, stage, transform, scene.get<ObjectChannels>(e));
        }

        void draw_decorators(Scene& scene, RenderStage stage)
        {
            scene.each<DecoratorComponent>([&](Entity e, const DecoratorComponent& c)
            {
                if (!eligible(scene, e, stage, Mobility::Stationary)) return;
                auto d = ctx_.data.lock();
                TechniqueBindContext bind{ctx_.gpu, ctx_.scopes, d->externs};
                DrawContext dc{ctx_.gpu, ctx_.assets, bind, ctx_.shaders.entity_vs_override, e};
                c.draw(dc, stage);
            });
        }

        RenderContext& ctx_;
    };
}

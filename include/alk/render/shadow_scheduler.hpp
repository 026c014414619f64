#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: shadow_scheduler.hpp
    MODULE: render
    PURPOSE: Budgeted shadow-map regeneration. Oldest-updated lights first;
            stationary content only when dirty, moving content every time a
            light is selected.
*/


#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "alk/core/log.hpp"
#include "alk/render/render_context.hpp"
#include "alk/render/shadow_map_renderer.hpp"
#include "alk/render/stage_dispatcher.hpp"
#include "alk/scene/components.hpp"
#include "alk/scene/scene.hpp"

namespace alk
{
    struct ShadowUpdateReport
    {
        std::vector<Entity> updated{};
        uint32_t stationary_regenerations = 0;
        uint32_t candidates = 0;
    };

    class ShadowUpdateScheduler
    {
    public:
        ShadowUpdateScheduler(RenderContext& ctx, StageDispatcher& dispatcher)
            : ctx_(ctx), dispatcher_(dispatcher)
        {}

        ShadowUpdateReport update_shadow_maps(Scene& scene)
        {
            ShadowUpdateReport report{};
            if (!shadows_active(ctx_.settings)) return report;

            const bool loader_idle = ctx_.assets.is_idle();
            const uint32_t main_view = ctx_.active_view;
            const std::optional<ViewExtern> main_extern = current_view_extern();

            struct Candidate
            {
                uint64_t last_update = 0;
                Entity entity{};
            };
            std::vector<Candidate> candidates{};
            scene.each<ShadowMapRenderer>([&](Entity e, const ShadowMapRenderer& shadow)
            {
                // Keep shadows warm while streaming, regardless of visibility.
                if (loader_idle && !is_visible_in(scene.get<ViewVisibility>(e), kMainView)) return;
                candidates.push_back(Candidate{shadow.last_update, e});
            });
            report.candidates = (uint32_t)candidates.size();

            std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b)
            {
                return a.last_update < b.last_update;
            });
            if (candidates.empty()) return report;
            const size_t budget = ctx_.settings.shadow_updates_per_frame;

            GpuEventScope event(ctx_.gpu, "shadow_updates");
            ctx_.depth_mode = DepthMode::Flipped;

            // A light whose map cannot be allocated does not consume budget.
            for (const Candidate& c : candidates)
            {
                if (report.updated.size() >= budget) break;
                ShadowMapRenderer* shadow = scene.get<ShadowMapRenderer>(c.entity);
                const Status st = shadow->ensure_resolution(
                    ctx_.gpu,
                    ctx_.settings.shadow_quality,
                    "shadow_map_" + std::to_string(c.entity.id));
                if (!st.ok)
                {
                    log_error("Failed to allocate shadow map for entity " + std::to_string(c.entity.id) + ": " + st.error);
                    continue;
                }

                if (shadow->stationary_needs_update)
                {
                    shadow->bind_for_generation(ctx_, ShadowGenerationMode::StationaryOnly);
                    dispatcher_.run_stage(scene, RenderStage::ShadowGenerate);
                    ++report.stationary_regenerations;
                    // A streaming scene may be incomplete; retry next time.
                    if (loader_idle) shadow->stationary_needs_update = false;
                }

                shadow->bind_for_generation(ctx_, ShadowGenerationMode::MovingOnly);
                dispatcher_.run_stage(scene, RenderStage::ShadowGenerate);
                shadow->last_update = ctx_.frame_index;
                report.updated.push_back(c.entity);
            }

            ctx_.depth_mode = DepthMode::Normal;
            ctx_.active_shadow_generation_mode = ShadowGenerationMode::MovingOnly;
            restore_view(main_view, main_extern);
            ctx_.gpu.unbind_render_targets();
            return report;
        }

    private:
        std::optional<ViewExtern> current_view_extern()
        {
            auto d = ctx_.data.lock();
            return d->externs.view;
        }

        void restore_view(uint32_t view, const std::optional<ViewExtern>& extern_data)
        {
            if (extern_data)
            {
                ctx_.bind_view(view, *extern_data);
                return;
            }
            ctx_.active_view = view;
            auto d = ctx_.data.lock();
            d->externs.view.reset();
        }

        RenderContext& ctx_;
        StageDispatcher& dispatcher_;
    };
}

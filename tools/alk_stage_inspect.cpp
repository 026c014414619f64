#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "alk/assets/asset_source.hpp"
#include "alk/core/env.hpp"
#include "alk/core/log.hpp"
#include "alk/gfx/sw_gpu_device.hpp"
#include "alk/render/renderer.hpp"
#include "alk/render/renderer_settings.hpp"
#include "alk/tfx/render_stage.hpp"

namespace
{
constexpr uint32_t kSurfaceW = 320;
constexpr uint32_t kSurfaceH = 180;

alk::TagHash tag(uint32_t v)
{
    alk::TagHash h{};
    h.value = v;
    return h;
}

alk::ShaderHandle shader_id(uint32_t v)
{
    alk::ShaderHandle h{};
    h.id = v;
    return h;
}

// Headless walk over a fixed sample scene on the software device. Prints what
// each stage submitted so stage wiring can be checked without a GPU.
class StageInspectApp
{
public:
    explicit StageInspectApp(std::string only_stage)
        : only_stage_(std::move(only_stage))
    {}

    void run()
    {
        init_settings();
        init_assets();
        init_renderer();
        init_scene();

        if (!only_stage_.empty())
        {
            inspect_single_stage();
            return;
        }

        const uint32_t frames = alk::parse_env_u32(std::getenv("ALK_INSPECT_FRAMES"), 3u, 1u);
        for (uint32_t i = 0; i < frames; ++i) render_one();
    }

private:
    void init_settings()
    {
        alk::apply_renderer_settings_env(settings_);
        alk::log_info(std::string("shadow quality: ") + alk::shadow_quality_name(settings_.shadow_quality) +
            ", updates/frame: " + std::to_string(settings_.shadow_updates_per_frame));
    }

    void add_technique(uint32_t hash, uint32_t vs, uint32_t ps, alk::ScopeBits scopes)
    {
        alk::TechniqueDesc desc{};
        desc.hash = tag(hash);
        desc.name = "inspect_" + std::to_string(hash);
        desc.used_scopes = scopes;

        alk::TechniqueShaderDesc vsd{};
        vsd.shader = shader_id(vs);
        desc.stages[(size_t)alk::ShaderStage::Vertex] = vsd;

        alk::TechniqueShaderDesc psd{};
        psd.shader = shader_id(ps);
        psd.constant_slot = 0;
        psd.constants = {glm::vec4(1.0f)};
        desc.stages[(size_t)alk::ShaderStage::Pixel] = psd;
        assets_.add_technique(std::move(desc));
    }

    void add_buffer(uint32_t hash, alk::BufferKind kind, uint32_t stride)
    {
        alk::BufferSource src{};
        src.desc.kind = kind;
        src.desc.size_bytes = 256;
        src.desc.stride = stride;
        src.desc.debug_name = "inspect_buffer_" + std::to_string(hash);
        src.data.assign(256, 0);
        assets_.add_buffer(tag(hash), std::move(src));
    }

    void init_assets()
    {
        add_buffer(1, alk::BufferKind::Vertex, 16);
        add_buffer(2, alk::BufferKind::Index, 2);

        alk::ScopeBits view_frame = alk::ScopeBits::of(alk::Scope::View);
        view_frame |= alk::ScopeBits::of(alk::Scope::Frame);
        add_technique(10, 1, 10, view_frame);
        add_technique(11, 1, 11, view_frame);
        add_technique(12, 1, 12, alk::ScopeBits::of(alk::Scope::Transparent));
        add_technique(13, 1, 13, alk::ScopeBits::of(alk::Scope::View));
        add_technique(14, 2, 14, alk::ScopeBits{});
    }

    void init_renderer()
    {
        auto r = alk::Renderer::create(gpu_, assets_, alk::Extent2D{kSurfaceW, kSurfaceH});
        if (!r.ok) throw std::runtime_error("Renderer create failed: " + r.error);
        renderer_ = std::move(r.value);
        renderer_->set_render_settings(settings_);

        alk::UtilityShaders& s = renderer_->context().shaders;
        s.entity_vs_override = shader_id(90);
        s.fullscreen_vs = shader_id(91);
        s.fxaa_ps = shader_id(92);
        s.fxaa_noise_ps = shader_id(93);
        s.ssao_ps = shader_id(94);
        s.ssao_blur_ps = shader_id(95);
        s.debug_shape_vs = shader_id(96);
        s.debug_shape_technique = tag(14);
    }

    alk::MeshDesc make_mesh(uint32_t technique, const std::vector<alk::RenderStage>& stages)
    {
        alk::MeshDesc mesh{};
        mesh.vertex0 = tag(1);
        mesh.index = tag(2);
        mesh.input_layout_per_render_stage.assign(alk::kRenderStageCount, 0);
        mesh.part_range_per_render_stage.assign(alk::kRenderStageCount + 1, 0);

        for (uint32_t s = 0; s < alk::kRenderStageCount; ++s)
        {
            mesh.part_range_per_render_stage[s] = (uint16_t)mesh.parts.size();
            for (alk::RenderStage stage : stages)
            {
                if ((uint32_t)stage != s) continue;
                alk::MeshPartDesc part{};
                part.technique = tag(technique);
                part.index_count = 36;
                mesh.parts.push_back(part);
            }
        }
        mesh.part_range_per_render_stage[alk::kRenderStageCount] = (uint16_t)mesh.parts.size();
        return mesh;
    }

    void init_scene()
    {
        const std::vector<alk::RenderStage> opaque{
            alk::RenderStage::DepthPrepass,
            alk::RenderStage::GenerateGbuffer,
            alk::RenderStage::ShadowGenerate};

        alk::StaticModelDesc ground{};
        ground.hash = tag(1000);
        ground.meshes.push_back(make_mesh(10, opaque));
        auto ground_model = alk::StaticModel::load(assets_, ground);
        if (!ground_model.ok) throw std::runtime_error("ground model: " + ground_model.error);

        std::vector<glm::mat4> tiles{};
        for (int i = 0; i < 4; ++i)
        {
            glm::mat4 m{1.0f};
            m[3] = glm::vec4((float)i * 10.0f, 0.0f, 0.0f, 1.0f);
            tiles.push_back(m);
        }
        auto statics = alk::StaticInstancesComponent::create(gpu_, ground_model.value, tiles);
        if (!statics.ok) throw std::runtime_error("static instances: " + statics.error);
        scene_.insert(scene_.create(), std::move(statics.value));

        for (uint32_t i = 0; i < 3; ++i)
        {
            alk::DynamicModelDesc crate{};
            crate.hash = tag(2000 + i);
            crate.meshes.push_back(make_mesh(11, opaque));
            alk::Transform t{};
            t.translation = glm::vec3((float)i * 2.0f, 1.0f, 5.0f);
            add_dynamic(crate, t);
        }

        alk::DynamicModelDesc glass{};
        glass.hash = tag(3000);
        glass.meshes.push_back(make_mesh(12, {alk::RenderStage::Transparents}));
        add_dynamic(glass, alk::Transform{});

        alk::DynamicModelDesc sky{};
        sky.hash = tag(3001);
        sky.feature_type = alk::FeatureRenderer::SkyTransparent;
        sky.meshes.push_back(make_mesh(13, {alk::RenderStage::Transparents}));
        add_dynamic(sky, alk::Transform{});

        for (uint32_t i = 0; i < 2; ++i)
        {
            alk::ViewExtern light{};
            light.position = glm::vec4(0.0f, 20.0f, (float)i * 15.0f, 1.0f);
            scene_.insert(scene_.create(), alk::ShadowMapRenderer(1 + i, light));
        }

        alk::DebugShape marker{};
        marker.color = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
        scene_.insert(scene_.create(), marker);
    }

    void add_dynamic(const alk::DynamicModelDesc& desc, const alk::Transform& t)
    {
        auto c = alk::DynamicModelComponent::create(gpu_, assets_, desc, t);
        if (!c.ok) throw std::runtime_error("dynamic model: " + c.error);
        const alk::Entity e = scene_.create();
        scene_.insert(e, std::move(c.value));
        scene_.insert(e, t);
    }

    alk::FrameInput frame_input() const
    {
        alk::FrameInput in{};
        in.view.position = glm::vec4(0.0f, 2.0f, -10.0f, 1.0f);
        in.frame.render_time = (float)frame_ * (1.0f / 60.0f);
        in.frame.game_time = in.frame.render_time;
        in.frame.delta_game_time = 1.0f / 60.0f;
        return in;
    }

    void render_one()
    {
        gpu_.clear_draw_log();
        renderer_->request_depth_probe();
        const alk::FrameReport report = renderer_->render_frame(scene_, frame_input());
        ++frame_;

        std::map<std::string, uint32_t> per_event{};
        for (const alk::SwDrawRecord& d : gpu_.draws()) ++per_event[d.event.empty() ? "<none>" : d.event];

        alk::log_info("frame " + std::to_string(report.frame_index) +
            ": draws=" + std::to_string(gpu_.draws().size()) +
            " shadows=" + std::to_string(report.shadows.updated.size()) + "/" + std::to_string(report.shadows.candidates) +
            " stationary=" + std::to_string(report.shadows.stationary_regenerations) +
            " ssao=" + (report.ssao ? "on" : "off") +
            " post_passes=" + std::to_string(report.postprocess.fullscreen_passes));
        for (const auto& [event, count] : per_event)
        {
            alk::log_info("  " + event + ": " + std::to_string(count));
        }
        if (report.depth_probe)
        {
            alk::log_info("  centre depth distance: " + std::to_string(report.depth_probe->distance));
        }

        const alk::GpuDeviceStats& st = gpu_.stats();
        alk::log_debug("  textures=" + std::to_string(st.live_textures) +
            " views=" + std::to_string(st.live_views) +
            " buffers=" + std::to_string(st.live_buffers) +
            " blits=" + std::to_string(st.blits));
    }

    void inspect_single_stage()
    {
        const auto stage = alk::parse_render_stage(only_stage_);
        if (!stage) throw std::runtime_error("unknown render stage '" + only_stage_ + "'");

        // One frame publishes the externs the stage binds against.
        (void)renderer_->render_frame(scene_, frame_input());
        gpu_.clear_draw_log();

        alk::RenderContext& ctx = renderer_->context();
        if (*stage == alk::RenderStage::ShadowGenerate)
        {
            ctx.active_shadow_generation_mode = alk::ShadowGenerationMode::StationaryOnly;
            renderer_->dispatcher().run_stage(scene_, *stage);
            ctx.active_shadow_generation_mode = alk::ShadowGenerationMode::MovingOnly;
        }
        renderer_->dispatcher().run_stage(scene_, *stage);
        renderer_->dispatcher().draw_sky_objects(scene_, *stage);

        alk::log_info(std::string("stage ") + alk::render_stage_name(*stage) + ": " +
            std::to_string(gpu_.draws().size()) + " draws");
        for (const alk::SwDrawRecord& d : gpu_.draws())
        {
            alk::log_info("  vs=" + std::to_string(d.vertex_shader.id) +
                (d.vertex_shader_overridden ? "*" : "") +
                " ps=" + std::to_string(d.pixel_shader.id) +
                " count=" + std::to_string(d.count) +
                " instances=" + std::to_string(d.instance_count) +
                " event=" + d.event);
        }
    }

    std::string only_stage_{};
    alk::RendererSettings settings_{};
    alk::SoftwareGpuDevice gpu_{};
    alk::InMemoryAssetSource assets_{gpu_};
    alk::Scene scene_{};
    std::unique_ptr<alk::Renderer> renderer_{};
    uint64_t frame_ = 0;
};
}

int main(int argc, char** argv)
{
    try
    {
        StageInspectApp app(argc > 1 ? argv[1] : "");
        app.run();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}

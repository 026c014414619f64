#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "alk/assets/asset_cache.hpp"
#include "alk/render/dynamic_model.hpp"
#include "alk/tfx/render_stage.hpp"
#include "alk/tfx/scope_registry.hpp"
#include "alk/tfx/technique.hpp"
#include "alk/tfx/technique_binder.hpp"
#include "alk/tfx/variant_table.hpp"

#include "alk_test_fixtures.hpp"

namespace
{
    using namespace alk;
    using alk_test::hash;

    bool test_subscriptions_union_matches_mesh_ranges()
    {
        SoftwareGpuDevice gpu{};
        InMemoryAssetSource assets(gpu);
        alk_test::add_vertex_buffer(assets, hash(1));
        alk_test::add_index_buffer(assets, hash(2));

        const TagHash t = hash(100);
        DynamicModelDesc desc{};
        desc.hash = hash(50);
        desc.meshes.push_back(alk_test::make_mesh(hash(1), hash(2), {
            {RenderStage::GenerateGbuffer, alk_test::part(t)},
            {RenderStage::ShadowGenerate, alk_test::part(t)},
        }));
        desc.meshes.push_back(alk_test::make_mesh(hash(1), hash(2), {
            {RenderStage::Transparents, alk_test::part(t)},
            {RenderStage::Transparents, alk_test::part(t)},
            {RenderStage::GenerateGbuffer, alk_test::part(t)},
        }));

        auto model = DynamicModel::load(assets, desc);
        if (!model.ok) return false;

        RenderStageSubscriptions expected{};
        for (size_t i = 0; i < model.value.mesh_count(); ++i)
        {
            const LoadedMesh& mesh = model.value.mesh(i);
            for (uint32_t s = 0; s < kRenderStageCount; ++s)
            {
                const RenderStage stage = static_cast<RenderStage>(s);
                const auto [first, last] = mesh.part_range(stage);
                if ((last > first) != mesh.stages().contains(stage)) return false;
            }
            expected |= mesh.stages();
        }

        const RenderStageSubscriptions got = model.value.subscribed_stages();
        return got == expected &&
            got.contains(RenderStage::GenerateGbuffer) &&
            got.contains(RenderStage::ShadowGenerate) &&
            got.contains(RenderStage::Transparents) &&
            !got.contains(RenderStage::Decals);
    }

    bool test_partrange_list_edge_cases()
    {
        // Start offsets per stage plus trailing end; stage 1 is reversed.
        std::vector<uint16_t> ranges(kRenderStageCount + 1, 4);
        ranges[0] = 0;
        ranges[1] = 4;
        ranges[2] = 2;

        const auto subs = RenderStageSubscriptions::from_partrange_list(ranges);
        if (!subs.contains(RenderStage::GenerateGbuffer)) return false;
        if (subs.contains(RenderStage::Decals)) return false;

        const auto reversed = part_range_for_stage(ranges, RenderStage::Decals);
        if (reversed.first != reversed.second) return false;

        // A truncated list subscribes nothing past its end.
        const std::vector<uint16_t> short_list{0, 3};
        const auto short_subs = RenderStageSubscriptions::from_partrange_list(short_list);
        return short_subs.bits() == RenderStageSubscriptions::bit(RenderStage::GenerateGbuffer);
    }

    bool test_variant_resolution_wraps()
    {
        std::vector<TagHash> techniques{};
        for (uint32_t i = 0; i < 8; ++i) techniques.push_back(hash(200 + i));
        const VariantTable table(
            {TechniqueMapEntry{0, 2, 0}, TechniqueMapEntry{5, 3, 1}},
            techniques);

        const size_t expected[] = {5, 6, 7, 5, 6};
        for (uint32_t v = 0; v < 5; ++v)
        {
            const auto index = table.resolve_index(1, v);
            if (!index || *index != expected[v]) return false;
        }

        if (table.resolve_index(kNoVariant, 0).has_value()) return false;
        if (table.resolve(kNoVariant, 3).is_some()) return false;
        if (table.resolve_index(9, 0).has_value()) return false;
        return table.variant_count() == 2 && table.resolve(1, 4) == hash(206);
    }

    bool test_scope_registry_requires_externs()
    {
        SoftwareGpuDevice gpu{};
        auto scopes = ScopeRegistry::create(gpu);
        if (!scopes.ok) return false;

        Externs externs{};
        const Status missing = scopes.value.bind(Scope::View, externs);
        if (missing.ok || missing.error.find("extern not set") == std::string::npos) return false;
        if (gpu.bound_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::View)).valid()) return false;

        externs.view = ViewExtern{};
        if (!scopes.value.bind(Scope::View, externs).ok) return false;
        const BufferHandle vs = gpu.bound_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::View));
        const BufferHandle ps = gpu.bound_constant_buffer(ShaderStage::Pixel, scope_slot(Scope::View));
        if (!vs.valid() || !same_handle(vs, ps)) return false;

        // Object-bound scopes belong to the drawable and bind nothing here.
        if (!scopes.value.bind(Scope::RigidModel, Externs{}).ok) return false;
        return !gpu.bound_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::RigidModel)).valid();
    }

    bool test_failed_base_bind_still_binds_variant()
    {
        SoftwareGpuDevice gpu{};
        InMemoryAssetSource assets(gpu);
        alk_test::add_technique(assets, hash(300), 1, 10, ScopeBits::of(Scope::View));
        alk_test::add_technique(assets, hash(301), 2, 20, ScopeBits::of(Scope::Frame));

        auto scopes = ScopeRegistry::create(gpu);
        if (!scopes.ok) return false;
        Externs externs{};
        externs.frame = FrameExtern{};
        TechniqueBindContext ctx{gpu, scopes.value, externs};

        const TechniqueHandle base = assets.technique(hash(300));
        const TechniqueHandle variant = assets.technique(hash(301));
        if (!base || !variant) return false;

        const PartBindResult r = bind_part_techniques(ctx, base.get(), variant.get(), nullptr);
        if (r.ok() || r.errors.size() != 1 || r.bound != 1) return false;
        if (!r.scopes.contains(Scope::View) || !r.scopes.contains(Scope::Frame)) return false;
        if (r.errors[0].find(base->name()) == std::string::npos) return false;

        // Variant state is bound last.
        return gpu.bound_constant_buffer(ShaderStage::Pixel, 0).valid();
    }

    bool test_channel_override_uses_scratch_buffer()
    {
        SoftwareGpuDevice gpu{};
        auto scopes = ScopeRegistry::create(gpu);
        if (!scopes.ok) return false;

        TechniqueDesc desc{};
        desc.hash = hash(400);
        desc.name = "dyed";
        TechniqueShaderDesc ps{};
        ps.shader = alk_test::shader(40);
        ps.constant_slot = 3;
        ps.constants = {glm::vec4(1.0f), glm::vec4(0.5f)};
        ps.channels = {TechniqueChannel{7, 1}};
        desc.stages[(size_t)ShaderStage::Pixel] = ps;

        auto technique = Technique::create(gpu, desc);
        if (!technique.ok) return false;

        Externs externs{};
        TechniqueBindContext ctx{gpu, scopes.value, externs};
        if (!technique.value->bind(ctx, nullptr).ok) return false;
        const BufferHandle own = gpu.bound_constant_buffer(ShaderStage::Pixel, 3);

        ObjectChannels channels{};
        channels.values[7] = glm::vec4(2.0f);
        if (!technique.value->bind(ctx, &channels).ok) return false;
        const BufferHandle scratch = gpu.bound_constant_buffer(ShaderStage::Pixel, 3);
        if (!own.valid() || !scratch.valid() || same_handle(own, scratch)) return false;

        glm::vec4 patched{};
        const std::vector<uint8_t>* scratch_bytes = gpu.buffer_bytes(scratch);
        if (!scratch_bytes) return false;
        std::memcpy(&patched, scratch_bytes->data() + sizeof(glm::vec4), sizeof(glm::vec4));

        glm::vec4 shared{};
        const std::vector<uint8_t>* own_bytes = gpu.buffer_bytes(own);
        if (!own_bytes) return false;
        std::memcpy(&shared, own_bytes->data() + sizeof(glm::vec4), sizeof(glm::vec4));

        return patched == glm::vec4(2.0f) && shared == glm::vec4(0.5f);
    }

    bool test_asset_cache_loads_once()
    {
        struct Blob
        {
            int value = 0;
        };

        AssetCache<Blob> cache{};
        int loads = 0;
        const auto loader = [&loads]() -> Result<AssetCache<Blob>::Handle>
        {
            ++loads;
            return Result<AssetCache<Blob>::Handle>::success(std::make_shared<const Blob>(Blob{42}));
        };

        auto a = cache.get_or_load(hash(1), loader);
        auto b = cache.get_or_load(hash(1), loader);
        if (!a.ok || !b.ok || loads != 1 || a.value.get() != b.value.get()) return false;

        const auto failing = []() -> Result<AssetCache<Blob>::Handle>
        {
            return Result<AssetCache<Blob>::Handle>::failure("corrupt");
        };
        auto c = cache.get_or_load(hash(2), failing);
        if (c.ok || c.error.find("corrupt") == std::string::npos || cache.size() != 1) return false;
        if (cache.get_or_load(TagHash{}, loader).ok) return false;

        // Still referenced by a and b.
        if (cache.evict_unused() != 0) return false;
        a.value.reset();
        b.value.reset();
        return cache.evict_unused() == 1 && cache.size() == 0;
    }

    bool test_stage_names_round_trip()
    {
        if (parse_render_stage("transparents") != RenderStage::Transparents) return false;
        if (parse_render_stage("shadow_generate") != RenderStage::ShadowGenerate) return false;
        return !parse_render_stage("no_such_stage").has_value();
    }
}

int main()
{
    const bool ok_union = test_subscriptions_union_matches_mesh_ranges();
    const bool ok_ranges = test_partrange_list_edge_cases();
    const bool ok_variants = test_variant_resolution_wraps();
    const bool ok_scopes = test_scope_registry_requires_externs();
    const bool ok_partial = test_failed_base_bind_still_binds_variant();
    const bool ok_channels = test_channel_override_uses_scratch_buffer();
    const bool ok_cache = test_asset_cache_loads_once();
    const bool ok_names = test_stage_names_round_trip();

    if (!ok_union) std::fprintf(stderr, "[alk-tests] stage subscription union failed\n");
    if (!ok_ranges) std::fprintf(stderr, "[alk-tests] part range edge cases failed\n");
    if (!ok_variants) std::fprintf(stderr, "[alk-tests] variant wrap-around failed\n");
    if (!ok_scopes) std::fprintf(stderr, "[alk-tests] scope registry extern check failed\n");
    if (!ok_partial) std::fprintf(stderr, "[alk-tests] partial technique bind failed\n");
    if (!ok_channels) std::fprintf(stderr, "[alk-tests] channel override scratch buffer failed\n");
    if (!ok_cache) std::fprintf(stderr, "[alk-tests] asset cache load-once failed\n");
    if (!ok_names) std::fprintf(stderr, "[alk-tests] render stage names failed\n");

    if (!(ok_union && ok_ranges && ok_variants && ok_scopes && ok_partial && ok_channels && ok_cache && ok_names)) return 1;
    std::fprintf(stderr, "[alk-tests] tfx tests passed\n");
    return 0;
}

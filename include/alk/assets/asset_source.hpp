#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: asset_source.hpp
    MODULE: assets
    PURPOSE: Asset resolution interface consumed by the render core, plus an
            in-memory implementation fed with already-decoded descriptions.
*/


#include <atomic>
#include <unordered_map>
#include <utility>
#include <vector>

#include "alk/assets/asset_cache.hpp"
#include "alk/assets/gpu_buffer.hpp"
#include "alk/core/log.hpp"
#include "alk/core/tag_hash.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/tfx/technique.hpp"

namespace alk
{
    class IAssetSource
    {
    public:
        virtual ~IAssetSource() = default;

        // Null when the hash is unknown or the asset failed to load.
        virtual TechniqueHandle technique(TagHash hash) = 0;
        virtual GpuBufferHandle buffer(TagHash hash) = 0;

        // False while the background loader still has queued work.
        virtual bool is_idle() const = 0;
    };

    struct BufferSource
    {
        BufferDesc desc{};
        std::vector<uint8_t> data{};
        IndexFormat index_format = IndexFormat::U16;
    };

    class InMemoryAssetSource final : public IAssetSource
    {
    public:
        explicit InMemoryAssetSource(IGpuDevice& gpu)
            : gpu_(gpu)
        {}

        void add_technique(TechniqueDesc desc)
        {
            const TagHash h = desc.hash;
            technique_sources_[h] = std::move(desc);
        }

        void add_buffer(TagHash hash, BufferSource src)
        {
            buffer_sources_[hash] = std::move(src);
        }

        void set_idle(bool idle) { idle_.store(idle); }

        TechniqueHandle technique(TagHash hash) override
        {
            auto r = techniques_.get_or_load(hash, [&]() -> Result<TechniqueHandle>
            {
                auto it = technique_sources_.find(hash);
                if (it == technique_sources_.end()) return Result<TechniqueHandle>::failure("unknown technique");
                return Technique::create(gpu_, it->second);
            });
            if (!r.ok)
            {
                warn_once(hash, r.error);
                return nullptr;
            }
            return r.value;
        }

        GpuBufferHandle buffer(TagHash hash) override
        {
            auto r = buffers_.get_or_load(hash, [&]() -> Result<GpuBufferHandle>
            {
                auto it = buffer_sources_.find(hash);
                if (it == buffer_sources_.end()) return Result<GpuBufferHandle>::failure("unknown buffer");
                const BufferSource& src = it->second;
                return GpuBuffer::create(gpu_, src.desc, src.data.empty() ? nullptr : src.data.data(), src.index_format);
            });
            if (!r.ok)
            {
                warn_once(hash, r.error);
                return nullptr;
            }
            return r.value;
        }

        bool is_idle() const override { return idle_.load(); }

        size_t cached_techniques() const { return techniques_.size(); }
        size_t cached_buffers() const { return buffers_.size(); }

    private:
        void warn_once(TagHash hash, const std::string& error)
        {
            if (warned_.emplace(hash, true).second) log_warn("asset " + error);
        }

        IGpuDevice& gpu_;
        std::unordered_map<TagHash, TechniqueDesc> technique_sources_{};
        std::unordered_map<TagHash, BufferSource> buffer_sources_{};
        AssetCache<Technique> techniques_{};
        AssetCache<GpuBuffer> buffers_{};
        std::unordered_map<TagHash, bool> warned_{};
        std::atomic<bool> idle_{true};
    };
}

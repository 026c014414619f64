#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: asset_cache.hpp
    MODULE: assets
    PURPOSE: Content-hash keyed cache of shared, immutable assets. An entry lives
            as long as its longest-held handle once evicted from the cache.
*/


#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>

#include "alk/core/result.hpp"
#include "alk/core/tag_hash.hpp"

namespace alk
{
    template<typename T>
    class AssetCache
    {
    public:
        using Handle = std::shared_ptr<const T>;

        Handle find(TagHash hash) const
        {
            auto it = entries_.find(hash);
            return it == entries_.end() ? Handle{} : it->second;
        }

        // Loader runs only on a cache miss; failures are not cached.
        Result<Handle> get_or_load(TagHash hash, const std::function<Result<Handle>()>& loader)
        {
            if (hash.is_none()) return Result<Handle>::failure("null tag hash");
            if (Handle h = find(hash)) return Result<Handle>::success(std::move(h));

            Result<Handle> loaded = loader();
            if (!loaded.ok) return std::move(loaded).with_context(to_string(hash));
            entries_[hash] = loaded.value;
            return loaded;
        }

        // Drops entries that nothing outside the cache still references.
        size_t evict_unused()
        {
            size_t evicted = 0;
            for (auto it = entries_.begin(); it != entries_.end();)
            {
                if (it->second.use_count() == 1)
                {
                    it = entries_.erase(it);
                    ++evicted;
                }
                else
                {
                    ++it;
                }
            }
            return evicted;
        }

        size_t size() const { return entries_.size(); }
        void clear() { entries_.clear(); }

    private:
        std::unordered_map<TagHash, Handle> entries_{};
    };
}

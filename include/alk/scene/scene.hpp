#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: scene.hpp
    MODULE: scene
    PURPOSE: Minimal entity/component store the render core queries. Iteration
            follows insertion order so draw order matches authoring order.
*/


#include <cstddef>
#include <cstdint>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace alk
{
    struct Entity
    {
        uint32_t id = 0; // 0 = invalid
        constexpr bool valid() const { return id != 0; }

        friend constexpr bool operator==(Entity a, Entity b) { return a.id == b.id; }
        friend constexpr bool operator!=(Entity a, Entity b) { return a.id != b.id; }
    };

    class Scene
    {
    public:
        Entity create()
        {
            Entity e{};
            e.id = next_id_++;
            return e;
        }

        void destroy(Entity e)
        {
            for (auto& [_, store] : stores_) store->remove(e);
        }

        template<typename T, typename... Args>
        T& emplace(Entity e, Args&&... args)
        {
            return store<T>().emplace(e, T(std::forward<Args>(args)...));
        }

        template<typename T>
        T& insert(Entity e, T value)
        {
            return store<T>().emplace(e, std::move(value));
        }

        template<typename T>
        T* get(Entity e)
        {
            Store<T>* s = find_store<T>();
            return s ? s->get(e) : nullptr;
        }

        template<typename T>
        const T* get(Entity e) const
        {
            const Store<T>* s = find_store<T>();
            return s ? s->get(e) : nullptr;
        }

        template<typename T>
        bool has(Entity e) const
        {
            return get<T>(e) != nullptr;
        }

        template<typename T>
        void remove(Entity e)
        {
            if (Store<T>* s = find_store<T>()) s->remove(e);
        }

        // fn(Entity, T&) for every entity holding T, in insertion order.
        template<typename T, typename F>
        void each(F&& fn)
        {
            Store<T>* s = find_store<T>();
            if (!s) return;
            for (auto& [e, value] : s->items) fn(e, value);
        }

        template<typename T, typename F>
        void each(F&& fn) const
        {
            const Store<T>* s = find_store<T>();
            if (!s) return;
            for (const auto& [e, value] : s->items) fn(e, value);
        }

        template<typename T>
        size_t count() const
        {
            const Store<T>* s = find_store<T>();
            return s ? s->items.size() : 0;
        }

    private:
        struct IStore
        {
            virtual ~IStore() = default;
            virtual void remove(Entity e) = 0;
        };

        template<typename T>
        struct Store final : IStore
        {
            std::vector<std::pair<Entity, T>> items{};
            std::unordered_map<uint32_t, size_t> index{};

            T& emplace(Entity e, T value)
            {
                auto it = index.find(e.id);
                if (it != index.end())
                {
                    items[it->second].second = std::move(value);
                    return items[it->second].second;
                }
                index.emplace(e.id, items.size());
                items.emplace_back(e, std::move(value));
                return items.back().second;
            }

            T* get(Entity e)
            {
                auto it = index.find(e.id);
                return it == index.end() ? nullptr : &items[it->second].second;
            }

            const T* get(Entity e) const
            {
                auto it = index.find(e.id);
                return it == index.end() ? nullptr : &items[it->second].second;
            }

            void remove(Entity e) override
            {
                auto it = index.find(e.id);
                if (it == index.end()) return;
                const size_t pos = it->second;
                items.erase(items.begin() + (std::ptrdiff_t)pos);
                index.erase(it);
                for (auto& [id, i] : index)
                {
                    if (i > pos) --i;
                }
            }
        };

        template<typename T>
        Store<T>& store()
        {
            auto& slot = stores_[std::type_index(typeid(T))];
            if (!slot) slot = std::make_unique<Store<T>>();
            return static_cast<Store<T>&>(*slot);
        }

        template<typename T>
        Store<T>* find_store()
        {
            auto it = stores_.find(std::type_index(typeid(T)));
            return it == stores_.end() ? nullptr : static_cast<Store<T>*>(it->second.get());
        }

        template<typename T>
        const Store<T>* find_store() const
        {
            auto it = stores_.find(std::type_index(typeid(T)));
            return it == stores_.end() ? nullptr : static_cast<const Store<T>*>(it->second.get());
        }

        uint32_t next_id_ = 1;
        std::unordered_map<std::type_index, std::unique_ptr<IStore>> stores_{};
    };
}

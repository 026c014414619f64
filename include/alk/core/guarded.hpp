#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: guarded.hpp
    MODULE: core
    PURPOSE: Mutex-owning wrapper for a coarse resource group (G-buffer + externs).
*/


#include <mutex>
#include <utility>

namespace alk
{
    template<typename T>
    class Guarded
    {
    public:
        class Lock
        {
        public:
            Lock(std::mutex& m, T& value)
                : lock_(m), value_(&value)
            {}

            T* operator->() { return value_; }
            T& operator*() { return *value_; }

        private:
            std::unique_lock<std::mutex> lock_;
            T* value_ = nullptr;
        };

        Guarded() = default;

        explicit Guarded(T value)
            : value_(std::move(value))
        {}

        Guarded(const Guarded&) = delete;
        Guarded& operator=(const Guarded&) = delete;

        // Released when the returned guard leaves scope, on every exit path.
        Lock lock()
        {
            return Lock(mutex_, value_);
        }

    private:
        std::mutex mutex_{};
        T value_{};
    };
}

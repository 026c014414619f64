#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: result.hpp
    MODULE: core
    PURPOSE: Value-or-error return types shared by every module.
*/


#include <string>
#include <utility>

namespace alk
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        // Prefixes the error with the name of the resource that produced it.
        Result<T> with_context(const std::string& ctx) &&
        {
            if (!ok) error = ctx + ": " + error;
            return std::move(*this);
        }
    };

    struct Status
    {
        bool ok = true;
        std::string error{};

        static Status success()
        {
            return Status{};
        }

        static Status failure(std::string e)
        {
            return Status{false, std::move(e)};
        }

        template<typename T>
        static Status from(const Result<T>& r)
        {
            return r.ok ? success() : failure(r.error);
        }

        Status with_context(const std::string& ctx) &&
        {
            if (!ok) error = ctx + ": " + error;
            return std::move(*this);
        }
    };
}

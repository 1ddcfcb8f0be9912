#pragma once

/*
    ARS SIM LIB

    FILE: result.hpp
    MODULE: core
    PURPOSE: Value-or-error return type for fallible parsing (view names, config values).
*/


#include <string>
#include <utility>

namespace ars
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

        explicit operator bool() const { return ok; }
    };
}

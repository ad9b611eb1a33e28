// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "LoaderTypes.hpp"
#include <functional>
#include <string>

namespace gload
{
    /// Host-supplied asynchronous load (asset pipeline, filesystem, ...).
    class IAsyncLoadPrimitive
    {
    public:
        using Completion = std::function<void(LoadResult)>;

        /// Starts loading `name`. `on_complete` must be called exactly once,
        /// from any thread, possibly before load_async returns.
        virtual void load_async(const std::string& name, Completion on_complete) = 0;

        virtual ~IAsyncLoadPrimitive() = default;
    };
}

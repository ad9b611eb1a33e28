// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "Asset.hpp"

namespace gload
{
    /// Host-supplied synchronous instantiation of a loaded object.
    class IMaterializePrimitive
    {
    public:
        /// Throws MaterializeError (or another std::exception) on failure.
        /// `placement` may be empty.
        virtual Asset materialize(const Asset& loaded, const Asset& placement) = 0;

        virtual ~IMaterializePrimitive() = default;
    };
}

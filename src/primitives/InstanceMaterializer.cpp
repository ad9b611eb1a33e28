// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "InstanceMaterializer.hpp"
#include "LoaderTypes.hpp"

namespace gload
{
    Asset InstanceMaterializer::materialize(const Asset& loaded, const Asset& placement)
    {
        auto blob = loaded.get<Blob>();
        if (!blob)
            throw MaterializeError("Only Blob objects can be instantiated");

        Instance instance;
        instance.source = std::move(blob);
        if (placement)
        {
            auto p = placement.get<Placement>();
            if (!p)
                throw MaterializeError("Placement context is not a Placement");
            instance.placement = *p;
        }
        instance.id = next_id_.fetch_add(1);
        return Asset::make(std::move(instance));
    }
}

// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IMaterializePrimitive.hpp"
#include "FileLoadPrimitive.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace gload
{
    /// Where an instance goes. Passed as RequestSpec::placement.
    struct Placement
    {
        std::string parent{};
        std::array<float, 3> position{ 0.0f, 0.0f, 0.0f };
    };

    /// A placed copy of a loaded Blob
    struct Instance
    {
        uint64_t id{ 0 };
        std::shared_ptr<const Blob> source;
        Placement placement{};
    };

    /// Instantiates Blobs. Any other object type is rejected with MaterializeError.
    class InstanceMaterializer : public IMaterializePrimitive
    {
    public:
        Asset materialize(const Asset& loaded, const Asset& placement) override;

        uint64_t instance_count() const { return next_id_.load() - 1; }

    private:
        std::atomic<uint64_t> next_id_{ 1 };
    };
}

// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IAsyncLoadPrimitive.hpp"
#include "IExecutor.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gload
{
    /// Raw file contents
    struct Blob
    {
        std::string name;
        std::vector<std::uint8_t> bytes;

        std::string as_string() const { return std::string(bytes.begin(), bytes.end()); }
    };

    /// Reads `root / name` on a worker executor and completes with a Blob.
    class FileLoadPrimitive : public IAsyncLoadPrimitive
    {
    public:
        FileLoadPrimitive(std::filesystem::path root, IExecutor& workers);

        void load_async(const std::string& name, Completion on_complete) override;

        const std::filesystem::path& root() const { return root_; }

        /// Synchronous read, throws LoadError. Rejects names escaping the root.
        Blob read(const std::string& name) const;

    private:
        std::filesystem::path resolve(const std::string& name) const;

        std::filesystem::path root_;
        IExecutor& workers_;
    };
}

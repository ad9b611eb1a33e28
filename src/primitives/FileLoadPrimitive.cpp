// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "FileLoadPrimitive.hpp"
#include "LoaderTypes.hpp"
#include <fstream>
#include <iterator>

namespace gload
{
    FileLoadPrimitive::FileLoadPrimitive(std::filesystem::path root, IExecutor& workers)
        : root_(std::move(root))
        , workers_(workers)
    {
    }

    void FileLoadPrimitive::load_async(const std::string& name, Completion on_complete)
    {
        workers_.post([this, name, on_complete = std::move(on_complete)]()
            {
                LoadResult result;
                try
                {
                    result = LoadResult::ok(Asset::make(read(name)));
                }
                catch (const std::exception& e)
                {
                    result = LoadResult::failure(e.what());
                }
                on_complete(std::move(result));
            });
    }

    Blob FileLoadPrimitive::read(const std::string& name) const
    {
        const auto path = resolve(name);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            throw LoadError("Resource not found: " + name);

        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw LoadError("Could not open " + path.string());

        Blob blob;
        blob.name = name;
        blob.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad())
            throw LoadError("I/O error while reading " + path.string());
        return blob;
    }

    std::filesystem::path FileLoadPrimitive::resolve(const std::string& name) const
    {
        const std::filesystem::path relative(name);
        if (name.empty() || relative.is_absolute())
            throw LoadError("Invalid resource name: '" + name + "'");

        for (const auto& part : relative)
            if (part == "..")
                throw LoadError("Resource name escapes the asset root: " + name);

        return root_ / relative;
    }
}

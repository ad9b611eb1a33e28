// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ILogManager.hpp"
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace gload
{
    struct LogSettings
    {
        bool echo = true;                 // mirror lines to stderr
        std::filesystem::path file{};     // append to this file if non-empty
        size_t history = 1000;            // lines kept in memory
    };

    /// Thread-safe logger. Each line gets a relative time stamp prefix.
    class LogManager : public ILogManager
    {
    public:
        LogManager();
        explicit LogManager(LogSettings settings);
        ~LogManager();

        void log(const char* fmt, ...) override;
        void clear() override;

        /// Snapshot of the retained lines, oldest first (no trailing newline)
        std::vector<std::string> lines() const;

        /// Number of lines logged since construction or the last clear()
        size_t line_count() const;

    private:
        struct Sink;
        std::unique_ptr<Sink> sink_ptr;
    };
}

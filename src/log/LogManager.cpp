// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogManager.hpp"
#include <cstdarg>
#include <cstdio>
#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <iostream>
#include <deque>
#include <mutex>

namespace
{
    std::string format_string(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int length = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (length <= 0)
            return {};

        std::string buffer(length, '\0');
        vsnprintf(buffer.data(), length + 1, fmt, args);
        return buffer;
    }

    std::string relative_time_string()
    {
        using namespace std::chrono;
        static auto start = steady_clock::now();
        auto now = steady_clock::now();
        auto elapsed = duration_cast<milliseconds>(now - start);

        int seconds = static_cast<int>(elapsed.count() / 1000);
        int millis = static_cast<int>(elapsed.count() % 1000);

        std::ostringstream oss;
        oss << "[+" << seconds << '.' << std::setw(3) << std::setfill('0') << millis << ']';
        return oss.str();
    }
}

namespace gload
{
    struct LogManager::Sink
    {
        LogSettings settings;
        std::ofstream file;
        std::deque<std::string> history;
        size_t count = 0;
        mutable std::mutex mutex;

        explicit Sink(LogSettings s)
            : settings(std::move(s))
        {
            if (!settings.file.empty())
            {
                file.open(settings.file, std::ios::app);
                if (!file)
                    std::cerr << "[WARN] Could not open log file " << settings.file.string() << std::endl;
            }
        }

        void clear()
        {
            std::lock_guard lock(mutex);
            history.clear();
            count = 0;
        }

        void add_log(const std::string& line)
        {
            std::lock_guard lock(mutex);
            ++count;
            if (settings.history > 0)
            {
                history.push_back(line);
                while (history.size() > settings.history)
                    history.pop_front();
            }
            if (settings.echo)
                std::cerr << line << '\n';
            if (file.is_open())
                file << line << '\n' << std::flush;
        }
    };

    // ---- LogManager public interface ----

    LogManager::LogManager()
        : sink_ptr(std::make_unique<Sink>(LogSettings{}))
    {
    }

    LogManager::LogManager(LogSettings settings)
        : sink_ptr(std::make_unique<Sink>(std::move(settings)))
    {
    }

    LogManager::~LogManager() = default;

    void LogManager::log(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string formatted = format_string(fmt, args);
        va_end(args);

        // Relative time stamp
        sink_ptr->add_log(relative_time_string() + " " + formatted);
    }

    void LogManager::clear()
    {
        sink_ptr->clear();
    }

    std::vector<std::string> LogManager::lines() const
    {
        std::lock_guard lock(sink_ptr->mutex);
        return { sink_ptr->history.begin(), sink_ptr->history.end() };
    }

    size_t LogManager::line_count() const
    {
        std::lock_guard lock(sink_ptr->mutex);
        return sink_ptr->count;
    }
}

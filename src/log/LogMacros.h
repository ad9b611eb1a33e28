// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "LogGlobals.hpp"

// Context loggers, e.g. GLOAD_LOG(ctx, "...") with a LoaderContext*
#define GLOAD_LOG(ctx, ...)        (ctx)->log_manager->log(__VA_ARGS__)

// Global logger (no-op until LogGlobals::set_logger has been called)
#define GLOAD_LOG_INFO(...)   ::gload::LogGlobals::log("[INFO] " __VA_ARGS__)
#define GLOAD_LOG_WARN(...)   ::gload::LogGlobals::log("[WARN] " __VA_ARGS__)
#define GLOAD_LOG_ERROR(...)  ::gload::LogGlobals::log("[ERROR] " __VA_ARGS__)

// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <functional>

/// Something that runs posted tasks, now or later, on some thread.
struct IExecutor
{
    virtual ~IExecutor() = default;
    virtual void post(std::function<void()> fn) = 0;
};

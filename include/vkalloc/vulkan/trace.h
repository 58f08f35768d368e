// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

namespace vkalloc {
namespace vulkan {

// Whether memory operations and capability probing log their arguments and
// outcomes at INFO. Read once from VKALLOC_TRACE_MEMORY_OPS.
bool trace_memory_ops_enabled() noexcept;

// Replace the cached value; nullopt restores the environment value.
void debug_set_trace_memory_ops_for_testing(std::optional<bool> enabled) noexcept;

} // namespace vulkan
} // namespace vkalloc

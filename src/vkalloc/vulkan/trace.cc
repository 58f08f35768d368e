// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "vkalloc/vulkan/trace.h"

#include <atomic>
#include <cstdlib>
#include <mutex>

#include "vkalloc/core/env.h"

namespace vkalloc {
namespace vulkan {

namespace {
std::once_flag    g_env_once;
bool              g_env_enabled{false};
// -1: follow the environment, 0/1: forced by tests.
std::atomic<int>  g_override{-1};

bool env_enabled() {
  std::call_once(g_env_once, [] {
    g_env_enabled = core::is_truthy_env(std::getenv("VKALLOC_TRACE_MEMORY_OPS"));
  });
  return g_env_enabled;
}
} // namespace

bool trace_memory_ops_enabled() noexcept {
  const int forced = g_override.load(std::memory_order_relaxed);
  if (forced >= 0) return forced != 0;
  return env_enabled();
}

void debug_set_trace_memory_ops_for_testing(std::optional<bool> enabled) noexcept {
  g_override.store(enabled ? (*enabled ? 1 : 0) : -1, std::memory_order_relaxed);
}

} // namespace vulkan
} // namespace vkalloc

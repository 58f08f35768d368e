// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <cassert>
#include <absl/log/check.h>
#include <absl/log/log.h>

namespace vkalloc {
// Initialize Abseil logging once; optionally set min log level.
void InitLogging(std::optional<int> min_level);

// InitLogging with the level taken from VKALLOC_LOG_LEVEL, if set and valid.
void InitLoggingFromEnv();
}

// Shorthand macros. VKALLOC_CHECK and VKALLOC_LOG(FATAL) abort with a
// diagnostic and are reserved for broken invariants.
#define VKALLOC_LOG(level) LOG(level)
#define VKALLOC_CHECK(cond) CHECK(cond)
#define VKALLOC_ASSERT(cond) assert(cond)

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

namespace vkalloc {
namespace core {

// "1", "true" or "yes" (case-insensitive). nullptr and "" are false.
bool is_truthy_env(const char* v);

// Parse an Abseil severity from an environment value: "info", "warning"/"warn",
// "error"/"err", "fatal", or a decimal 0..3. Returns nullopt for anything else.
std::optional<int> parse_log_level(const char* v);

} // namespace core
} // namespace vkalloc

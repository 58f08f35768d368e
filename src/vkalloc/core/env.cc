// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "vkalloc/core/env.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace vkalloc {
namespace core {

namespace {
std::string to_lower(const char* v) {
  std::string s(v);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}
} // namespace

bool is_truthy_env(const char* v) {
  if (!v || *v == '\0') return false;
  const std::string s = to_lower(v);
  return s == "1" || s == "true" || s == "yes";
}

std::optional<int> parse_log_level(const char* v) {
  if (!v || *v == '\0') return std::nullopt;
  const std::string s = to_lower(v);
  if (s == "info" || s == "0") return 0;
  if (s == "warning" || s == "warn" || s == "1") return 1;
  if (s == "error" || s == "err" || s == "2") return 2;
  if (s == "fatal" || s == "3") return 3;
  return std::nullopt;
}

} // namespace core
} // namespace vkalloc

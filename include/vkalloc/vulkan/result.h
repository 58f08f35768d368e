// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <vulkan/vulkan.h>

namespace vkalloc {
namespace vulkan {

// Canonical enumerant spelling, e.g. "VK_ERROR_OUT_OF_DEVICE_MEMORY".
// Values unknown to this build map to "VK_RESULT_UNKNOWN".
const char* result_name(VkResult result) noexcept;

// A Vulkan call failed with a code the caller is expected to handle.
class VulkanError : public std::runtime_error {
 public:
  VulkanError(const char* call, VkResult result);

  VkResult result() const noexcept { return result_; }

 private:
  VkResult result_;
};

} // namespace vulkan
} // namespace vkalloc

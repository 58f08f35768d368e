// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "vkalloc/vulkan/result.h"

namespace vkalloc {
namespace vulkan {

const char* result_name(VkResult result) noexcept {
#define VKALLOC_RESULT_CASE(r) \
  case r:                      \
    return #r
  switch (result) {
    VKALLOC_RESULT_CASE(VK_SUCCESS);
    VKALLOC_RESULT_CASE(VK_NOT_READY);
    VKALLOC_RESULT_CASE(VK_TIMEOUT);
    VKALLOC_RESULT_CASE(VK_EVENT_SET);
    VKALLOC_RESULT_CASE(VK_EVENT_RESET);
    VKALLOC_RESULT_CASE(VK_INCOMPLETE);
    VKALLOC_RESULT_CASE(VK_ERROR_OUT_OF_HOST_MEMORY);
    VKALLOC_RESULT_CASE(VK_ERROR_OUT_OF_DEVICE_MEMORY);
    VKALLOC_RESULT_CASE(VK_ERROR_INITIALIZATION_FAILED);
    VKALLOC_RESULT_CASE(VK_ERROR_DEVICE_LOST);
    VKALLOC_RESULT_CASE(VK_ERROR_MEMORY_MAP_FAILED);
    VKALLOC_RESULT_CASE(VK_ERROR_LAYER_NOT_PRESENT);
    VKALLOC_RESULT_CASE(VK_ERROR_EXTENSION_NOT_PRESENT);
    VKALLOC_RESULT_CASE(VK_ERROR_FEATURE_NOT_PRESENT);
    VKALLOC_RESULT_CASE(VK_ERROR_INCOMPATIBLE_DRIVER);
    VKALLOC_RESULT_CASE(VK_ERROR_TOO_MANY_OBJECTS);
    VKALLOC_RESULT_CASE(VK_ERROR_FORMAT_NOT_SUPPORTED);
    VKALLOC_RESULT_CASE(VK_ERROR_FRAGMENTED_POOL);
    VKALLOC_RESULT_CASE(VK_ERROR_UNKNOWN);
    VKALLOC_RESULT_CASE(VK_ERROR_OUT_OF_POOL_MEMORY);
    VKALLOC_RESULT_CASE(VK_ERROR_INVALID_EXTERNAL_HANDLE);
    VKALLOC_RESULT_CASE(VK_ERROR_FRAGMENTATION);
    VKALLOC_RESULT_CASE(VK_ERROR_INVALID_OPAQUE_CAPTURE_ADDRESS);
    VKALLOC_RESULT_CASE(VK_ERROR_SURFACE_LOST_KHR);
    VKALLOC_RESULT_CASE(VK_ERROR_NATIVE_WINDOW_IN_USE_KHR);
    VKALLOC_RESULT_CASE(VK_SUBOPTIMAL_KHR);
    VKALLOC_RESULT_CASE(VK_ERROR_OUT_OF_DATE_KHR);
    VKALLOC_RESULT_CASE(VK_ERROR_VALIDATION_FAILED_EXT);
    default:
      break;
  }
#undef VKALLOC_RESULT_CASE
  return "VK_RESULT_UNKNOWN";
}

VulkanError::VulkanError(const char* call, VkResult result)
    : std::runtime_error(std::string(call ? call : "vulkan") + ": " + result_name(result) +
                         " (" + std::to_string(static_cast<int>(result)) + ")"),
      result_(result) {}

} // namespace vulkan
} // namespace vkalloc

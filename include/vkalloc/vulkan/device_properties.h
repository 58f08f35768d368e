// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <vulkan/vulkan.h>

#include "vkalloc/alloc/types.h"
#include "vkalloc/vulkan/dispatch.h"

namespace vkalloc {
namespace vulkan {

// Extensions that gate the optional queries, in slot order.
enum class ProbeExtension : std::uint8_t {
  GetPhysicalDeviceProperties2 = 0,  // vkGetPhysicalDevice{Properties,Features}2, core in 1.1
  Maintenance3 = 1,                  // maxMemoryAllocationSize, core in 1.1
  BufferDeviceAddress = 2,           // bufferDeviceAddress feature, core in 1.2
};

inline constexpr std::size_t kNumProbeExtensions = 3;

// Per slot: the extension name if it still has to be found among the device
// extensions, nullptr once it is known to be available.
using RequiredExtensions = std::array<const char*, kNumProbeExtensions>;

// Which optional queries device_properties() issues.
struct QueryPlan {
  bool query_properties2{false};  // VkPhysicalDeviceMaintenance3Properties
  bool query_features2{false};    // VkPhysicalDeviceBufferDeviceAddressFeatures
};

// Extensions not already promoted to core at `version`'s minor number:
// 1.0 needs all three, 1.1 only VK_KHR_buffer_device_address, 1.2+ none.
RequiredExtensions required_extensions_for_version(std::uint32_t version) noexcept;

bool any_required(const RequiredExtensions& required) noexcept;

// Clear every slot whose name appears in `available`. Stops scanning once all
// slots are clear.
void mark_available_extensions(RequiredExtensions& required,
                               std::span<const VkExtensionProperties> available) noexcept;

// Decide the query path from the slots left after mark_available_extensions.
QueryPlan plan_from_missing(const RequiredExtensions& missing) noexcept;

// Collect the allocator-facing device facts for `physical_device`.
//
// Caller obligations (not checked):
// - `version` does not exceed the API version the instance was created with;
// - `physical_device` was enumerated from `instance`.
//
// A returned `buffer_device_address == true` only says the device can do it.
// The caller must still enable the bufferDeviceAddress feature (and
// VK_KHR_buffer_device_address before 1.2) at device creation, or clear the
// field before handing the record to the allocator.
//
// Throws VulkanError when enumerating device extensions fails.
alloc::DeviceProperties device_properties(const Instance& instance,
                                          std::uint32_t version,
                                          VkPhysicalDevice physical_device);

} // namespace vulkan
} // namespace vkalloc

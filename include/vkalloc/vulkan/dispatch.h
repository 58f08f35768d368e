// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vulkan/vulkan.h>

namespace vkalloc {
namespace vulkan {

// Instance-level entry points used by device_properties(). The `...2` queries
// are core in 1.1 and resolve to their KHR aliases when only
// VK_KHR_get_physical_device_properties2 is available; they may be null.
struct InstanceFunctions {
  PFN_vkGetDeviceProcAddr                      vkGetDeviceProcAddr{nullptr};
  PFN_vkGetPhysicalDeviceMemoryProperties      vkGetPhysicalDeviceMemoryProperties{nullptr};
  PFN_vkGetPhysicalDeviceProperties            vkGetPhysicalDeviceProperties{nullptr};
  PFN_vkGetPhysicalDeviceProperties2           vkGetPhysicalDeviceProperties2{nullptr};
  PFN_vkGetPhysicalDeviceFeatures2             vkGetPhysicalDeviceFeatures2{nullptr};
  PFN_vkEnumerateDeviceExtensionProperties     vkEnumerateDeviceExtensionProperties{nullptr};
};

// Device-level memory entry points used by VulkanMemoryDevice.
struct DeviceFunctions {
  PFN_vkAllocateMemory                 vkAllocateMemory{nullptr};
  PFN_vkFreeMemory                     vkFreeMemory{nullptr};
  PFN_vkMapMemory                      vkMapMemory{nullptr};
  PFN_vkUnmapMemory                    vkUnmapMemory{nullptr};
  PFN_vkFlushMappedMemoryRanges        vkFlushMappedMemoryRanges{nullptr};
  PFN_vkInvalidateMappedMemoryRanges   vkInvalidateMappedMemoryRanges{nullptr};
};

// A borrowed VkInstance paired with its dispatch table. Does not destroy the
// instance.
struct Instance {
  VkInstance        handle{VK_NULL_HANDLE};
  InstanceFunctions fns{};
};

// A borrowed VkDevice paired with its dispatch table. Does not destroy the
// device.
struct Device {
  VkDevice        handle{VK_NULL_HANDLE};
  DeviceFunctions fns{};
};

// Resolve instance entry points through `get_instance_proc_addr`.
// Throws std::runtime_error naming the first missing 1.0 entry point.
Instance load_instance(VkInstance instance, PFN_vkGetInstanceProcAddr get_instance_proc_addr);

// As above, through the Vulkan loader this library links against.
Instance load_instance(VkInstance instance);

// Resolve device entry points through instance.fns.vkGetDeviceProcAddr.
// Throws std::runtime_error naming the first missing entry point.
Device load_device(const Instance& instance, VkDevice device);

} // namespace vulkan
} // namespace vkalloc

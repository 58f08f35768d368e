// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "vkalloc/vulkan/device_properties.h"

#include <cstring>
#include <vector>

#include "vkalloc/logging/logging.h"
#include "vkalloc/vulkan/memory_flags.h"
#include "vkalloc/vulkan/result.h"
#include "vkalloc/vulkan/trace.h"

namespace vkalloc {
namespace vulkan {

namespace {

constexpr int kMaxEnumerateAttempts = 8;

constexpr std::size_t slot(ProbeExtension e) noexcept { return static_cast<std::size_t>(e); }

std::vector<VkExtensionProperties> enumerate_device_extensions(const Instance& instance,
                                                               VkPhysicalDevice physical_device) {
  const PFN_vkEnumerateDeviceExtensionProperties enumerate =
      instance.fns.vkEnumerateDeviceExtensionProperties;
  VKALLOC_CHECK(enumerate != nullptr) << "vkEnumerateDeviceExtensionProperties not loaded";

  std::vector<VkExtensionProperties> exts;
  for (int attempt = 0; attempt < kMaxEnumerateAttempts; ++attempt) {
    std::uint32_t count = 0;
    VkResult r = enumerate(physical_device, nullptr, &count, nullptr);
    if (r != VK_SUCCESS) {
      throw VulkanError("vkEnumerateDeviceExtensionProperties", r);
    }
    exts.resize(count);
    if (count == 0) return exts;

    r = enumerate(physical_device, nullptr, &count, exts.data());
    if (r == VK_SUCCESS) {
      exts.resize(count);
      return exts;
    }
    if (r != VK_INCOMPLETE) {
      throw VulkanError("vkEnumerateDeviceExtensionProperties", r);
    }
    // The list grew between the two calls; ask again.
  }
  VKALLOC_LOG(WARNING) << "[vkalloc][probe] device extension list kept changing after "
                       << kMaxEnumerateAttempts << " attempts";
  throw VulkanError("vkEnumerateDeviceExtensionProperties", VK_INCOMPLETE);
}

} // namespace

RequiredExtensions required_extensions_for_version(std::uint32_t version) noexcept {
  RequiredExtensions required{
      VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME,
      VK_KHR_MAINTENANCE_3_EXTENSION_NAME,
      VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME,
  };
  switch (VK_API_VERSION_MINOR(version)) {
    case 0:
      break;
    case 1:
      required[slot(ProbeExtension::GetPhysicalDeviceProperties2)] = nullptr;
      required[slot(ProbeExtension::Maintenance3)] = nullptr;
      break;
    default:
      required.fill(nullptr);
      break;
  }
  return required;
}

bool any_required(const RequiredExtensions& required) noexcept {
  for (const char* name : required) {
    if (name != nullptr) return true;
  }
  return false;
}

void mark_available_extensions(RequiredExtensions& required,
                               std::span<const VkExtensionProperties> available) noexcept {
  std::size_t to_find = 0;
  for (const char* name : required) {
    if (name != nullptr) ++to_find;
  }

  for (const VkExtensionProperties& ext : available) {
    if (to_find == 0) break;
    for (const char*& name : required) {
      if (name != nullptr &&
          std::strncmp(name, ext.extensionName, VK_MAX_EXTENSION_NAME_SIZE) == 0) {
        name = nullptr;
        --to_find;
        break;
      }
    }
  }
}

QueryPlan plan_from_missing(const RequiredExtensions& missing) noexcept {
  const bool props2 = missing[slot(ProbeExtension::GetPhysicalDeviceProperties2)] == nullptr;
  const bool maintenance3 = missing[slot(ProbeExtension::Maintenance3)] == nullptr;
  const bool bda = missing[slot(ProbeExtension::BufferDeviceAddress)] == nullptr;
  QueryPlan plan;
  plan.query_properties2 = props2 && maintenance3;
  plan.query_features2 = props2 && bda;
  return plan;
}

alloc::DeviceProperties device_properties(const Instance& instance,
                                          std::uint32_t version,
                                          VkPhysicalDevice physical_device) {
  const InstanceFunctions& fns = instance.fns;
  VKALLOC_CHECK(fns.vkGetPhysicalDeviceMemoryProperties != nullptr)
      << "vkGetPhysicalDeviceMemoryProperties not loaded";

  VkPhysicalDeviceMemoryProperties memory_properties{};
  fns.vkGetPhysicalDeviceMemoryProperties(physical_device, &memory_properties);

  RequiredExtensions required = required_extensions_for_version(version);
  const bool enumerated = any_required(required);
  if (enumerated) {
    const std::vector<VkExtensionProperties> exts =
        enumerate_device_extensions(instance, physical_device);
    mark_available_extensions(required, exts);
  }
  const QueryPlan plan = plan_from_missing(required);

  if (trace_memory_ops_enabled()) {
    VKALLOC_LOG(INFO) << "[vkalloc][probe] version=" << VK_API_VERSION_MAJOR(version) << "."
                      << VK_API_VERSION_MINOR(version)
                      << " enumerated_extensions=" << enumerated
                      << " properties2=" << plan.query_properties2
                      << " features2=" << plan.query_features2;
  }

  alloc::DeviceProperties out;

  VkPhysicalDeviceLimits limits{};
  if (plan.query_properties2) {
    VKALLOC_CHECK(fns.vkGetPhysicalDeviceProperties2 != nullptr)
        << "vkGetPhysicalDeviceProperties2 not loaded for the selected query path";

    VkPhysicalDeviceMaintenance3Properties maintenance3{};
    maintenance3.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_MAINTENANCE_3_PROPERTIES;
    VkPhysicalDeviceProperties2 properties{};
    properties.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_PROPERTIES_2;
    properties.pNext = &maintenance3;
    fns.vkGetPhysicalDeviceProperties2(physical_device, &properties);

    limits = properties.properties.limits;
    out.max_memory_allocation_size = maintenance3.maxMemoryAllocationSize;
  } else {
    VKALLOC_CHECK(fns.vkGetPhysicalDeviceProperties != nullptr)
        << "vkGetPhysicalDeviceProperties not loaded";

    VkPhysicalDeviceProperties properties{};
    fns.vkGetPhysicalDeviceProperties(physical_device, &properties);
    limits = properties.limits;
  }

  if (plan.query_features2) {
    VKALLOC_CHECK(fns.vkGetPhysicalDeviceFeatures2 != nullptr)
        << "vkGetPhysicalDeviceFeatures2 not loaded for the selected query path";

    VkPhysicalDeviceBufferDeviceAddressFeatures bda{};
    bda.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_BUFFER_DEVICE_ADDRESS_FEATURES;
    VkPhysicalDeviceFeatures2 features{};
    features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features.pNext = &bda;
    fns.vkGetPhysicalDeviceFeatures2(physical_device, &features);

    out.buffer_device_address = bda.bufferDeviceAddress != VK_FALSE;
  }

  out.memory_types.reserve(memory_properties.memoryTypeCount);
  for (std::uint32_t i = 0; i < memory_properties.memoryTypeCount; ++i) {
    const VkMemoryType& t = memory_properties.memoryTypes[i];
    out.memory_types.push_back(
        alloc::MemoryType{memory_properties_from(t.propertyFlags), t.heapIndex});
  }
  out.memory_heaps.reserve(memory_properties.memoryHeapCount);
  for (std::uint32_t i = 0; i < memory_properties.memoryHeapCount; ++i) {
    out.memory_heaps.push_back(alloc::MemoryHeap{memory_properties.memoryHeaps[i].size});
  }

  out.max_memory_allocation_count = limits.maxMemoryAllocationCount;
  out.non_coherent_atom_size = limits.nonCoherentAtomSize;
  return out;
}

} // namespace vulkan
} // namespace vkalloc

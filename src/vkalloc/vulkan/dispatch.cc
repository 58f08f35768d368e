// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "vkalloc/vulkan/dispatch.h"

#include <stdexcept>
#include <string>

namespace vkalloc {
namespace vulkan {

namespace {

template <typename Pfn>
Pfn instance_proc(PFN_vkGetInstanceProcAddr gipa, VkInstance instance, const char* name) {
  return reinterpret_cast<Pfn>(gipa(instance, name));
}

template <typename Pfn>
Pfn device_proc(PFN_vkGetDeviceProcAddr gdpa, VkDevice device, const char* name) {
  return reinterpret_cast<Pfn>(gdpa(device, name));
}

[[noreturn]] void throw_missing(const char* what, const char* name) {
  throw std::runtime_error(std::string(what) + ": missing entry point " + name);
}

} // namespace

#define VKALLOC_LOAD_INSTANCE(fns, name)                                      \
  do {                                                                        \
    (fns).name = instance_proc<PFN_##name>(get_instance_proc_addr, instance, #name); \
    if ((fns).name == nullptr) throw_missing("load_instance", #name);         \
  } while (0)

Instance load_instance(VkInstance instance, PFN_vkGetInstanceProcAddr get_instance_proc_addr) {
  if (get_instance_proc_addr == nullptr) {
    throw std::runtime_error("load_instance: vkGetInstanceProcAddr is null");
  }
  if (instance == VK_NULL_HANDLE) {
    throw std::runtime_error("load_instance: instance is VK_NULL_HANDLE");
  }

  Instance out;
  out.handle = instance;
  InstanceFunctions& fns = out.fns;

  VKALLOC_LOAD_INSTANCE(fns, vkGetDeviceProcAddr);
  VKALLOC_LOAD_INSTANCE(fns, vkGetPhysicalDeviceMemoryProperties);
  VKALLOC_LOAD_INSTANCE(fns, vkGetPhysicalDeviceProperties);
  VKALLOC_LOAD_INSTANCE(fns, vkEnumerateDeviceExtensionProperties);

  // Optional: core names first, then the KHR aliases.
  fns.vkGetPhysicalDeviceProperties2 = instance_proc<PFN_vkGetPhysicalDeviceProperties2>(
      get_instance_proc_addr, instance, "vkGetPhysicalDeviceProperties2");
  if (fns.vkGetPhysicalDeviceProperties2 == nullptr) {
    fns.vkGetPhysicalDeviceProperties2 = instance_proc<PFN_vkGetPhysicalDeviceProperties2>(
        get_instance_proc_addr, instance, "vkGetPhysicalDeviceProperties2KHR");
  }
  fns.vkGetPhysicalDeviceFeatures2 = instance_proc<PFN_vkGetPhysicalDeviceFeatures2>(
      get_instance_proc_addr, instance, "vkGetPhysicalDeviceFeatures2");
  if (fns.vkGetPhysicalDeviceFeatures2 == nullptr) {
    fns.vkGetPhysicalDeviceFeatures2 = instance_proc<PFN_vkGetPhysicalDeviceFeatures2>(
        get_instance_proc_addr, instance, "vkGetPhysicalDeviceFeatures2KHR");
  }
  return out;
}

#undef VKALLOC_LOAD_INSTANCE

Instance load_instance(VkInstance instance) {
  return load_instance(instance, &vkGetInstanceProcAddr);
}

#define VKALLOC_LOAD_DEVICE(fns, name)                                        \
  do {                                                                        \
    (fns).name = device_proc<PFN_##name>(gdpa, device, #name);                \
    if ((fns).name == nullptr) throw_missing("load_device", #name);           \
  } while (0)

Device load_device(const Instance& instance, VkDevice device) {
  PFN_vkGetDeviceProcAddr gdpa = instance.fns.vkGetDeviceProcAddr;
  if (gdpa == nullptr) {
    throw std::runtime_error("load_device: instance has no vkGetDeviceProcAddr");
  }
  if (device == VK_NULL_HANDLE) {
    throw std::runtime_error("load_device: device is VK_NULL_HANDLE");
  }

  Device out;
  out.handle = device;
  DeviceFunctions& fns = out.fns;

  VKALLOC_LOAD_DEVICE(fns, vkAllocateMemory);
  VKALLOC_LOAD_DEVICE(fns, vkFreeMemory);
  VKALLOC_LOAD_DEVICE(fns, vkMapMemory);
  VKALLOC_LOAD_DEVICE(fns, vkUnmapMemory);
  VKALLOC_LOAD_DEVICE(fns, vkFlushMappedMemoryRanges);
  VKALLOC_LOAD_DEVICE(fns, vkInvalidateMappedMemoryRanges);
  return out;
}

#undef VKALLOC_LOAD_DEVICE

} // namespace vulkan
} // namespace vkalloc

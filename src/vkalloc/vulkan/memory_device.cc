// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "vkalloc/vulkan/memory_device.h"

#include <ios>
#include <limits>

#include <absl/container/inlined_vector.h>

#include "vkalloc/logging/logging.h"
#include "vkalloc/vulkan/result.h"
#include "vkalloc/vulkan/trace.h"

namespace vkalloc {
namespace vulkan {

namespace {

using alloc::AllocationFlags;
using alloc::DeviceMapError;
using alloc::DeviceMapFailure;
using alloc::MappedMemoryRange;
using alloc::OutOfMemory;
using alloc::OutOfMemoryError;

// Typical batches are a handful of ranges; larger ones spill to the heap.
using RangeBuffer = absl::InlinedVector<VkMappedMemoryRange, 4>;

[[noreturn]] void unexpected_result(const char* call, VkResult r) {
  VKALLOC_LOG(FATAL) << "Unexpected Vulkan error: " << result_name(r) << " ("
                     << static_cast<int>(r) << ") from " << call;
}

RangeBuffer to_vk_ranges(std::span<const MappedMemoryRange<VkDeviceMemory>> ranges) {
  VKALLOC_CHECK(ranges.size() <= std::numeric_limits<std::uint32_t>::max())
      << "mapped memory range batch too large: " << ranges.size();
  RangeBuffer out;
  out.reserve(ranges.size());
  for (const auto& r : ranges) {
    VkMappedMemoryRange vr{};
    vr.sType = VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE;
    vr.pNext = nullptr;
    vr.memory = *r.memory;
    vr.offset = r.offset;
    vr.size = r.size;
    out.push_back(vr);
  }
  return out;
}

// Shared by flush and invalidate; both may only fail with the two OOM codes.
void check_range_result(const char* call, VkResult r) {
  switch (r) {
    case VK_SUCCESS:
      return;
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
      throw OutOfMemoryError(OutOfMemory::OutOfDeviceMemory);
    case VK_ERROR_OUT_OF_HOST_MEMORY:
      throw OutOfMemoryError(OutOfMemory::OutOfHostMemory);
    default:
      unexpected_result(call, r);
  }
}

} // namespace

VkDeviceMemory VulkanMemoryDevice::allocate_memory(std::uint64_t size,
                                                   std::uint32_t memory_type,
                                                   AllocationFlags flags) const {
  VKALLOC_CHECK(!flags.has_unknown_bits())
      << "allocate_memory: unsupported allocation flags 0x" << std::hex << flags.bits();

  VkMemoryAllocateInfo info{};
  info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
  info.pNext = nullptr;
  info.allocationSize = size;
  info.memoryTypeIndex = memory_type;

  VkMemoryAllocateFlagsInfo flags_info{};
  if (flags.contains(AllocationFlags::DeviceAddress())) {
    flags_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_FLAGS_INFO;
    flags_info.pNext = nullptr;
    flags_info.flags = VK_MEMORY_ALLOCATE_DEVICE_ADDRESS_BIT;
    flags_info.deviceMask = 0;
    info.pNext = &flags_info;
  }

  VkDeviceMemory memory = VK_NULL_HANDLE;
  const VkResult r = device_.fns.vkAllocateMemory(device_.handle, &info, nullptr, &memory);

  if (trace_memory_ops_enabled()) {
    VKALLOC_LOG(INFO) << "[vkalloc][memory] allocate size=" << size
                      << " type=" << memory_type << " flags=0x" << std::hex << flags.bits()
                      << std::dec << " -> " << result_name(r);
  }

  switch (r) {
    case VK_SUCCESS:
      return memory;
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
      throw OutOfMemoryError(OutOfMemory::OutOfDeviceMemory);
    case VK_ERROR_OUT_OF_HOST_MEMORY:
      throw OutOfMemoryError(OutOfMemory::OutOfHostMemory);
    default:
      unexpected_result("vkAllocateMemory", r);
  }
}

void VulkanMemoryDevice::deallocate_memory(VkDeviceMemory memory) const noexcept {
  if (trace_memory_ops_enabled()) {
    VKALLOC_LOG(INFO) << "[vkalloc][memory] free";
  }
  device_.fns.vkFreeMemory(device_.handle, memory, nullptr);
}

std::byte* VulkanMemoryDevice::map_memory(VkDeviceMemory& memory,
                                          std::uint64_t offset,
                                          std::uint64_t size) const {
  void* ptr = nullptr;
  const VkResult r =
      device_.fns.vkMapMemory(device_.handle, memory, offset, size, /*flags=*/0, &ptr);

  if (trace_memory_ops_enabled()) {
    VKALLOC_LOG(INFO) << "[vkalloc][memory] map offset=" << offset << " size=" << size
                      << " -> " << result_name(r);
  }

  switch (r) {
    case VK_SUCCESS:
      VKALLOC_CHECK(ptr != nullptr) << "Pointer to memory mapping must not be null";
      return static_cast<std::byte*>(ptr);
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:
      throw DeviceMapFailure(DeviceMapError::OutOfDeviceMemory);
    case VK_ERROR_OUT_OF_HOST_MEMORY:
      throw DeviceMapFailure(DeviceMapError::OutOfHostMemory);
    case VK_ERROR_MEMORY_MAP_FAILED:
      throw DeviceMapFailure(DeviceMapError::MapFailed);
    default:
      unexpected_result("vkMapMemory", r);
  }
}

void VulkanMemoryDevice::unmap_memory(VkDeviceMemory& memory) const noexcept {
  if (trace_memory_ops_enabled()) {
    VKALLOC_LOG(INFO) << "[vkalloc][memory] unmap";
  }
  device_.fns.vkUnmapMemory(device_.handle, memory);
}

void VulkanMemoryDevice::invalidate_memory_ranges(
    std::span<const MappedMemoryRange<VkDeviceMemory>> ranges) const {
  if (ranges.empty()) return;
  const RangeBuffer vk_ranges = to_vk_ranges(ranges);
  const VkResult r = device_.fns.vkInvalidateMappedMemoryRanges(
      device_.handle, static_cast<std::uint32_t>(vk_ranges.size()), vk_ranges.data());

  if (trace_memory_ops_enabled()) {
    VKALLOC_LOG(INFO) << "[vkalloc][memory] invalidate ranges=" << vk_ranges.size()
                      << " -> " << result_name(r);
  }
  check_range_result("vkInvalidateMappedMemoryRanges", r);
}

void VulkanMemoryDevice::flush_memory_ranges(
    std::span<const MappedMemoryRange<VkDeviceMemory>> ranges) const {
  if (ranges.empty()) return;
  const RangeBuffer vk_ranges = to_vk_ranges(ranges);
  const VkResult r = device_.fns.vkFlushMappedMemoryRanges(
      device_.handle, static_cast<std::uint32_t>(vk_ranges.size()), vk_ranges.data());

  if (trace_memory_ops_enabled()) {
    VKALLOC_LOG(INFO) << "[vkalloc][memory] flush ranges=" << vk_ranges.size()
                      << " -> " << result_name(r);
  }
  check_range_result("vkFlushMappedMemoryRanges", r);
}

} // namespace vulkan
} // namespace vkalloc

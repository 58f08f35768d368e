// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <vulkan/vulkan.h>

#include "vkalloc/alloc/memory_device.h"
#include "vkalloc/vulkan/dispatch.h"

namespace vkalloc {
namespace vulkan {

// MemoryDevice over a borrowed vulkan::Device. Holds only the reference; the
// Device must outlive every call. No locking: concurrent use of one
// VkDeviceMemory must be synchronized by the caller.
//
// Error mapping:
//   allocate / flush / invalidate:
//     VK_ERROR_OUT_OF_DEVICE_MEMORY -> OutOfMemory::OutOfDeviceMemory
//     VK_ERROR_OUT_OF_HOST_MEMORY   -> OutOfMemory::OutOfHostMemory
//   map:
//     the two above                 -> DeviceMapError::OutOf{Device,Host}Memory
//     VK_ERROR_MEMORY_MAP_FAILED    -> DeviceMapError::MapFailed
// Any other code is outside what Vulkan allows for these calls and aborts.
class VulkanMemoryDevice final : public alloc::MemoryDevice<VkDeviceMemory> {
 public:
  explicit VulkanMemoryDevice(const Device& device) noexcept : device_(device) {}
  // A temporary Device would dangle once the full-expression ends.
  explicit VulkanMemoryDevice(const Device&& device) = delete;

  const Device& device() const noexcept { return device_; }

  // Aborts if `flags` carries a bit other than DeviceAddress.
  VkDeviceMemory allocate_memory(std::uint64_t size,
                                 std::uint32_t memory_type,
                                 alloc::AllocationFlags flags) const override;

  void deallocate_memory(VkDeviceMemory memory) const noexcept override;

  // Aborts if the driver reports success with a null pointer.
  std::byte* map_memory(VkDeviceMemory& memory,
                        std::uint64_t offset,
                        std::uint64_t size) const override;

  void unmap_memory(VkDeviceMemory& memory) const noexcept override;

  // An empty batch is a no-op; Vulkan requires memoryRangeCount > 0.
  void invalidate_memory_ranges(
      std::span<const alloc::MappedMemoryRange<VkDeviceMemory>> ranges) const override;

  void flush_memory_ranges(
      std::span<const alloc::MappedMemoryRange<VkDeviceMemory>> ranges) const override;

 private:
  const Device& device_;
};

inline VulkanMemoryDevice as_memory_device(const Device& device) noexcept {
  return VulkanMemoryDevice(device);
}
VulkanMemoryDevice as_memory_device(const Device&& device) = delete;

} // namespace vulkan
} // namespace vkalloc

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "vkalloc/alloc/types.h"

namespace vkalloc {
namespace alloc {

// Memory primitives an allocator needs from a graphics backend. `M` is the
// backend's memory object handle.
//
// Callers uphold the backend's own preconditions: handles belong to this
// device, and the same memory object is not used from two threads at once.
// Reported failures are thrown as OutOfMemoryError / DeviceMapFailure.
template <typename M>
class MemoryDevice {
 public:
  virtual ~MemoryDevice() = default;

  // Throws OutOfMemoryError.
  virtual M allocate_memory(std::uint64_t size,
                            std::uint32_t memory_type,
                            AllocationFlags flags) const = 0;

  virtual void deallocate_memory(M memory) const noexcept = 0;

  // Returns a non-null pointer to the first mapped byte. Throws DeviceMapFailure.
  virtual std::byte* map_memory(M& memory, std::uint64_t offset, std::uint64_t size) const = 0;

  virtual void unmap_memory(M& memory) const noexcept = 0;

  // Throws OutOfMemoryError.
  virtual void invalidate_memory_ranges(std::span<const MappedMemoryRange<M>> ranges) const = 0;

  // Throws OutOfMemoryError.
  virtual void flush_memory_ranges(std::span<const MappedMemoryRange<M>> ranges) const = 0;
};

} // namespace alloc
} // namespace vkalloc

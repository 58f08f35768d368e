// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

// Types shared between a generic GPU memory allocator and the backend that
// provides it with device facts and memory primitives.

namespace vkalloc {
namespace alloc {

class MemoryPropertyFlags final {
 public:
  using Repr = std::uint32_t;

  static constexpr Repr kDeviceLocal     = 0x01;
  static constexpr Repr kHostVisible     = 0x02;
  static constexpr Repr kHostCoherent    = 0x04;
  static constexpr Repr kHostCached      = 0x08;
  static constexpr Repr kLazilyAllocated = 0x10;
  static constexpr Repr kAll = kDeviceLocal | kHostVisible | kHostCoherent |
                               kHostCached | kLazilyAllocated;

  constexpr MemoryPropertyFlags() = default;

  // Bits outside kAll are discarded.
  static constexpr MemoryPropertyFlags from_bits_truncate(Repr bits) noexcept {
    return MemoryPropertyFlags(bits & kAll);
  }

  static constexpr MemoryPropertyFlags DeviceLocal() noexcept { return MemoryPropertyFlags(kDeviceLocal); }
  static constexpr MemoryPropertyFlags HostVisible() noexcept { return MemoryPropertyFlags(kHostVisible); }
  static constexpr MemoryPropertyFlags HostCoherent() noexcept { return MemoryPropertyFlags(kHostCoherent); }
  static constexpr MemoryPropertyFlags HostCached() noexcept { return MemoryPropertyFlags(kHostCached); }
  static constexpr MemoryPropertyFlags LazilyAllocated() noexcept { return MemoryPropertyFlags(kLazilyAllocated); }

  constexpr Repr bits() const noexcept { return bits_; }
  constexpr bool empty() const noexcept { return bits_ == 0; }

  // True when every bit of `other` is set here.
  constexpr bool contains(MemoryPropertyFlags other) const noexcept {
    return (bits_ & other.bits_) == other.bits_;
  }

  friend constexpr bool operator==(MemoryPropertyFlags a, MemoryPropertyFlags b) noexcept {
    return a.bits_ == b.bits_;
  }
  friend constexpr bool operator!=(MemoryPropertyFlags a, MemoryPropertyFlags b) noexcept {
    return a.bits_ != b.bits_;
  }
  friend constexpr MemoryPropertyFlags operator|(MemoryPropertyFlags a, MemoryPropertyFlags b) noexcept {
    return MemoryPropertyFlags(a.bits_ | b.bits_);
  }
  friend constexpr MemoryPropertyFlags operator&(MemoryPropertyFlags a, MemoryPropertyFlags b) noexcept {
    return MemoryPropertyFlags(a.bits_ & b.bits_);
  }
  friend constexpr MemoryPropertyFlags operator~(MemoryPropertyFlags a) noexcept {
    return MemoryPropertyFlags((~a.bits_) & kAll);
  }
  MemoryPropertyFlags& operator|=(MemoryPropertyFlags o) noexcept {
    bits_ |= o.bits_;
    return *this;
  }

 private:
  constexpr explicit MemoryPropertyFlags(Repr bits) : bits_(bits) {}

  Repr bits_{0};
};

static_assert(std::is_trivially_copyable_v<MemoryPropertyFlags>,
              "MemoryPropertyFlags must be trivially copyable");

class AllocationFlags final {
 public:
  using Repr = std::uint32_t;

  // Allocation must support device address queries.
  static constexpr Repr kDeviceAddress = 0x1;
  static constexpr Repr kAll = kDeviceAddress;

  constexpr AllocationFlags() = default;

  // No masking. Unrecognized bits survive so that backends can reject them.
  static constexpr AllocationFlags from_bits_unchecked(Repr bits) noexcept {
    return AllocationFlags(bits);
  }

  static constexpr AllocationFlags DeviceAddress() noexcept { return AllocationFlags(kDeviceAddress); }

  constexpr Repr bits() const noexcept { return bits_; }
  constexpr bool empty() const noexcept { return bits_ == 0; }
  constexpr bool contains(AllocationFlags other) const noexcept {
    return (bits_ & other.bits_) == other.bits_;
  }
  constexpr bool has_unknown_bits() const noexcept { return (bits_ & ~kAll) != 0; }

  friend constexpr bool operator==(AllocationFlags a, AllocationFlags b) noexcept {
    return a.bits_ == b.bits_;
  }
  friend constexpr bool operator!=(AllocationFlags a, AllocationFlags b) noexcept {
    return a.bits_ != b.bits_;
  }
  friend constexpr AllocationFlags operator|(AllocationFlags a, AllocationFlags b) noexcept {
    return AllocationFlags(a.bits_ | b.bits_);
  }

 private:
  constexpr explicit AllocationFlags(Repr bits) : bits_(bits) {}

  Repr bits_{0};
};

static_assert(std::is_trivially_copyable_v<AllocationFlags>,
              "AllocationFlags must be trivially copyable");

struct MemoryType {
  MemoryPropertyFlags props{};
  std::uint32_t       heap{0};  // index into DeviceProperties::memory_heaps
};

struct MemoryHeap {
  std::uint64_t size{0};
};

// Device facts consumed once by the allocator constructor.
struct DeviceProperties {
  std::vector<MemoryType> memory_types;
  std::vector<MemoryHeap> memory_heaps;
  std::uint32_t max_memory_allocation_count{0};
  std::uint64_t max_memory_allocation_size{std::numeric_limits<std::uint64_t>::max()};
  // Alignment of flush/invalidate ranges on non-coherent memory. Power of two.
  std::uint64_t non_coherent_atom_size{1};
  bool          buffer_device_address{false};
};

// Sub-region of a mapped memory object. `memory` is borrowed.
template <typename M>
struct MappedMemoryRange {
  const M*      memory{nullptr};
  std::uint64_t offset{0};
  std::uint64_t size{0};
};

enum class OutOfMemory : std::uint8_t {
  OutOfDeviceMemory = 0,
  OutOfHostMemory = 1,
};

enum class DeviceMapError : std::uint8_t {
  OutOfDeviceMemory = 0,
  OutOfHostMemory = 1,
  MapFailed = 2,
};

inline const char* to_string(OutOfMemory e) noexcept {
  switch (e) {
    case OutOfMemory::OutOfDeviceMemory: return "out of device memory";
    case OutOfMemory::OutOfHostMemory:   return "out of host memory";
  }
  return "unknown out-of-memory condition";
}

inline const char* to_string(DeviceMapError e) noexcept {
  switch (e) {
    case DeviceMapError::OutOfDeviceMemory: return "out of device memory";
    case DeviceMapError::OutOfHostMemory:   return "out of host memory";
    case DeviceMapError::MapFailed:         return "memory map failed";
  }
  return "unknown map error";
}

class OutOfMemoryError : public std::runtime_error {
 public:
  explicit OutOfMemoryError(OutOfMemory code)
      : std::runtime_error(to_string(code)), code_(code) {}

  OutOfMemory code() const noexcept { return code_; }

 private:
  OutOfMemory code_;
};

class DeviceMapFailure : public std::runtime_error {
 public:
  explicit DeviceMapFailure(DeviceMapError code)
      : std::runtime_error(to_string(code)), code_(code) {}

  DeviceMapError code() const noexcept { return code_; }

 private:
  DeviceMapError code_;
};

} // namespace alloc
} // namespace vkalloc

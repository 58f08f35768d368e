// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "vkalloc/vulkan/memory_flags.h"

namespace vkalloc {
namespace vulkan {

namespace {
using alloc::MemoryPropertyFlags;

struct FlagPair {
  VkMemoryPropertyFlagBits vk;
  MemoryPropertyFlags      props;
};

constexpr FlagPair kFlagPairs[] = {
    {VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,     MemoryPropertyFlags::DeviceLocal()},
    {VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT,     MemoryPropertyFlags::HostVisible()},
    {VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,    MemoryPropertyFlags::HostCoherent()},
    {VK_MEMORY_PROPERTY_HOST_CACHED_BIT,      MemoryPropertyFlags::HostCached()},
    {VK_MEMORY_PROPERTY_LAZILY_ALLOCATED_BIT, MemoryPropertyFlags::LazilyAllocated()},
};
} // namespace

MemoryPropertyFlags memory_properties_from(VkMemoryPropertyFlags props) noexcept {
  MemoryPropertyFlags out;
  for (const FlagPair& p : kFlagPairs) {
    if ((props & p.vk) != 0) out |= p.props;
  }
  return out;
}

VkMemoryPropertyFlags memory_properties_to(MemoryPropertyFlags props) noexcept {
  VkMemoryPropertyFlags out = 0;
  for (const FlagPair& p : kFlagPairs) {
    if (props.contains(p.props)) out |= p.vk;
  }
  return out;
}

} // namespace vulkan
} // namespace vkalloc

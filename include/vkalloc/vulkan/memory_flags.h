// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vulkan/vulkan.h>

#include "vkalloc/alloc/types.h"

namespace vkalloc {
namespace vulkan {

// Vulkan property bits with no allocator counterpart (PROTECTED,
// DEVICE_COHERENT_AMD, ...) are dropped.
alloc::MemoryPropertyFlags memory_properties_from(VkMemoryPropertyFlags props) noexcept;

VkMemoryPropertyFlags memory_properties_to(alloc::MemoryPropertyFlags props) noexcept;

} // namespace vulkan
} // namespace vkalloc

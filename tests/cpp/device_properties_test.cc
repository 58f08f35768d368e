// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "fake_vulkan.h"
#include "vkalloc/vulkan/device_properties.h"
#include "vkalloc/vulkan/result.h"

using vkalloc::alloc::DeviceProperties;
using vkalloc::alloc::MemoryPropertyFlags;
using vkalloc::testonly::fake;
using vkalloc::testonly::fake_physical_device;
using vkalloc::testonly::make_fake_instance;
using vkalloc::testonly::reset_fake;
using vkalloc::testonly::set_memory_layout;
using vkalloc::vulkan::device_properties;
using vkalloc::vulkan::VulkanError;

namespace {

constexpr std::uint64_t kUnbounded = std::numeric_limits<std::uint64_t>::max();

class DevicePropertiesTest : public ::testing::Test {
 protected:
  void SetUp() override { reset_fake(); }

  DeviceProperties probe(std::uint32_t version) {
    const auto instance = make_fake_instance();
    return device_properties(instance, version, fake_physical_device());
  }
};

} // namespace

TEST_F(DevicePropertiesTest, Version12NeverEnumeratesExtensions) {
  fake().buffer_device_address = VK_TRUE;
  fake().max_memory_allocation_size = 3ull << 30;

  const DeviceProperties p = probe(VK_API_VERSION_1_2);

  EXPECT_EQ(fake().enumerate_extensions_calls, 0);
  EXPECT_EQ(fake().get_properties2_calls, 1);
  EXPECT_EQ(fake().get_properties_calls, 0);
  EXPECT_EQ(fake().get_features2_calls, 1);
  EXPECT_EQ(p.max_memory_allocation_size, 3ull << 30);
  EXPECT_TRUE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, Version13BehavesLike12) {
  const DeviceProperties p = probe(VK_MAKE_API_VERSION(0, 1, 3, 0));
  EXPECT_EQ(fake().enumerate_extensions_calls, 0);
  EXPECT_EQ(fake().get_properties2_calls, 1);
  EXPECT_EQ(fake().get_features2_calls, 1);
  EXPECT_FALSE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, Version11WithoutBufferDeviceAddressExtension) {
  fake().device_extensions = {"VK_KHR_swapchain"};
  fake().buffer_device_address = VK_TRUE;  // must not be consulted
  fake().max_memory_allocation_size = 1ull << 31;

  const DeviceProperties p = probe(VK_API_VERSION_1_1);

  EXPECT_GE(fake().enumerate_extensions_calls, 1);
  EXPECT_EQ(fake().get_properties2_calls, 1);
  EXPECT_EQ(fake().get_features2_calls, 0);
  EXPECT_EQ(p.max_memory_allocation_size, 1ull << 31);
  EXPECT_FALSE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, Version11WithBufferDeviceAddressExtension) {
  fake().device_extensions = {"VK_KHR_swapchain", VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME};
  fake().buffer_device_address = VK_TRUE;

  const DeviceProperties p = probe(VK_API_VERSION_1_1);

  EXPECT_EQ(fake().get_features2_calls, 1);
  EXPECT_TRUE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, FeatureReportedDisabled) {
  fake().device_extensions = {VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME};
  fake().buffer_device_address = VK_FALSE;

  const DeviceProperties p = probe(VK_API_VERSION_1_1);
  EXPECT_EQ(fake().get_features2_calls, 1);
  EXPECT_FALSE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, Version10WithoutExtensionsFallsBackToBasicQueries) {
  fake().limits.maxMemoryAllocationCount = 1234;
  fake().limits.nonCoherentAtomSize = 256;

  const DeviceProperties p = probe(VK_API_VERSION_1_0);

  EXPECT_GE(fake().enumerate_extensions_calls, 1);
  EXPECT_EQ(fake().get_properties2_calls, 0);
  EXPECT_EQ(fake().get_properties_calls, 1);
  EXPECT_EQ(fake().get_features2_calls, 0);
  EXPECT_EQ(p.max_memory_allocation_size, kUnbounded);
  EXPECT_FALSE(p.buffer_device_address);
  EXPECT_EQ(p.max_memory_allocation_count, 1234u);
  EXPECT_EQ(p.non_coherent_atom_size, 256u);
}

TEST_F(DevicePropertiesTest, Version10NeedsBothPropertiesExtensions) {
  // maintenance3 without properties2 is not enough for the chained query.
  fake().device_extensions = {VK_KHR_MAINTENANCE_3_EXTENSION_NAME,
                              VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME};
  const DeviceProperties p = probe(VK_API_VERSION_1_0);
  EXPECT_EQ(fake().get_properties2_calls, 0);
  EXPECT_EQ(fake().get_features2_calls, 0);
  EXPECT_EQ(p.max_memory_allocation_size, kUnbounded);
}

TEST_F(DevicePropertiesTest, Version10WithAllExtensions) {
  fake().device_extensions = {VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME,
                              VK_KHR_MAINTENANCE_3_EXTENSION_NAME,
                              VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME};
  fake().buffer_device_address = VK_TRUE;
  fake().max_memory_allocation_size = 7ull << 28;

  const DeviceProperties p = probe(VK_API_VERSION_1_0);

  EXPECT_EQ(fake().get_properties2_calls, 1);
  EXPECT_EQ(fake().get_properties_calls, 0);
  EXPECT_EQ(fake().get_features2_calls, 1);
  EXPECT_EQ(p.max_memory_allocation_size, 7ull << 28);
  EXPECT_TRUE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, Version10UsesKhrAliases) {
  fake().hidden_procs = {"vkGetPhysicalDeviceProperties2", "vkGetPhysicalDeviceFeatures2"};
  fake().device_extensions = {VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME,
                              VK_KHR_MAINTENANCE_3_EXTENSION_NAME,
                              VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME};
  fake().buffer_device_address = VK_TRUE;

  const DeviceProperties p = probe(VK_API_VERSION_1_0);
  EXPECT_EQ(fake().get_properties2_calls, 1);
  EXPECT_EQ(fake().get_features2_calls, 1);
  EXPECT_TRUE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, LimitsComeFromChainedQueryToo) {
  fake().limits.maxMemoryAllocationCount = 77;
  fake().limits.nonCoherentAtomSize = 128;
  const DeviceProperties p = probe(VK_API_VERSION_1_2);
  EXPECT_EQ(p.max_memory_allocation_count, 77u);
  EXPECT_EQ(p.non_coherent_atom_size, 128u);
}

TEST_F(DevicePropertiesTest, PreservesMemoryTypesAndHeaps) {
  set_memory_layout(
      {256ull << 20, 4ull << 30},
      {{VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, 0},
       {VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, 1},
       {VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_CACHED_BIT |
            VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
        1}});

  const DeviceProperties p = probe(VK_API_VERSION_1_2);

  ASSERT_EQ(p.memory_heaps.size(), 2u);
  EXPECT_EQ(p.memory_heaps[0].size, 256ull << 20);
  EXPECT_EQ(p.memory_heaps[1].size, 4ull << 30);

  ASSERT_EQ(p.memory_types.size(), 3u);
  EXPECT_EQ(p.memory_types[0].props, MemoryPropertyFlags::DeviceLocal());
  EXPECT_EQ(p.memory_types[0].heap, 0u);
  EXPECT_EQ(p.memory_types[1].props,
            MemoryPropertyFlags::HostVisible() | MemoryPropertyFlags::HostCoherent());
  EXPECT_EQ(p.memory_types[1].heap, 1u);
  EXPECT_EQ(p.memory_types[2].props, MemoryPropertyFlags::HostVisible() |
                                         MemoryPropertyFlags::HostCached() |
                                         MemoryPropertyFlags::DeviceLocal());
  EXPECT_EQ(p.memory_types[2].heap, 1u);

  for (const auto& t : p.memory_types) {
    EXPECT_LT(t.heap, p.memory_heaps.size());
  }
}

TEST_F(DevicePropertiesTest, EnumerationFailurePropagates) {
  fake().enumerate_result = VK_ERROR_OUT_OF_HOST_MEMORY;
  try {
    (void)probe(VK_API_VERSION_1_0);
    FAIL() << "expected VulkanError";
  } catch (const VulkanError& e) {
    EXPECT_EQ(e.result(), VK_ERROR_OUT_OF_HOST_MEMORY);
  }
  EXPECT_EQ(fake().get_properties_calls, 0);
  EXPECT_EQ(fake().get_properties2_calls, 0);
}

TEST_F(DevicePropertiesTest, EnumerationFailureIrrelevantAt12) {
  fake().enumerate_result = VK_ERROR_OUT_OF_HOST_MEMORY;
  EXPECT_NO_THROW((void)probe(VK_API_VERSION_1_2));
}

TEST_F(DevicePropertiesTest, EnumerationRetriesOnIncomplete) {
  fake().device_extensions = {VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME};
  fake().enumerate_incomplete_rounds = 2;
  fake().buffer_device_address = VK_TRUE;

  const DeviceProperties p = probe(VK_API_VERSION_1_1);
  EXPECT_EQ(fake().enumerate_extensions_calls, 6);  // three count + fill pairs
  EXPECT_TRUE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, EnumerationGivesUpWhenAlwaysIncomplete) {
  fake().device_extensions = {"VK_KHR_swapchain"};
  fake().enumerate_incomplete_rounds = 1000;
  try {
    (void)probe(VK_API_VERSION_1_1);
    FAIL() << "expected VulkanError";
  } catch (const VulkanError& e) {
    EXPECT_EQ(e.result(), VK_INCOMPLETE);
  }
}

TEST_F(DevicePropertiesTest, EmptyExtensionListIsNotAnError) {
  fake().device_extensions.clear();
  const DeviceProperties p = probe(VK_API_VERSION_1_1);
  EXPECT_EQ(fake().enumerate_extensions_calls, 1);
  EXPECT_FALSE(p.buffer_device_address);
}

TEST_F(DevicePropertiesTest, MissingEntryPointOnSelectedPathIsFatal) {
  fake().hidden_procs = {"vkGetPhysicalDeviceProperties2", "vkGetPhysicalDeviceProperties2KHR"};
  EXPECT_DEATH((void)probe(VK_API_VERSION_1_2), "vkGetPhysicalDeviceProperties2 not loaded");
}

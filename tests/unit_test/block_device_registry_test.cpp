/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 块设备注册表单元测试
 */

#include "block_device_registry.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "ram_block_device.hpp"

namespace {

using test_env::RamBlockDevice;

TEST(BlockDeviceRegistryTest, RegisterAndGet) {
  BlockDeviceRegistry registry;
  RamBlockDevice dev(8);

  auto id = registry.Register(&dev);
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(registry.Count(), 1u);

  auto found = registry.Get(*id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, &dev);
}

TEST(BlockDeviceRegistryTest, RegisterNullptr) {
  BlockDeviceRegistry registry;
  auto id = registry.Register(nullptr);
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error().code, ErrorCode::kInvalidArgument);
}

// 扇区大小不是 512 的设备被拒绝
TEST(BlockDeviceRegistryTest, RejectSectorSizeMismatch) {
  BlockDeviceRegistry registry;
  RamBlockDevice dev(8, 4096);

  auto id = registry.Register(&dev);
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error().code, ErrorCode::kBlkSectorSizeMismatch);
  EXPECT_EQ(registry.Count(), 0u);
}

TEST(BlockDeviceRegistryTest, GetUnknownDevice) {
  BlockDeviceRegistry registry;
  EXPECT_EQ(registry.Get(0).error().code, ErrorCode::kBlkDeviceNotFound);
  EXPECT_EQ(registry.Get(ext4shim::config::kMaxBlockDevices).error().code,
            ErrorCode::kBlkDeviceNotFound);
}

TEST(BlockDeviceRegistryTest, UnregisterFreesSlot) {
  BlockDeviceRegistry registry;
  RamBlockDevice first(8);
  RamBlockDevice second(8);

  auto id = registry.Register(&first);
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(registry.Unregister(*id).has_value());
  EXPECT_EQ(registry.Get(*id).error().code, ErrorCode::kBlkDeviceNotFound);
  EXPECT_EQ(registry.Unregister(*id).error().code,
            ErrorCode::kBlkDeviceNotFound);

  // 空出的编号被复用
  auto reused = registry.Register(&second);
  ASSERT_TRUE(reused.has_value());
  EXPECT_EQ(*reused, *id);
}

TEST(BlockDeviceRegistryTest, RegistryFull) {
  BlockDeviceRegistry registry;
  std::vector<std::unique_ptr<RamBlockDevice>> devices;
  for (size_t i = 0; i < ext4shim::config::kMaxBlockDevices; ++i) {
    devices.push_back(std::make_unique<RamBlockDevice>(1));
    ASSERT_TRUE(registry.Register(devices.back().get()).has_value());
  }

  RamBlockDevice extra(1);
  auto id = registry.Register(&extra);
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error().code, ErrorCode::kBlkRegistryFull);
  EXPECT_EQ(registry.Count(), ext4shim::config::kMaxBlockDevices);
}

// GetBlkDevice 通过全局单例查找
TEST(BlockDeviceRegistryTest, GetBlkDeviceUsesSingleton) {
  RamBlockDevice dev(8);
  test_env::ScopedRegistration registration(&dev);
  ASSERT_TRUE(registration.ok());

  auto found = GetBlkDevice(registration.id());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, &dev);
}

TEST(BlockDeviceRegistryTest, GetBlkDeviceAfterUnregister) {
  size_t id = 0;
  {
    RamBlockDevice dev(8);
    test_env::ScopedRegistration registration(&dev);
    ASSERT_TRUE(registration.ok());
    id = registration.id();
  }
  auto found = GetBlkDevice(id);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kBlkDeviceNotFound);
}

}  // namespace

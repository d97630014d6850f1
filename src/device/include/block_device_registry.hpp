/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#ifndef EXT4SHIM_SRC_DEVICE_INCLUDE_BLOCK_DEVICE_REGISTRY_HPP_
#define EXT4SHIM_SRC_DEVICE_INCLUDE_BLOCK_DEVICE_REGISTRY_HPP_

#include <etl/singleton.h>

#include <array>
#include <cstddef>

#include "block_device.hpp"
#include "expected.hpp"
#include "ext4shim_config.hpp"
#include "spinlock.hpp"

/**
 * @brief  块设备注册表 — 设备编号 (device id) 到 vfs::BlockDevice 的映射
 * @details 驱动 probe 成功后注册设备并获得编号；文件系统只持有编号，
 *          每次 I/O 时通过 GetBlkDevice() 重新查找设备。
 */
class BlockDeviceRegistry {
 public:
  /**
   * @brief  注册块设备
   * @param  device         块设备，生命周期由调用者管理
   * @return Expected<size_t> 成功时返回设备编号
   * @pre    device != nullptr
   * @pre    device->GetSectorSize() == ext4shim::config::kSectorSize
   */
  auto Register(vfs::BlockDevice* device) -> Expected<size_t>;

  /**
   * @brief  注销块设备
   * @param  device_id      Register() 返回的编号
   * @return Expected<void> 成功或 kBlkDeviceNotFound
   */
  auto Unregister(size_t device_id) -> Expected<void>;

  /**
   * @brief  通过编号查找设备
   * @param  device_id      设备编号
   * @return Expected<vfs::BlockDevice*> 设备指针或 kBlkDeviceNotFound
   */
  [[nodiscard]] auto Get(size_t device_id) -> Expected<vfs::BlockDevice*>;

  /// 当前已注册设备数
  [[nodiscard]] auto Count() -> size_t;

  /// @name 构造/析构函数
  /// @{
  BlockDeviceRegistry() = default;
  ~BlockDeviceRegistry() = default;
  BlockDeviceRegistry(const BlockDeviceRegistry&) = delete;
  BlockDeviceRegistry(BlockDeviceRegistry&&) = delete;
  auto operator=(const BlockDeviceRegistry&) -> BlockDeviceRegistry& = delete;
  auto operator=(BlockDeviceRegistry&&) -> BlockDeviceRegistry& = delete;
  /// @}

 private:
  std::array<vfs::BlockDevice*, ext4shim::config::kMaxBlockDevices> devices_{};
  SpinLock lock_{"block_device_registry"};
};

using BlockDeviceRegistrySingleton = etl::singleton<BlockDeviceRegistry>;

/**
 * @brief  按编号获取块设备（惰性创建注册表单例）
 * @note   首次调用应发生在单线程初始化阶段
 * @param  device_id      设备编号
 * @return Expected<vfs::BlockDevice*> 设备指针或 kBlkDeviceNotFound
 */
auto GetBlkDevice(size_t device_id) -> Expected<vfs::BlockDevice*>;

#endif /* EXT4SHIM_SRC_DEVICE_INCLUDE_BLOCK_DEVICE_REGISTRY_HPP_ */

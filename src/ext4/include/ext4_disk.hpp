/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 块地址转换：字节偏移 <-> 512 字节扇区
 */

#ifndef EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_DISK_HPP_
#define EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_DISK_HPP_

#include <cstddef>
#include <cstdint>
#include <span>

#include "block_device.hpp"
#include "expected.hpp"
#include "ext4_engine.hpp"

namespace ext4 {

/**
 * @brief 以扇区设备为后端的字节寻址存储
 * @details 引擎以 4096 字节逻辑块工作，物理设备只支持 512 字节扇区。
 *          读：任意偏移，按扇区读出后拼接出完整的 4096 字节。
 *          写：偏移必须扇区对齐；不足一个扇区的尾部采用读-改-写，
 *          扇区内未被覆盖的字节保持不变。
 *          不做缓存，每次调用都直接访问设备。
 */
class Ext4Disk final : public BlockStorage {
 public:
  /**
   * @brief 构造函数
   * @param device_id 块设备编号，每次 I/O 时经 GetBlkDevice() 查找
   */
  explicit Ext4Disk(size_t device_id) : device_id_(device_id) {}

  /// @name 构造/析构函数
  /// @{
  ~Ext4Disk() override = default;
  Ext4Disk(const Ext4Disk&) = delete;
  Ext4Disk(Ext4Disk&&) = delete;
  auto operator=(const Ext4Disk&) -> Ext4Disk& = delete;
  auto operator=(Ext4Disk&&) -> Ext4Disk& = delete;
  /// @}

  /**
   * @brief 读取从 offset 开始的一个逻辑块
   * @param offset 字节偏移
   * @return Expected<Block> 第 k 字节等于设备上 offset + k 处的字节
   */
  auto ReadOffset(uint64_t offset) -> Expected<Block> override;

  /**
   * @brief 从扇区对齐的 offset 开始写入 buffer
   * @param offset 字节偏移
   * @param buffer 数据，长度任意
   * @return Expected<void> 成功或错误；offset 未对齐时返回
   *         kBlkUnalignedOffset 且不访问设备
   */
  auto WriteOffset(uint64_t offset, std::span<const uint8_t> buffer)
      -> Expected<void> override;

  [[nodiscard]] auto GetDeviceId() const -> size_t { return device_id_; }

 private:
  size_t device_id_;

  /// 读一个完整扇区
  static auto ReadSector(vfs::BlockDevice* device, uint64_t lba, uint8_t* out)
      -> Expected<void>;
  /// 写一个完整扇区
  static auto WriteSector(vfs::BlockDevice* device, uint64_t lba,
                          const uint8_t* in) -> Expected<void>;
};

}  // namespace ext4

#endif /* EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_DISK_HPP_ */

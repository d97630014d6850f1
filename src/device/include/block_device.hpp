/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 扇区设备接口
 */

#ifndef EXT4SHIM_SRC_DEVICE_INCLUDE_BLOCK_DEVICE_HPP_
#define EXT4SHIM_SRC_DEVICE_INCLUDE_BLOCK_DEVICE_HPP_

#include <cstddef>
#include <cstdint>

#include "expected.hpp"

namespace vfs {

/**
 * @brief 扇区设备
 * @details 以固定大小扇区、按设备内扇区号 (LBA) 同步读写。
 *          不提供按字节偏移或任意长度的访问，字节寻址由
 *          ext4::Ext4Disk 在其上完成。
 * @note 对不同扇区的并发调用由驱动保证安全，本层不做串行化。
 */
class BlockDevice {
 public:
  virtual ~BlockDevice() = default;

  /**
   * @brief 读取连续扇区
   * @param sector_start 起始扇区号（LBA）
   * @param sector_count 扇区数量
   * @param buffer 输出缓冲区，大小至少为 sector_count * GetSectorSize()
   * @return Expected<size_t> 实际读取的字节数
   * @pre sector_start + sector_count <= GetSectorCount()
   */
  virtual auto ReadSectors(uint64_t sector_start, uint32_t sector_count,
                           void* buffer) -> Expected<size_t> = 0;

  /**
   * @brief 写入连续扇区
   * @param sector_start 起始扇区号（LBA）
   * @param sector_count 扇区数量
   * @param buffer 输入缓冲区
   * @return Expected<size_t> 实际写入的字节数
   * @pre sector_start + sector_count <= GetSectorCount()
   */
  virtual auto WriteSectors(uint64_t sector_start, uint32_t sector_count,
                            const void* buffer) -> Expected<size_t> = 0;

  /// 扇区大小（字节），注册表只接受 512
  [[nodiscard]] virtual auto GetSectorSize() const -> uint32_t = 0;

  [[nodiscard]] virtual auto GetSectorCount() const -> uint64_t = 0;

  /// 设备名，仅用于日志
  [[nodiscard]] virtual auto GetName() const -> const char* = 0;

  virtual auto Flush() -> Expected<void> { return {}; }

  /// 设备容量（字节）
  [[nodiscard]] auto GetCapacity() const -> uint64_t {
    return GetSectorCount() * GetSectorSize();
  }
};

}  // namespace vfs

#endif /* EXT4SHIM_SRC_DEVICE_INCLUDE_BLOCK_DEVICE_HPP_ */

/** @copyright Copyright The SimpleKernel Contributors */

#ifndef EXT4SHIM_SRC_INCLUDE_EXT4SHIM_CONFIG_HPP_
#define EXT4SHIM_SRC_INCLUDE_EXT4SHIM_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

#include "project_config.h"

namespace ext4shim::config {

// ── 块地址转换 ──────────────────────────────────────────────────
/// 物理扇区大小（字节）
inline constexpr size_t kSectorSize = 512;
/// 引擎逻辑块大小（字节）
inline constexpr size_t kBlockSize = 4096;
/// 每个逻辑块包含的扇区数
inline constexpr size_t kSectorsPerBlock = kBlockSize / kSectorSize;

static_assert(kBlockSize % kSectorSize == 0,
              "logical block size must be a multiple of the sector size");
static_assert(kSectorsPerBlock == 8);

// ── 设备注册表容量 ──────────────────────────────────────────────
/// 可同时注册的块设备数
inline constexpr size_t kMaxBlockDevices = 16;

// ── 文件系统 ────────────────────────────────────────────────────
/// 路径最大长度（含结尾 '\0'）
inline constexpr size_t kMaxPathLength = 4096;
/// 单个目录项名称最大长度
inline constexpr size_t kMaxNameLength = 255;
/// 文件系统名
inline constexpr const char* kFsName = "ext4";

}  // namespace ext4shim::config

#endif /* EXT4SHIM_SRC_INCLUDE_EXT4SHIM_CONFIG_HPP_ */

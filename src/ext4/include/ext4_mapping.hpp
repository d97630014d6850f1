/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief VFS 与 ext4 引擎之间的打开模式、错误码、文件类型映射
 */

#ifndef EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_MAPPING_HPP_
#define EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_MAPPING_HPP_

#include <cstdint>
#include <string_view>

#include "expected.hpp"
#include "ext4_engine.hpp"
#include "vfs_types.hpp"

namespace ext4 {

/// 引擎打开模式
enum class OpenMode : uint8_t {
  /// "r"
  kRead,
  /// "w"：只写，创建并截断
  kWrite,
  /// "a"：只写，创建并追加
  kAppend,
  /// "r+"
  kReadWrite,
  /// "w+"：读写，创建并截断
  kReadWriteTruncate,
  /// "a+"：读写，创建并追加
  kReadWriteAppend,
};

/// 一次打开请求
struct OpenRequest {
  OpenMode mode;
  bool create;
};

/**
 * @brief 将 VFS OpenFlags 位掩码转换为引擎打开模式
 * @details 仅接受以下六种精确组合：
 *          | flags                             | mode                 |
 *          |-----------------------------------|----------------------|
 *          | kOReadOnly                        | kRead                |
 *          | kOWriteOnly|kOCreate|kOTruncate   | kWrite               |
 *          | kOWriteOnly|kOCreate|kOAppend     | kAppend              |
 *          | kOReadWrite                       | kReadWrite           |
 *          | kOReadWrite|kOCreate|kOTruncate   | kReadWriteTruncate   |
 *          | kOReadWrite|kOCreate|kOAppend     | kReadWriteAppend     |
 *          create 独立地由 kOCreate 位决定。
 * @param flags OpenFlags 位掩码
 * @return Expected<OpenRequest> 其他组合返回 kFsInvalidOpenFlags
 */
[[nodiscard]] auto TranslateOpenFlags(uint32_t flags) -> Expected<OpenRequest>;

/// 打开模式对应的引擎模式字符串
[[nodiscard]] auto OpenModeToString(OpenMode mode) -> std::string_view;

/// 该模式是否允许写
[[nodiscard]] auto OpenModeWritable(OpenMode mode) -> bool;

/**
 * @brief 引擎错误码 -> VFS 错误码
 * @note 未列出的引擎错误映射为 kFsUnmappedEngineError
 */
[[nodiscard]] auto MapEngineError(Errnum err) -> ErrorCode;

/// 磁盘目录项类型字节 -> VFS 文件类型
[[nodiscard]] auto MapDirEntryType(uint8_t type) -> vfs::FileType;

/// inode i_mode 类型位 -> VFS 文件类型，归类与 MapDirEntryType 一致
[[nodiscard]] auto MapInodeMode(uint16_t mode) -> vfs::FileType;

}  // namespace ext4

#endif /* EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_MAPPING_HPP_ */

/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief VFS 基础类型定义
 * @note 此头文件只包含基础类型定义，不包含复杂依赖，用于解决循环依赖问题
 */

#ifndef EXT4SHIM_SRC_VFS_INCLUDE_VFS_TYPES_HPP_
#define EXT4SHIM_SRC_VFS_INCLUDE_VFS_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "expected.hpp"

namespace vfs {

/// 文件类型
enum class FileType : uint8_t {
  kUnknown = 0,
  /// 普通文件
  kRegular = 1,
  /// 目录
  kDirectory = 2,
  /// 字符设备
  kCharDevice = 3,
  /// 块设备
  kBlockDevice = 4,
  /// 符号链接
  kSymlink = 5,
  /// 命名管道
  kFifo = 6,
};

/// 文件打开标志（兼容 Linux O_* 定义）
enum OpenFlags : uint32_t {
  kOReadOnly = 0x0000,
  kOWriteOnly = 0x0001,
  kOReadWrite = 0x0002,
  kOCreate = 0x0040,
  kOTruncate = 0x0200,
  kOAppend = 0x0400,
  /// 必须是目录
  kODirectory = 0x010000,
};

/// 目录项结构（用于 ReadDir）
struct DirEntry {
  /// 文件名
  std::string name;
  /// inode 编号
  uint64_t ino;
  /// 文件类型
  FileType type;
};

/// 时间戳
struct TimeSpec {
  int64_t sec;
  int64_t nsec;
};

/// TimeSpec::nsec 取该值时表示不修改对应时间
inline constexpr int64_t kUtimeOmit = (1L << 30) - 2L;

/// TimeSpec::nsec 取该值时表示设为当前时间
inline constexpr int64_t kUtimeNow = (1L << 30) - 1L;

/// 节点元数据
struct Metadata {
  uint64_t ino;
  FileType type;
  uint64_t size;
  /// 权限位（低 12 位）
  uint32_t mode;
  uint32_t nlink;
  uint32_t uid;
  uint32_t gid;
  /// 占用的 512 字节块数
  uint64_t blocks;
  TimeSpec atime;
  TimeSpec mtime;
  TimeSpec ctime;
};

/// stat(2) 风格的属性
struct Stat {
  uint64_t dev;
  uint64_t ino;
  /// 文件类型位 | 权限位
  uint32_t mode;
  uint32_t nlink;
  uint32_t uid;
  uint32_t gid;
  uint64_t rdev;
  uint64_t size;
  uint32_t blksize;
  uint64_t blocks;
  TimeSpec atime;
  TimeSpec mtime;
  TimeSpec ctime;
};

/// statfs(2) 风格的文件系统信息
struct StatFs {
  /// 文件系统魔数
  uint64_t type;
  uint64_t bsize;
  uint64_t blocks;
  uint64_t bfree;
  uint64_t bavail;
  uint64_t files;
  uint64_t ffree;
  uint64_t namelen;
};

/// Stat::mode 中的文件类型位
enum StatMode : uint32_t {
  kSIfMt = 0170000,
  kSIfSock = 0140000,
  kSIfLnk = 0120000,
  kSIfReg = 0100000,
  kSIfBlk = 0060000,
  kSIfDir = 0040000,
  kSIfChr = 0020000,
  kSIfIfo = 0010000,
};

}  // namespace vfs

#endif /* EXT4SHIM_SRC_VFS_INCLUDE_VFS_TYPES_HPP_ */

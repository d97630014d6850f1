/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief ext4 引擎边界：引擎使用的存储接口与引擎对外提供的操作
 */

#ifndef EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_ENGINE_HPP_
#define EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_ENGINE_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "expected.hpp"
#include "ext4shim_config.hpp"

namespace ext4 {

/// 引擎错误码（errno 风格）
enum class Errnum : int {
  kEPERM = 1,
  kENOENT = 2,
  kEIO = 5,
  kENXIO = 6,
  kE2BIG = 7,
  kENOMEM = 12,
  kEACCES = 13,
  kEFAULT = 14,
  kEEXIST = 17,
  kENODEV = 19,
  kENOTDIR = 20,
  kEISDIR = 21,
  kEINVAL = 22,
  kEFBIG = 27,
  kENOSPC = 28,
  kEROFS = 30,
  kEMLINK = 31,
  kERANGE = 34,
  kENAMETOOLONG = 36,
  kENOTEMPTY = 39,
  kENODATA = 61,
  kENOTSUP = 95,
  /// 目录项链接失败
  kELINKFAIL = 97,
  /// 块/inode 分配失败
  kEALLOCFAIL = 98,
};

/// 引擎调用结果
template <typename T>
using EngineResult = std::expected<T, Errnum>;

/// 磁盘目录项中的类型字节
namespace DirEntryType {
inline constexpr uint8_t kUnknown = 0;
inline constexpr uint8_t kRegFile = 1;
inline constexpr uint8_t kDir = 2;
inline constexpr uint8_t kChrDev = 3;
inline constexpr uint8_t kBlkDev = 4;
inline constexpr uint8_t kFifo = 5;
inline constexpr uint8_t kSock = 6;
inline constexpr uint8_t kSymlink = 7;
}  // namespace DirEntryType

/// 引擎的单个打开文件状态
struct Ext4File {
  /// inode 编号，0 表示未打开
  uint32_t inode = 0;
  /// 当前读写位置
  uint64_t fpos = 0;
  /// 文件大小
  uint64_t fsize = 0;
  /// 打开模式对应的 O_* 位
  uint32_t flags = 0;
};

/// 引擎返回的原始目录项
struct Ext4DirEntry {
  uint32_t inode;
  std::string name;
  /// DirEntryType 之一
  uint8_t file_type;
};

/// 引擎 inode 属性
struct Ext4InodeStat {
  uint32_t inode;
  /// i_mode：类型位 | 权限位
  uint16_t mode;
  uint16_t links_count;
  uint32_t uid;
  uint32_t gid;
  uint64_t size;
  /// 以 512 字节为单位
  uint64_t blocks;
  uint32_t atime;
  uint32_t mtime;
  uint32_t ctime;
};

/// 引擎超级块统计
struct Ext4SuperStat {
  uint32_t block_size;
  uint64_t blocks_count;
  uint64_t free_blocks_count;
  uint64_t reserved_blocks_count;
  uint32_t inodes_count;
  uint32_t free_inodes_count;
};

/// ext4 超级块魔数
inline constexpr uint64_t kExt4SuperMagic = 0xEF53;

/**
 * @brief 引擎使用的字节寻址存储
 * @details 引擎以 4096 字节逻辑块为单位读取，写入长度由引擎决定。
 */
class BlockStorage {
 public:
  using Block = std::array<uint8_t, ext4shim::config::kBlockSize>;

  virtual ~BlockStorage() = default;

  /**
   * @brief 读取从 offset 开始的一个逻辑块
   * @param offset 字节偏移，不要求对齐
   * @return Expected<Block> 恰好 kBlockSize 字节
   */
  virtual auto ReadOffset(uint64_t offset) -> Expected<Block> = 0;

  /**
   * @brief 从 offset 开始写入 buffer
   * @param offset 字节偏移
   * @param buffer 要写入的数据
   * @pre offset % kSectorSize == 0
   */
  virtual auto WriteOffset(uint64_t offset, std::span<const uint8_t> buffer)
      -> Expected<void> = 0;
};

/**
 * @brief ext4 引擎接口
 * @details 磁盘布局、分配、日志、目录 B 树等均由引擎实现，
 *          适配层只通过本接口访问引擎。实现不必是线程安全的，
 *          调用方负责串行化。
 */
class Ext4Engine {
 public:
  virtual ~Ext4Engine() = default;

  /**
   * @brief 打开文件或目录
   * @param file   输出的文件状态
   * @param path   卷内绝对路径
   * @param mode   "r" "w" "a" "r+" "w+" "a+"
   * @param create 不存在时是否创建
   */
  virtual auto Open(Ext4File& file, std::string_view path,
                    std::string_view mode, bool create)
      -> EngineResult<void> = 0;

  /// 创建目录
  virtual auto DirMake(std::string_view path) -> EngineResult<void> = 0;

  /// 删除空目录
  virtual auto DirRemove(std::string_view path) -> EngineResult<void> = 0;

  /// 删除文件
  virtual auto FileRemove(std::string_view path) -> EngineResult<void> = 0;

  /// 读取目录 inode 的全部目录项，顺序为磁盘顺序
  virtual auto ReadDirEntries(uint32_t inode)
      -> EngineResult<std::vector<Ext4DirEntry>> = 0;

  /// 设置读写位置
  virtual auto FileSeek(Ext4File& file, uint64_t pos) -> EngineResult<void> = 0;

  /// 从当前位置读取，返回读取字节数
  virtual auto FileRead(Ext4File& file, std::span<uint8_t> buffer)
      -> EngineResult<size_t> = 0;

  /// 从当前位置写入，返回写入字节数
  virtual auto FileWrite(Ext4File& file, std::span<const uint8_t> buffer)
      -> EngineResult<size_t> = 0;

  /// 截断或扩展文件
  virtual auto FileTruncate(Ext4File& file, uint64_t size)
      -> EngineResult<void> = 0;

  /// 读取 inode 属性
  virtual auto Stat(uint32_t inode) -> EngineResult<Ext4InodeStat> = 0;

  /// 读取超级块统计
  virtual auto StatFs() -> EngineResult<Ext4SuperStat> = 0;

  /// 设置访问/修改时间
  virtual auto SetTimes(uint32_t inode, uint32_t atime, uint32_t mtime)
      -> EngineResult<void> = 0;
};

/**
 * @brief 在存储上打开引擎实例
 * @details 由挂载方提供，通常解析超级块并建立引擎内部状态。
 */
using EngineOpener = std::function<Expected<std::shared_ptr<Ext4Engine>>(
    std::shared_ptr<BlockStorage>)>;

}  // namespace ext4

#endif /* EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_ENGINE_HPP_ */

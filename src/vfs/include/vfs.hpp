/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief VFS 节点与文件系统接口
 */

#ifndef EXT4SHIM_SRC_VFS_INCLUDE_VFS_HPP_
#define EXT4SHIM_SRC_VFS_INCLUDE_VFS_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vfs_types.hpp"

namespace vfs {

/**
 * @brief 节点接口 — 一个打开的文件或目录
 * @details 具体文件系统为每个打开的文件/目录返回一个 INode 实现。
 *          节点以 std::shared_ptr 共享，最后一个引用释放时关闭底层文件。
 *          所有方法都可能被多个执行上下文并发调用。
 */
class INode {
 public:
  virtual ~INode() = default;

  /**
   * @brief 打开文件或目录
   * @param path  绝对路径，或相对于本节点的路径
   * @param flags OpenFlags 位掩码
   * @return Expected<std::shared_ptr<INode>> 新节点或错误
   */
  virtual auto Open(std::string_view path, uint32_t flags)
      -> Expected<std::shared_ptr<INode>> = 0;

  /**
   * @brief 创建目录并打开
   * @param path 目录路径
   * @return Expected<std::shared_ptr<INode>> 新目录节点或错误
   */
  virtual auto Mkdir(std::string_view path)
      -> Expected<std::shared_ptr<INode>> = 0;

  /**
   * @brief 以读写方式打开文件，不存在时创建，存在时截断
   * @param path 文件路径
   * @return Expected<std::shared_ptr<INode>> 新节点或错误
   */
  virtual auto Touch(std::string_view path)
      -> Expected<std::shared_ptr<INode>> = 0;

  /**
   * @brief 读取本目录的全部目录项
   * @return Expected<std::vector<DirEntry>> 按底层文件系统顺序排列的目录项
   */
  virtual auto ReadDir() -> Expected<std::vector<DirEntry>> = 0;

  /// 获取节点元数据
  virtual auto GetMetadata() -> Expected<Metadata> = 0;

  /**
   * @brief 从指定偏移读取
   * @param offset 文件内偏移
   * @param buffer 输出缓冲区
   * @return Expected<size_t> 实际读取字节数，到达文件末尾时为 0
   */
  virtual auto ReadAt(uint64_t offset, std::span<uint8_t> buffer)
      -> Expected<size_t> = 0;

  /**
   * @brief 向指定偏移写入
   * @param offset 文件内偏移
   * @param buffer 输入缓冲区
   * @return Expected<size_t> 实际写入字节数
   */
  virtual auto WriteAt(uint64_t offset, std::span<const uint8_t> buffer)
      -> Expected<size_t> = 0;

  /// 删除本目录下的空子目录
  virtual auto Rmdir(std::string_view name) -> Expected<void> = 0;

  /// 删除本目录下的文件
  virtual auto Remove(std::string_view name) -> Expected<void> = 0;

  /// 在本目录下查找子节点
  virtual auto Lookup(std::string_view name)
      -> Expected<std::shared_ptr<INode>> = 0;

  /// 将文件截断或扩展到 size 字节
  virtual auto Truncate(uint64_t size) -> Expected<void> = 0;

  /// 读取符号链接目标
  virtual auto ResolveLink() -> Expected<std::string> = 0;

  /// 创建硬链接 name -> src
  virtual auto Link(std::string_view name, std::shared_ptr<INode> src)
      -> Expected<void> = 0;

  /// 创建符号链接 name -> target
  virtual auto SymLink(std::string_view name, std::string_view target)
      -> Expected<void> = 0;

  /// 删除本目录下的目录项
  virtual auto Unlink(std::string_view name) -> Expected<void> = 0;

  /// 填充 stat 信息
  virtual auto GetStat(Stat& stat) -> Expected<void> = 0;

  /// 填充所在文件系统的 statfs 信息
  virtual auto GetStatFs(StatFs& statfs) -> Expected<void> = 0;

  /**
   * @brief 修改访问/修改时间
   * @param times times[0] 为 atime，times[1] 为 mtime
   */
  virtual auto Utimes(std::span<const TimeSpec> times) -> Expected<void> = 0;
};

/**
 * @brief 文件系统接口
 * @details 每个挂载的文件系统实例提供一个根节点。
 */
class FileSystem {
 public:
  virtual ~FileSystem() = default;

  /**
   * @brief 获取根目录节点
   * @return std::shared_ptr<INode> 根目录
   * @post 返回值 != nullptr
   */
  [[nodiscard]] virtual auto RootDir() const -> std::shared_ptr<INode> = 0;

  /**
   * @brief 获取文件系统类型名（如 "ext4"）
   * @return 文件系统类型名
   */
  [[nodiscard]] virtual auto GetName() const -> const char* = 0;
};

}  // namespace vfs

#endif /* EXT4SHIM_SRC_VFS_INCLUDE_VFS_HPP_ */

/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief ext4 节点适配器
 */

#ifndef EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_NODE_HPP_
#define EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_NODE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "expected.hpp"
#include "ext4_engine.hpp"
#include "ext4_mapping.hpp"
#include "spinlock.hpp"
#include "vfs.hpp"

namespace ext4 {

/**
 * @brief 一个文件系统实例共享的引擎
 * @details 引擎不保证线程安全，所有引擎调用都在 lock 下进行。
 *          加锁顺序：节点会话锁 -> 引擎锁。
 */
struct EngineContext {
  EngineContext(std::shared_ptr<Ext4Engine> _engine, size_t _device_id)
      : engine(std::move(_engine)), device_id(_device_id) {}

  /// @name 构造/析构函数
  /// @{
  ~EngineContext() = default;
  EngineContext(const EngineContext&) = delete;
  EngineContext(EngineContext&&) = delete;
  auto operator=(const EngineContext&) -> EngineContext& = delete;
  auto operator=(EngineContext&&) -> EngineContext& = delete;
  /// @}

  std::shared_ptr<Ext4Engine> engine;
  /// 所在块设备编号
  size_t device_id;
  SpinLock lock{"ext4_engine"};
};

/**
 * @brief ext4 节点 — 包装引擎中一个打开的文件/目录
 * @details 每个节点独占一个 Ext4File 会话，由 session_lock_ 保护；
 *          最后一个 shared_ptr 释放时会话随之销毁，无需显式关闭。
 *          相对路径相对于本节点的路径解析。
 */
class Ext4Node final : public vfs::INode {
 public:
  /**
   * @brief 构造函数，接管已打开的会话
   * @param ctx  引擎上下文
   * @param file 已由引擎打开的文件状态
   * @param path 卷内绝对路径
   * @param mode 打开模式
   */
  Ext4Node(std::shared_ptr<EngineContext> ctx, const Ext4File& file,
           std::string path, OpenMode mode);

  /// @name 构造/析构函数
  /// @{
  ~Ext4Node() override = default;
  Ext4Node(const Ext4Node&) = delete;
  Ext4Node(Ext4Node&&) = delete;
  auto operator=(const Ext4Node&) -> Ext4Node& = delete;
  auto operator=(Ext4Node&&) -> Ext4Node& = delete;
  /// @}

  /**
   * @brief 通过引擎打开 path 并包装为节点
   * @param ctx     引擎上下文
   * @param path    卷内绝对路径
   * @param request 打开模式与是否创建
   * @return Expected<std::shared_ptr<Ext4Node>> 新节点或映射后的错误
   */
  static auto OpenAt(const std::shared_ptr<EngineContext>& ctx,
                     std::string path, OpenRequest request)
      -> Expected<std::shared_ptr<Ext4Node>>;

  auto Open(std::string_view path, uint32_t flags)
      -> Expected<std::shared_ptr<vfs::INode>> override;

  /**
   * @brief 创建目录并以只读方式打开
   * @note 创建成功但打开失败时返回 kFsMkdirOpenFailed，目录保留在磁盘上
   */
  auto Mkdir(std::string_view path)
      -> Expected<std::shared_ptr<vfs::INode>> override;

  auto Touch(std::string_view path)
      -> Expected<std::shared_ptr<vfs::INode>> override;

  auto ReadDir() -> Expected<std::vector<vfs::DirEntry>> override;

  auto GetMetadata() -> Expected<vfs::Metadata> override;

  auto ReadAt(uint64_t offset, std::span<uint8_t> buffer)
      -> Expected<size_t> override;

  /**
   * @brief 向指定偏移写入
   * @note 追加模式打开的会话忽略 offset，总是写到文件末尾
   */
  auto WriteAt(uint64_t offset, std::span<const uint8_t> buffer)
      -> Expected<size_t> override;

  auto Rmdir(std::string_view name) -> Expected<void> override;

  auto Remove(std::string_view name) -> Expected<void> override;

  auto Lookup(std::string_view name)
      -> Expected<std::shared_ptr<vfs::INode>> override;

  auto Truncate(uint64_t size) -> Expected<void> override;

  auto ResolveLink() -> Expected<std::string> override;

  auto Link(std::string_view name, std::shared_ptr<vfs::INode> src)
      -> Expected<void> override;

  auto SymLink(std::string_view name, std::string_view target)
      -> Expected<void> override;

  auto Unlink(std::string_view name) -> Expected<void> override;

  auto GetStat(vfs::Stat& stat) -> Expected<void> override;

  auto GetStatFs(vfs::StatFs& statfs) -> Expected<void> override;

  auto Utimes(std::span<const vfs::TimeSpec> times) -> Expected<void> override;

  /// 卷内绝对路径
  [[nodiscard]] auto GetPath() const -> const std::string& { return path_; }

  /// 会话对应的 inode 编号
  [[nodiscard]] auto GetInode() const -> uint32_t { return inode_; }

  [[nodiscard]] auto GetMode() const -> OpenMode { return mode_; }

 private:
  std::shared_ptr<EngineContext> ctx_;
  /// 保护 file_
  SpinLock session_lock_{"ext4_session"};
  Ext4File file_;
  /// 打开后不再改变，读取无需加锁
  uint32_t inode_;
  std::string path_;
  OpenMode mode_;

  /// 绝对路径原样返回，相对路径拼接到 path_ 之后
  [[nodiscard]] auto ResolvePath(std::string_view path) const
      -> Expected<std::string>;

  /// 校验单个目录项名称并拼接到 path_ 之后
  [[nodiscard]] auto ChildPath(std::string_view name) const
      -> Expected<std::string>;

  /// 在引擎锁下读取本节点 inode 属性
  auto StatInode() -> Expected<Ext4InodeStat>;
};

}  // namespace ext4

#endif /* EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_NODE_HPP_ */

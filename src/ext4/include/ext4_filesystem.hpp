/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief ext4 文件系统句柄
 */

#ifndef EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_FILESYSTEM_HPP_
#define EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_FILESYSTEM_HPP_

#include <cstddef>
#include <memory>

#include "expected.hpp"
#include "ext4_disk.hpp"
#include "ext4_engine.hpp"
#include "ext4_node.hpp"
#include "vfs.hpp"

namespace ext4 {

/**
 * @brief ext4 文件系统 — 将一个引擎实例绑定到一个块设备
 * @details 持有块地址转换层、引擎上下文和根目录节点。
 *          没有显式卸载操作，最后一个引用释放时销毁；
 *          派生出的节点各自持有引擎上下文的引用。
 */
class Ext4FileSystem final : public vfs::FileSystem {
  /// 限定只能经由 Open() 构造
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  /**
   * @brief 在块设备上打开文件系统
   * @param device_id 已注册的块设备编号
   * @param opener    在存储上打开引擎的回调
   * @return Expected<std::shared_ptr<Ext4FileSystem>> 文件系统或错误
   * @post 成功时 RootDir() 为以只读方式打开的 "/"
   */
  static auto Open(size_t device_id, const EngineOpener& opener)
      -> Expected<std::shared_ptr<Ext4FileSystem>>;

  /// @name 构造/析构函数
  /// @{
  Ext4FileSystem(PrivateTag tag, std::shared_ptr<Ext4Disk> disk,
                 std::shared_ptr<EngineContext> ctx,
                 std::shared_ptr<Ext4Node> root);
  ~Ext4FileSystem() override = default;
  Ext4FileSystem(const Ext4FileSystem&) = delete;
  Ext4FileSystem(Ext4FileSystem&&) = delete;
  auto operator=(const Ext4FileSystem&) -> Ext4FileSystem& = delete;
  auto operator=(Ext4FileSystem&&) -> Ext4FileSystem& = delete;
  /// @}

  [[nodiscard]] auto RootDir() const -> std::shared_ptr<vfs::INode> override;

  /**
   * @brief 返回 "ext4"
   */
  [[nodiscard]] auto GetName() const -> const char* override;

  [[nodiscard]] auto GetDeviceId() const -> size_t {
    return disk_->GetDeviceId();
  }

 private:
  std::shared_ptr<Ext4Disk> disk_;
  std::shared_ptr<EngineContext> ctx_;
  std::shared_ptr<Ext4Node> root_;
};

}  // namespace ext4

#endif /* EXT4SHIM_SRC_EXT4_INCLUDE_EXT4_FILESYSTEM_HPP_ */

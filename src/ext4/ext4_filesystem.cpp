/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "ext4_filesystem.hpp"

#include <utility>

#include "block_device_registry.hpp"
#include "ext4shim_config.hpp"
#include "kernel_log.hpp"

namespace ext4 {

Ext4FileSystem::Ext4FileSystem(PrivateTag /*tag*/,
                               std::shared_ptr<Ext4Disk> disk,
                               std::shared_ptr<EngineContext> ctx,
                               std::shared_ptr<Ext4Node> root)
    : disk_(std::move(disk)), ctx_(std::move(ctx)), root_(std::move(root)) {}

auto Ext4FileSystem::Open(size_t device_id, const EngineOpener& opener)
    -> Expected<std::shared_ptr<Ext4FileSystem>> {
  if (!opener) {
    klog::Err("Ext4FileSystem::Open: no engine opener\n");
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  auto device = GetBlkDevice(device_id);
  if (!device) {
    klog::Err("Ext4FileSystem::Open: device %zu: %s\n", device_id,
              device.error().message());
    return std::unexpected(device.error());
  }

  auto disk = std::make_shared<Ext4Disk>(device_id);

  auto engine = opener(disk);
  if (!engine || *engine == nullptr) {
    klog::Err("Ext4FileSystem::Open: engine open on '%s' failed: %s\n",
              (*device)->GetName(),
              engine ? "null engine" : engine.error().message());
    return std::unexpected(Error(ErrorCode::kFsMountFailed));
  }

  auto ctx = std::make_shared<EngineContext>(std::move(*engine), device_id);

  auto root = Ext4Node::OpenAt(ctx, "/", {OpenMode::kRead, false});
  if (!root) {
    klog::Err("Ext4FileSystem::Open: open '/' failed: %s\n",
              root.error().message());
    return std::unexpected(root.error());
  }

  klog::Info("Ext4FileSystem: mounted '%s' (device %zu), root inode %u\n",
             (*device)->GetName(), device_id, (*root)->GetInode());
  return std::make_shared<Ext4FileSystem>(PrivateTag{}, std::move(disk),
                                          std::move(ctx), std::move(*root));
}

auto Ext4FileSystem::RootDir() const -> std::shared_ptr<vfs::INode> {
  return root_;
}

auto Ext4FileSystem::GetName() const -> const char* {
  return ext4shim::config::kFsName;
}

}  // namespace ext4

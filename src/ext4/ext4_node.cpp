/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "ext4_node.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

#include "ext4shim_config.hpp"
#include "kernel_log.hpp"

namespace ext4 {

namespace {

/// 将引擎结果转换为 Expected，错误码经 MapEngineError 映射
template <typename T>
auto FromEngine(EngineResult<T>&& result) -> Expected<T> {
  return std::move(result).transform_error(
      [](Errnum err) { return Error(MapEngineError(err)); });
}

auto JoinPath(std::string_view base, std::string_view name) -> std::string {
  std::string joined(base);
  if (joined.empty() || joined.back() != '/') {
    joined.push_back('/');
  }
  joined.append(name);
  return joined;
}

constexpr int64_t kNanosecondsPerSecond = 1000000000;

auto ToTimeSpec(uint32_t sec) -> vfs::TimeSpec {
  return {static_cast<int64_t>(sec), 0};
}

/// 当前时间，截断为 inode 的 32 位秒
auto CurrentEpochSeconds() -> uint32_t {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
  return static_cast<uint32_t>(seconds);
}

}  // namespace

Ext4Node::Ext4Node(std::shared_ptr<EngineContext> ctx, const Ext4File& file,
                   std::string path, OpenMode mode)
    : ctx_(std::move(ctx)),
      file_(file),
      inode_(file.inode),
      path_(std::move(path)),
      mode_(mode) {}

auto Ext4Node::OpenAt(const std::shared_ptr<EngineContext>& ctx,
                      std::string path, OpenRequest request)
    -> Expected<std::shared_ptr<Ext4Node>> {
  Ext4File file;
  EngineResult<void> result;
  {
    LockGuard guard(ctx->lock);
    result = ctx->engine->Open(file, path, OpenModeToString(request.mode),
                               request.create);
  }
  if (!result) {
    auto code = MapEngineError(result.error());
    klog::Debug("Ext4Node::OpenAt: '%s' (%s): %s\n", path.c_str(),
                OpenModeToString(request.mode).data(), GetErrorMessage(code));
    return std::unexpected(Error(code));
  }
  return std::make_shared<Ext4Node>(ctx, file, std::move(path), request.mode);
}

auto Ext4Node::ResolvePath(std::string_view path) const
    -> Expected<std::string> {
  if (path.empty()) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  std::string resolved =
      path.front() == '/' ? std::string(path) : JoinPath(path_, path);
  if (resolved.size() >= ext4shim::config::kMaxPathLength) {
    return std::unexpected(Error(ErrorCode::kFsNameTooLong));
  }
  return resolved;
}

auto Ext4Node::ChildPath(std::string_view name) const
    -> Expected<std::string> {
  if (name.empty() || name.find('/') != std::string_view::npos) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  if (name.size() > ext4shim::config::kMaxNameLength) {
    return std::unexpected(Error(ErrorCode::kFsNameTooLong));
  }
  return ResolvePath(name);
}

auto Ext4Node::StatInode() -> Expected<Ext4InodeStat> {
  LockGuard guard(ctx_->lock);
  return FromEngine(ctx_->engine->Stat(inode_));
}

auto Ext4Node::Open(std::string_view path, uint32_t flags)
    -> Expected<std::shared_ptr<vfs::INode>> {
  auto request = TranslateOpenFlags(flags);
  if (!request) {
    return std::unexpected(request.error());
  }
  auto full_path = ResolvePath(path);
  if (!full_path) {
    return std::unexpected(full_path.error());
  }
  return OpenAt(ctx_, std::move(*full_path), *request);
}

auto Ext4Node::Mkdir(std::string_view path)
    -> Expected<std::shared_ptr<vfs::INode>> {
  auto full_path = ResolvePath(path);
  if (!full_path) {
    return std::unexpected(full_path.error());
  }

  EngineResult<void> created;
  {
    LockGuard guard(ctx_->lock);
    created = ctx_->engine->DirMake(*full_path);
  }
  if (!created) {
    return std::unexpected(Error(MapEngineError(created.error())));
  }

  // 创建与打开是两次独立的引擎调用
  auto node = OpenAt(ctx_, *full_path, {OpenMode::kRead, false});
  if (!node) {
    klog::Err("Ext4Node::Mkdir: '%s' created but open failed: %s\n",
              full_path->c_str(), node.error().message());
    return std::unexpected(Error(ErrorCode::kFsMkdirOpenFailed));
  }
  return *node;
}

auto Ext4Node::Touch(std::string_view path)
    -> Expected<std::shared_ptr<vfs::INode>> {
  auto full_path = ResolvePath(path);
  if (!full_path) {
    return std::unexpected(full_path.error());
  }
  return OpenAt(ctx_, std::move(*full_path),
                {OpenMode::kReadWriteTruncate, true});
}

auto Ext4Node::ReadDir() -> Expected<std::vector<vfs::DirEntry>> {
  LockGuard session(session_lock_);

  EngineResult<std::vector<Ext4DirEntry>> raw;
  {
    LockGuard guard(ctx_->lock);
    raw = ctx_->engine->ReadDirEntries(file_.inode);
  }
  if (!raw) {
    return std::unexpected(Error(MapEngineError(raw.error())));
  }

  std::vector<vfs::DirEntry> entries;
  entries.reserve(raw->size());
  for (auto& entry : *raw) {
    entries.push_back(vfs::DirEntry{std::move(entry.name), entry.inode,
                                    MapDirEntryType(entry.file_type)});
  }
  return entries;
}

auto Ext4Node::GetMetadata() -> Expected<vfs::Metadata> {
  auto stat = StatInode();
  if (!stat) {
    return std::unexpected(stat.error());
  }
  return vfs::Metadata{
      .ino = stat->inode,
      .type = MapInodeMode(stat->mode),
      .size = stat->size,
      .mode = static_cast<uint32_t>(stat->mode & 07777U),
      .nlink = stat->links_count,
      .uid = stat->uid,
      .gid = stat->gid,
      .blocks = stat->blocks,
      .atime = ToTimeSpec(stat->atime),
      .mtime = ToTimeSpec(stat->mtime),
      .ctime = ToTimeSpec(stat->ctime),
  };
}

auto Ext4Node::ReadAt(uint64_t offset, std::span<uint8_t> buffer)
    -> Expected<size_t> {
  if (buffer.empty()) {
    return 0;
  }
  LockGuard session(session_lock_);
  LockGuard guard(ctx_->lock);

  auto seek = FromEngine(ctx_->engine->FileSeek(file_, offset));
  if (!seek) {
    return std::unexpected(seek.error());
  }
  return FromEngine(ctx_->engine->FileRead(file_, buffer));
}

auto Ext4Node::WriteAt(uint64_t offset, std::span<const uint8_t> buffer)
    -> Expected<size_t> {
  if (!OpenModeWritable(mode_)) {
    return std::unexpected(Error(ErrorCode::kFsPermissionDenied));
  }
  if (buffer.empty()) {
    return 0;
  }
  LockGuard session(session_lock_);
  LockGuard guard(ctx_->lock);

  uint64_t pos = offset;
  if (mode_ == OpenMode::kAppend || mode_ == OpenMode::kReadWriteAppend) {
    // 其他会话可能已改变文件大小，追加位置以 inode 当前大小为准
    auto current = FromEngine(ctx_->engine->Stat(inode_));
    if (!current) {
      return std::unexpected(current.error());
    }
    pos = current->size;
  }
  auto seek = FromEngine(ctx_->engine->FileSeek(file_, pos));
  if (!seek) {
    return std::unexpected(seek.error());
  }
  auto written = FromEngine(ctx_->engine->FileWrite(file_, buffer));
  if (!written) {
    klog::Err("Ext4Node::WriteAt: '%s' offset %llu: %s\n", path_.c_str(),
              static_cast<unsigned long long>(offset),
              written.error().message());
    return std::unexpected(written.error());
  }
  file_.fsize = std::max(file_.fsize, file_.fpos);
  return *written;
}

auto Ext4Node::Rmdir(std::string_view name) -> Expected<void> {
  auto child = ChildPath(name);
  if (!child) {
    return std::unexpected(child.error());
  }
  LockGuard guard(ctx_->lock);
  return FromEngine(ctx_->engine->DirRemove(*child));
}

auto Ext4Node::Remove(std::string_view name) -> Expected<void> {
  auto child = ChildPath(name);
  if (!child) {
    return std::unexpected(child.error());
  }
  LockGuard guard(ctx_->lock);
  return FromEngine(ctx_->engine->FileRemove(*child));
}

auto Ext4Node::Lookup(std::string_view name)
    -> Expected<std::shared_ptr<vfs::INode>> {
  auto child = ChildPath(name);
  if (!child) {
    return std::unexpected(child.error());
  }
  return OpenAt(ctx_, std::move(*child), {OpenMode::kRead, false});
}

auto Ext4Node::Truncate(uint64_t size) -> Expected<void> {
  if (!OpenModeWritable(mode_)) {
    return std::unexpected(Error(ErrorCode::kFsPermissionDenied));
  }
  LockGuard session(session_lock_);
  LockGuard guard(ctx_->lock);
  return FromEngine(ctx_->engine->FileTruncate(file_, size));
}

auto Ext4Node::ResolveLink() -> Expected<std::string> {
  return std::unexpected(Error(ErrorCode::kFsNotSupported));
}

auto Ext4Node::Link(std::string_view /*name*/,
                    std::shared_ptr<vfs::INode> /*src*/) -> Expected<void> {
  return std::unexpected(Error(ErrorCode::kFsNotSupported));
}

auto Ext4Node::SymLink(std::string_view /*name*/, std::string_view /*target*/)
    -> Expected<void> {
  return std::unexpected(Error(ErrorCode::kFsNotSupported));
}

auto Ext4Node::Unlink(std::string_view name) -> Expected<void> {
  return Remove(name);
}

auto Ext4Node::GetStat(vfs::Stat& stat) -> Expected<void> {
  auto inode_stat = StatInode();
  if (!inode_stat) {
    return std::unexpected(inode_stat.error());
  }
  stat = vfs::Stat{
      .dev = ctx_->device_id,
      .ino = inode_stat->inode,
      .mode = inode_stat->mode,
      .nlink = inode_stat->links_count,
      .uid = inode_stat->uid,
      .gid = inode_stat->gid,
      .rdev = 0,
      .size = inode_stat->size,
      .blksize = static_cast<uint32_t>(ext4shim::config::kBlockSize),
      .blocks = inode_stat->blocks,
      .atime = ToTimeSpec(inode_stat->atime),
      .mtime = ToTimeSpec(inode_stat->mtime),
      .ctime = ToTimeSpec(inode_stat->ctime),
  };
  return {};
}

auto Ext4Node::GetStatFs(vfs::StatFs& statfs) -> Expected<void> {
  EngineResult<Ext4SuperStat> super;
  {
    LockGuard guard(ctx_->lock);
    super = ctx_->engine->StatFs();
  }
  if (!super) {
    return std::unexpected(Error(MapEngineError(super.error())));
  }
  const uint64_t reserved =
      std::min(super->reserved_blocks_count, super->free_blocks_count);
  statfs = vfs::StatFs{
      .type = kExt4SuperMagic,
      .bsize = super->block_size,
      .blocks = super->blocks_count,
      .bfree = super->free_blocks_count,
      .bavail = super->free_blocks_count - reserved,
      .files = super->inodes_count,
      .ffree = super->free_inodes_count,
      .namelen = ext4shim::config::kMaxNameLength,
  };
  return {};
}

auto Ext4Node::Utimes(std::span<const vfs::TimeSpec> times) -> Expected<void> {
  if (times.size() != 2) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  for (const auto& t : times) {
    if (t.nsec == vfs::kUtimeOmit || t.nsec == vfs::kUtimeNow) {
      continue;
    }
    // inode 时间戳为 32 位无符号秒
    if (t.sec < 0 ||
        t.sec > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()) ||
        t.nsec < 0 || t.nsec >= kNanosecondsPerSecond) {
      klog::Warn("Ext4Node::Utimes: '%s' time {%lld, %lld} out of range\n",
                 path_.c_str(), static_cast<long long>(t.sec),
                 static_cast<long long>(t.nsec));
      return std::unexpected(Error(ErrorCode::kInvalidArgument));
    }
  }

  const uint32_t now = CurrentEpochSeconds();

  // 读取与写回在同一临界区内完成
  LockGuard guard(ctx_->lock);
  auto current = FromEngine(ctx_->engine->Stat(inode_));
  if (!current) {
    return std::unexpected(current.error());
  }
  auto resolve = [now](const vfs::TimeSpec& t, uint32_t old) -> uint32_t {
    if (t.nsec == vfs::kUtimeOmit) {
      return old;
    }
    if (t.nsec == vfs::kUtimeNow) {
      return now;
    }
    return static_cast<uint32_t>(t.sec);
  };
  return FromEngine(ctx_->engine->SetTimes(
      inode_, resolve(times[0], current->atime),
      resolve(times[1], current->mtime)));
}

}  // namespace ext4

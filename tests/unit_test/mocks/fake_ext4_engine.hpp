/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#ifndef EXT4SHIM_TESTS_UNIT_TEST_MOCKS_FAKE_EXT4_ENGINE_HPP_
#define EXT4SHIM_TESTS_UNIT_TEST_MOCKS_FAKE_EXT4_ENGINE_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ext4_engine.hpp"

namespace test_env {

/**
 * @brief 内存中的 ext4 引擎替身
 * @details 目录树保存在内存中。构造时传入 BlockStorage 时，文件数据
 *          以 4096 字节块的形式经 BlockStorage 读写，从而覆盖
 *          节点 -> 引擎 -> 块地址转换 -> 块设备的完整路径。
 */
class FakeExt4Engine : public ext4::Ext4Engine {
 public:
  /// 可注入错误的引擎操作
  enum class Op {
    kOpen,
    kDirMake,
    kDirRemove,
    kFileRemove,
    kReadDir,
    kSeek,
    kRead,
    kWrite,
    kTruncate,
    kStat,
    kStatFs,
    kSetTimes,
  };

  static constexpr uint32_t kRootInode = 2;
  /// 数据块从该块号开始分配
  static constexpr uint64_t kFirstDataBlock = 1;

  explicit FakeExt4Engine(std::shared_ptr<ext4::BlockStorage> storage = {});

  auto Open(ext4::Ext4File& file, std::string_view path,
            std::string_view mode, bool create)
      -> ext4::EngineResult<void> override;
  auto DirMake(std::string_view path) -> ext4::EngineResult<void> override;
  auto DirRemove(std::string_view path) -> ext4::EngineResult<void> override;
  auto FileRemove(std::string_view path) -> ext4::EngineResult<void> override;
  auto ReadDirEntries(uint32_t inode)
      -> ext4::EngineResult<std::vector<ext4::Ext4DirEntry>> override;
  auto FileSeek(ext4::Ext4File& file, uint64_t pos)
      -> ext4::EngineResult<void> override;
  auto FileRead(ext4::Ext4File& file, std::span<uint8_t> buffer)
      -> ext4::EngineResult<size_t> override;
  auto FileWrite(ext4::Ext4File& file, std::span<const uint8_t> buffer)
      -> ext4::EngineResult<size_t> override;
  auto FileTruncate(ext4::Ext4File& file, uint64_t size)
      -> ext4::EngineResult<void> override;
  auto Stat(uint32_t inode) -> ext4::EngineResult<ext4::Ext4InodeStat> override;
  auto StatFs() -> ext4::EngineResult<ext4::Ext4SuperStat> override;
  auto SetTimes(uint32_t inode, uint32_t atime, uint32_t mtime)
      -> ext4::EngineResult<void> override;

  /// 下一次 op 调用返回 err（一次性）
  void FailNext(Op op, ext4::Errnum err) { injected_[op] = err; }

  /// 限制 inode 总数，超出时创建返回 kEALLOCFAIL
  void SetInodeLimit(size_t limit) { inode_limit_ = limit; }

  /**
   * @brief 直接在目录下添加一个特殊类型的目录项（设备、套接字等）
   * @return 新 inode 编号
   */
  auto AddSpecialEntry(std::string_view dir_path, std::string_view name,
                       uint8_t dir_entry_type) -> uint32_t;

  /// 路径对应的 inode，不存在时为 std::nullopt
  auto InodeOf(std::string_view path) const -> std::optional<uint32_t>;

  /// 最近一次 Open 的参数
  std::string last_open_mode;
  bool last_open_create = false;
  size_t open_calls = 0;

 private:
  struct Node {
    uint32_t ino = 0;
    uint16_t mode = 0;
    uint16_t links = 1;
    uint64_t size = 0;
    uint32_t atime = 0;
    uint32_t mtime = 0;
    uint32_t ctime = 0;
    /// 无 BlockStorage 时的数据
    std::vector<uint8_t> data;
    /// 有 BlockStorage 时的数据块号
    std::vector<uint64_t> blocks;
    /// 目录的子项，保持插入顺序
    std::vector<ext4::Ext4DirEntry> children;
  };

  std::shared_ptr<ext4::BlockStorage> storage_;
  std::map<uint32_t, Node> nodes_;
  std::map<Op, ext4::Errnum> injected_;
  uint32_t next_ino_ = kRootInode + 1;
  uint64_t next_block_ = kFirstDataBlock;
  size_t inode_limit_ = SIZE_MAX;
  uint32_t clock_ = 1000;

  auto TakeInjected(Op op) -> std::optional<ext4::Errnum>;
  auto Resolve(std::string_view path) const -> std::optional<uint32_t>;
  /// 拆分为父目录 inode 与最后一级名称
  auto SplitParent(std::string_view path) const
      -> ext4::EngineResult<std::pair<uint32_t, std::string>>;
  auto CreateNode(uint32_t parent, const std::string& name, uint16_t mode,
                  uint8_t dir_entry_type) -> ext4::EngineResult<uint32_t>;
  void Unlink(uint32_t parent, const std::string& name);
  auto Resize(Node& node, uint64_t size) -> ext4::EngineResult<void>;
  auto ReadData(Node& node, uint64_t pos, std::span<uint8_t> out)
      -> ext4::EngineResult<void>;
  auto WriteData(Node& node, uint64_t pos, std::span<const uint8_t> in)
      -> ext4::EngineResult<void>;
};

}  // namespace test_env

#endif /* EXT4SHIM_TESTS_UNIT_TEST_MOCKS_FAKE_EXT4_ENGINE_HPP_ */

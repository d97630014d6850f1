/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "ext4_disk.hpp"

#include <algorithm>
#include <array>
#include <cstring>

#include "block_device_registry.hpp"
#include "ext4shim_config.hpp"
#include "kernel_log.hpp"

namespace ext4 {

namespace {

using ext4shim::config::kBlockSize;
using ext4shim::config::kSectorSize;

using Sector = std::array<uint8_t, kSectorSize>;

}  // namespace

auto Ext4Disk::ReadSector(vfs::BlockDevice* device, uint64_t lba, uint8_t* out)
    -> Expected<void> {
  auto result = device->ReadSectors(lba, 1, out);
  if (!result) {
    klog::Err("Ext4Disk: read sector %llu on '%s' failed: %s\n",
              static_cast<unsigned long long>(lba), device->GetName(),
              result.error().message());
    return std::unexpected(Error(ErrorCode::kBlkReadFailed));
  }
  if (*result != kSectorSize) {
    klog::Err("Ext4Disk: short read on sector %llu (%zu bytes)\n",
              static_cast<unsigned long long>(lba), *result);
    return std::unexpected(Error(ErrorCode::kBlkReadFailed));
  }
  return {};
}

auto Ext4Disk::WriteSector(vfs::BlockDevice* device, uint64_t lba,
                           const uint8_t* in) -> Expected<void> {
  auto result = device->WriteSectors(lba, 1, in);
  if (!result) {
    klog::Err("Ext4Disk: write sector %llu on '%s' failed: %s\n",
              static_cast<unsigned long long>(lba), device->GetName(),
              result.error().message());
    return std::unexpected(Error(ErrorCode::kBlkWriteFailed));
  }
  if (*result != kSectorSize) {
    klog::Err("Ext4Disk: short write on sector %llu (%zu bytes)\n",
              static_cast<unsigned long long>(lba), *result);
    return std::unexpected(Error(ErrorCode::kBlkWriteFailed));
  }
  return {};
}

auto Ext4Disk::ReadOffset(uint64_t offset) -> Expected<Block> {
  auto device = GetBlkDevice(device_id_);
  if (!device) {
    klog::Err("Ext4Disk::ReadOffset: device %zu: %s\n", device_id_,
              device.error().message());
    return std::unexpected(device.error());
  }

  const uint64_t start_sector = offset / kSectorSize;
  // 请求范围在首个扇区内的偏移
  size_t skew = offset % kSectorSize;

  Block block{};
  Sector sector{};
  size_t filled = 0;
  for (uint64_t lba = start_sector; filled < kBlockSize; ++lba) {
    auto read = ReadSector(*device, lba, sector.data());
    if (!read) {
      return std::unexpected(read.error());
    }
    // skew 非 0 时需要多读一个扇区来补齐尾部
    size_t bytes_to_copy = std::min(kSectorSize - skew, kBlockSize - filled);
    std::memcpy(block.data() + filled, sector.data() + skew, bytes_to_copy);
    filled += bytes_to_copy;
    skew = 0;
  }
  return block;
}

auto Ext4Disk::WriteOffset(uint64_t offset, std::span<const uint8_t> buffer)
    -> Expected<void> {
  if (offset % kSectorSize != 0) {
    klog::Err("Ext4Disk::WriteOffset: offset 0x%llx is not %zu-byte aligned\n",
              static_cast<unsigned long long>(offset), kSectorSize);
    return std::unexpected(Error(ErrorCode::kBlkUnalignedOffset));
  }
  if (buffer.empty()) {
    return {};
  }

  auto device = GetBlkDevice(device_id_);
  if (!device) {
    klog::Err("Ext4Disk::WriteOffset: device %zu: %s\n", device_id_,
              device.error().message());
    return std::unexpected(device.error());
  }

  const uint64_t start_sector = offset / kSectorSize;
  const size_t sector_count = (buffer.size() + kSectorSize - 1) / kSectorSize;

  Sector sector{};
  for (size_t i = 0; i < sector_count; ++i) {
    const uint64_t lba = start_sector + i;
    auto chunk = buffer.subspan(i * kSectorSize,
                                std::min(kSectorSize, buffer.size() -
                                                          i * kSectorSize));
    if (chunk.size() == kSectorSize) {
      auto written = WriteSector(*device, lba, chunk.data());
      if (!written) {
        return std::unexpected(written.error());
      }
      continue;
    }

    // 尾部不足一个扇区：读-改-写
    auto read = ReadSector(*device, lba, sector.data());
    if (!read) {
      return std::unexpected(read.error());
    }
    std::memcpy(sector.data(), chunk.data(), chunk.size());
    auto written = WriteSector(*device, lba, sector.data());
    if (!written) {
      return std::unexpected(written.error());
    }
  }

  klog::Debug("Ext4Disk::WriteOffset: offset 0x%llx len %zu -> %zu sector(s)\n",
              static_cast<unsigned long long>(offset), buffer.size(),
              sector_count);
  return {};
}

}  // namespace ext4

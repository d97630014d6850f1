/**
 * @copyright Copyright The SimpleKernel Contributors
 */

#include "block_device_registry.hpp"

#include "kernel_log.hpp"

auto BlockDeviceRegistry::Register(vfs::BlockDevice* device)
    -> Expected<size_t> {
  if (device == nullptr) {
    klog::Err("BlockDeviceRegistry::Register: device is nullptr\n");
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  if (device->GetSectorSize() != ext4shim::config::kSectorSize) {
    klog::Err("BlockDeviceRegistry::Register: '%s' sector size %u != %zu\n",
              device->GetName(), device->GetSectorSize(),
              ext4shim::config::kSectorSize);
    return std::unexpected(Error(ErrorCode::kBlkSectorSizeMismatch));
  }

  LockGuard guard(lock_);
  for (size_t i = 0; i < devices_.size(); ++i) {
    if (devices_[i] == nullptr) {
      devices_[i] = device;
      klog::Info("BlockDeviceRegistry: '%s' (%llu bytes) registered as "
                 "device %zu\n",
                 device->GetName(),
                 static_cast<unsigned long long>(device->GetCapacity()), i);
      return i;
    }
  }
  return std::unexpected(Error(ErrorCode::kBlkRegistryFull));
}

auto BlockDeviceRegistry::Unregister(size_t device_id) -> Expected<void> {
  LockGuard guard(lock_);
  if (device_id >= devices_.size() || devices_[device_id] == nullptr) {
    return std::unexpected(Error(ErrorCode::kBlkDeviceNotFound));
  }
  devices_[device_id] = nullptr;
  return {};
}

auto BlockDeviceRegistry::Get(size_t device_id)
    -> Expected<vfs::BlockDevice*> {
  LockGuard guard(lock_);
  if (device_id >= devices_.size() || devices_[device_id] == nullptr) {
    return std::unexpected(Error(ErrorCode::kBlkDeviceNotFound));
  }
  return devices_[device_id];
}

auto BlockDeviceRegistry::Count() -> size_t {
  LockGuard guard(lock_);
  size_t count = 0;
  for (const auto* dev : devices_) {
    if (dev != nullptr) {
      ++count;
    }
  }
  return count;
}

auto GetBlkDevice(size_t device_id) -> Expected<vfs::BlockDevice*> {
  if (!BlockDeviceRegistrySingleton::is_valid()) {
    BlockDeviceRegistrySingleton::create();
  }
  return BlockDeviceRegistrySingleton::instance().Get(device_id);
}

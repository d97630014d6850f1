/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 自旋锁
 */

#ifndef EXT4SHIM_SRC_INCLUDE_SPINLOCK_HPP_
#define EXT4SHIM_SRC_INCLUDE_SPINLOCK_HPP_

#include <atomic>
#include <cstdio>
#include <thread>

/**
 * @brief 自旋锁
 * @note 不可重入：同一线程重复 lock() 返回 false
 */
class SpinLock {
 public:
  /**
   * @brief 构造函数
   * @param  _name            锁名
   */
  explicit SpinLock(const char* _name) : name_(_name) {}

  /// @name 构造/析构函数
  /// @{
  SpinLock() = default;
  SpinLock(const SpinLock&) = delete;
  SpinLock(SpinLock&&) = delete;
  auto operator=(const SpinLock&) -> SpinLock& = delete;
  auto operator=(SpinLock&&) -> SpinLock& = delete;
  virtual ~SpinLock() = default;
  /// @}

  /**
   * @brief 获得锁
   */
  auto lock() -> bool {
    if (IsLockedByCurrentThread()) {
      std::fprintf(stderr, "spinlock %s IsLockedByCurrentThread == true.\n",
                   name_);
      return false;
    }
    while (locked_.test_and_set(std::memory_order_acquire)) {
      std::this_thread::yield();
    }

    owner_.store(GetCurrentThreadId(), std::memory_order_relaxed);
    return true;
  }

  /**
   * @brief 释放锁
   */
  auto unlock() -> bool {
    if (!IsLockedByCurrentThread()) {
      std::fprintf(stderr, "spinlock %s IsLockedByCurrentThread == false.\n",
                   name_);
      return false;
    }
    owner_.store(std::thread::id{}, std::memory_order_relaxed);

    locked_.clear(std::memory_order_release);
    return true;
  }

  /**
   * @brief 检查当前线程是否获得此锁
   * @return true             是
   * @return false            否
   */
  [[nodiscard]] auto IsLockedByCurrentThread() const -> bool {
    return locked_.test(std::memory_order_acquire) &&
           (owner_.load(std::memory_order_relaxed) == GetCurrentThreadId());
  }

  [[nodiscard]] auto GetName() const -> const char* { return name_; }

 protected:
  /// 自旋锁名称
  const char* name_{"unnamed"};
  /// 是否 lock
  std::atomic_flag locked_{};
  /// 获得此锁的线程
  std::atomic<std::thread::id> owner_{};

  [[nodiscard]] virtual auto GetCurrentThreadId() const -> std::thread::id {
    return std::this_thread::get_id();
  }
};

/**
 * @brief RAII 锁守卫
 * @tparam Lock 提供 lock()/unlock() 的锁类型
 */
template <typename Lock>
class LockGuard {
 public:
  explicit LockGuard(Lock& lock) : lock_(lock) { locked_ = lock_.lock(); }

  /// @name 构造/析构函数
  /// @{
  LockGuard(const LockGuard&) = delete;
  LockGuard(LockGuard&&) = delete;
  auto operator=(const LockGuard&) -> LockGuard& = delete;
  auto operator=(LockGuard&&) -> LockGuard& = delete;
  ~LockGuard() {
    if (locked_) {
      (void)lock_.unlock();
    }
  }
  /// @}

  /// 是否真正获得了锁（重入时为 false）
  [[nodiscard]] auto IsLocked() const -> bool { return locked_; }

 private:
  Lock& lock_;
  bool locked_{false};
};

#endif /* EXT4SHIM_SRC_INCLUDE_SPINLOCK_HPP_ */

/**
 * @copyright Copyright The SimpleKernel Contributors
 * @brief 自旋锁
 */

#include "spinlock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace {

// 测试用的全局变量
std::atomic<int> shared_counter{0};

class SpinLockTest : public ::testing::Test {
 protected:
  void SetUp() override { shared_counter = 0; }
};

// 测试基本的 lock/unlock 功能
TEST_F(SpinLockTest, BasicLockUnlock) {
  SpinLock lock("basic_test");

  EXPECT_FALSE(lock.IsLockedByCurrentThread());
  EXPECT_TRUE(lock.lock());
  EXPECT_TRUE(lock.IsLockedByCurrentThread());

  // 解锁应该成功
  EXPECT_TRUE(lock.unlock());
  EXPECT_FALSE(lock.IsLockedByCurrentThread());
}

TEST_F(SpinLockTest, Name) {
  SpinLock named("named_lock");
  EXPECT_STREQ(named.GetName(), "named_lock");

  SpinLock unnamed;
  EXPECT_STREQ(unnamed.GetName(), "unnamed");
}

// 同一线程重复加锁应失败
TEST_F(SpinLockTest, RecursiveLockFails) {
  SpinLock lock("recursive_test");

  ASSERT_TRUE(lock.lock());
  EXPECT_FALSE(lock.lock());
  EXPECT_TRUE(lock.unlock());
}

// 未持有时解锁应失败
TEST_F(SpinLockTest, UnlockWithoutLockFails) {
  SpinLock lock("unlock_test");
  EXPECT_FALSE(lock.unlock());
}

// 其它线程不能解锁
TEST_F(SpinLockTest, UnlockFromOtherThreadFails) {
  SpinLock lock("owner_test");
  ASSERT_TRUE(lock.lock());

  bool other_result = true;
  std::thread other([&]() {
    other_result = lock.unlock();
    EXPECT_FALSE(lock.IsLockedByCurrentThread());
  });
  other.join();

  EXPECT_FALSE(other_result);
  EXPECT_TRUE(lock.IsLockedByCurrentThread());
  EXPECT_TRUE(lock.unlock());
}

// 多线程并发计数
TEST_F(SpinLockTest, ConcurrentIncrement) {
  SpinLock lock("concurrent_test");
  constexpr int kThreads = 4;
  constexpr int kIterations = 10000;
  int counter = 0;

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&]() {
      for (int j = 0; j < kIterations; ++j) {
        LockGuard<SpinLock> guard(lock);
        ++counter;
        shared_counter.fetch_add(1, std::memory_order_relaxed);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(counter, kThreads * kIterations);
  EXPECT_EQ(shared_counter.load(), kThreads * kIterations);
}

TEST_F(SpinLockTest, LockGuardReleasesOnScopeExit) {
  SpinLock lock("guard_test");
  {
    LockGuard<SpinLock> guard(lock);
    EXPECT_TRUE(guard.IsLocked());
    EXPECT_TRUE(lock.IsLockedByCurrentThread());
  }
  EXPECT_FALSE(lock.IsLockedByCurrentThread());
}

// 重入的守卫不获得锁，析构时也不释放外层持有的锁
TEST_F(SpinLockTest, NestedLockGuardDoesNotRelease) {
  SpinLock lock("nested_guard_test");
  LockGuard<SpinLock> outer(lock);
  {
    LockGuard<SpinLock> inner(lock);
    EXPECT_FALSE(inner.IsLocked());
  }
  EXPECT_TRUE(lock.IsLockedByCurrentThread());
}

}  // namespace

// tests/RwLock_gtest.cpp
#include <gtest/gtest.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <thread>

#include "Tool/RwLock.hpp"

using namespace std::chrono_literals;

// 1) 多个读者可以同时持有共享锁
TEST(RwLockTest, SharedLock_AllowsConcurrentReaders) {
    RwLock rw;
    std::shared_lock<RwLock> first(rw);

    bool second_acquired = false;
    std::thread reader([&]() {
        second_acquired = rw.try_lock_shared();
        if (second_acquired) rw.unlock_shared();
    });
    reader.join();

    EXPECT_TRUE(second_acquired);
    EXPECT_FALSE(rw.try_lock());
}

// 2) 独占锁排斥所有读者和写者
TEST(RwLockTest, ExclusiveLock_ExcludesReadersAndWriters) {
    RwLock rw;
    std::unique_lock<RwLock> writer(rw);

    bool reader_acquired = true;
    bool writer_acquired = true;
    std::thread other([&]() {
        reader_acquired = rw.try_lock_shared();
        if (reader_acquired) rw.unlock_shared();
        writer_acquired = rw.try_lock();
        if (writer_acquired) rw.unlock();
    });
    other.join();

    EXPECT_FALSE(reader_acquired);
    EXPECT_FALSE(writer_acquired);
}

// 3) 写者等待期间，已持有共享锁的线程可以再次获取共享锁（读者优先）
TEST(RwLockTest, NestedSharedLock_DoesNotDeadlockWithWaitingWriter) {
    RwLock rw;
    rw.lock_shared();

    std::atomic<bool> writer_started{false};
    auto writer = std::async(std::launch::async, [&]() {
        writer_started.store(true);
        std::unique_lock<RwLock> lock(rw);
    });

    while (!writer_started.load()) {
        std::this_thread::yield();
    }
    // 给写者时间进入等待
    std::this_thread::sleep_for(20ms);

    auto nested = std::async(std::launch::async, [&]() {
        // 在另一个线程上模拟“持有读锁时再次读”，语义与同线程递归相同
        std::shared_lock<RwLock> lock(rw);
    });
    EXPECT_EQ(nested.wait_for(2s), std::future_status::ready);

    EXPECT_NE(writer.wait_for(50ms), std::future_status::ready);
    rw.unlock_shared();
    EXPECT_EQ(writer.wait_for(2s), std::future_status::ready);
}

// 4) 同一线程重复获取写锁抛出 EDEADLK
TEST(RwLockTest, RelockExclusiveFromSameThread_Throws) {
    RwLock rw;
    std::unique_lock<RwLock> lock(rw);

    try {
        rw.lock();
        FAIL() << "relocking the write lock should throw";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code().value(), EDEADLK);
    }
}

#pragma once
#include <pthread.h>
#include <cstddef>
#include <cstdint>

// 结构锁：保护对象链表的拓扑（插入/摘除）。
// 使用 PTHREAD_MUTEX_ERRORCHECK，同一线程重复加锁会得到 EDEADLK 并抛出异常，
// 而不是静默死锁。
class MutexLock {
public:
    MutexLock();
    ~MutexLock();

    MutexLock(const MutexLock&) = delete;
    MutexLock& operator=(const MutexLock&) = delete;
    MutexLock(MutexLock&&) = delete;
    MutexLock& operator=(MutexLock&&) = delete;

    void lock() const;
    bool try_lock() const noexcept;
    void unlock() const noexcept;

private:
    alignas(64) mutable pthread_mutex_t mtx_{};
};

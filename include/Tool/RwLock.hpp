#pragma once
#include <pthread.h>

/**
 * @class RwLock
 * @brief 回收器互斥锁（读写锁）。
 *
 * - 共享模式：任何访问/修改/析构对象值的操作，期间回收器不能运行。
 * - 独占模式：collectCycles()，等待所有进行中的访问结束，并阻塞新的访问。
 *
 * 接口满足 Lockable / SharedLockable，可直接配合 std::unique_lock
 * 与 std::shared_lock 使用。
 *
 * 锁以“读者优先”初始化：在持有共享锁的情况下再次获取共享锁
 * （例如借用值期间析构了一个内部句柄）不会被等待中的写者卡住。
 */
class RwLock {
public:
    RwLock();
    ~RwLock();

    RwLock(const RwLock&) = delete;
    RwLock& operator=(const RwLock&) = delete;
    RwLock(RwLock&&) = delete;
    RwLock& operator=(RwLock&&) = delete;

    // 独占模式
    void lock() const;
    bool try_lock() const noexcept;
    void unlock() const noexcept;

    // 共享模式
    void lock_shared() const;
    bool try_lock_shared() const noexcept;
    void unlock_shared() const noexcept;

private:
    alignas(64) mutable pthread_rwlock_t rw_{};
};

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <utility>

#include "Collector/GcList.hpp"
#include "Collector/SpaceState.hpp"

// 单线程引用计数：非原子，无锁
class LocalRefCount {
public:
    // 单线程没有并发的回收器，访问值无需加锁
    struct Guard {};

    LocalRefCount(bool tracked, std::shared_ptr<GcList> list) noexcept
        : tracked_(tracked), list_(std::move(list)) {}

    LocalRefCount(const LocalRefCount&) = delete;
    LocalRefCount& operator=(const LocalRefCount&) = delete;

    // 返回修改前的值
    std::size_t incRef() noexcept { return ref_count_++; }
    std::size_t decRef() noexcept { return ref_count_--; }
    std::size_t refCount() const noexcept { return ref_count_; }

    bool isTracked() const noexcept { return tracked_; }
    bool isDropped() const noexcept { return dropped_; }
    void setDropped() noexcept { dropped_ = true; }

    Guard locked() const noexcept { return Guard{}; }

private:
    std::size_t ref_count_ = 1;
    const bool tracked_;
    bool dropped_ = false;

    // 保证链表（哨兵）比对象活得久
    std::shared_ptr<GcList> list_;
};


/**
 * @class ThreadedRefCount
 * @brief 多线程引用计数。
 *
 * 计数为原子变量；同时持有对象空间共享状态的句柄，
 * locked() 以共享模式获取回收器互斥锁，访问或析构值期间回收器不能运行。
 */
class ThreadedRefCount {
public:
    using Guard = std::shared_lock<RwLock>;

    ThreadedRefCount(bool tracked, std::shared_ptr<ThreadedSpaceState> state) noexcept
        : tracked_(tracked), state_(std::move(state)) {}

    ThreadedRefCount(const ThreadedRefCount&) = delete;
    ThreadedRefCount& operator=(const ThreadedRefCount&) = delete;

    // 增加引用只可能发生在已有强引用的线程上，不会改变回收器对根的判断，无需加锁
    std::size_t incRef() noexcept {
        return ref_count_.fetch_add(1, std::memory_order_relaxed);
    }

    // 调用方必须持有 locked() 返回的锁
    std::size_t decRef() noexcept {
        return ref_count_.fetch_sub(1, std::memory_order_acq_rel);
    }

    std::size_t refCount() const noexcept {
        return ref_count_.load(std::memory_order_acquire);
    }

    bool isTracked() const noexcept { return tracked_; }

    bool isDropped() const noexcept { return dropped_.load(std::memory_order_acquire); }
    void setDropped() noexcept { dropped_.store(true, std::memory_order_release); }

    Guard locked() const { return Guard(state_->collector_lock); }

private:
    std::atomic<std::size_t> ref_count_{1};
    std::atomic<bool> dropped_{false};
    const bool tracked_;

    std::shared_ptr<ThreadedSpaceState> state_;
};

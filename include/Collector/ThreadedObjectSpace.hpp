#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include "Collector/Cc.hpp"
#include "Collector/GcHeader.hpp"
#include "Collector/RefCount.hpp"
#include "Collector/SpaceState.hpp"
#include "Trace/ThreadShareable.hpp"

/**
 * @class ThreadedObjectSpace
 * @brief 多线程对象空间：可被回收的 ThreadedCc<T> 的集合。
 *
 * 任意线程都可以并发地创建、访问、释放对象，也可以调用 collectCycles()。
 *
 * 使用约束（不做运行期检查）：
 *   - 对象不能引用其他对象空间创建的 ThreadedCc，否则跨空间的循环不会被回收；
 *   - trace 实现与值的析构逻辑不能在同一个对象空间上调用 collectCycles()，
 *     也不能在持有 CcRef 时调用，否则会自锁。
 */
class ThreadedObjectSpace {
public:
    using RefCount = ThreadedRefCount;

    ThreadedObjectSpace();

    // 析构时执行最后一次回收；仍然存活的对象继续持有共享状态
    ~ThreadedObjectSpace();

    ThreadedObjectSpace(const ThreadedObjectSpace&) = delete;
    ThreadedObjectSpace& operator=(const ThreadedObjectSpace&) = delete;
    ThreadedObjectSpace(ThreadedObjectSpace&&) = delete;
    ThreadedObjectSpace& operator=(ThreadedObjectSpace&&) = delete;

    // 在本空间中创建对象。T 需要满足 Trace<T>，且 ThreadShareable<T> 为 true
    template <class T>
    Cc<T, ThreadedObjectSpace> create(T value);

    // 遍历链表计数，O(n)，用于诊断和测试
    std::size_t countTracked() const;

    // 回收本空间中所有不可达的循环，返回回收的对象数
    std::size_t collectCycles();

    // ---- CcBox 使用的底层接口 ----

    // 调用方必须已持有结构锁（create() 负责）
    void insert(GcHeader& header, CcDyn& value) const;

    // 自行获取结构锁
    static void remove(GcHeader& header);

    RefCount newRefCount(bool tracked) const;
    GcHeader emptyHeader() const noexcept;

private:
    std::shared_ptr<ThreadedSpaceState> state_;
};

template <class T>
using ThreadedCc = Cc<T, ThreadedObjectSpace>;

// 多线程句柄本身可以跨线程共享（create() 已检查 T）
template <class T>
struct ThreadShareable<Cc<T, ThreadedObjectSpace>> : std::true_type {};


template <class T>
Cc<T, ThreadedObjectSpace> ThreadedObjectSpace::create(T value) {
    static_assert(ThreadShareable<T>::value,
                  "ThreadedObjectSpace::create: T must be safe to share across threads");

    // 构造与链入在同一个临界区内完成
    std::lock_guard<MutexLock> lock(state_->list_lock);
    return Cc<T, ThreadedObjectSpace>::newInSpace(std::move(value), *this);
}

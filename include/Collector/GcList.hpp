#pragma once

#include <atomic>
#include <cstddef>

#include "Collector/GcHeader.hpp"

class CcDyn;

// 以哨兵节点为头尾的侵入式双向循环链表，串起一个对象空间的所有被跟踪对象
// 本身不加锁，由所属的对象空间负责同步
class GcList {
public:
    GcList() noexcept;
    ~GcList() = default;

    GcList(const GcList&) = delete;
    GcList& operator=(const GcList&) = delete;
    GcList(GcList&&) = delete;
    GcList& operator=(GcList&&) = delete;

    // 把一个未链入的节点插到哨兵之后，并记录它的类型擦除入口
    void insertAfterSentinel(GcHeader* header, CcDyn* value) noexcept;

    // 摘除节点，将 next 置空
    static void unlink(GcHeader* header) noexcept;

    std::size_t count() const noexcept;
    bool empty() const noexcept;

    // 按链表顺序（从最新插入的节点开始）访问每个节点
    template <class Callable>
    void forEach(Callable func) const;

    // 回收标志：仅用于调试断言
    bool isCollecting() const noexcept;
    void setCollecting(bool collecting) noexcept;

private:
    GcHeader sentinel_;
    std::atomic<bool> collecting_{false};
};


/**
 * @class GcDropScope
 * @brief 标记当前线程正在析构某个链表中的值（可嵌套）。
 *
 * 值的析构期间持有回收器互斥锁的共享模式，析构逻辑里对同一对象空间调用
 * collectCycles() 会自锁。collectCycles() 入口用 isDropping() 断言。
 * 作用域按栈组织在 thread_local 链上，不分配内存。
 */
class GcDropScope {
public:
    explicit GcDropScope(const GcList* list) noexcept;
    ~GcDropScope();

    GcDropScope(const GcDropScope&) = delete;
    GcDropScope& operator=(const GcDropScope&) = delete;

    // 当前线程是否位于 list 的某个值析构之中
    static bool isDropping(const GcList* list) noexcept;

private:
    const GcList* list_;
    const GcDropScope* outer_;
};


template <class Callable>
void GcList::forEach(Callable func) const {
    const GcHeader* sentinel = &sentinel_;
    GcHeader* current = sentinel_.next;
    while (current != sentinel) {
        // 先取 next：回调里不允许修改拓扑，但保持与摘除安全的遍历写法一致
        GcHeader* next = current->next;
        func(current);
        current = next;
    }
}

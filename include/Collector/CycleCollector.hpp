#pragma once

#include <cstddef>
#include <vector>

#include "Collector/CcDyn.hpp"
#include "Collector/GcHeader.hpp"
#include "Collector/GcList.hpp"

/**
 * @class CycleCollector
 * @brief 试探删除（trial deletion）循环检测，一次回收分两个阶段。
 *
 * 阶段一 findUnreachable()，调用方必须持有对象空间的全部锁：
 *   1. gc_refs = 强引用计数；
 *   2. 对每个对象 trace，每条指向同一链表内对象的出边让目标 gc_refs - 1，
 *      剩下的就是来自图外的引用数；
 *   3. gc_refs > 0 的对象是根，沿 trace 边标记所有从根可达的对象；
 *   4. 未被标记的对象即不可达的垃圾，回收器为每个垃圾对象持有一个强引用后返回。
 *   对象真实的引用计数在此阶段不被修改。
 *
 * 阶段二 releaseUnreachable()，调用方必须已经释放全部锁：
 *   先按链表顺序原地析构每个垃圾对象的值（值里的句柄照常递减计数），
 *   再释放回收器持有的强引用，对象在此时摘除链表节点并释放分配。
 */
class CycleCollector {
public:
    explicit CycleCollector(GcList& list) noexcept;
    ~CycleCollector() = default;

    CycleCollector(const CycleCollector&) = delete;
    CycleCollector& operator=(const CycleCollector&) = delete;
    CycleCollector(CycleCollector&&) = delete;
    CycleCollector& operator=(CycleCollector&&) = delete;

    std::vector<CcDyn*> findUnreachable();

    static std::size_t releaseUnreachable(const std::vector<CcDyn*>& unreachable) noexcept;

private:
    void updateRefs_() noexcept;
    void subtractRefs_() noexcept;
    void markReachable_();
    std::vector<CcDyn*> takeUnreachable_();

    // 目标是否属于正在回收的链表；跨对象空间的边被忽略
    bool isCandidate_(const GcHeader& header) const noexcept;

    static void subtractVisit_(void* ctx, CcDyn& target) noexcept;
    static void markVisit_(void* ctx, CcDyn& target);

private:
    GcList& list_;
    std::vector<GcHeader*> worklist_;
};

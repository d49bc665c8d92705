#pragma once

#include <cstddef>

#include "Collector/GcHeader.hpp"
#include "Trace/Tracer.hpp"

/**
 * @class CcDyn
 * @brief 回收器看到的对象接口（类型擦除）。
 *
 * 每个 CcBox<T, Space> 都实现它，GcHeader::value 指向它，
 * 回收器只通过这个接口与对象交互，不需要知道 T。
 */
class CcDyn {
public:
    virtual ~CcDyn() = default;

    virtual GcHeader& gcHeader() noexcept = 0;

    // 当前强引用计数
    virtual std::size_t gcRefCount() const noexcept = 0;

    // 把值的每条出边报告给 tracer；值已被析构时什么也不做
    virtual void gcTraverse(Tracer& tracer) noexcept = 0;

    // 回收器持有一个临时强引用，保证释放阶段开始前对象不会被释放
    virtual void gcRetain() noexcept = 0;

    // 原地析构值，但保留分配（引用计数元数据仍然可读）
    virtual void gcDropValue() noexcept = 0;

    // 释放 gcRetain() 取得的引用；归零时摘除链表节点并释放分配
    virtual void gcRelease() noexcept = 0;
};

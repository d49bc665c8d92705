#pragma once

#include "Collector/GcList.hpp"
#include "Tool/MutexLock.hpp"
#include "Tool/RwLock.hpp"

/**
 * @brief ThreadedObjectSpace 的共享状态：哨兵链表 + 两把锁。
 *
 * 由对象空间和每个对象的引用计数通过 std::shared_ptr 共同持有，
 * 对象可以在任意线程、甚至在对象空间析构之后安全地摘除自己。
 *
 * 加锁顺序：collector_lock 在前，list_lock 在后。
 */
struct ThreadedSpaceState : GcList {
    // 结构锁：保护链表拓扑，只在一次拼接期间持有
    MutexLock list_lock;

    // 回收器互斥锁：值访问取共享模式，collectCycles() 取独占模式
    RwLock collector_lock;
};

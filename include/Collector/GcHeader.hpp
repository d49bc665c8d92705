#pragma once

#include <cstddef>
#include <cstdint>

class CcDyn;
class GcList;

// 回收期间每个对象的临时分类
enum class GcState : std::uint8_t {
    Idle      = 0,
    Tentative = 1,  // 暂定为垃圾：所有引用都来自图内
    Reachable = 2   // 可从图外的根到达
};

// 对象头部：嵌入每个 CcBox 分配的固定位置
// 链表拓扑归对象空间所有，next/prev 均为非拥有指针
struct GcHeader {
    GcHeader* next  = nullptr;      // 已链入时非空；摘除后显式置空
    GcHeader* prev  = nullptr;
    CcDyn*    value = nullptr;      // 类型擦除入口，insert 时写入
    GcList*   owner = nullptr;      // 所属对象空间的共享上下文

    // ---- 仅在 collectCycles() 持锁期间读写 ----
    std::ptrdiff_t gc_refs  = 0;
    GcState        gc_state = GcState::Idle;

    bool isLinked() const noexcept { return next != nullptr; }
};

// ThreadedObjectSpace.cpp
#include "Collector/ThreadedObjectSpace.hpp"

#include <cassert>
#include <mutex>
#include <string>
#include <vector>

#include "Collector/CycleCollector.hpp"
#include "Tool/DebugLog.hpp"

ThreadedObjectSpace::ThreadedObjectSpace()
    : state_(std::make_shared<ThreadedSpaceState>()) {}

ThreadedObjectSpace::~ThreadedObjectSpace() {
    collectCycles();
}

void ThreadedObjectSpace::insert(GcHeader& header, CcDyn& value) const {
    assert(header.owner == state_.get() && "insert: header created by another object space");
    // 应已由 create() 加锁
    assert(!state_->list_lock.try_lock() && "insert: structural lock is not held");
    state_->insertAfterSentinel(&header, &value);
}

void ThreadedObjectSpace::remove(GcHeader& header) {
    // 对象空间可能已经析构，锁通过 owner 找到（共享状态由对象的引用计数保活）
    auto* state = static_cast<ThreadedSpaceState*>(header.owner);
    std::lock_guard<MutexLock> lock(state->list_lock);
    GcList::unlink(&header);
}

ThreadedObjectSpace::RefCount ThreadedObjectSpace::newRefCount(bool tracked) const {
    return RefCount(tracked, state_);
}

GcHeader ThreadedObjectSpace::emptyHeader() const noexcept {
    GcHeader header;
    header.owner = state_.get();
    return header;
}

std::size_t ThreadedObjectSpace::countTracked() const {
    std::lock_guard<MutexLock> lock(state_->list_lock);
    return state_->count();
}

std::size_t ThreadedObjectSpace::collectCycles() {
    assert(!GcDropScope::isDropping(state_.get()) &&
           "collectCycles() called from a value destructor of the same object space");

    std::vector<CcDyn*> unreachable;
    {
        // 等待进行中的值访问（解引用、析构）结束，并阻塞新的访问
        std::unique_lock<RwLock> collector_lock(state_->collector_lock);
        // 阻塞链表变更（创建、摘除）
        std::lock_guard<MutexLock> list_lock(state_->list_lock);

        debugLog("ThreadedObjectSpace", [] { return std::string("start collectCycles"); });
        unreachable = CycleCollector(*state_).findUnreachable();
    }

    // 值的析构会摘除链表节点、获取共享锁，必须在释放两把锁之后进行
    const std::size_t collected = CycleCollector::releaseUnreachable(unreachable);

    debugLog("ThreadedObjectSpace", [collected] {
        return "end collectCycles: " + std::to_string(collected) + " object(s) reclaimed";
    });
    return collected;
}

// CycleCollector.cpp
#include "Collector/CycleCollector.hpp"

#include <cassert>

#include "Trace/Tracer.hpp"

namespace {

    // 保证异常路径上也能清除回收标志
    class CollectingScope {
    public:
        explicit CollectingScope(GcList& list) noexcept : list_(list) {
            assert(!list_.isCollecting() && "collectCycles() re-entered");
            list_.setCollecting(true);
        }
        ~CollectingScope() { list_.setCollecting(false); }

        CollectingScope(const CollectingScope&) = delete;
        CollectingScope& operator=(const CollectingScope&) = delete;

    private:
        GcList& list_;
    };
}

CycleCollector::CycleCollector(GcList& list) noexcept
    : list_(list) {}

std::vector<CcDyn*> CycleCollector::findUnreachable() {
    CollectingScope scope(list_);

    updateRefs_();
    subtractRefs_();
    markReachable_();
    return takeUnreachable_();
}

bool CycleCollector::isCandidate_(const GcHeader& header) const noexcept {
    return header.owner == &list_ && header.isLinked();
}

void CycleCollector::updateRefs_() noexcept {
    list_.forEach([this](GcHeader* header) {
        assert(header->owner == &list_ && "linked header belongs to another object space");
        assert(header->value != nullptr);
        header->gc_refs  = static_cast<std::ptrdiff_t>(header->value->gcRefCount());
        header->gc_state = GcState::Idle;
    });
}

void CycleCollector::subtractRefs_() noexcept {
    Tracer tracer(&CycleCollector::subtractVisit_, this);
    list_.forEach([&tracer](GcHeader* header) {
        header->value->gcTraverse(tracer);
    });
}

void CycleCollector::subtractVisit_(void* ctx, CcDyn& target) noexcept {
    auto* self = static_cast<CycleCollector*>(ctx);
    GcHeader& header = target.gcHeader();
    if (!self->isCandidate_(header)) {
        return;
    }
    assert(header.gc_refs > 0 && "trace reported more edges than strong references");
    --header.gc_refs;
}

void CycleCollector::markReachable_() {
    worklist_.clear();

    // gc_refs > 0：存在图外引用，是根
    list_.forEach([this](GcHeader* header) {
        if (header->gc_refs > 0) {
            header->gc_state = GcState::Reachable;
            worklist_.push_back(header);
        } else {
            header->gc_state = GcState::Tentative;
        }
    });

    // 从根出发恢复可达对象
    Tracer tracer(&CycleCollector::markVisit_, this);
    while (!worklist_.empty()) {
        GcHeader* header = worklist_.back();
        worklist_.pop_back();
        header->value->gcTraverse(tracer);
    }
}

void CycleCollector::markVisit_(void* ctx, CcDyn& target) {
    auto* self = static_cast<CycleCollector*>(ctx);
    GcHeader& header = target.gcHeader();
    if (!self->isCandidate_(header) || header.gc_state != GcState::Tentative) {
        return;
    }
    header.gc_state = GcState::Reachable;
    self->worklist_.push_back(&header);
}

std::vector<CcDyn*> CycleCollector::takeUnreachable_() {
    std::vector<CcDyn*> unreachable;
    list_.forEach([&unreachable](GcHeader* header) {
        if (header->gc_state == GcState::Tentative) {
            unreachable.push_back(header->value);
        }
        header->gc_state = GcState::Idle;
    });

    // 持有临时强引用：值析构期间，垃圾对象之间的互相释放不会提前归还分配
    for (CcDyn* object : unreachable) {
        object->gcRetain();
    }
    return unreachable;
}

std::size_t CycleCollector::releaseUnreachable(const std::vector<CcDyn*>& unreachable) noexcept {
    // 步骤 1: 析构值，分配保留
    for (CcDyn* object : unreachable) {
        object->gcDropValue();
    }

    // 步骤 2: 此时垃圾对象只剩回收器持有的引用，释放后归还分配
    for (CcDyn* object : unreachable) {
        object->gcRelease();
    }

    return unreachable.size();
}

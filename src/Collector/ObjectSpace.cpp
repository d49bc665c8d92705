// ObjectSpace.cpp
#include "Collector/ObjectSpace.hpp"

#include <cassert>
#include <string>
#include <vector>

#include "Collector/CycleCollector.hpp"
#include "Tool/DebugLog.hpp"

ObjectSpace::ObjectSpace()
    : list_(std::make_shared<GcList>()) {}

ObjectSpace::~ObjectSpace() {
    collectCycles();
}

ObjectSpace& ObjectSpace::local() {
    static thread_local ObjectSpace tls_instance;
    return tls_instance;
}

void ObjectSpace::insert(GcHeader& header, CcDyn& value) const noexcept {
    assert(header.owner == list_.get() && "insert: header created by another object space");
    list_->insertAfterSentinel(&header, &value);
}

void ObjectSpace::remove(GcHeader& header) noexcept {
    GcList::unlink(&header);
}

ObjectSpace::RefCount ObjectSpace::newRefCount(bool tracked) const {
    return RefCount(tracked, list_);
}

GcHeader ObjectSpace::emptyHeader() const noexcept {
    GcHeader header;
    header.owner = list_.get();
    return header;
}

std::size_t ObjectSpace::countTracked() const noexcept {
    return list_->count();
}

std::size_t ObjectSpace::collectCycles() {
    assert(!GcDropScope::isDropping(list_.get()) &&
           "collectCycles() called from a value destructor of the same object space");

    debugLog("ObjectSpace", [] { return std::string("start collectCycles"); });

    std::vector<CcDyn*> unreachable = CycleCollector(*list_).findUnreachable();
    const std::size_t collected = CycleCollector::releaseUnreachable(unreachable);

    debugLog("ObjectSpace", [collected] {
        return "end collectCycles: " + std::to_string(collected) + " object(s) reclaimed";
    });
    return collected;
}

// GcList.cpp
#include "Collector/GcList.hpp"

#include <cassert>

GcList::GcList() noexcept {
    // 空链表：哨兵自成环
    sentinel_.next  = &sentinel_;
    sentinel_.prev  = &sentinel_;
    sentinel_.owner = this;
}

void GcList::insertAfterSentinel(GcHeader* header, CcDyn* value) noexcept {
    assert(header != nullptr);
    assert(!header->isLinked() && "insert: header is already linked");
    assert(header->owner == this && "insert: header belongs to another object space");
    assert(!isCollecting() && "insert: collection in progress");

    GcHeader* prev = &sentinel_;
    GcHeader* next = sentinel_.next;

    header->value = value;
    header->prev  = prev;
    header->next  = next;
    next->prev    = header;
    prev->next    = header;
}

void GcList::unlink(GcHeader* header) noexcept {
    assert(header != nullptr);
    assert(header->next != nullptr && "unlink: header is not linked");
    assert(header->prev != nullptr && "unlink: header is not linked");
    assert(header->owner == nullptr || !header->owner->isCollecting());

    GcHeader* next = header->next;
    GcHeader* prev = header->prev;
    prev->next = next;
    next->prev = prev;

    header->next = nullptr;
    header->prev = nullptr;
}

std::size_t GcList::count() const noexcept {
    std::size_t n = 0;
    forEach([&n](GcHeader*) { ++n; });
    return n;
}

bool GcList::empty() const noexcept {
    return sentinel_.next == &sentinel_;
}

namespace {
    thread_local const GcDropScope* t_drop_top = nullptr;
}

GcDropScope::GcDropScope(const GcList* list) noexcept
    : list_(list), outer_(t_drop_top) {
    t_drop_top = this;
}

GcDropScope::~GcDropScope() {
    t_drop_top = outer_;
}

bool GcDropScope::isDropping(const GcList* list) noexcept {
    for (const GcDropScope* scope = t_drop_top; scope != nullptr; scope = scope->outer_) {
        if (scope->list_ == list) {
            return true;
        }
    }
    return false;
}

bool GcList::isCollecting() const noexcept {
    return collecting_.load(std::memory_order_relaxed);
}

void GcList::setCollecting(bool collecting) noexcept {
    collecting_.store(collecting, std::memory_order_relaxed);
}

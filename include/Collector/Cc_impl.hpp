// Collector/Cc_impl.hpp
#pragma once

// ============================================================================
// CcBox
// ============================================================================

template <class T, class Space>
CcBox<T, Space>::CcBox(const Space& space, bool tracked, T&& value)
    : header_(space.emptyHeader()),
      ref_count_(space.newRefCount(tracked)) {
    ::new (static_cast<void*>(&storage_)) T(std::move(value));
}

template <class T, class Space>
void CcBox<T, Space>::incRef() noexcept {
    ref_count_.incRef();
}

template <class T, class Space>
void CcBox<T, Space>::decRef() noexcept {
    bool last = false;
    {
        // 析构是复合操作：减计数、析构值、摘除节点必须整体对回收器原子
        auto locked = ref_count_.locked();
        if (ref_count_.decRef() == 1) {
            last = true;
            dropValueLocked_();
            if (ref_count_.isTracked()) {
                Space::remove(header_);
            }
        }
    }
    // 锁已释放；ref_count_ 持有的共享状态句柄随分配一起释放
    if (last) {
        delete this;
    }
}

template <class T, class Space>
void CcBox<T, Space>::dropValueLocked_() noexcept {
    if (ref_count_.isDropped()) {
        return;
    }
    // 先置位：值析构期间的 trace 看到的是“已析构”
    ref_count_.setDropped();
    GcDropScope scope(header_.owner);
    value().~T();
}

template <class T, class Space>
std::size_t CcBox<T, Space>::gcRefCount() const noexcept {
    return ref_count_.refCount();
}

template <class T, class Space>
void CcBox<T, Space>::gcTraverse(Tracer& tracer) noexcept {
    if (ref_count_.isDropped()) {
        return;
    }
    Trace<T>::trace(value(), tracer);
}

template <class T, class Space>
void CcBox<T, Space>::gcRetain() noexcept {
    incRef();
}

template <class T, class Space>
void CcBox<T, Space>::gcDropValue() noexcept {
    auto locked = ref_count_.locked();
    dropValueLocked_();
}

template <class T, class Space>
void CcBox<T, Space>::gcRelease() noexcept {
    decRef();
}

// ============================================================================
// Cc
// ============================================================================

template <class T, class Space>
Cc<T, Space> Cc<T, Space>::newInSpace(T&& value, const Space& space) {
    const bool tracked = Trace<T>::isTypeTracked();
    Box* box = new Box(space, tracked, std::move(value));
    if (tracked) {
        space.insert(box->gcHeader(), *box);
    }
    return Cc(box);
}

template <class T, class Space>
Cc<T, Space>::Cc(const Cc& other) noexcept : box_(other.box_) {
    if (box_ != nullptr) {
        box_->incRef();
    }
}

template <class T, class Space>
Cc<T, Space>::Cc(Cc&& other) noexcept : box_(std::exchange(other.box_, nullptr)) {}

template <class T, class Space>
Cc<T, Space>& Cc<T, Space>::operator=(const Cc& other) noexcept {
    if (this != &other) {
        Cc tmp(other);
        swap(tmp);
    }
    return *this;
}

template <class T, class Space>
Cc<T, Space>& Cc<T, Space>::operator=(Cc&& other) noexcept {
    if (this != &other) {
        // 先接管再释放：释放旧对象可能递归析构到 other 所在的值
        Box* old = std::exchange(box_, std::exchange(other.box_, nullptr));
        if (old != nullptr) {
            old->decRef();
        }
    }
    return *this;
}

template <class T, class Space>
Cc<T, Space>::~Cc() {
    reset_();
}

template <class T, class Space>
void Cc<T, Space>::reset_() noexcept {
    Box* box = std::exchange(box_, nullptr);
    if (box != nullptr) {
        box->decRef();
    }
}

template <class T, class Space>
CcRef<T, Space> Cc<T, Space>::borrow() const {
    assert(box_ != nullptr && "borrow() on an empty Cc");

    auto guard = box_->refCount().locked();
    if (box_->refCount().isDropped()) {
        throw std::logic_error("Cc::borrow: value was already reclaimed by cycle collection");
    }
    return Ref(*this, std::move(guard), &box_->value());
}

template <class T, class Space>
std::size_t Cc<T, Space>::refCount() const noexcept {
    return box_ != nullptr ? box_->refCount().refCount() : 0;
}

template <class T, class Space>
bool Cc<T, Space>::isTracked() const noexcept {
    return box_ != nullptr && box_->refCount().isTracked();
}

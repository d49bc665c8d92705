#pragma once

#include <cassert>
#include <cstddef>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "Collector/CcDyn.hpp"
#include "Collector/GcHeader.hpp"
#include "Collector/GcList.hpp"
#include "Trace/Trace.hpp"
#include "Trace/Tracer.hpp"

template <class T, class Space> class Cc;
template <class T, class Space> class CcRef;

/**
 * @class CcBox
 * @brief 被跟踪对象的单次堆分配：[GcHeader][RefCount][T]。
 *
 * Space 提供 RefCount 类型、emptyHeader()、newRefCount() 以及静态的 remove()。
 * 值的生命周期与分配的生命周期分开：值可以先被回收器原地析构（dropped），
 * 分配在最后一个强引用释放时才归还。
 */
template <class T, class Space>
class CcBox final : public CcDyn {
public:
    using RefCount = typename Space::RefCount;

    CcBox(const Space& space, bool tracked, T&& value);
    ~CcBox() override = default;

    CcBox(const CcBox&) = delete;
    CcBox& operator=(const CcBox&) = delete;
    CcBox(CcBox&&) = delete;
    CcBox& operator=(CcBox&&) = delete;

    T& value() noexcept { return *reinterpret_cast<T*>(&storage_); }
    const T& value() const noexcept { return *reinterpret_cast<const T*>(&storage_); }

    RefCount& refCount() noexcept { return ref_count_; }
    const RefCount& refCount() const noexcept { return ref_count_; }

    void incRef() noexcept;

    // 最后一个强引用：析构值，摘除链表节点，释放分配
    void decRef() noexcept;

    // ---- CcDyn ----
    GcHeader& gcHeader() noexcept override { return header_; }
    std::size_t gcRefCount() const noexcept override;
    void gcTraverse(Tracer& tracer) noexcept override;
    void gcRetain() noexcept override;
    void gcDropValue() noexcept override;
    void gcRelease() noexcept override;

private:
    // 调用方持有 locked()
    void dropValueLocked_() noexcept;

private:
    GcHeader header_;
    RefCount ref_count_;
    std::aligned_storage_t<sizeof(T), alignof(T)> storage_;
};


/**
 * @class Cc
 * @brief 指向被跟踪对象的强引用句柄。
 *
 * 拷贝 = 强引用 +1，析构 = 强引用 -1。没有循环时仅靠引用计数即可释放；
 * 循环由所属对象空间的 collectCycles() 回收。
 * 被移动后的句柄为空，只能析构或重新赋值。
 */
template <class T, class Space>
class Cc {
public:
    using element_type = T;
    using Box = CcBox<T, Space>;
    using Ref = CcRef<T, Space>;

    Cc(const Cc& other) noexcept;
    Cc(Cc&& other) noexcept;
    Cc& operator=(const Cc& other) noexcept;
    Cc& operator=(Cc&& other) noexcept;
    ~Cc();

    // 借用值：返回的 CcRef 存活期间，所属对象空间的回收器不会运行
    // 值已被回收器析构时抛出 std::logic_error
    Ref borrow() const;

    std::size_t refCount() const noexcept;
    bool isTracked() const noexcept;

    bool ptrEq(const Cc& other) const noexcept { return box_ == other.box_; }
    explicit operator bool() const noexcept { return box_ != nullptr; }

    void swap(Cc& other) noexcept { std::swap(box_, other.box_); }

private:
    friend Space;
    friend struct Trace<Cc>;

    explicit Cc(Box* box) noexcept : box_(box) {}

    // 调用方负责结构锁。value 以引用传入，被移走后的对象由调用方在锁外析构
    static Cc newInSpace(T&& value, const Space& space);

    void reset_() noexcept;

    Box* box_;
};


// 借用守卫：持有一个强引用以及（多线程时）回收器互斥锁的共享模式
template <class T, class Space>
class CcRef {
public:
    using Guard = typename Space::RefCount::Guard;

    CcRef(CcRef&&) noexcept = default;
    CcRef& operator=(CcRef&&) noexcept = default;

    CcRef(const CcRef&) = delete;
    CcRef& operator=(const CcRef&) = delete;

    T& operator*() const noexcept { return *value_; }
    T* operator->() const noexcept { return value_; }
    T& get() const noexcept { return *value_; }

private:
    friend class Cc<T, Space>;

    CcRef(Cc<T, Space> owner, Guard guard, T* value) noexcept
        : owner_(std::move(owner)), guard_(std::move(guard)), value_(value) {}

    // 析构顺序与声明相反：先释放锁，再释放强引用
    Cc<T, Space> owner_;
    Guard guard_;
    T* value_;
};


// Cc 本身的出边：指向被跟踪对象时报告给 tracer
template <class T, class Space>
struct Trace<Cc<T, Space>> {
    static void trace(const Cc<T, Space>& cc, Tracer& tracer) {
        if (cc.box_ != nullptr && cc.box_->refCount().isTracked()) {
            tracer.visit(*cc.box_);
        }
    }

    static bool isTypeTracked() { return Trace<T>::isTypeTracked(); }
};

#include "Collector/Cc_impl.hpp"

#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

#include "Collector/Cc.hpp"
#include "Collector/GcHeader.hpp"
#include "Collector/GcList.hpp"
#include "Collector/RefCount.hpp"
#include "Trace/ThreadShareable.hpp"

/**
 * @class ObjectSpace
 * @brief 单线程对象空间。
 *
 * 算法与 ThreadedObjectSpace 相同，不做任何同步；对象只能在创建它的线程上
 * 使用。ObjectSpace::local() 是每个线程的默认空间，makeCc()、
 * collectThreadCycles()、countThreadTracked() 都作用于它。
 */
class ObjectSpace {
public:
    using RefCount = LocalRefCount;

    ObjectSpace();
    ~ObjectSpace();

    ObjectSpace(const ObjectSpace&) = delete;
    ObjectSpace& operator=(const ObjectSpace&) = delete;
    ObjectSpace(ObjectSpace&&) = delete;
    ObjectSpace& operator=(ObjectSpace&&) = delete;

    // 当前线程的默认对象空间
    static ObjectSpace& local();

    template <class T>
    Cc<T, ObjectSpace> create(T value);

    std::size_t countTracked() const noexcept;
    std::size_t collectCycles();

    // ---- CcBox 使用的底层接口 ----
    void insert(GcHeader& header, CcDyn& value) const noexcept;
    static void remove(GcHeader& header) noexcept;
    RefCount newRefCount(bool tracked) const;
    GcHeader emptyHeader() const noexcept;

private:
    std::shared_ptr<GcList> list_;
};

template <class T>
using LocalCc = Cc<T, ObjectSpace>;

// 单线程句柄的计数非原子，不能放进多线程对象空间
template <class T>
struct ThreadShareable<Cc<T, ObjectSpace>> : std::false_type {};


template <class T>
Cc<T, ObjectSpace> ObjectSpace::create(T value) {
    return Cc<T, ObjectSpace>::newInSpace(std::move(value), *this);
}

// ---- 线程默认空间的便捷接口 ----

template <class T>
LocalCc<T> makeCc(T value) {
    return ObjectSpace::local().create(std::move(value));
}

inline std::size_t collectThreadCycles() {
    return ObjectSpace::local().collectCycles();
}

inline std::size_t countThreadTracked() {
    return ObjectSpace::local().countTracked();
}

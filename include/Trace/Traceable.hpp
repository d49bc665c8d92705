#pragma once

#include "Trace/Trace.hpp"

/**
 * @class Traceable
 * @brief 不透明的、动态类型的可追踪值。
 *
 * 具体内容在编译期未知，因此持有 Traceable 的类型一律被视为可能参与循环
 * （isTypeTracked() 为 true）。典型用法是 std::unique_ptr<Traceable>。
 */
class Traceable {
public:
    virtual ~Traceable() = default;

    virtual void trace(Tracer& tracer) const = 0;
};

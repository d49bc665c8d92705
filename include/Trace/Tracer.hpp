#pragma once

class CcDyn;

/**
 * @class Tracer
 * @brief 传给 trace 的一次性访问器。
 *
 * 值的 trace 实现对它持有的每一条指向被跟踪对象的强引用调用一次 visit()。
 * 回收器每个阶段都会新建一个 Tracer，它本身不携带任何持久状态：
 * 只有一个回调函数指针和回调上下文。
 */
class Tracer {
public:
    using VisitFn = void (*)(void* ctx, CcDyn& target);

    Tracer(VisitFn fn, void* ctx) noexcept : fn_(fn), ctx_(ctx) {}

    Tracer(const Tracer&) = delete;
    Tracer& operator=(const Tracer&) = delete;

    void visit(CcDyn& target) { fn_(ctx_, target); }

private:
    VisitFn fn_;
    void*   ctx_;
};

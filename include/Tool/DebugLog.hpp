#pragma once

#include <atomic>
#include <string>

/**
 * @class DebugLog
 * @brief 进程级诊断日志，默认关闭。
 *
 * 输出格式为 "[component] message"，默认写入 std::cerr，
 * 也可以通过 setSink() 安装自定义输出函数（测试中用于捕获日志）。
 *
 * 初始开关：
 *   1. 编译期 CYCLECC_DEBUG_LOG_DEFAULT（由 CMake 选项 CYCLECC_ENABLE_DEBUG_LOG 定义）
 *   2. 首次使用时读取环境变量 CYCLECC_DEBUG_LOG（"1" 开 / "0" 关），覆盖 1
 *   3. setEnabled() 覆盖以上两者
 */
class DebugLog {
public:
    using Sink = void (*)(const char* component, const char* message);

    static bool enabled() noexcept;
    static void setEnabled(bool on) noexcept;

    // 传入 nullptr 恢复默认输出（std::cerr）
    static void setSink(Sink sink) noexcept;

    static void write(const char* component, const std::string& message);

    DebugLog() = delete;
};

// 仅在日志开启时才调用 makeMessage() 构造消息字符串
template <class MakeMessage>
inline void debugLog(const char* component, MakeMessage&& makeMessage) {
    if (DebugLog::enabled()) {
        DebugLog::write(component, makeMessage());
    }
}

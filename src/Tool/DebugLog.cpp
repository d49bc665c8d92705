#include "Tool/DebugLog.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

#include "Tool/MutexLock.hpp"

#ifndef CYCLECC_DEBUG_LOG_DEFAULT
#define CYCLECC_DEBUG_LOG_DEFAULT 0
#endif

namespace {

    // 0 = 未初始化，1 = 关闭，2 = 开启
    std::atomic<int> g_state{0};
    std::atomic<DebugLog::Sink> g_sink{nullptr};

    MutexLock& outputLock() {
        static MutexLock lock;
        return lock;
    }

    int initialState() noexcept {
        bool on = CYCLECC_DEBUG_LOG_DEFAULT != 0;
        const char* env = std::getenv("CYCLECC_DEBUG_LOG");
        if (env != nullptr) {
            on = std::strcmp(env, "0") != 0 && env[0] != '\0';
        }
        return on ? 2 : 1;
    }
}

bool DebugLog::enabled() noexcept {
    int state = g_state.load(std::memory_order_relaxed);
    if (state == 0) {
        int expected = 0;
        const int init = initialState();
        // 与 setEnabled() 竞争时以先写入者为准
        if (!g_state.compare_exchange_strong(expected, init, std::memory_order_relaxed)) {
            return expected == 2;
        }
        return init == 2;
    }
    return state == 2;
}

void DebugLog::setEnabled(bool on) noexcept {
    g_state.store(on ? 2 : 1, std::memory_order_relaxed);
}

void DebugLog::setSink(Sink sink) noexcept {
    g_sink.store(sink, std::memory_order_release);
}

void DebugLog::write(const char* component, const std::string& message) {
    std::lock_guard<MutexLock> lock(outputLock());

    Sink sink = g_sink.load(std::memory_order_acquire);
    if (sink != nullptr) {
        sink(component, message.c_str());
        return;
    }

    std::cerr << "[" << component << "] " << message << std::endl;
}

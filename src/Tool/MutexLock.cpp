#include "Tool/MutexLock.hpp"

#include <pthread.h>
#include <cerrno>
#include <system_error>

// 将 pthread 返回码转成 C++ 异常
static void throw_system_error(int ec, const char* what) {
    // pthread 函数返回的是“错误码”而不是设置 errno
    throw std::system_error(std::error_code(ec, std::generic_category()), what);
}

MutexLock::MutexLock() {
    pthread_mutexattr_t attr{};
    int rc = pthread_mutexattr_init(&attr);
    if (rc != 0) {
        throw_system_error(rc, "pthread_mutexattr_init failed");
    }

    rc = pthread_mutexattr_settype(&attr, PTHREAD_MUTEX_ERRORCHECK);
    if (rc != 0) {
        pthread_mutexattr_destroy(&attr);
        throw_system_error(rc, "pthread_mutexattr_settype(PTHREAD_MUTEX_ERRORCHECK) failed");
    }

    rc = pthread_mutex_init(&mtx_, &attr);
    pthread_mutexattr_destroy(&attr);

    if (rc != 0)
        throw_system_error(rc, "pthread_mutex_init failed");
}

MutexLock::~MutexLock() {
    pthread_mutex_destroy(&mtx_);
}

void MutexLock::lock() const {
    int rc = pthread_mutex_lock(&mtx_);
    if (rc == 0) return;

    if (rc == EDEADLK) {
        // 当前线程已持有该锁：通常是 trace/析构逻辑重入了同一个对象空间
        throw_system_error(rc, "pthread_mutex_lock: lock already held by this thread");
    }

    throw_system_error(rc, "pthread_mutex_lock failed");
}

bool MutexLock::try_lock() const noexcept {
    int rc = pthread_mutex_trylock(&mtx_);
    if (rc == 0) return true;

    // EBUSY 为正常的忙碌情况；其他错误在 noexcept 环境中一律按失败处理
    return false;
}

void MutexLock::unlock() const noexcept {
    // unlock 若失败通常是未持有锁，这里选择忽略返回值
    (void)pthread_mutex_unlock(&mtx_);
}

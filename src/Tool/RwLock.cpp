#include "Tool/RwLock.hpp"

#include <pthread.h>
#include <cerrno>
#include <system_error>

static void throw_system_error(int ec, const char* what) {
    throw std::system_error(std::error_code(ec, std::generic_category()), what);
}

RwLock::RwLock() {
    pthread_rwlockattr_t attr{};
    int rc = pthread_rwlockattr_init(&attr);
    if (rc != 0) {
        throw_system_error(rc, "pthread_rwlockattr_init failed");
    }

    // glibc 扩展：读者优先，允许同一线程递归获取共享锁
    rc = pthread_rwlockattr_setkind_np(&attr, PTHREAD_RWLOCK_PREFER_READER_NP);
    if (rc != 0) {
        pthread_rwlockattr_destroy(&attr);
        throw_system_error(rc, "pthread_rwlockattr_setkind_np(PTHREAD_RWLOCK_PREFER_READER_NP) failed");
    }

    rc = pthread_rwlock_init(&rw_, &attr);
    pthread_rwlockattr_destroy(&attr);

    if (rc != 0)
        throw_system_error(rc, "pthread_rwlock_init failed");
}

RwLock::~RwLock() {
    pthread_rwlock_destroy(&rw_);
}

void RwLock::lock() const {
    int rc = pthread_rwlock_wrlock(&rw_);
    if (rc == 0) return;

    if (rc == EDEADLK) {
        // 当前线程已持有写锁：回收过程中重入了 collectCycles()
        throw_system_error(rc, "pthread_rwlock_wrlock: write lock already held by this thread");
    }

    throw_system_error(rc, "pthread_rwlock_wrlock failed");
}

bool RwLock::try_lock() const noexcept {
    return pthread_rwlock_trywrlock(&rw_) == 0;
}

void RwLock::unlock() const noexcept {
    (void)pthread_rwlock_unlock(&rw_);
}

void RwLock::lock_shared() const {
    int rc = pthread_rwlock_rdlock(&rw_);
    if (rc == 0) return;

    if (rc == EDEADLK) {
        // 当前线程持有写锁：回收过程中的 trace 访问了对象值
        throw_system_error(rc, "pthread_rwlock_rdlock: write lock held by this thread");
    }

    // EAGAIN：共享锁计数溢出
    throw_system_error(rc, "pthread_rwlock_rdlock failed");
}

bool RwLock::try_lock_shared() const noexcept {
    return pthread_rwlock_tryrdlock(&rw_) == 0;
}

void RwLock::unlock_shared() const noexcept {
    (void)pthread_rwlock_unlock(&rw_);
}

// tests/ThreadedObjectSpace_concurrency_test.cpp
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <thread>
#include <vector>

#include "Collector/ThreadedObjectSpace.hpp"
#include "fixtures/ObjectSpaceTestFixture.hpp"

using namespace std::chrono_literals;

namespace {

// 有上限的等待，避免失败时测试挂死
bool waitFor(const std::atomic<bool>& flag, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!flag.load(std::memory_order_acquire)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

class ThreadedObjectSpaceConcurrencyTest : public ObjectSpaceTestFixture<ThreadedObjectSpace> {};

/**
 * @test ConcurrentCreate_AllObjectsLinked
 * @brief 8 个线程并发创建对象，链表不丢节点。
 */
TEST_F(ThreadedObjectSpaceConcurrencyTest, ConcurrentCreate_AllObjectsLinked) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::vector<Handle>> kept(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, t, &kept] {
            kept[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                kept[t].push_back(makeNode(t * kPerThread + i));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(space_->countTracked(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(space_->collectCycles(), 0u);

    kept.clear();
    EXPECT_EQ(space_->countTracked(), 0u);
    EXPECT_EQ(destroyed(), static_cast<std::size_t>(kThreads * kPerThread));
}

/**
 * @test HandlesCrossThreads_RefCountBalanced
 * @brief 多个线程反复拷贝、释放同一个句柄，最终引用计数回到 1。
 */
TEST_F(ThreadedObjectSpaceConcurrencyTest, HandlesCrossThreads_RefCountBalanced) {
    Handle shared = makeNode(1);

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&shared] {
            for (int i = 0; i < 1000; ++i) {
                Handle copy = shared;
                Handle moved = std::move(copy);
                (void)moved;
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(shared.refCount(), 1u);
    EXPECT_EQ(destroyed(), 0u);
}

/**
 * @test StressCyclesWithBackgroundCollector
 * @brief 多个线程不停地制造并丢弃循环，另一个线程不停地回收。
 *        结束后再回收一次：创建数 == 析构数，链表为空。
 */
TEST_F(ThreadedObjectSpaceConcurrencyTest, StressCyclesWithBackgroundCollector) {
    constexpr int kThreads = 4;
    constexpr int kRounds = 300;

    std::atomic<bool> done{false};
    std::atomic<std::size_t> created{0};

    std::thread collector([this, &done] {
        while (!done.load(std::memory_order_acquire)) {
            space_->collectCycles();
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, t, &created] {
            for (int i = 0; i < kRounds; ++i) {
                Handle a = makeNode(t);
                Handle b = makeNode(t);
                Handle c = makeNode(t);
                linkNodes(a, b);
                linkNodes(b, c);
                linkNodes(c, a);
                if (i % 3 == 0) {
                    // 偶尔留一条无环的尾巴
                    Handle tail = makeNode(t);
                    linkNodes(c, tail);
                    created.fetch_add(1, std::memory_order_relaxed);
                }
                created.fetch_add(3, std::memory_order_relaxed);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    done.store(true, std::memory_order_release);
    collector.join();

    space_->collectCycles();
    EXPECT_EQ(space_->countTracked(), 0u);
    EXPECT_EQ(destroyed(), created.load());
}

/**
 * @test StressCyclesWithConcurrentCollectors
 * @brief 多个回收线程同时运行：一个回收器在锁外析构垃圾时，另一个回收器
 *        会再次扫描到这些已被持有、尚未释放的对象，它们不能被重复回收。
 */
TEST_F(ThreadedObjectSpaceConcurrencyTest, StressCyclesWithConcurrentCollectors) {
    constexpr int kCreators = 4;
    constexpr int kCollectors = 3;
    constexpr int kRounds = 500;

    std::atomic<bool> done{false};
    std::atomic<std::size_t> created{0};
    std::atomic<std::size_t> collected{0};

    std::vector<std::thread> collectors;
    for (int c = 0; c < kCollectors; ++c) {
        collectors.emplace_back([this, &done, &collected] {
            while (!done.load(std::memory_order_acquire)) {
                collected.fetch_add(space_->collectCycles(), std::memory_order_relaxed);
                std::this_thread::yield();
            }
        });
    }

    std::vector<std::thread> creators;
    for (int t = 0; t < kCreators; ++t) {
        creators.emplace_back([this, t, &created] {
            for (int i = 0; i < kRounds; ++i) {
                Handle a = makeNode(t);
                Handle b = makeNode(t);
                linkNodes(a, b);
                linkNodes(b, a);
                if (i % 2 == 0) {
                    linkNodes(a, a);
                }
                created.fetch_add(2, std::memory_order_relaxed);
            }
        });
    }
    for (auto& w : creators) {
        w.join();
    }
    done.store(true, std::memory_order_release);
    for (auto& c : collectors) {
        c.join();
    }

    collected.fetch_add(space_->collectCycles(), std::memory_order_relaxed);
    EXPECT_EQ(space_->countTracked(), 0u);
    EXPECT_EQ(destroyed(), created.load());
    // 每个环上的对象恰好被回收一次
    EXPECT_EQ(collected.load(), created.load());
}

/**
 * @test BorrowBlocksCollect
 * @brief 持有 CcRef 期间 collectCycles() 不能开始；释放后很快完成。
 */
TEST_F(ThreadedObjectSpaceConcurrencyTest, BorrowBlocksCollect) {
    {
        Handle a = makeNode(1);
        linkNodes(a, a);
    }
    Handle held = makeNode(2);

    std::optional<Handle::Ref> ref(held.borrow());
    auto pending = std::async(std::launch::async, [this] { return space_->collectCycles(); });

    EXPECT_EQ(pending.wait_for(100ms), std::future_status::timeout);
    EXPECT_EQ(destroyed(), 0u);

    ref.reset();
    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(pending.get(), 1u);
    EXPECT_EQ(destroyed(), 1u);
}

// trace() 第一次被调用时停下来，直到测试放行
struct SlowTraceNode {
    static constexpr bool kThreadShareable = true;

    std::atomic<bool>* entered = nullptr;
    std::atomic<bool>* release = nullptr;
    std::optional<ThreadedCc<SlowTraceNode>> next;

    SlowTraceNode(std::atomic<bool>* entered_flag, std::atomic<bool>* release_flag)
        : entered(entered_flag), release(release_flag) {}

    void trace(Tracer& tracer) const {
        if (entered != nullptr && !entered->exchange(true)) {
            waitFor(*release, 5000ms);
        }
        traceValue(next, tracer);
    }
};

/**
 * @test CollectBlocksBorrow
 * @brief 回收器运行期间，其他线程对同一空间的 borrow() 会阻塞到回收结束。
 */
TEST(ThreadedObjectSpaceExclusionTest, CollectBlocksBorrow) {
    ThreadedObjectSpace space;
    std::atomic<std::size_t> destroyed{0};
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};

    auto slow = space.create(SlowTraceNode(&entered, &release));
    auto other = space.create(GraphNode<ThreadedObjectSpace>(7, &destroyed));

    auto collecting = std::async(std::launch::async, [&space] { return space.collectCycles(); });
    ASSERT_TRUE(waitFor(entered, 5000ms));

    auto borrowing = std::async(std::launch::async, [&other] { return other.borrow()->id; });
    EXPECT_EQ(borrowing.wait_for(100ms), std::future_status::timeout);

    release.store(true, std::memory_order_release);

    ASSERT_EQ(collecting.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(collecting.get(), 0u);
    ASSERT_EQ(borrowing.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(borrowing.get(), 7);
    EXPECT_EQ(destroyed.load(), 0u);
}

#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

#include "Collector/Cc.hpp"
#include "Trace/ThreadShareable.hpp"
#include "Trace/Trace.hpp"
#include "Trace/TraceStd.hpp"

// ============================================================================
// --- 测试辅助工具 ---
// ============================================================================

// 图节点：edges 持有指向其他节点的强引用，析构时原子地增加外部计数器。
// 被移动后 destruction_counter 置空，移走的空壳析构不计数。
template <class Space>
struct GraphNode {
    using Handle = Cc<GraphNode, Space>;

    // 能否跨线程共享取决于边的句柄类型
    static constexpr bool kThreadShareable = ThreadShareable<std::vector<Handle>>::value;

    int id = 0;
    std::atomic<std::size_t>* destruction_counter = nullptr;
    std::vector<Handle> edges;

    GraphNode(int node_id, std::atomic<std::size_t>* counter)
        : id(node_id), destruction_counter(counter) {}

    GraphNode(GraphNode&& other) noexcept
        : id(other.id),
          destruction_counter(std::exchange(other.destruction_counter, nullptr)),
          edges(std::move(other.edges)) {}

    GraphNode& operator=(GraphNode&&) = delete;
    GraphNode(const GraphNode&) = delete;
    GraphNode& operator=(const GraphNode&) = delete;

    ~GraphNode() {
        if (destruction_counter) {
            destruction_counter->fetch_add(1, std::memory_order_relaxed);
        }
    }

    void trace(Tracer& tracer) const { traceValue(edges, tracer); }
};

// from -> to
template <class Space>
void linkNodes(const Cc<GraphNode<Space>, Space>& from, const Cc<GraphNode<Space>, Space>& to) {
    from.borrow()->edges.push_back(to);
}

// 不持有任何 Cc 的叶子值
struct LeafValue {
    int payload = 0;
};

CYCLECC_TRACE_ACYCLIC(LeafValue);

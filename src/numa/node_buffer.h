#pragma once

/// @file node_buffer.h
/// @brief NUMA-local arena holding one copy of the iterate.
///
/// The iterate is shared between Hogwild workers without locks. Elements
/// are std::atomic<double> accessed with memory_order_relaxed: on x86-64
/// that is a plain aligned 8-byte load/store, so the racy sweep costs the
/// same as raw doubles while staying well-defined C++. No ordering is
/// implied between different coordinates; a worker may observe any mix of
/// old and new values of the other entries.

#include <atomic>
#include <cstddef>

#include "core/types.h"

namespace qpscd {

/// Non-owning handle to an iterate replica, passed to the update kernel.
struct IterateView {
    std::atomic<double>* data = nullptr;
    Index size = 0;

    double load(Index i) const {
        return data[i].load(std::memory_order_relaxed);
    }
    void store(Index i, double v) const {
        data[i].store(v, std::memory_order_relaxed);
    }
};

/// Length-n array of atomic doubles allocated on one NUMA node.
///
/// Memory comes from numa_alloc_onnode when node >= 0 and NUMA is
/// available, otherwise from an aligned heap allocation. Move-only.
class NodeBuffer {
public:
    NodeBuffer() = default;

    /// @param n    Number of elements (zero-initialized).
    /// @param node NUMA node id, or -1 for no placement.
    /// @throws std::runtime_error if the allocation fails.
    NodeBuffer(Index n, int node);
    ~NodeBuffer();

    NodeBuffer(const NodeBuffer&) = delete;
    NodeBuffer& operator=(const NodeBuffer&) = delete;
    NodeBuffer(NodeBuffer&& other) noexcept;
    NodeBuffer& operator=(NodeBuffer&& other) noexcept;

    Index size() const { return size_; }
    int node() const { return node_; }

    double load(Index i) const {
        return data_[i].load(std::memory_order_relaxed);
    }
    void store(Index i, double v) {
        data_[i].store(v, std::memory_order_relaxed);
    }

    IterateView view() { return IterateView{data_, size_}; }

    /// Copy the current contents into a dense vector.
    VectorXd to_vector() const;

private:
    void release();

    std::atomic<double>* data_ = nullptr;
    Index size_ = 0;
    int node_ = -1;
    std::size_t bytes_ = 0;
    bool numa_backed_ = false;
};

}  // namespace qpscd

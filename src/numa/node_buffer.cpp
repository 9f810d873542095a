#include "numa/node_buffer.h"

#include <cstdlib>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

#include <numa.h>

namespace qpscd {

namespace {

constexpr std::size_t kCacheLine = 64;

static_assert(sizeof(std::atomic<double>) == sizeof(double),
              "atomic<double> must have the layout of double");

}  // namespace

NodeBuffer::NodeBuffer(Index n, int node) : size_(n), node_(node) {
    if (n < 0) {
        throw std::runtime_error("NodeBuffer: negative size " +
                                 std::to_string(n));
    }
    if (n == 0) return;

    bytes_ = static_cast<std::size_t>(n) * sizeof(std::atomic<double>);
    void* mem = nullptr;
    if (node >= 0 && numa_available() >= 0) {
        // numa_alloc_onnode returns page-aligned memory.
        mem = numa_alloc_onnode(bytes_, node);
        numa_backed_ = true;
    } else {
        std::size_t rounded = (bytes_ + kCacheLine - 1) / kCacheLine * kCacheLine;
        mem = std::aligned_alloc(kCacheLine, rounded);
        numa_backed_ = false;
    }
    if (mem == nullptr) {
        throw std::runtime_error("NodeBuffer: failed to allocate " +
                                 std::to_string(bytes_) + " bytes on node " +
                                 std::to_string(node));
    }

    data_ = static_cast<std::atomic<double>*>(mem);
    for (Index i = 0; i < n; ++i) {
        new (&data_[i]) std::atomic<double>(0.0);
    }
}

NodeBuffer::~NodeBuffer() { release(); }

NodeBuffer::NodeBuffer(NodeBuffer&& other) noexcept
    : data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      node_(other.node_),
      bytes_(std::exchange(other.bytes_, 0)),
      numa_backed_(other.numa_backed_) {}

NodeBuffer& NodeBuffer::operator=(NodeBuffer&& other) noexcept {
    if (this != &other) {
        release();
        data_ = std::exchange(other.data_, nullptr);
        size_ = std::exchange(other.size_, 0);
        node_ = other.node_;
        bytes_ = std::exchange(other.bytes_, 0);
        numa_backed_ = other.numa_backed_;
    }
    return *this;
}

void NodeBuffer::release() {
    if (data_ == nullptr) return;
    // std::atomic<double> is trivially destructible.
    if (numa_backed_) {
        numa_free(data_, bytes_);
    } else {
        std::free(data_);
    }
    data_ = nullptr;
    size_ = 0;
    bytes_ = 0;
}

VectorXd NodeBuffer::to_vector() const {
    VectorXd v(size_);
    for (Index i = 0; i < size_; ++i) {
        v(i) = load(i);
    }
    return v;
}

}  // namespace qpscd

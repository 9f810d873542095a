#include "solver/epoch_driver.h"

#include <algorithm>
#include <exception>

#include "solver/coordinate_update.h"

namespace qpscd {

void sweep_range(const BoxQP& bqp, const Permutation& perm, Index begin,
                 Index end, const IterateView& x) {
    for (Index k = begin; k < end; ++k) {
        scd_update(bqp, perm[k], x);
    }
}

std::vector<std::future<void>> launch_epoch(const BoxQP& bqp,
                                            const Permutation& perm,
                                            const IterateView& x,
                                            ThreadPool& pool) {
    const Index n = static_cast<Index>(perm.size());
    const Index n_chunks = std::max<Index>(
        1, std::min<Index>(static_cast<Index>(pool.thread_count()), n));
    const Index base = n / n_chunks;
    const Index extra = n % n_chunks;

    std::vector<std::future<void>> futures;
    futures.reserve(n_chunks);

    Index begin = 0;
    for (Index c = 0; c < n_chunks; ++c) {
        // First `extra` chunks take one more index.
        const Index end = begin + base + (c < extra ? 1 : 0);
        if (end > begin) {
            futures.push_back(pool.enqueue([&bqp, &perm, x, begin, end] {
                sweep_range(bqp, perm, begin, end, x);
            }));
        }
        begin = end;
    }
    return futures;
}

void run_epoch(const BoxQP& bqp, const Permutation& perm,
               const IterateView& x, ThreadPool& pool) {
    auto futures = launch_epoch(bqp, perm, x, pool);
    wait_all(futures);
}

void wait_all(std::vector<std::future<void>>& futures) {
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    futures.clear();
    if (first_error) std::rethrow_exception(first_error);
}

}  // namespace qpscd

#pragma once

/// @file epoch_driver.h
/// @brief One Hogwild sweep over all coordinates of one replica.
///
/// The permutation is cut into one contiguous chunk per worker of the
/// replica's pool; each worker walks its chunk in order and calls the
/// coordinate kernel with no locking. Updates in different chunks run
/// concurrently and may observe each other's partial progress. The only
/// synchronization is waiting for all chunks to finish.

#include <future>
#include <vector>

#include "core/types.h"
#include "numa/node_buffer.h"
#include "parallel/thread_pool.h"
#include "problem/box_qp.h"

namespace qpscd {

/// Apply the coordinate kernel to perm[begin], ..., perm[end - 1] in order
/// on the calling thread.
void sweep_range(const BoxQP& bqp, const Permutation& perm, Index begin,
                 Index end, const IterateView& x);

/// Queue one epoch on x across the pool's workers without waiting.
///
/// bqp, perm and the memory behind x must outlive the returned futures.
/// @return One future per queued chunk (empty chunks are not queued).
std::vector<std::future<void>> launch_epoch(const BoxQP& bqp,
                                            const Permutation& perm,
                                            const IterateView& x,
                                            ThreadPool& pool);

/// Run one epoch on x and block until every chunk has finished.
/// Rethrows the first exception raised by a worker.
void run_epoch(const BoxQP& bqp, const Permutation& perm,
               const IterateView& x, ThreadPool& pool);

/// Block on a batch of futures, rethrowing the first failure only after
/// every future has completed (so no task still touches freed state).
void wait_all(std::vector<std::future<void>>& futures);

}  // namespace qpscd

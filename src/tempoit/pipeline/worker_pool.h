//
//  worker_pool.h
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <functional>
#include <thread>

namespace tempoit {
namespace detail {

using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

/// @brief Run `task(index)` for every index in [0, count) on up to `jobs` threads.
///
/// Workers pull the next index from a shared counter, so a slow item never
/// holds back the queue. Returns once every task has finished. `task` must
/// not throw.
void run_indexed(std::size_t count, std::size_t jobs, const std::function<void(std::size_t)>& task);

/// @brief As above, with helper threads started through `launch`.
///
/// When `launch` throws `std::system_error` no further threads are started;
/// the threads already running and the calling thread finish the work.
void run_indexed(std::size_t count,
                 std::size_t jobs,
                 const std::function<void(std::size_t)>& task,
                 const ThreadLauncher& launch);

} // namespace detail
} // namespace tempoit

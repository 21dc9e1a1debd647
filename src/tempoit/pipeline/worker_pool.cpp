//
//  worker_pool.cpp
//  TempoIt
//
//  Created by Till Toenshoff on 2026-10-15.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "worker_pool.h"

#include "tempoit/logging.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <utility>
#include <vector>

namespace tempoit {
namespace detail {

void run_indexed(std::size_t count, std::size_t jobs, const std::function<void(std::size_t)>& task) {
    run_indexed(count, jobs, task, [](std::function<void()> body) {
        return std::thread(std::move(body));
    });
}

void run_indexed(std::size_t count,
                 std::size_t jobs,
                 const std::function<void(std::size_t)>& task,
                 const ThreadLauncher& launch) {
    if (count == 0 || !task) {
        return;
    }
    const std::size_t workers = std::min(std::max<std::size_t>(1, jobs), count);
    if (workers == 1 || !launch) {
        for (std::size_t i = 0; i < count; ++i) {
            task(i);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            const std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= count) {
                return;
            }
            task(index);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers - 1);
    for (std::size_t i = 1; i < workers; ++i) {
        try {
            threads.push_back(launch(worker));
        } catch (const std::system_error& err) {
            TEMPOIT_LOG_WARN("Worker pool: started " << threads.size() + 1 << " of " << workers
                             << " workers: " << err.what());
            break;
        }
    }
    worker();
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace detail
} // namespace tempoit

#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

// Worker count: requested (>0) or hardware concurrency, capped at 16 and at
// the amount of work, never 0.
inline unsigned choose_worker_count(unsigned requested, std::size_t work_items) {
    unsigned n = requested;
    if (n == 0) {
        n = std::thread::hardware_concurrency();
        if (n == 0) n = 4;
        n = std::min<unsigned>(n, 16u);
    }
    if (work_items < n) n = static_cast<unsigned>(work_items);
    if (n == 0) n = 1;
    return n;
}

// Splits [0,total) into contiguous chunks, one per worker, and runs
// fn(worker_idx, start, end) on each. Chunk i always precedes chunk i+1, so
// callers merge per-worker results in worker order to keep input order.
// The first exception thrown by any worker is rethrown after all joined.
// Returns the number of workers actually used.
template <class Fn>
unsigned run_chunked(std::size_t total, unsigned num_workers, Fn&& fn) {
    if (total == 0) return 0;
    if (num_workers == 0) num_workers = 1;

    const std::size_t chunk_size = (total + num_workers - 1) / num_workers;

    std::vector<std::thread> workers;
    std::vector<std::exception_ptr> errors(num_workers);
    workers.reserve(num_workers);

    std::size_t cur_start = 0;
    for (unsigned t = 0; t < num_workers; ++t) {
        const std::size_t start = cur_start;
        const std::size_t end   = std::min<std::size_t>(start + chunk_size, total);
        cur_start = end;
        if (start >= end) break;

        workers.emplace_back([&, start, end, t]() {
            try {
                fn(t, start, end);
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }

    const unsigned used = static_cast<unsigned>(workers.size());
    for (auto& th : workers) {
        if (th.joinable()) th.join();
    }

    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    return used;
}

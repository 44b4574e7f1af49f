#include "worker_pool.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#include "obs/context.h"

namespace cloudpulse {

auto RunBounded(size_t count, size_t max_workers, const std::function<void(size_t)>& task) -> void {
    if (count == 0) return;
    size_t workers = std::max<size_t>(1, std::min(count, max_workers));

    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) {
            task(i);
        }
        return;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    const bool has_ctx = obs::HasContext();
    const obs::Context ctx = obs::GetContext();

    auto worker = [&]() {
        if (has_ctx) {
            obs::SetContext(ctx);
        }
        while (!failed.load()) {
            size_t i = next.fetch_add(1);
            if (i >= count) break;
            try {
                task(i);
            } catch (...) {
                // Captured and rethrown on the calling thread.
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true);
            }
        }
        obs::ClearContext();
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back(worker);
        }
    } catch (...) {
        // Joinable threads must not be destroyed; stop and join the ones already running.
        failed.store(true);
        for (auto& t : threads) {
            t.join();
        }
        throw;
    }
    for (auto& t : threads) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace cloudpulse

#pragma once

#include <cstddef>
#include <functional>

namespace cloudpulse {

/**
 * @brief Runs task(0) .. task(count - 1) on at most max_workers threads.
 *
 * Blocks until every index has run. Workers inherit the caller's
 * obs::Context. If any task throws, remaining indices are skipped and the
 * first exception is rethrown on the calling thread once all workers exit.
 */
auto RunBounded(size_t count, size_t max_workers, const std::function<void(size_t)>& task) -> void;

} // namespace cloudpulse

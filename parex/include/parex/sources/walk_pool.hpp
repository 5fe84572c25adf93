#ifndef PAREX_SOURCES_WALK_POOL_HPP
#define PAREX_SOURCES_WALK_POOL_HPP

#include <parex/error.hpp>
#include <job_system/job_system.hpp>
#include <cstddef>
#include <exception>
#include <new>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace parex {

enum class WalkJobType {
    VISIT,      // hand a batch of ready items to the visitor
    ENUMERATE   // read one directory, visit its children, schedule subdirectories
};

using WalkPool = job_system::JobSystem<WalkJobType>;

/**
 * Run one push-shaped traversal on a fresh pool: start the workers, let
 * seed() submit the initial jobs, wait until every job has executed or
 * been discarded, then join. The pool is always quiesced before this
 * returns or throws.
 *
 * Failing to allocate or spawn workers, or a job that throws, surfaces as a
 * ThreadPoolFailure (a thrown ParexError keeps its identity).
 */
template<typename Seed>
void run_walk_pool(std::size_t threads, Seed&& seed) {
    std::optional<WalkPool> pool_storage;
    try {
        pool_storage.emplace(threads);
        pool_storage->start();
    } catch (const std::system_error& e) {
        throw ParexError::thread_pool_failure(e.what(), std::current_exception());
    } catch (const std::bad_alloc& e) {
        throw ParexError::thread_pool_failure(e.what(), std::current_exception());
    } catch (const std::length_error& e) {
        throw ParexError::thread_pool_failure(e.what(), std::current_exception());
    }
    WalkPool& pool = *pool_storage;

    try {
        seed(pool);
    } catch (...) {
        pool.request_stop();
        pool.wait_for_completion();
        pool.shutdown();
        throw;
    }

    pool.wait_for_completion();
    pool.shutdown();

    try {
        pool.rethrow_if_failed();
    } catch (const ParexError&) {
        throw;
    } catch (...) {
        throw ParexError::thread_pool_failure(pool.get_error_description(),
                                              std::current_exception());
    }
}

} // namespace parex

#endif // PAREX_SOURCES_WALK_POOL_HPP

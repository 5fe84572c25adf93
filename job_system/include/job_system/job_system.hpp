#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace job_system {

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Work-stealing pool with one deque per worker.
 *
 * Jobs may submit further jobs while executing. request_stop() is
 * cooperative: queued jobs are discarded and new submissions refused,
 * but jobs already executing run to completion. wait_for_completion()
 * returns once every submitted job has either executed or been discarded.
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // Supports both LIFO and FIFO
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executed{0};
        std::atomic<size_t> jobs_executing{0};
        std::atomic<size_t> jobs_stolen{0};
        std::atomic<size_t> jobs_discarded{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};
    size_t num_threads_;

    // Submitted jobs that have neither finished nor been discarded
    std::atomic<size_t> pending_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<bool> stop_requested_{false};

    // Error tracking - set by worker threads on exception
    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::mutex error_mutex_;
    std::exception_ptr first_error_;

    // Try to steal half the tasks from a victim worker
    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        // Steal from the front, the owner pops from the back
        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);

        for (size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }

        return stolen;
    }

    void finish_jobs(size_t count) {
        if (count == 0) return;
        if (pending_.fetch_sub(count) == count) {
            // Lock so a waiter between its predicate check and wait() cannot miss this
            { std::lock_guard<std::mutex> lock(completion_mutex_); }
            completion_cv_.notify_all();
        }
    }

    void record_failure(ErrorType type, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (!first_error_) {
                first_error_ = std::move(error);
                error_type_.store(type, std::memory_order_release);
            }
        }
        request_stop();
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr<JobType> job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                // If no local work, try stealing before waiting
                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();

                    for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (!job) continue;

            // Raced with request_stop(): drop it like the queued ones
            if (stop_requested_.load(std::memory_order_acquire)) {
                job.reset();
                data->jobs_discarded.fetch_add(1);
                finish_jobs(1);
                continue;
            }

            data->jobs_executing.fetch_add(1);

            // Worker threads must not throw; the first failure is kept for the owner
            try {
                job->execute();
            } catch (const std::bad_alloc&) {
                record_failure(ErrorType::OutOfMemory, std::current_exception());
            } catch (const std::exception&) {
                record_failure(ErrorType::Exception, std::current_exception());
            } catch (...) {
                record_failure(ErrorType::Unhandled, std::current_exception());
            }

            // Release captures before the job counts as finished
            job.reset();

            data->jobs_executing.fetch_sub(1);
            data->jobs_executed.fetch_add(1);
            finish_jobs(1);
        }
    }

    bool enqueue(WorkerData* worker, JobPtr<JobType> job, ScheduleMode mode) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            return false;
        }

        pending_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                // Oldest at the back, which is where the owner pops
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
        return true;
    }

public:
    explicit JobSystem(size_t num_threads = 0)
        : num_threads_(num_threads == 0 ? std::thread::hardware_concurrency() : num_threads) {
        if (num_threads_ == 0) num_threads_ = 1;

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    ~JobSystem() {
        shutdown();
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    /**
     * Spawn the worker threads. Throws std::system_error if a thread
     * cannot be created; workers that did start are joined first.
     */
    void start() {
        if (is_running_.load()) return;

        pending_.store(0);
        stop_requested_.store(false);
        error_type_.store(ErrorType::None, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            first_error_ = nullptr;
        }

        for (auto& worker : workers_) {
            worker->stop.store(false);
        }

        try {
            for (auto& worker : workers_) {
                auto* data = worker.get();
                data->thread = std::thread([this, data] {
                    worker_loop(data);
                });
            }
        } catch (...) {
            for (auto& worker : workers_) {
                worker->stop.store(true);
                worker->cv.notify_all();
            }
            for (auto& worker : workers_) {
                if (worker->thread.joinable()) {
                    worker->thread.join();
                }
            }
            throw;
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    /**
     * Queue a job on the next worker in round-robin order.
     * Returns false once a stop has been requested.
     */
    bool submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        return enqueue(workers_[worker_idx].get(), std::move(job), mode);
    }

    bool submit_to_worker(size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }

        return enqueue(workers_[worker_id].get(), std::move(job), mode);
    }

    template<typename F>
    bool submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        return submit(make_job(std::forward<F>(func), job_type), mode);
    }

    /**
     * Stop dispatching. Queued jobs are discarded, later submissions are
     * refused. Safe to call from inside a job and from several threads.
     */
    void request_stop() {
        if (stop_requested_.exchange(true, std::memory_order_acq_rel)) return;

        for (auto& worker : workers_) {
            std::deque<JobPtr<JobType>> dropped;
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                dropped.swap(worker->tasks);
            }
            worker->jobs_discarded.fetch_add(dropped.size());
            size_t count = dropped.size();
            dropped.clear();
            finish_jobs(count);
        }
    }

    bool stop_requested() const {
        return stop_requested_.load(std::memory_order_acquire);
    }

    // Blocks until every submitted job has executed or been discarded
    void wait_for_completion() {
        if (!is_running_.load()) return;

        std::unique_lock<std::mutex> lock(completion_mutex_);
        completion_cv_.wait(lock, [this] {
            return pending_.load() == 0;
        });
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    size_t get_pending_count() const {
        return pending_.load(std::memory_order_relaxed);
    }

    size_t get_executing_count() const {
        size_t count = 0;
        for (const auto& worker : workers_) {
            count += worker->jobs_executing.load(std::memory_order_relaxed);
        }
        return count;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    // Rethrow the first exception a job raised, if any
    void rethrow_if_failed() {
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error = first_error_;
        }
        if (error) {
            std::rethrow_exception(error);
        }
    }

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
        size_t total_jobs_discarded;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0, 0};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->jobs_executed.load();
            stats.total_jobs_stolen += worker->jobs_stolen.load();
            stats.total_jobs_discarded += worker->jobs_discarded.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP

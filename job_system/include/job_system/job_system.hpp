#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace job_system {

// How the first job that threw since start/clear_error failed
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc
    Exception,     // any other std::exception
    Unhandled      // not derived from std::exception
};

/**
 * Fixed-size pool of worker threads with per-worker deques and work stealing.
 * The pool size is the upper bound on concurrently executing jobs.
 *
 * Jobs are expected to report their own failures. An exception escaping a job
 * is recorded together with the job's kind (see get_error_type,
 * get_error_message, get_failed_job_type) and the worker keeps running, so the
 * pool stays usable after a failed job.
 */
template<typename JobType>
class JobSystem {
private:
    struct Worker {
        std::deque<JobPtr<JobType>> queue;  // back is taken by the owner, front by thieves
        std::mutex mutex;
        std::condition_variable wake;
        std::thread thread;
        std::atomic<bool> stopping{false};
        std::atomic<size_t> executed{0};
        std::atomic<size_t> stolen{0};
    };

    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<size_t> next_worker_{0};
    std::atomic<bool> running_{false};

    // Completion barrier: finished_ only advances under state_mutex_
    std::atomic<size_t> submitted_{0};
    size_t finished_{0};
    mutable std::mutex state_mutex_;
    std::condition_variable all_done_;

    // First escaped failure, guarded by state_mutex_
    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::string error_message_;
    std::optional<JobType> failed_job_type_;

    // Moves up to half of the victim's queue, oldest jobs first
    std::vector<JobPtr<JobType>> steal_from(Worker* victim) {
        std::vector<JobPtr<JobType>> taken;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);
        if (!lock.owns_lock() || victim->queue.empty()) {
            return taken;
        }

        const size_t count = std::max<size_t>(1, victim->queue.size() / 2);
        taken.reserve(count);
        while (taken.size() < count && !victim->queue.empty()) {
            taken.push_back(std::move(victim->queue.front()));
            victim->queue.pop_front();
        }
        return taken;
    }

    // Look for work on other workers; true if something was moved onto `self`
    bool try_steal(Worker* self, std::mt19937& rng) {
        std::uniform_int_distribution<size_t> pick(0, workers_.size() - 1);
        for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
            Worker* victim = workers_[pick(rng)].get();
            if (victim == self) {
                continue;
            }
            auto taken = steal_from(victim);
            if (taken.empty()) {
                continue;
            }
            std::lock_guard<std::mutex> lock(self->mutex);
            self->stolen.fetch_add(taken.size());
            for (auto& job : taken) {
                self->queue.push_back(std::move(job));
            }
            return true;
        }
        return false;
    }

    void record_error(ErrorType type, JobType kind, const char* message) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (error_type_.load(std::memory_order_relaxed) != ErrorType::None) {
            return;
        }
        error_message_ = message;
        failed_job_type_ = kind;
        error_type_.store(type, std::memory_order_release);
    }

    void run_job(Worker* self, JobPtr<JobType> job) {
        const JobType kind = job->kind();
        try {
            job->run();
        } catch (const std::bad_alloc& e) {
            record_error(ErrorType::OutOfMemory, kind, e.what());
        } catch (const std::exception& e) {
            record_error(ErrorType::Exception, kind, e.what());
        } catch (...) {
            record_error(ErrorType::Unhandled, kind, "non-standard exception");
        }

        // Captures are released before anyone waiting on the barrier wakes up
        job.reset();
        self->executed.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++finished_;
        }
        all_done_.notify_all();
    }

    void worker_loop(Worker* self) {
        std::mt19937 rng(std::random_device{}());

        for (;;) {
            JobPtr<JobType> job;
            {
                std::unique_lock<std::mutex> lock(self->mutex);
                if (self->queue.empty() && !self->stopping.load() && workers_.size() > 1) {
                    lock.unlock();
                    try_steal(self, rng);
                    lock.lock();
                }

                // Timed so an idle worker goes back to stealing
                self->wake.wait_for(lock, std::chrono::milliseconds(1), [self] {
                    return self->stopping.load() || !self->queue.empty();
                });

                if (self->queue.empty()) {
                    if (self->stopping.load()) {
                        return;
                    }
                    continue;
                }
                job = std::move(self->queue.back());
                self->queue.pop_back();
            }
            run_job(self, std::move(job));
        }
    }

    void enqueue(Worker* target, JobPtr<JobType> job, ScheduleMode mode) {
        if (!running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }
        submitted_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(target->mutex);
            if (mode == ScheduleMode::FIFO) {
                target->queue.push_front(std::move(job));
            } else {
                target->queue.push_back(std::move(job));
            }
        }
        target->wake.notify_one();
    }

public:
    explicit JobSystem(size_t num_threads) {
        if (num_threads == 0) {
            throw std::invalid_argument("JobSystem requires at least one worker thread");
        }
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.push_back(std::make_unique<Worker>());
        }
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    ~JobSystem() {
        shutdown();
    }

    void start() {
        if (running_.load()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            submitted_.store(0);
            finished_ = 0;
            error_message_.clear();
            failed_job_type_.reset();
            error_type_.store(ErrorType::None, std::memory_order_relaxed);
        }
        for (auto& worker : workers_) {
            Worker* self = worker.get();
            self->stopping.store(false);
            self->thread = std::thread([this, self] { worker_loop(self); });
        }
        running_.store(true);
    }

    // Drains every queued job, then joins the workers
    void shutdown() {
        if (!running_.load()) {
            return;
        }
        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stopping.store(true);
            }
            worker->wake.notify_all();
        }
        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }
        running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        Worker* target = workers_[next_worker_.fetch_add(1) % workers_.size()].get();
        enqueue(target, std::move(job), mode);
    }

    void submit_to_worker(size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (worker_id >= workers_.size()) {
            throw std::out_of_range("JobSystem: no worker " + std::to_string(worker_id));
        }
        enqueue(workers_[worker_id].get(), std::move(job), mode);
    }

    template<typename F>
    void submit_function(F&& func, JobType kind, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), kind), mode);
    }

    // Blocks until every job submitted so far, including jobs submitted by
    // running jobs, has finished
    void wait_for_completion() {
        std::unique_lock<std::mutex> lock(state_mutex_);
        all_done_.wait(lock, [this] { return submitted_.load() == finished_; });
    }

    size_t get_num_workers() const { return workers_.size(); }

    size_t get_pending_count() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const size_t submitted = submitted_.load();
        return submitted > finished_ ? submitted - finished_ : 0;
    }

    bool is_running() const { return running_.load(); }

    ErrorType get_error_type() const { return error_type_.load(std::memory_order_acquire); }

    bool has_error() const { return get_error_type() != ErrorType::None; }

    std::string get_error_message() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return error_message_;
    }

    // Kind of the job behind get_error_message; empty when nothing failed
    std::optional<JobType> get_failed_job_type() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return failed_job_type_;
    }

    void clear_error() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        error_message_.clear();
        failed_job_type_.reset();
        error_type_.store(ErrorType::None, std::memory_order_release);
    }

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->executed.load();
            stats.total_jobs_stolen += worker->stolen.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP

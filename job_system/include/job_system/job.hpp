#ifndef JOB_SYSTEM_JOB_HPP
#define JOB_SYSTEM_JOB_HPP

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace job_system {

/**
 * A unit of work queued on a JobSystem, labelled with a caller-defined kind.
 * The kind is reported back when the work throws (see
 * JobSystem::get_failed_job_type).
 */
template<typename JobType>
class Job {
private:
    std::function<void()> work_;
    JobType kind_;

public:
    Job(std::function<void()> work, JobType kind)
        : work_(std::move(work)), kind_(kind) {}

    void run() { work_(); }

    JobType kind() const { return kind_; }
};

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

template<typename JobType, typename Func>
JobPtr<JobType> make_job(Func&& func, JobType kind) {
    static_assert(std::is_invocable_v<std::decay_t<Func>&>, "job body must be callable without arguments");
    return std::make_unique<Job<JobType>>(std::function<void()>(std::forward<Func>(func)), kind);
}

// Order in which a worker takes jobs from its own queue
enum class ScheduleMode {
    LIFO,  // newest first
    FIFO   // submission order
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_HPP

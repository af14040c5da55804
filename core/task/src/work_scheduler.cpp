#include <xfer/common/debug.hpp>
#include <xfer/task/work_scheduler.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

namespace xfer::task {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::SCHEDULER;
}  // namespace

// ============================================================================
// WorkScheduler::Impl
// ============================================================================

class WorkScheduler::Impl {
public:
    Impl(const TaskLoader& loader, TaskEnvironment env, WorkSchedulerConfig config)
        : loader_(loader), env_(env), config_(config) {
        if (config_.worker_threads == 0) {
            config_.worker_threads = WorkSchedulerConfig{}.worker_threads;
        }
        if (config_.max_queue_size == 0) {
            config_.max_queue_size = WorkSchedulerConfig{}.max_queue_size;
        }
        if (config_.finished_history == 0) {
            config_.finished_history = WorkSchedulerConfig{}.finished_history;
        }
    }

    ~Impl() { stop(); }

    bool start() {
        XFER_SPAN_CAT("WorkScheduler::start", LOG_CAT);

        std::lock_guard lock(mutex_);
        if (running_) {
            XFER_LOG_WARN(LOG_CAT, "WorkScheduler already running");
            return false;
        }
        running_        = true;
        stop_requested_ = false;

        for (size_t i = 0; i < config_.worker_threads; ++i) {
            workers_.emplace_back([this, i]() { worker_loop(i); });
        }

        XFER_LOG_INFO(LOG_CAT,
                      "WorkScheduler started with " << config_.worker_threads << " workers");
        return true;
    }

    void stop() {
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            if (!running_) {
                return;
            }
            stop_requested_ = true;

            for (WorkId id : queue_) {
                auto it = works_.find(id);
                if (it != works_.end() && it->second.info.state == WorkState::ENQUEUED) {
                    finish_locked(it->second, WorkState::CANCELLED, {});
                }
            }
            queue_.clear();
            prune_locked();
            workers.swap(workers_);
        }
        work_cv_.notify_all();
        done_cv_.notify_all();

        XFER_LOG_INFO(LOG_CAT, "Stopping WorkScheduler...");
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        std::lock_guard lock(mutex_);
        running_ = false;
        XFER_LOG_INFO(LOG_CAT, "WorkScheduler stopped");
    }

    bool is_running() const noexcept {
        std::lock_guard lock(mutex_);
        return running_ && !stop_requested_;
    }

    common::Result<WorkId> enqueue(WorkRequest request) {
        WorkId id = 0;
        {
            std::lock_guard lock(mutex_);
            if (!running_ || stop_requested_) {
                ++stats_.rejected;
                return common::err<WorkId>(common::ErrorCode::SCHEDULER_STOPPED,
                                           "work scheduler is not running");
            }
            if (queue_.size() >= config_.max_queue_size) {
                ++stats_.rejected;
                return common::err<WorkId>(common::ErrorCode::SCHEDULER_OVERLOADED,
                                           "work queue full (" +
                                               std::to_string(config_.max_queue_size) + ")");
            }

            id = next_id_++;
            Entry entry;
            entry.info.id        = id;
            entry.info.task_type = std::move(request.task_type);
            entry.input          = std::move(request.input);
            XFER_LOG_DEBUG(LOG_CAT, "enqueued work " << id << " (" << entry.info.task_type << ")");

            works_.emplace(id, std::move(entry));
            queue_.push_back(id);
            ++stats_.enqueued;
        }
        work_cv_.notify_one();
        return id;
    }

    std::optional<WorkInfo> get_work_info(WorkId id) const {
        std::lock_guard lock(mutex_);
        auto it = works_.find(id);
        if (it == works_.end() || it->second.evicted) {
            return std::nullopt;
        }
        return it->second.info;
    }

    bool cancel(WorkId id) {
        std::stop_source running_stop;
        {
            std::lock_guard lock(mutex_);
            auto it = works_.find(id);
            if (it == works_.end() || it->second.evicted) {
                return false;
            }

            Entry& entry = it->second;
            switch (entry.info.state) {
                case WorkState::ENQUEUED:
                    queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
                    finish_locked(entry, WorkState::CANCELLED, {});
                    prune_locked();
                    XFER_LOG_INFO(LOG_CAT, "cancelled pending work " << id);
                    done_cv_.notify_all();
                    return true;
                case WorkState::RUNNING:
                    running_stop = entry.stop;
                    break;
                default:
                    return false;
            }
        }

        // Outside the lock: stop callbacks run the engine's cancel hint synchronously
        XFER_LOG_INFO(LOG_CAT, "requesting stop of running work " << id);
        running_stop.request_stop();
        return true;
    }

    common::Result<WorkInfo> wait(WorkId id, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        auto it = works_.find(id);
        if (it == works_.end() || it->second.evicted) {
            return common::err<WorkInfo>(common::ErrorCode::WORK_NOT_FOUND,
                                         "no work with id " + std::to_string(id));
        }

        // A waiting caller pins the record until it has read the final state
        Entry& entry = it->second;
        ++entry.waiters;
        bool done = done_cv_.wait_for(lock, timeout,
                                      [&entry]() { return is_finished(entry.info.state); });
        WorkInfo info = entry.info;
        if (--entry.waiters == 0 && entry.evicted) {
            works_.erase(id);
        }

        if (!done) {
            return common::err<WorkInfo>(common::ErrorCode::OPERATION_TIMEOUT,
                                         "work " + std::to_string(id) + " unfinished after " +
                                             std::to_string(timeout.count()) + "ms");
        }
        return info;
    }

    WorkSchedulerStats stats() const {
        std::lock_guard lock(mutex_);
        WorkSchedulerStats s = stats_;
        s.queue_size         = queue_.size();
        s.retained           = works_.size();
        return s;
    }

    const WorkSchedulerConfig& config() const noexcept { return config_; }

private:
    struct Entry {
        WorkInfo info;
        TaskData input;
        std::stop_source stop;
        size_t waiters = 0;
        bool evicted   = false;
    };

    struct Job {
        WorkId id = 0;
        std::string task_type;
        TaskData input;
        std::stop_token token;
        uint32_t run_attempt = 0;
    };

    void worker_loop(size_t worker_id) {
        common::debug::Logger::set_thread_name("xfer-work-" + std::to_string(worker_id));
        XFER_LOG_DEBUG(LOG_CAT, "Worker " << worker_id << " started");

        while (true) {
            Job job;
            {
                std::unique_lock lock(mutex_);
                work_cv_.wait(lock, [this]() { return stop_requested_ || !queue_.empty(); });
                if (stop_requested_) {
                    break;
                }

                job.id = queue_.front();
                queue_.pop_front();

                auto it = works_.find(job.id);
                if (it == works_.end() || it->second.info.state != WorkState::ENQUEUED) {
                    continue;
                }
                Entry& entry           = it->second;
                entry.info.state       = WorkState::RUNNING;
                entry.info.run_attempt += 1;
                job.task_type          = entry.info.task_type;
                job.input              = entry.input;
                job.token              = entry.stop.get_token();
                job.run_attempt        = entry.info.run_attempt;
            }

            execute(std::move(job));
        }

        XFER_LOG_DEBUG(LOG_CAT, "Worker " << worker_id << " stopped");
    }

    void execute(Job job) {
        common::debug::TraceScope trace(common::debug::TraceContext::for_work(job.id));
        XFER_LOG_INFO(LOG_CAT, "running work " << job.id << " (" << job.task_type << ", attempt "
                                               << job.run_attempt << ")");

        WorkState state = WorkState::FAILED;
        TaskData output;
        try {
            std::stop_token token = job.token;
            TaskParameters params{job.id, std::move(job.input), job.token, job.run_attempt};
            auto task = loader_.create_task(job.task_type, env_, std::move(params));

            if (!task) {
                output = TaskData::Builder()
                             .put_string(std::string(keys::ERROR),
                                         std::string(CONSTRUCTION_FAILED_MESSAGE))
                             .build();
            } else {
                TaskOutcome outcome = task->run();
                output              = std::move(outcome.output);
                if (outcome.is_success()) {
                    state = WorkState::SUCCEEDED;
                } else if (token.stop_requested()) {
                    state = WorkState::CANCELLED;
                }
            }
        } catch (const std::exception& e) {
            XFER_LOG_ERROR(LOG_CAT, "work " << job.id << " failed with exception: " << e.what());
            output = TaskData::Builder().put_string(std::string(keys::ERROR), e.what()).build();
        } catch (...) {
            XFER_LOG_ERROR(LOG_CAT, "work " << job.id << " failed with a non-standard exception");
            output = TaskData::Builder()
                         .put_string(std::string(keys::ERROR),
                                     std::string(UNKNOWN_EXCEPTION_MESSAGE))
                         .build();
        }

        XFER_LOG_INFO(LOG_CAT, "work " << job.id << " finished " << work_state_name(state));

        {
            std::lock_guard lock(mutex_);
            auto it = works_.find(job.id);
            if (it != works_.end()) {
                finish_locked(it->second, state, std::move(output));
                prune_locked();
            }
        }
        done_cv_.notify_all();
    }

    void finish_locked(Entry& entry, WorkState state, TaskData output) {
        entry.info.state  = state;
        entry.info.output = std::move(output);
        entry.input       = TaskData{};
        finished_order_.push_back(entry.info.id);
        switch (state) {
            case WorkState::SUCCEEDED:
                ++stats_.succeeded;
                break;
            case WorkState::CANCELLED:
                ++stats_.cancelled;
                break;
            default:
                ++stats_.failed;
                break;
        }
    }

    // Drops the oldest finished records beyond finished_history
    void prune_locked() {
        while (finished_order_.size() > config_.finished_history) {
            WorkId oldest = finished_order_.front();
            finished_order_.pop_front();
            auto it = works_.find(oldest);
            if (it == works_.end()) {
                continue;
            }
            if (it->second.waiters > 0) {
                it->second.evicted = true;
            } else {
                works_.erase(it);
            }
            XFER_LOG_TRACE(LOG_CAT, "forgot finished work " << oldest);
        }
    }

    const TaskLoader& loader_;
    TaskEnvironment env_;
    WorkSchedulerConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::deque<WorkId> queue_;
    std::unordered_map<WorkId, Entry> works_;
    std::deque<WorkId> finished_order_;
    std::vector<std::thread> workers_;
    WorkId next_id_      = 1;
    bool running_        = false;
    bool stop_requested_ = false;
    WorkSchedulerStats stats_;
};

// ============================================================================
// WorkScheduler
// ============================================================================

WorkScheduler::WorkScheduler(const TaskLoader& loader, TaskEnvironment env,
                             WorkSchedulerConfig config)
    : impl_(std::make_unique<Impl>(loader, env, config)) {}

WorkScheduler::~WorkScheduler() = default;

bool WorkScheduler::start() {
    return impl_->start();
}

void WorkScheduler::stop() {
    impl_->stop();
}

bool WorkScheduler::is_running() const noexcept {
    return impl_->is_running();
}

common::Result<WorkId> WorkScheduler::enqueue(WorkRequest request) {
    return impl_->enqueue(std::move(request));
}

std::optional<WorkInfo> WorkScheduler::get_work_info(WorkId id) const {
    return impl_->get_work_info(id);
}

bool WorkScheduler::cancel(WorkId id) {
    return impl_->cancel(id);
}

common::Result<WorkInfo> WorkScheduler::wait(WorkId id, std::chrono::milliseconds timeout) {
    return impl_->wait(id, timeout);
}

WorkSchedulerStats WorkScheduler::stats() const {
    return impl_->stats();
}

const WorkSchedulerConfig& WorkScheduler::config() const noexcept {
    return impl_->config();
}

}  // namespace xfer::task

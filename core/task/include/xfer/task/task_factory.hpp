#pragma once

/**
 * @file task_factory.hpp
 * @brief Construction of tasks by type name
 *
 * A TaskFactory is one loading context: a table of type name -> constructor filled
 * in at start-up. TaskLoader resolves a name in an alternate context (the one the
 * task implementation was packaged in) before the host's primary context, and
 * turns every failure into "no instance".
 *
 * Usage:
 * @code
 * TaskFactory primary("host");
 * register_builtin_tasks(primary);
 * TaskLoader loader(primary);
 * auto task = loader.create_task("xfer.TransferTask", env, std::move(params));
 * if (!task) { ... fatal for this work item ... }
 * @endcode
 */

#include <xfer/common/error.hpp>
#include <xfer/task/background_task.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace xfer::task {

using TaskConstructor =
    std::function<std::unique_ptr<BackgroundTask>(TaskEnvironment&, TaskParameters)>;

class TaskFactory {
public:
    explicit TaskFactory(std::string name = "primary") : name_(std::move(name)) {}

    TaskFactory(const TaskFactory&)            = delete;
    TaskFactory& operator=(const TaskFactory&) = delete;

    /**
     * @brief Add a type; TASK_TYPE_CONFLICT if the name is taken
     *
     * An empty constructor is accepted and fails at construction time.
     */
    common::Result<void> register_type(std::string type_name, TaskConstructor constructor);

    bool unregister_type(std::string_view type_name);

    bool contains(std::string_view type_name) const;

    std::vector<std::string> type_names() const;

    /**
     * @return the registered constructor, or std::nullopt if the type is absent
     */
    std::optional<TaskConstructor> find(std::string_view type_name) const;

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, TaskConstructor, std::less<>> constructors_;
};

/**
 * @brief Register the task types shipped with this library ("xfer.TransferTask")
 */
common::Result<void> register_builtin_tasks(TaskFactory& factory);

class TaskLoader {
public:
    explicit TaskLoader(const TaskFactory& primary, const TaskFactory* alternate = nullptr) noexcept
        : primary_(primary), alternate_(alternate) {}

    /**
     * @brief Construct a task; nullptr on any failure, never throws
     *
     * The caller must treat nullptr as fatal for that work item.
     */
    std::unique_ptr<BackgroundTask> create_task(std::string_view type_name, TaskEnvironment& env,
                                                TaskParameters params) const noexcept;

    /**
     * @brief As create_task(), reporting TASK_TYPE_NOT_FOUND or TASK_CONSTRUCTION_FAILED
     */
    common::Result<std::unique_ptr<BackgroundTask>> try_create_task(
        std::string_view type_name, TaskEnvironment& env, TaskParameters params) const noexcept;

private:
    const TaskFactory& primary_;
    const TaskFactory* alternate_;
};

}  // namespace xfer::task

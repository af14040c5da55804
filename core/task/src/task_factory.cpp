#include <xfer/common/debug.hpp>
#include <xfer/task/task_factory.hpp>
#include <xfer/task/transfer_task.hpp>

#include <exception>
#include <mutex>

namespace xfer::task {

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::LOADER;
}  // namespace

// ============================================================================
// TaskFactory
// ============================================================================

common::Result<void> TaskFactory::register_type(std::string type_name,
                                                TaskConstructor constructor) {
    if (type_name.empty()) {
        return common::err(common::ErrorCode::INVALID_ARGUMENT, "task type name is empty");
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = constructors_.try_emplace(type_name, std::move(constructor));
    if (!inserted) {
        return common::err(common::ErrorCode::TASK_TYPE_CONFLICT,
                           "task type '" + type_name + "' already registered in " + name_);
    }

    XFER_LOG_DEBUG(LOG_CAT, "registered task type '" << type_name << "' in " << name_);
    return common::ok();
}

bool TaskFactory::unregister_type(std::string_view type_name) {
    std::unique_lock lock(mutex_);
    auto it = constructors_.find(type_name);
    if (it == constructors_.end()) {
        return false;
    }
    constructors_.erase(it);
    return true;
}

bool TaskFactory::contains(std::string_view type_name) const {
    std::shared_lock lock(mutex_);
    return constructors_.find(type_name) != constructors_.end();
}

std::vector<std::string> TaskFactory::type_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(constructors_.size());
    for (const auto& [name, constructor] : constructors_) {
        names.push_back(name);
    }
    return names;
}

std::optional<TaskConstructor> TaskFactory::find(std::string_view type_name) const {
    std::shared_lock lock(mutex_);
    auto it = constructors_.find(type_name);
    if (it == constructors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

common::Result<void> register_builtin_tasks(TaskFactory& factory) {
    return factory.register_type(
        std::string(TRANSFER_TASK_TYPE),
        [](TaskEnvironment& env, TaskParameters params) -> std::unique_ptr<BackgroundTask> {
            return std::make_unique<TransferTask>(env, std::move(params));
        });
}

// ============================================================================
// TaskLoader
// ============================================================================

common::Result<std::unique_ptr<BackgroundTask>> TaskLoader::try_create_task(
    std::string_view type_name, TaskEnvironment& env, TaskParameters params) const noexcept {
    using TaskPtr = std::unique_ptr<BackgroundTask>;

    try {
        const TaskFactory* context = nullptr;
        std::optional<TaskConstructor> constructor;
        if (alternate_ != nullptr) {
            constructor = alternate_->find(type_name);
            context     = alternate_;
        }
        if (!constructor) {
            constructor = primary_.find(type_name);
            context     = &primary_;
        }

        if (!constructor) {
            return common::err<TaskPtr>(common::ErrorCode::TASK_TYPE_NOT_FOUND,
                                        "no task type '" + std::string(type_name) + "'");
        }
        if (!*constructor) {
            return common::err<TaskPtr>(common::ErrorCode::TASK_CONSTRUCTION_FAILED,
                                        "task type '" + std::string(type_name) +
                                            "' has no constructor in " + context->name());
        }

        TaskPtr task = (*constructor)(env, std::move(params));
        if (!task) {
            return common::err<TaskPtr>(common::ErrorCode::TASK_CONSTRUCTION_FAILED,
                                        "constructor of '" + std::string(type_name) +
                                            "' produced no instance");
        }

        XFER_LOG_DEBUG(LOG_CAT, "created '" << type_name << "' from " << context->name());
        return task;
    } catch (const std::exception& e) {
        return common::err<TaskPtr>(common::ErrorCode::TASK_CONSTRUCTION_FAILED,
                                    "constructing '" + std::string(type_name) +
                                        "' threw: " + e.what());
    } catch (...) {
        return common::err<TaskPtr>(common::ErrorCode::TASK_CONSTRUCTION_FAILED,
                                    "constructing '" + std::string(type_name) +
                                        "' threw a non-standard exception");
    }
}

std::unique_ptr<BackgroundTask> TaskLoader::create_task(std::string_view type_name,
                                                        TaskEnvironment& env,
                                                        TaskParameters params) const noexcept {
    auto task = try_create_task(type_name, env, std::move(params));
    if (task.is_error()) {
        XFER_LOG_ERROR(LOG_CAT, "failed to create task: " << task.error().to_string());
        return nullptr;
    }
    return std::move(task).value();
}

}  // namespace xfer::task

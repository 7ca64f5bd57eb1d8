#include "task_manager.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace ferry::tasks {

namespace {

int64_t local_total_bytes(const std::string& path) {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        throw IOError("not found: " + path);
    }
    if (!fs::is_directory(st)) {
        return static_cast<int64_t>(fs::file_size(path, ec));
    }
    int64_t total = 0;
    for (auto it = fs::recursive_directory_iterator(path, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            total += static_cast<int64_t>(it->file_size(ec));
        }
    }
    if (ec) {
        throw IOError("cannot walk " + path + ": " + ec.message());
    }
    return total;
}

} // namespace

TaskManager::TaskManager(transfer::TransferBackend& backend, TaskManagerConfig config, CompletionCallback on_complete)
    : m_backend(backend),
      m_config(config),
      m_on_complete(std::move(on_complete)),
      m_slots(std::max(1, config.max_parallel)) {}

TaskManager::~TaskManager() {
    m_shutting_down = true;
    {
        std::shared_lock<std::shared_mutex> lock(m_tasks_mutex);
        for (auto& entry : m_tasks) {
            if (!is_terminal(entry.second->status())) {
                // Keep partial output so a later session can resume it
                entry.second->request_cancel(true);
            }
        }
    }
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_workers_mutex);
        workers.swap(m_workers);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

// ============================================================================
// TASK CREATION
// ============================================================================

std::shared_ptr<Task> TaskManager::register_task(TaskType type, const std::string& local_path,
                                                 const std::string& remote_path,
                                                 const std::function<void(Task&)>& setup) {
    expire_finished();

    std::shared_ptr<Task> task;
    {
        std::unique_lock<std::shared_mutex> lock(m_tasks_mutex);
        uint64_t seq = m_next_sequence++;
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
        std::string id = std::to_string(nanos) + "-" + std::to_string(seq);
        task = std::make_shared<Task>(id, seq, type, local_path, remote_path);
        if (setup) {
            setup(*task);
        }
        m_tasks[id] = task;
    }
    LOG_INFO("TASK: " + task->id() + " added (" + task_type_name(type) + ")");
    launch(task);
    return task;
}

std::string TaskManager::add_download(const std::string& remote_path, const std::string& local_path) {
    return register_task(TaskType::DOWNLOAD, local_path, remote_path)->id();
}

std::string TaskManager::add_upload(const std::string& local_path, const std::string& remote_path) {
    int64_t total = local_total_bytes(local_path);
    return register_task(TaskType::UPLOAD, local_path, remote_path,
                         [total](Task& t) { t.m_total_bytes = total; })
        ->id();
}

std::string TaskManager::add_compress(const std::vector<std::string>& remote_sources, const std::string& output,
                                      const std::string& format) {
    return register_task(TaskType::COMPRESS, "", output,
                         [&](Task& t) {
                             t.m_sources = remote_sources;
                             t.m_format = format;
                         })
        ->id();
}

std::string TaskManager::add_extract(const std::string& remote_archive, const std::string& destination) {
    return register_task(TaskType::EXTRACT, "", remote_archive,
                         [&](Task& t) { t.m_destination = destination; })
        ->id();
}

// ============================================================================
// CONTROL
// ============================================================================

std::shared_ptr<Task> TaskManager::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_tasks_mutex);
    auto it = m_tasks.find(id);
    return it == m_tasks.end() ? nullptr : it->second;
}

bool TaskManager::cancel(const std::string& id) {
    auto task = find(id);
    if (!task) {
        return false;
    }
    TaskStatus status = task->status();
    if (status == TaskStatus::PAUSED) {
        discard_partial_output(*task);
        TaskSnapshot snap = task->finish(TaskStatus::CANCELED);
        LOG_INFO("TASK: " + id + " canceled while paused");
        notify_complete(snap);
        return true;
    }
    if (is_terminal(status)) {
        return false;
    }
    LOG_INFO("TASK: " + id + " cancel requested");
    task->request_cancel(false);
    return true;
}

bool TaskManager::pause(const std::string& id) {
    auto task = find(id);
    if (!task || is_terminal(task->status())) {
        return false;
    }
    LOG_INFO("TASK: " + id + " pause requested");
    task->request_cancel(true);
    return true;
}

bool TaskManager::resume(const std::string& id) {
    auto task = find(id);
    if (!task) {
        return false;
    }
    TaskStatus status = task->status();
    if (status != TaskStatus::PAUSED && status != TaskStatus::FAILED && status != TaskStatus::CANCELED) {
        return false;
    }
    LOG_INFO("TASK: " + id + " resumed from " + task_status_name(status));
    launch(task);
    return true;
}

std::optional<TaskSnapshot> TaskManager::get_task(const std::string& id) const {
    auto task = find(id);
    if (!task) {
        return std::nullopt;
    }
    return task->snapshot();
}

std::vector<TaskSnapshot> TaskManager::get_all_tasks() {
    expire_finished();

    std::vector<std::shared_ptr<Task>> tasks;
    {
        std::shared_lock<std::shared_mutex> lock(m_tasks_mutex);
        tasks.reserve(m_tasks.size());
        for (const auto& entry : m_tasks) {
            tasks.push_back(entry.second);
        }
    }
    std::sort(tasks.begin(), tasks.end(),
              [](const std::shared_ptr<Task>& a, const std::shared_ptr<Task>& b) {
                  return a->sequence() < b->sequence();
              });

    std::vector<TaskSnapshot> out;
    out.reserve(tasks.size());
    for (const auto& t : tasks) {
        out.push_back(t->snapshot());
    }
    return out;
}

bool TaskManager::remove_task(const std::string& id) {
    std::shared_ptr<Task> task;
    {
        std::unique_lock<std::shared_mutex> lock(m_tasks_mutex);
        auto it = m_tasks.find(id);
        if (it == m_tasks.end()) {
            return false;
        }
        task = it->second;
        m_tasks.erase(it);
    }
    if (!is_terminal(task->status())) {
        task->request_cancel(false);
    }
    LOG_DEBUG("TASK: " + id + " removed");
    return true;
}

void TaskManager::expire_finished() {
    if (m_config.retention_seconds <= 0) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    std::chrono::seconds retention(m_config.retention_seconds);
    std::unique_lock<std::shared_mutex> lock(m_tasks_mutex);
    for (auto it = m_tasks.begin(); it != m_tasks.end();) {
        if (it->second->expired(now, retention)) {
            LOG_DEBUG("TASK: " + it->first + " aged out");
            it = m_tasks.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

void TaskManager::reap_workers() {
    auto it = m_workers.begin();
    while (it != m_workers.end()) {
        if (it->done->load()) {
            it->thread.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

void TaskManager::launch(const std::shared_ptr<Task>& task) {
    std::shared_ptr<CancellationToken> token = task->begin_attempt();
    if (m_shutting_down) {
        task->finish(TaskStatus::CANCELED);
        return;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(m_workers_mutex);
    reap_workers();
    m_workers.push_back(Worker{std::thread([this, task, token, done] {
                                   run(task, token);
                                   done->store(true);
                               }),
                               done});
}

void TaskManager::run(const std::shared_ptr<Task>& task, const std::shared_ptr<CancellationToken>& token) {
    TaskStatus final_status = TaskStatus::CANCELED;
    bool admitted = m_slots.acquire_unless([&token] { return token->is_canceled(); });

    if (admitted) {
        SemaphoreGuard slot(m_slots);
        if (!token->is_canceled()) {
            task->m_status = TaskStatus::RUNNING;
            ++m_running;
            LOG_INFO("TASK: " + task->id() + " running");
            try {
                execute(*task, token.get());
                task->m_progress = 1.0;
                final_status = TaskStatus::COMPLETED;
            } catch (const CancellationError&) {
                final_status = TaskStatus::CANCELED;
            } catch (const FerryError& e) {
                if (task->cancel_requested()) {
                    final_status = TaskStatus::CANCELED;
                } else {
                    task->record_error(e);
                    final_status = TaskStatus::FAILED;
                }
            } catch (const std::exception& e) {
                task->record_error(IOError(e.what()));
                final_status = TaskStatus::FAILED;
            }
            --m_running;
        }
    }

    if (final_status == TaskStatus::CANCELED) {
        if (task->m_pause_requested.load()) {
            final_status = TaskStatus::PAUSED;
        } else {
            discard_partial_output(*task);
        }
    }
    TaskSnapshot snap = task->finish(final_status);
    if (final_status == TaskStatus::FAILED) {
        LOG_WARN("TASK: " + task->id() + " failed: " + snap.error_message);
    } else {
        LOG_INFO("TASK: " + task->id() + " " + task_status_name(final_status));
    }
    notify_complete(snap);
}

void TaskManager::notify_complete(const TaskSnapshot& snap) {
    if (!m_on_complete) {
        return;
    }
    try {
        m_on_complete(snap);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("TASK: completion callback threw: ") + e.what());
    }
}

void TaskManager::execute(Task& task, CancellationToken* token) {
    auto on_progress = [&task](const transfer::TransferProgress& p) {
        task.m_bytes_done = p.bytes_done;
        if (p.total > 0) {
            task.m_total_bytes = p.total;
        }
        task.m_progress = p.fraction;
        task.m_speed = p.bytes_per_second;
    };

    switch (task.type()) {
        case TaskType::DOWNLOAD:
            m_backend.download(task.remote_path(), task.local_path(), on_progress, token);
            break;
        case TaskType::UPLOAD:
            m_backend.upload(task.local_path(), task.remote_path(), on_progress, token);
            break;
        case TaskType::COMPRESS:
            m_backend.compress(task.m_sources, task.remote_path(), task.m_format, token);
            break;
        case TaskType::EXTRACT:
            m_backend.extract(task.remote_path(), task.m_destination, token);
            break;
    }
}

void TaskManager::discard_partial_output(const Task& task) {
    if (task.type() != TaskType::DOWNLOAD || task.local_path().empty()) {
        return;
    }
    std::error_code ec;
    if (fs::is_regular_file(task.local_path(), ec) && fs::remove(task.local_path(), ec)) {
        LOG_DEBUG("TASK: removed partial download " + task.local_path());
    }
    if (ec) {
        LOG_WARN("TASK: could not remove partial download " + task.local_path() + ": " + ec.message());
    }
}

} // namespace ferry::tasks

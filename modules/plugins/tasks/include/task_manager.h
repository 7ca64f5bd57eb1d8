#ifndef FERRY_TASK_MANAGER_H
#define FERRY_TASK_MANAGER_H

#include "counting_semaphore.h"
#include "settings.h"
#include "task.h"
#include "transfer_backend.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace ferry::tasks {

// Runs after a task's fields have reached their final values, on the worker thread.
using CompletionCallback = std::function<void(const TaskSnapshot&)>;

/**
 * TASK MANAGER
 *
 * - Every task runs on its own thread, admitted by a semaphore of
 *   max_parallel permits; waiting tasks stay PENDING.
 * - The registry is one map under a shared_mutex. Task progress is read
 *   lock-free from the Task's atomics.
 * - Failures never escape a worker: the FerryError is recorded on the task,
 *   which stays FAILED until resumed, removed or aged out.
 * - Canceling a download deletes its partial local output; uploads leave
 *   the remote partial file in place.
 * - Terminal tasks (except PAUSED) are dropped retention_seconds after they
 *   finish, checked whenever the registry is touched. 0 keeps them forever.
 */
class TaskManager {
public:
    TaskManager(transfer::TransferBackend& backend, TaskManagerConfig config,
                CompletionCallback on_complete = nullptr);
    // Cancels everything still running and joins the workers.
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    std::string add_download(const std::string& remote_path, const std::string& local_path);
    // Throws IOError if local_path does not exist.
    std::string add_upload(const std::string& local_path, const std::string& remote_path);
    std::string add_compress(const std::vector<std::string>& remote_sources, const std::string& output,
                             const std::string& format);
    std::string add_extract(const std::string& remote_archive, const std::string& destination);

    // Return false for an unknown id or a task that is no longer active.
    bool cancel(const std::string& id);
    bool pause(const std::string& id);
    // Re-submits a PAUSED, FAILED or CANCELED task under the same id.
    bool resume(const std::string& id);

    std::optional<TaskSnapshot> get_task(const std::string& id) const;
    // In creation order.
    std::vector<TaskSnapshot> get_all_tasks();
    // Cancels the task first if it is still active.
    bool remove_task(const std::string& id);

    int running_count() const { return m_running.load(); }

private:
    std::shared_ptr<Task> register_task(TaskType type, const std::string& local_path,
                                        const std::string& remote_path,
                                        const std::function<void(Task&)>& setup = nullptr);
    std::shared_ptr<Task> find(const std::string& id) const;
    void launch(const std::shared_ptr<Task>& task);
    void run(const std::shared_ptr<Task>& task, const std::shared_ptr<CancellationToken>& token);
    void execute(Task& task, CancellationToken* token);
    void discard_partial_output(const Task& task);
    void notify_complete(const TaskSnapshot& snap);
    void expire_finished();
    void reap_workers();

    transfer::TransferBackend& m_backend;
    const TaskManagerConfig m_config;
    CompletionCallback m_on_complete;

    mutable std::shared_mutex m_tasks_mutex;
    std::map<std::string, std::shared_ptr<Task>> m_tasks;
    uint64_t m_next_sequence = 1;

    CountingSemaphore m_slots;
    std::atomic<int> m_running{0};

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex m_workers_mutex;
    std::vector<Worker> m_workers;
    std::atomic<bool> m_shutting_down{false};
};

} // namespace ferry::tasks

#endif // FERRY_TASK_MANAGER_H

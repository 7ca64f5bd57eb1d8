#ifndef FERRY_TASK_H
#define FERRY_TASK_H

#include "cancellation.h"
#include "errors.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::tasks {

enum class TaskType {
    DOWNLOAD,
    UPLOAD,
    COMPRESS,
    EXTRACT,
};

/**
 * PENDING -> RUNNING -> COMPLETED | FAILED | CANCELED
 * PAUSED is a canceled attempt whose partial output is kept; resume() sends
 * the task back through PENDING.
 */
enum class TaskStatus {
    PENDING,
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELED,
};

const char* task_type_name(TaskType type);
const char* task_status_name(TaskStatus status);

// PAUSED counts as terminal: nothing runs until resume().
bool is_terminal(TaskStatus status);

// Copy of a task's fields for observers.
struct TaskSnapshot {
    std::string id;
    TaskType type = TaskType::DOWNLOAD;
    TaskStatus status = TaskStatus::PENDING;
    double progress = 0.0;         // 0..1
    double speed = 0.0;            // bytes per second
    int64_t bytes_done = 0;
    int64_t total_bytes = 0;
    std::string local_path;
    std::string remote_path;
    bool has_error = false;
    ErrorCategory error_category = ErrorCategory::IO;
    std::string error_message;
};

/**
 * One tracked unit of work.
 * Progress fields are atomics written by the worker and read without locking.
 * Error details and the per-attempt cancellation token sit behind m_mutex.
 */
class Task {
public:
    Task(std::string id, uint64_t sequence, TaskType type, std::string local_path, std::string remote_path);

    const std::string& id() const { return m_id; }
    uint64_t sequence() const { return m_sequence; }
    TaskType type() const { return m_type; }
    const std::string& local_path() const { return m_local_path; }
    const std::string& remote_path() const { return m_remote_path; }

    TaskStatus status() const { return m_status.load(); }
    double progress() const { return m_progress.load(); }
    double speed() const { return m_speed.load(); }
    int64_t bytes_done() const { return m_bytes_done.load(); }
    int64_t total_bytes() const { return m_total_bytes.load(); }
    bool cancel_requested() const { return m_canceled.load(); }

    TaskSnapshot snapshot() const;

private:
    friend class TaskManager;

    // Starts a new attempt: clears the error and flags, installs a fresh token.
    std::shared_ptr<CancellationToken> begin_attempt();
    // Sets the flag and fires the current attempt's token.
    void request_cancel(bool pause);
    void record_error(const FerryError& error);
    // Sets the final status and returns the fields as they stand at that moment,
    // before a concurrent resume() can start the next attempt.
    TaskSnapshot finish(TaskStatus status);
    TaskSnapshot snapshot_locked() const;
    bool expired(std::chrono::steady_clock::time_point now, std::chrono::seconds retention) const;

    const std::string m_id;
    const uint64_t m_sequence;
    const TaskType m_type;
    const std::string m_local_path;
    const std::string m_remote_path;

    // COMPRESS: sources and format; EXTRACT: destination
    std::vector<std::string> m_sources;
    std::string m_format;
    std::string m_destination;

    std::atomic<TaskStatus> m_status{TaskStatus::PENDING};
    std::atomic<double> m_progress{0.0};
    std::atomic<double> m_speed{0.0};
    std::atomic<int64_t> m_bytes_done{0};
    std::atomic<int64_t> m_total_bytes{0};
    std::atomic<bool> m_canceled{false};
    std::atomic<bool> m_pause_requested{false};

    mutable std::mutex m_mutex;
    std::shared_ptr<CancellationToken> m_cancel;
    bool m_has_error = false;
    ErrorCategory m_error_category = ErrorCategory::IO;
    std::string m_error_message;
    std::chrono::steady_clock::time_point m_finished_at;
};

} // namespace ferry::tasks

#endif // FERRY_TASK_H

#include "task.h"

namespace ferry::tasks {

const char* task_type_name(TaskType type) {
    switch (type) {
        case TaskType::DOWNLOAD: return "download";
        case TaskType::UPLOAD: return "upload";
        case TaskType::COMPRESS: return "compress";
        case TaskType::EXTRACT: return "extract";
    }
    return "unknown";
}

const char* task_status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::RUNNING: return "running";
        case TaskStatus::PAUSED: return "paused";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
        case TaskStatus::CANCELED: return "canceled";
    }
    return "unknown";
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::PAUSED || status == TaskStatus::COMPLETED || status == TaskStatus::FAILED ||
           status == TaskStatus::CANCELED;
}

Task::Task(std::string id, uint64_t sequence, TaskType type, std::string local_path, std::string remote_path)
    : m_id(std::move(id)),
      m_sequence(sequence),
      m_type(type),
      m_local_path(std::move(local_path)),
      m_remote_path(std::move(remote_path)) {}

TaskSnapshot Task::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return snapshot_locked();
}

TaskSnapshot Task::snapshot_locked() const {
    TaskSnapshot s;
    s.id = m_id;
    s.type = m_type;
    s.status = m_status.load();
    s.progress = m_progress.load();
    s.speed = m_speed.load();
    s.bytes_done = m_bytes_done.load();
    s.total_bytes = m_total_bytes.load();
    s.local_path = m_local_path;
    s.remote_path = m_remote_path;
    s.has_error = m_has_error;
    s.error_category = m_error_category;
    s.error_message = m_error_message;
    return s;
}

std::shared_ptr<CancellationToken> Task::begin_attempt() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancel = std::make_shared<CancellationToken>();
    m_has_error = false;
    m_error_message.clear();
    m_canceled = false;
    m_pause_requested = false;
    // Progress restarts with each attempt; a resumed download reports its
    // on-disk base through the first progress sample.
    m_progress = 0.0;
    m_bytes_done = 0;
    m_speed = 0.0;
    m_status = TaskStatus::PENDING;
    return m_cancel;
}

void Task::request_cancel(bool pause) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pause_requested = pause;
        m_canceled = true;
        token = m_cancel;
    }
    if (token) {
        token->cancel();
    }
}

void Task::record_error(const FerryError& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_has_error = true;
    m_error_category = error.category();
    m_error_message = error.what();
}

TaskSnapshot Task::finish(TaskStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_finished_at = std::chrono::steady_clock::now();
    m_speed = 0.0;
    m_status = status;
    return snapshot_locked();
}

bool Task::expired(std::chrono::steady_clock::time_point now, std::chrono::seconds retention) const {
    TaskStatus status = m_status.load();
    if (!is_terminal(status) || status == TaskStatus::PAUSED) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return now - m_finished_at >= retention;
}

} // namespace ferry::tasks

#include "logger.h"
#include <mutex>
#include <algorithm>
#include <string>
#include <iostream>
#include <cctype>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <memory>
#include <queue>
#include <thread>
#include <condition_variable>
#include <atomic>

/**
 * @brief Tag written in front of every line ("server", "client", ...).
 */
static std::string g_tag = "ferry";

/**
 * @brief Mutex for protecting the logger.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 * Default: INFO (skips DEBUG messages)
 */
static std::atomic<LogLevel> g_log_level(LogLevel::INFO);

static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Global async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static std::atomic<bool> g_log_thread_running(false);
static std::unique_ptr<std::thread> g_log_thread;

static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
    return out;
}

static void emit(const std::string& line) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        cb = g_log_callback;
    }
    if (cb) {
        cb(line);
        return;
    }
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << line << std::endl;
}

void set_log_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_tag = tag;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

/**
 * @brief Sets the global log level (for conditional logging)
 * @param level The log level to set.
 */
void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

/**
 * @brief Gets the current global log level
 * @return The current log level.
 */
LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none" || v == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

/**
 * @brief Background thread worker for async logging
 */
static void async_log_worker() {
    while (true) {
        std::unique_lock<std::mutex> lock(g_log_queue_mutex);
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });

        if (g_log_queue.empty()) {
            if (!g_log_thread_running) break;
            continue;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();

        // Write without holding the queue lock so producers never wait on stderr
        emit(msg);
    }
}

/**
 * @brief Enables async logging (non-blocking)
 */
void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_log_queue_mutex);
    if (g_async_logging_enabled) return;
    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

/**
 * @brief Disables async logging and flushes remaining messages
 */
void disable_async_logging() {
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        if (!g_async_logging_enabled) return;
        g_async_logging_enabled = false;
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
}

/**
 * @brief Check if async logging is enabled
 */
bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

/**
 * @brief Logs a message with timestamp and process tag.
 * @param message The message to log.
 */
void nativeLog(const std::string& message) {
    std::string tag;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        tag = g_tag;
    }
    std::string log_message = timestamp() + " [" + tag + "] " + message;

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            g_log_queue.push(std::move(log_message));
        }
        g_log_queue_cv.notify_one();
    } else {
        emit(log_message);
    }
}

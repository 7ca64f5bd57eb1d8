#include "errors.h"
#include "key_derivation.h"
#include "task_manager.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace fs = std::filesystem;
using namespace ferry;
using namespace ferry::tasks;
using ferry::transfer::ProgressCallback;
using ferry::transfer::TransferProgress;
using ferry::transfer::TransferReport;

namespace {

// Backend whose transfers block until the gate opens or the attempt is canceled.
class GatedBackend : public transfer::TransferBackend {
public:
    std::string fail_remote;

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }

    int peak() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_peak;
    }

    std::vector<std::string> compressed_sources() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sources;
    }

    std::string compressed_format() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_format;
    }

    TransferReport download(const std::string& remote, const std::string& local, ProgressCallback progress,
                            CancellationToken* cancel) override {
        write_file(local, "partial");
        TransferProgress p;
        p.bytes_done = 7;
        p.total = 14;
        p.fraction = 0.5;
        p.bytes_per_second = 100.0;
        progress(p);

        wait_gate(cancel);
        if (remote == fail_remote) {
            throw ProtocolError(404, "not found: " + remote);
        }
        write_file(local, "partialcomplete");
        TransferReport report;
        report.bytes_transferred = 14;
        return report;
    }

    TransferReport upload(const std::string&, const std::string& remote, ProgressCallback,
                          CancellationToken* cancel) override {
        wait_gate(cancel);
        if (remote == fail_remote) {
            throw IntegrityError("aa", "bb");
        }
        return TransferReport{};
    }

    std::string compress(const std::vector<std::string>& sources, const std::string& output,
                         const std::string& format, CancellationToken* cancel) override {
        wait_gate(cancel);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sources = sources;
        m_format = format;
        return output;
    }

    std::string extract(const std::string& archive, const std::string& destination,
                        CancellationToken* cancel) override {
        wait_gate(cancel);
        return destination.empty() ? archive + ".d" : destination;
    }

private:
    static void write_file(const std::string& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void wait_gate(CancellationToken* cancel) {
        std::unique_lock<std::mutex> lock(m_mutex);
        ++m_active;
        m_peak = std::max(m_peak, m_active);
        while (!m_open && !(cancel && cancel->is_canceled())) {
            m_cv.wait_for(lock, std::chrono::milliseconds(10));
        }
        --m_active;
        if (cancel && cancel->is_canceled()) {
            throw CancellationError();
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = false;
    int m_active = 0;
    int m_peak = 0;
    std::vector<std::string> m_sources;
    std::string m_format;
};

// First attempt gets to 80% and fails. Later attempts report 10% when told
// to, then finish when told to.
class FlakyBackend : public transfer::TransferBackend {
public:
    std::atomic<int> attempts{0};
    std::atomic<bool> allow_report{false};
    std::atomic<bool> allow_finish{false};

    TransferReport download(const std::string&, const std::string&, ProgressCallback progress,
                            CancellationToken* cancel) override {
        if (attempts.fetch_add(1) == 0) {
            progress(sample(80));
            throw IOError("connection reset");
        }
        wait_until(allow_report, cancel);
        progress(sample(10));
        wait_until(allow_finish, cancel);
        progress(sample(100));
        return TransferReport{};
    }

    TransferReport upload(const std::string&, const std::string&, ProgressCallback, CancellationToken*) override {
        return TransferReport{};
    }
    std::string compress(const std::vector<std::string>&, const std::string& output, const std::string&,
                         CancellationToken*) override {
        return output;
    }
    std::string extract(const std::string&, const std::string& destination, CancellationToken*) override {
        return destination;
    }

private:
    static TransferProgress sample(int64_t done) {
        TransferProgress p;
        p.bytes_done = done;
        p.total = 100;
        p.fraction = static_cast<double>(done) / 100.0;
        return p;
    }

    static void wait_until(const std::atomic<bool>& flag, CancellationToken* cancel) {
        while (!flag.load()) {
            if (cancel) cancel->throw_if_canceled();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
};

struct ScratchDir {
    fs::path dir;
    ScratchDir() : dir(fs::temp_directory_path() / ("ferry_tasks_" + crypto::random_hex(6))) {
        fs::create_directories(dir);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    std::string file(const std::string& name) const { return (dir / name).string(); }
};

bool wait_for(const std::function<bool()>& pred, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

bool has_status(TaskManager& m, const std::string& id, TaskStatus status) {
    auto snap = m.get_task(id);
    return snap && snap->status == status;
}

TaskManagerConfig config_with(int max_parallel, int retention_seconds = 300) {
    TaskManagerConfig c;
    c.max_parallel = max_parallel;
    c.retention_seconds = retention_seconds;
    return c;
}

} // namespace

bool test_concurrency_cap() {
    std::cout << "Testing the parallel task cap..." << std::endl;
    ScratchDir scratch;
    GatedBackend backend;
    TaskManager manager(backend, config_with(2));

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(manager.add_download("/r" + std::to_string(i), scratch.file("l" + std::to_string(i))));
    }
    TEST_ASSERT(wait_for([&] { return manager.running_count() == 2; }), "two tasks should be running");
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    TEST_ASSERT(manager.running_count() == 2, "cap exceeded: " << manager.running_count());

    int pending = 0;
    for (const auto& s : manager.get_all_tasks()) {
        if (s.status == TaskStatus::PENDING) ++pending;
    }
    TEST_ASSERT(pending == 3, "three tasks should wait as PENDING, got " << pending);

    auto all = manager.get_all_tasks();
    TEST_ASSERT(all.size() == 5 && all.front().id == ids.front() && all.back().id == ids.back(),
                "tasks are listed in creation order");

    backend.open_gate();
    for (const auto& id : ids) {
        TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::COMPLETED); }),
                    "task " << id << " did not complete");
    }
    TEST_ASSERT(backend.peak() == 2, "peak concurrency was " << backend.peak());
    TEST_ASSERT(manager.running_count() == 0, "nothing should be running");
    return true;
}

bool test_cancel_removes_partial_download() {
    std::cout << "Testing cancel of a running download..." << std::endl;
    ScratchDir scratch;
    GatedBackend backend;
    TaskManager manager(backend, config_with(3));

    std::string local = scratch.file("movie.bin");
    std::string id = manager.add_download("/movie.bin", local);
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::RUNNING); }), "task never ran");
    TEST_ASSERT(wait_for([&] {
        auto snap = manager.get_task(id);
        return snap && snap->bytes_done == 7 && snap->total_bytes == 14;
    }),
                "progress fields not updated");
    TEST_ASSERT(fs::exists(local), "partial output not written");

    TEST_ASSERT(manager.cancel(id), "cancel should accept a running task");
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::CANCELED); }), "task not CANCELED");
    TEST_ASSERT(!fs::exists(local), "partial download must be deleted");
    TEST_ASSERT(!manager.get_task(id)->has_error, "cancel is not an error");
    TEST_ASSERT(!manager.cancel(id), "cancel of a finished task returns false");
    TEST_ASSERT(!manager.cancel("no-such-task"), "unknown id");
    return true;
}

bool test_failure_is_recorded() {
    std::cout << "Testing task failure reporting..." << std::endl;
    ScratchDir scratch;
    GatedBackend backend;
    backend.fail_remote = "/gone";
    backend.open_gate();
    TaskManager manager(backend, config_with(3));

    std::string id = manager.add_download("/gone", scratch.file("gone"));
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::FAILED); }), "task should fail");
    auto snap = manager.get_task(id);
    TEST_ASSERT(snap->has_error && snap->error_category == ErrorCategory::Protocol, "error category");
    TEST_ASSERT(snap->error_message.find("/gone") != std::string::npos, "error message kept");

    fs::path upload_src = scratch.dir / "up.txt";
    {
        std::ofstream out(upload_src);
        out << "0123456789";
    }
    std::string up = manager.add_upload(upload_src.string(), "/gone");
    TEST_ASSERT(manager.get_task(up)->total_bytes == 10, "upload total comes from the local size");
    TEST_ASSERT(wait_for([&] { return has_status(manager, up, TaskStatus::FAILED); }), "upload should fail");
    TEST_ASSERT(manager.get_task(up)->error_category == ErrorCategory::Integrity, "integrity failure");

    bool threw = false;
    try {
        manager.add_upload(scratch.file("missing"), "/x");
    } catch (const IOError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "upload of a missing path should throw IOError");
    return true;
}

bool test_pause_and_resume() {
    std::cout << "Testing pause and resume..." << std::endl;
    ScratchDir scratch;
    GatedBackend backend;
    TaskManager manager(backend, config_with(3));

    std::string local = scratch.file("big.iso");
    std::string id = manager.add_download("/big.iso", local);
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::RUNNING); }), "task never ran");

    TEST_ASSERT(manager.pause(id), "pause should accept a running task");
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::PAUSED); }), "task not PAUSED");
    TEST_ASSERT(fs::exists(local), "paused download keeps its partial output");
    TEST_ASSERT(!manager.pause(id), "pausing a paused task returns false");

    backend.open_gate();
    TEST_ASSERT(manager.resume(id), "resume should accept a paused task");
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::COMPLETED); }), "resumed task completes");
    TEST_ASSERT(manager.get_all_tasks().size() == 1, "resume keeps the same task");
    TEST_ASSERT(!manager.resume(id), "completed tasks cannot be resumed");
    return true;
}

bool test_cancel_while_paused() {
    std::cout << "Testing cancel of a paused download..." << std::endl;
    ScratchDir scratch;
    GatedBackend backend;
    std::mutex mutex;
    std::vector<TaskStatus> notified;
    TaskManager manager(backend, config_with(3), [&](const TaskSnapshot& s) {
        std::lock_guard<std::mutex> lock(mutex);
        notified.push_back(s.status);
    });

    std::string local = scratch.file("half.bin");
    std::string id = manager.add_download("/half.bin", local);
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::RUNNING); }), "task never ran");
    manager.pause(id);
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::PAUSED); }), "task not PAUSED");
    TEST_ASSERT(wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return notified.size() == 1;
    }),
                "pause should notify");

    TEST_ASSERT(manager.cancel(id), "cancel should accept a paused task");
    TEST_ASSERT(has_status(manager, id, TaskStatus::CANCELED), "paused task becomes CANCELED");
    TEST_ASSERT(!fs::exists(local), "partial output is discarded on cancel");

    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(notified.size() == 2, "expected a callback for PAUSED and for CANCELED, got " << notified.size());
    TEST_ASSERT(notified[0] == TaskStatus::PAUSED && notified[1] == TaskStatus::CANCELED,
                "callback order " << task_status_name(notified[0]) << ", " << task_status_name(notified[1]));
    return true;
}

bool test_resumed_progress_starts_over() {
    std::cout << "Testing progress of a resumed task..." << std::endl;
    ScratchDir scratch;
    FlakyBackend backend;
    std::mutex mutex;
    std::vector<TaskSnapshot> notified;
    TaskManager manager(backend, config_with(3), [&](const TaskSnapshot& s) {
        std::lock_guard<std::mutex> lock(mutex);
        notified.push_back(s);
    });

    std::string id = manager.add_download("/flaky.bin", scratch.file("flaky.bin"));
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::FAILED); }), "first attempt should fail");
    TEST_ASSERT(manager.get_task(id)->progress == 0.8, "failed task keeps its last progress");

    TEST_ASSERT(manager.resume(id), "resume a failed task");
    TEST_ASSERT(wait_for([&] { return has_status(manager, id, TaskStatus::RUNNING); }), "second attempt never ran");
    auto start = manager.get_task(id);
    TEST_ASSERT(start->progress == 0.0 && start->bytes_done == 0,
                "a new attempt starts from zero, got " << start->progress);
    TEST_ASSERT(!start->has_error, "error cleared on resume");

    backend.allow_report = true;
    TEST_ASSERT(wait_for([&] { return manager.get_task(id)->bytes_done == 10; }), "second attempt progress");

    // Progress only moves forward while the attempt runs
    double last = 0.0;
    backend.allow_finish = true;
    bool finished = wait_for([&] {
        auto snap = manager.get_task(id);
        if (snap->progress < last) {
            return true;
        }
        last = snap->progress;
        return snap->status == TaskStatus::COMPLETED;
    });
    TEST_ASSERT(finished && has_status(manager, id, TaskStatus::COMPLETED), "progress went backwards at " << last);
    TEST_ASSERT(backend.attempts.load() == 2, "two attempts expected");
    TEST_ASSERT(wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return notified.size() >= 2;
    }),
                "one callback per attempt");

    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(notified.size() == 2, "one callback per attempt, got " << notified.size());
    TEST_ASSERT(notified[0].status == TaskStatus::FAILED && notified[0].progress == 0.8, "first callback");
    TEST_ASSERT(notified[1].status == TaskStatus::COMPLETED && notified[1].progress == 1.0, "second callback");
    return true;
}

bool test_completion_callback() {
    std::cout << "Testing completion callback..." << std::endl;
    ScratchDir scratch;
    GatedBackend backend;
    backend.open_gate();

    std::mutex mutex;
    std::vector<TaskSnapshot> seen;
    TaskManager manager(backend, config_with(3), [&](const TaskSnapshot& s) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(s);
    });

    std::string id = manager.add_compress({"/a", "/b"}, "/out.zip", "zip");
    TEST_ASSERT(wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return !seen.empty();
    }),
                "callback never fired");
    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(seen.front().id == id, "callback for the wrong task");
    TEST_ASSERT(seen.front().status == TaskStatus::COMPLETED, "callback sees the final status");
    TEST_ASSERT(seen.front().progress == 1.0, "callback sees final progress");
    TEST_ASSERT(seen.front().type == TaskType::COMPRESS && seen.front().remote_path == "/out.zip", "compress task");
    TEST_ASSERT(backend.compressed_sources().size() == 2 && backend.compressed_format() == "zip",
                "compress arguments reach the backend");
    return true;
}

bool test_retention() {
    std::cout << "Testing retention of finished tasks..." << std::endl;
    ScratchDir scratch;
    GatedBackend backend;
    TaskManager manager(backend, config_with(3, 1));

    std::string paused = manager.add_download("/p", scratch.file("p"));
    TEST_ASSERT(wait_for([&] { return has_status(manager, paused, TaskStatus::RUNNING); }), "task never ran");
    manager.pause(paused);
    TEST_ASSERT(wait_for([&] { return has_status(manager, paused, TaskStatus::PAUSED); }), "task not PAUSED");

    backend.open_gate();
    std::string done = manager.add_extract("/a.zip", "");
    TEST_ASSERT(wait_for([&] { return has_status(manager, done, TaskStatus::COMPLETED); }), "extract completes");
    TEST_ASSERT(manager.get_all_tasks().size() == 2, "both tasks listed before expiry");

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    auto remaining = manager.get_all_tasks();
    TEST_ASSERT(remaining.size() == 1, "finished task should age out, have " << remaining.size());
    TEST_ASSERT(remaining.front().id == paused, "paused tasks never age out");

    TEST_ASSERT(manager.remove_task(paused), "remove_task");
    TEST_ASSERT(manager.get_all_tasks().empty(), "registry empty after remove");
    TEST_ASSERT(!manager.remove_task(paused), "second remove returns false");
    return true;
}

int main() {
    std::cout << "Running Task Manager Tests..." << std::endl;

    test_concurrency_cap();
    test_cancel_removes_partial_download();
    test_failure_is_recorded();
    test_pause_and_resume();
    test_cancel_while_paused();
    test_resumed_progress_starts_over();
    test_completion_callback();
    test_retention();

    if (tests_failed == 0) {
        std::cout << "ALL TASK MANAGER TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}

#pragma once

#include "event_thread_pool.h"
#include "file_service.h"
#include "request_server.h"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ferry::server {

// Attempts to remove an archive after auto-extraction, backing off (1 << i) * 100 ms.
inline constexpr int kArchiveDeleteAttempts = 5;

/**
 * Dispatches request actions onto the FileService.
 *
 * Uploads with a Content-Range write at the given offset with pwrite and
 * fsync before answering. Concurrent writers to one file are not serialized:
 * each request owns a disjoint range and relies on positioned writes.
 */
class FileRequestHandler : public rpc::RequestHandler {
public:
    FileRequestHandler(std::shared_ptr<FileService> files, std::shared_ptr<EventThreadPool> jobs);

    void handle(rpc::ServerExchange& exchange) override;

private:
    using Action = void (FileRequestHandler::*)(rpc::ServerExchange&);
    struct Route {
        std::vector<std::string> methods;
        Action action;
    };

    void handle_probe(rpc::ServerExchange& ex);
    void handle_download(rpc::ServerExchange& ex);
    void handle_upload(rpc::ServerExchange& ex);
    void handle_list(rpc::ServerExchange& ex);
    void handle_stat(rpc::ServerExchange& ex);
    void handle_checksum(rpc::ServerExchange& ex);
    void handle_delete(rpc::ServerExchange& ex);
    void handle_mkdir(rpc::ServerExchange& ex);
    void handle_rename(rpc::ServerExchange& ex);
    void handle_copy(rpc::ServerExchange& ex);
    void handle_chmod(rpc::ServerExchange& ex);
    void handle_edit(rpc::ServerExchange& ex);
    void handle_compress(rpc::ServerExchange& ex);
    void handle_extract(rpc::ServerExchange& ex);

    // Extracts into the archive's directory off the request thread, then deletes it.
    void schedule_extract(const std::filesystem::path& archive);

    std::shared_ptr<FileService> m_files;
    std::shared_ptr<EventThreadPool> m_jobs;
    std::map<std::string, Route> m_routes;
};

} // namespace ferry::server

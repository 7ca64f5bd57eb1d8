#include "ferry_client.h"
#include "archive.h"
#include "errors.h"
#include "key_derivation.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace ferry {

namespace {

wire::RequestHead make_head(const std::string& method, const std::string& action) {
    wire::RequestHead head;
    head.method = method;
    head.action = action;
    return head;
}

wire::RequestHead make_head(const std::string& method, const std::string& action, const std::string& path) {
    wire::RequestHead head = make_head(method, action);
    head.params["path"] = path;
    return head;
}

template <typename T>
T parse_json_body(const rpc::Response& resp, const char* what) {
    try {
        return nlohmann::json::parse(resp.body).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(resp.head.status, std::string("malformed ") + what + " response: " + e.what());
    }
}

// Last component of a server path ("/a/b/" -> "b").
std::string remote_base_name(const std::string& remote_path) {
    std::string trimmed = remote_path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    size_t slash = trimmed.find_last_of('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

std::string remote_without_trailing_slash(std::string remote_path) {
    while (remote_path.size() > 1 && remote_path.back() == '/') {
        remote_path.pop_back();
    }
    return remote_path;
}

} // namespace

FerryClient::FerryClient(ClientOptions options, TransportTuning tuning, MuxConfig mux_config,
                         PackTransferConfig pack_config)
    : m_options(std::move(options)),
      m_tuning(tuning),
      m_mux_config(mux_config),
      m_pack_config(std::move(pack_config)) {}

FerryClient::~FerryClient() {
    close();
}

// ============================================================================
// CONNECTION
// ============================================================================

void FerryClient::connect(const std::string& passphrase) {
    connect(m_options.server_address, passphrase);
}

void FerryClient::connect(const std::string& address, const std::string& passphrase) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_session) {
        m_session->close();
        m_session.reset();
    }
    rpc::Connector connector(m_tuning, m_mux_config, std::chrono::milliseconds(m_options.handshake_timeout_ms));
    if (m_on_state) {
        connector.set_state_callback(m_on_state);
    }
    m_session = connector.connect(address, passphrase);
}

void FerryClient::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_session) {
        m_session->close();
        m_session.reset();
    }
}

bool FerryClient::is_connected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session && !m_session->is_closed();
}

void FerryClient::set_state_callback(rpc::Connector::StateCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_state = std::move(callback);
}

void FerryClient::set_pack_config(const PackTransferConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pack_config = config;
}

PackTransferConfig FerryClient::pack_config() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pack_config;
}

std::shared_ptr<rpc::Session> FerryClient::session() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session || m_session->is_closed()) {
        throw ConnectionError("not connected");
    }
    return m_session;
}

rpc::Response FerryClient::call_ok(const wire::RequestHead& head, const std::string& body,
                                   CancellationToken* cancel) {
    wire::RequestHead request = head;
    request.content_length = static_cast<int64_t>(body.size());
    rpc::Response resp = session()->client().call(request, body, cancel);
    if (!resp.head.ok()) {
        LOG_DEBUG("RPC: " + head.action + " failed with " + std::to_string(resp.head.status) + ": " + resp.body);
        throw_for_status(resp.head.status, resp.body);
    }
    return resp;
}

// ============================================================================
// REMOTE FILE OPERATIONS
// ============================================================================

std::vector<wire::ListItem> FerryClient::list(const std::string& path, bool recursive) {
    wire::RequestHead head = make_head("GET", "list", path);
    if (recursive) {
        head.params["recursive"] = "1";
    }
    return parse_json_body<std::vector<wire::ListItem>>(call_ok(head), "list");
}

wire::FileStat FerryClient::stat(const std::string& path) {
    return parse_json_body<wire::FileStat>(call_ok(make_head("GET", "stat", path)), "stat");
}

std::string FerryClient::checksum(const std::string& path) {
    std::string sum = call_ok(make_head("GET", "checksum", path)).body;
    while (!sum.empty() && (sum.back() == '\n' || sum.back() == '\r')) {
        sum.pop_back();
    }
    return sum;
}

void FerryClient::remove(const std::string& path) {
    call_ok(make_head("DELETE", "delete", path));
}

void FerryClient::make_directory(const std::string& path) {
    call_ok(make_head("POST", "mkdir", path));
}

void FerryClient::rename(const std::string& old_path, const std::string& new_path) {
    wire::RequestHead head = make_head("POST", "rename");
    head.params["old"] = old_path;
    head.params["new"] = new_path;
    call_ok(head);
}

void FerryClient::copy(const std::string& src, const std::string& dst) {
    wire::RequestHead head = make_head("POST", "copy");
    head.params["src"] = src;
    head.params["dst"] = dst;
    call_ok(head);
}

void FerryClient::chmod(const std::string& path, const std::string& mode) {
    wire::RequestHead head = make_head("POST", "chmod", path);
    head.params["mode"] = mode;
    call_ok(head);
}

std::string FerryClient::read_text(const std::string& path) {
    return call_ok(make_head("GET", "edit", path)).body;
}

void FerryClient::save_text(const std::string& path, const std::string& content) {
    call_ok(make_head("PUT", "edit", path), content);
}

std::string FerryClient::compress(const std::vector<std::string>& remote_sources, const std::string& output,
                                  const std::string& format, CancellationToken* cancel) {
    std::string paths;
    for (const auto& p : remote_sources) {
        if (!paths.empty()) paths += ",";
        paths += p;
    }
    wire::RequestHead head = make_head("POST", "compress");
    head.params["paths"] = paths;
    head.params["output"] = output;
    head.params["format"] = format.empty() ? std::string("zip") : format;
    return call_ok(head, "", cancel).body;
}

std::string FerryClient::extract(const std::string& remote_archive, const std::string& destination,
                                 CancellationToken* cancel) {
    wire::RequestHead head = make_head("POST", "extract", remote_archive);
    if (!destination.empty()) {
        head.params["dest"] = destination;
    }
    return call_ok(head, "", cancel).body;
}

// ============================================================================
// TRANSFERS
// ============================================================================

transfer::TransferReport FerryClient::upload(const std::string& local_path, const std::string& remote_path,
                                             transfer::ProgressCallback progress, CancellationToken* cancel) {
    std::error_code ec;
    fs::file_status st = fs::status(local_path, ec);
    if (ec || !fs::exists(st)) {
        throw IOError("not found: " + local_path);
    }

    const bool is_dir = fs::is_directory(st);
    if (is_dir) {
        LOG_INFO("PACK: folder upload " + local_path + " is always packed");
        return upload_packed(local_path, remote_path, std::move(progress), cancel);
    }

    int64_t size = static_cast<int64_t>(fs::file_size(local_path, ec));
    if (ec) {
        throw IOError("cannot stat " + local_path + ": " + ec.message());
    }
    if (transfer::decide_pack(pack_config(), false, size) == transfer::PackDecision::PACK) {
        return upload_packed(local_path, remote_path, std::move(progress), cancel);
    }

    transfer::TransferEngine engine(session(), m_options);
    return engine.upload(local_path, remote_path, transfer::UploadOptions{}, std::move(progress), cancel);
}

transfer::TransferReport FerryClient::upload_packed(const std::string& local_path, const std::string& remote_path,
                                                    transfer::ProgressCallback progress,
                                                    CancellationToken* cancel) {
    const std::string remote = remote_without_trailing_slash(remote_path);
    const std::string root_name = remote_base_name(remote);

    transfer::ScratchFile scratch(transfer::unique_scratch_archive(pack_config(), root_name));
    archive::pack_tar_gz(local_path, root_name, scratch.path());
    if (cancel) cancel->throw_if_canceled();

    // The server unpacks into the archive's directory, so the item lands at remote_path
    transfer::UploadOptions options;
    options.auto_extract = true;
    transfer::TransferEngine engine(session(), m_options);
    transfer::TransferReport report =
        engine.upload(scratch.path().string(), remote + ".tar.gz", options, std::move(progress), cancel);
    report.packed = true;

    scratch.remove();
    LOG_INFO("PACK: uploaded " + local_path + " -> " + remote + " packed");
    return report;
}

transfer::TransferReport FerryClient::download(const std::string& remote_path, const std::string& local_path,
                                               transfer::ProgressCallback progress, CancellationToken* cancel) {
    transfer::TransferEngine engine(session(), m_options);

    wire::FileStat info;
    try {
        info = stat(remote_path);
    } catch (const ProtocolError& e) {
        LOG_DEBUG("PACK: stat of " + remote_path + " failed (" + e.what() + "), downloading as-is");
        return engine.download(remote_path, local_path, std::move(progress), cancel);
    }

    if (info.is_dir) {
        return download_packed(remote_path, local_path, true, std::move(progress), cancel);
    }
    if (transfer::decide_pack(pack_config(), false, info.size) == transfer::PackDecision::PACK) {
        return download_packed(remote_path, local_path, false, std::move(progress), cancel);
    }
    return engine.download(remote_path, local_path, std::move(progress), cancel);
}

transfer::TransferReport FerryClient::download_packed(const std::string& remote_path, const std::string& local_path,
                                                      bool is_directory, transfer::ProgressCallback progress,
                                                      CancellationToken* cancel) {
    const std::string remote = remote_without_trailing_slash(remote_path);
    const std::string remote_archive = remote + ".tar.gz";
    const std::string root_name = remote_base_name(remote);

    try {
        compress({remote}, remote_archive, "targz", cancel);
    } catch (const ProtocolError& e) {
        if (is_directory) {
            throw;
        }
        LOG_WARN("PACK: server could not compress " + remote + " (" + e.what() + "), downloading as-is");
        transfer::TransferEngine engine(session(), m_options);
        return engine.download(remote, local_path, std::move(progress), cancel);
    }

    fs::path local(local_path);
    std::error_code ec;
    if (fs::is_directory(local, ec)) {
        throw IOError("destination already exists: " + local_path);
    }

    transfer::TransferReport report;
    {
        transfer::ScratchFile scratch(transfer::unique_scratch_archive(pack_config(), root_name));
        try {
            transfer::TransferEngine engine(session(), m_options);
            report = engine.download(remote_archive, scratch.path().string(), std::move(progress), cancel);
        } catch (const FerryError&) {
            try {
                remove(remote_archive);
            } catch (const FerryError& e) {
                LOG_WARN("PACK: could not delete remote " + remote_archive + ": " + e.what());
            }
            throw;
        }

        // Unpack beside the destination, then move the root entry into place
        fs::path parent = local.parent_path().empty() ? fs::path(".") : local.parent_path();
        fs::create_directories(parent, ec);
        fs::path staging = parent / (".ferry-unpack-" + crypto::random_hex(6));
        try {
            archive::extract_archive(scratch.path(), staging);
            fs::path unpacked = staging / root_name;
            if (!fs::exists(fs::symlink_status(unpacked))) {
                throw IOError("archive did not contain " + root_name);
            }
            fs::remove(local, ec);
            fs::rename(unpacked, local);
        } catch (const fs::filesystem_error& e) {
            fs::remove_all(staging, ec);
            throw IOError(std::string("cannot unpack into ") + local_path + ": " + e.what());
        } catch (...) {
            fs::remove_all(staging, ec);
            throw;
        }
        fs::remove_all(staging, ec);
    }

    try {
        remove(remote_archive);
    } catch (const FerryError& e) {
        LOG_WARN("PACK: could not delete remote " + remote_archive + ": " + e.what());
    }

    report.packed = true;
    LOG_INFO("PACK: downloaded " + remote + " -> " + local_path + " packed");
    return report;
}

} // namespace ferry

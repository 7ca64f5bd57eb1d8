#ifndef FERRY_CLIENT_H
#define FERRY_CLIENT_H

#include "list_item.h"
#include "pack_transfer.h"
#include "session.h"
#include "settings.h"
#include "transfer_backend.h"
#include "transfer_engine.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry {

/**
 * Client-side entry point for front-ends.
 *
 * Owns at most one Session. connect() and close() are serialized; every
 * other call takes a reference to the current session and runs on its own
 * stream, so operations from different threads proceed in parallel.
 *
 * Remote paths are server-relative ("/docs/a.txt"). Failures surface as
 * FerryError subclasses; a call made while disconnected throws ConnectionError.
 */
class FerryClient : public transfer::TransferBackend {
public:
    FerryClient(ClientOptions options, TransportTuning tuning, MuxConfig mux_config,
                PackTransferConfig pack_config = PackTransferConfig{});
    ~FerryClient() override;

    FerryClient(const FerryClient&) = delete;
    FerryClient& operator=(const FerryClient&) = delete;

    // Connects to options.server_address. Replaces any existing session.
    void connect(const std::string& passphrase);
    void connect(const std::string& address, const std::string& passphrase);
    void close();
    bool is_connected() const;

    void set_state_callback(rpc::Connector::StateCallback callback);
    void set_pack_config(const PackTransferConfig& config);
    PackTransferConfig pack_config() const;

    // ========================================================================
    // Remote file operations
    // ========================================================================

    std::vector<wire::ListItem> list(const std::string& path, bool recursive = false);
    wire::FileStat stat(const std::string& path);
    std::string checksum(const std::string& path);
    void remove(const std::string& path);
    void make_directory(const std::string& path);
    void rename(const std::string& old_path, const std::string& new_path);
    void copy(const std::string& src, const std::string& dst);
    // mode is octal text, e.g. "755"
    void chmod(const std::string& path, const std::string& mode);
    std::string read_text(const std::string& path);
    void save_text(const std::string& path, const std::string& content);

    // ========================================================================
    // Transfers (TransferBackend)
    // ========================================================================

    // A directory is always packed. A file is packed when the pack policy says so.
    transfer::TransferReport upload(const std::string& local_path, const std::string& remote_path,
                                    transfer::ProgressCallback progress, CancellationToken* cancel) override;
    // A remote directory is always packed. A file is packed when the pack policy says so;
    // if the server cannot compress it, the file is downloaded as-is.
    transfer::TransferReport download(const std::string& remote_path, const std::string& local_path,
                                      transfer::ProgressCallback progress, CancellationToken* cancel) override;
    // Returns the server's confirmation text.
    std::string compress(const std::vector<std::string>& remote_sources, const std::string& output,
                         const std::string& format, CancellationToken* cancel) override;
    std::string extract(const std::string& remote_archive, const std::string& destination,
                        CancellationToken* cancel) override;

private:
    std::shared_ptr<rpc::Session> session() const;
    rpc::Response call_ok(const wire::RequestHead& head, const std::string& body = "",
                          CancellationToken* cancel = nullptr);

    transfer::TransferReport upload_packed(const std::string& local_path, const std::string& remote_path,
                                           transfer::ProgressCallback progress, CancellationToken* cancel);
    transfer::TransferReport download_packed(const std::string& remote_path, const std::string& local_path,
                                             bool is_directory, transfer::ProgressCallback progress,
                                             CancellationToken* cancel);

    const ClientOptions m_options;
    const TransportTuning m_tuning;
    const MuxConfig m_mux_config;

    mutable std::mutex m_mutex;
    std::shared_ptr<rpc::Session> m_session;
    PackTransferConfig m_pack_config;
    rpc::Connector::StateCallback m_on_state;
};

} // namespace ferry

#endif // FERRY_CLIENT_H

#ifndef FERRY_TRANSFER_ENGINE_H
#define FERRY_TRANSFER_ENGINE_H

#include "cancellation.h"
#include "progress_ticker.h"
#include "session.h"
#include "settings.h"
#include "transfer_types.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ferry::transfer {

/**
 * CHUNKED TRANSFER ENGINE
 *
 * - Files below the chunk threshold move over one stream; downloads resume
 *   from whatever is already on disk.
 * - Larger files are split by plan_chunks() and moved by one worker per
 *   chunk, each on its own stream with an inclusive byte range.
 * - Downloaded chunks land in .tmp_<name>/chunk_NNNN.tmp and are merged in
 *   index order; the temp directory is always removed.
 * - Uploaded chunks are written by the server at their offsets directly.
 * - Every successful transfer is checked against the server's SHA-256.
 * - The first failing chunk fails the transfer. Nothing is retried here.
 */
class TransferEngine {
public:
    TransferEngine(std::shared_ptr<rpc::Session> session, ClientOptions options);

    TransferReport upload(const std::string& local_path, const std::string& remote_path,
                          const UploadOptions& upload_options, ProgressCallback progress,
                          CancellationToken* cancel = nullptr);

    TransferReport download(const std::string& remote_path, const std::string& local_path,
                            ProgressCallback progress, CancellationToken* cancel = nullptr);

    int64_t remote_size(const std::string& remote_path, CancellationToken* cancel = nullptr) const;
    std::string remote_checksum(const std::string& remote_path, CancellationToken* cancel = nullptr) const;

    // Throws IntegrityError when the local and remote hashes differ.
    void verify(const std::string& remote_path, const std::string& local_path, CancellationToken* cancel) const;

private:
    using ChunkWork = std::function<void(const Chunk&, CancellationToken*)>;

    TransferReport download_single(const std::string& remote_path, const std::string& local_path, int64_t size,
                                   ProgressCallback progress, CancellationToken* cancel);
    TransferReport download_parallel(const std::string& remote_path, const std::string& local_path, int64_t size,
                                     ProgressCallback progress, CancellationToken* cancel);
    void download_chunk(const std::string& remote_path, const Chunk& chunk, const std::string& chunk_file,
                        ProgressTicker& ticker, CancellationToken* cancel) const;

    TransferReport upload_single(const std::string& local_path, const std::string& remote_path, int64_t size,
                                 ProgressCallback progress, CancellationToken* cancel);
    TransferReport upload_parallel(const std::string& local_path, const std::string& remote_path, int64_t size,
                                   ProgressCallback progress, CancellationToken* cancel);
    void upload_chunk(const std::string& local_path, const std::string& remote_path, const Chunk& chunk,
                      int64_t size, ProgressTicker& ticker, CancellationToken* cancel) const;
    // Asks the server to unpack a completed upload.
    void finalize_upload(const std::string& remote_path, int64_t size, CancellationToken* cancel) const;

    // Runs work for every chunk, at most chunk_workers at a time. The first failure
    // cancels the rest and is rethrown once every worker has finished.
    void run_chunks(const std::vector<Chunk>& chunks, CancellationToken* cancel, const ChunkWork& work) const;

    std::shared_ptr<rpc::Session> m_session;
    ClientOptions m_options;
};

} // namespace ferry::transfer

#endif // FERRY_TRANSFER_ENGINE_H

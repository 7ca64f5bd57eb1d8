#ifndef FERRY_TRANSFER_BACKEND_H
#define FERRY_TRANSFER_BACKEND_H

#include "cancellation.h"
#include "transfer_types.h"

#include <string>
#include <vector>

namespace ferry::transfer {

/**
 * Operations a task can run. Implemented by FerryClient; tests substitute their own.
 * Every call blocks and throws a FerryError subclass on failure.
 */
class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    virtual TransferReport upload(const std::string& local_path, const std::string& remote_path,
                                  ProgressCallback progress, CancellationToken* cancel) = 0;
    virtual TransferReport download(const std::string& remote_path, const std::string& local_path,
                                    ProgressCallback progress, CancellationToken* cancel) = 0;
    virtual std::string compress(const std::vector<std::string>& remote_sources, const std::string& output,
                                 const std::string& format, CancellationToken* cancel) = 0;
    virtual std::string extract(const std::string& remote_archive, const std::string& destination,
                                CancellationToken* cancel) = 0;
};

} // namespace ferry::transfer

#endif // FERRY_TRANSFER_BACKEND_H

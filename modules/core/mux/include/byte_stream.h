#pragma once

#include "io_status.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace ferry {

// A bidirectional byte stream. Implementations are safe for one reader and one writer at a time.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual IoStatus read(uint8_t* buf, size_t len, size_t& n, std::chrono::milliseconds timeout) = 0;
    virtual bool write(const uint8_t* data, size_t len) = 0;
    // Idempotent. Unblocks pending reads and writes.
    virtual void close() = 0;
    virtual uint32_t id() const = 0;
};

// Accept/close/local-address capability a request server layers on,
// unaware of how streams are produced.
class StreamAcceptor {
public:
    virtual ~StreamAcceptor() = default;

    // nullptr on timeout. Throws nothing; check is_closed() to stop looping.
    virtual std::shared_ptr<ByteStream> accept(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual bool is_closed() const = 0;
    virtual std::string local_address() const = 0;
};

} // namespace ferry

#pragma once

#include "byte_stream.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace ferry::wire {

using json = nlohmann::json;

// Head frames are JSON; anything larger than this is rejected.
inline constexpr uint32_t kMaxHeadSize = 1024u * 1024u;

enum class FrameType : uint8_t {
    REQUEST_HEAD = 0x51,
    RESPONSE_HEAD = 0x52,
};

// HTTP-style status codes used on the wire
inline constexpr int kStatusOk = 200;
inline constexpr int kStatusPartialContent = 206;
inline constexpr int kStatusBadRequest = 400;
inline constexpr int kStatusForbidden = 403;
inline constexpr int kStatusNotFound = 404;
inline constexpr int kStatusMethodNotAllowed = 405;
inline constexpr int kStatusTooLarge = 413;
inline constexpr int kStatusRangeNotSatisfiable = 416;
inline constexpr int kStatusInternalError = 500;

// Header names shared by both ends
inline constexpr const char* kHeaderRange = "Range";
inline constexpr const char* kHeaderContentRange = "Content-Range";
inline constexpr const char* kHeaderAutoExtract = "X-Auto-Extract";
inline constexpr const char* kHeaderFileSize = "X-File-Size";
inline constexpr const char* kHeaderUploadedBytes = "X-Uploaded-Bytes";

struct RequestHead {
    std::string method = "GET";
    std::string action;
    std::map<std::string, std::string> params;
    std::map<std::string, std::string> headers;
    int64_t content_length = 0;

    std::string param(const std::string& name, const std::string& fallback = "") const;
    std::string header(const std::string& name) const;
};

struct ResponseHead {
    int status = kStatusOk;
    std::map<std::string, std::string> headers;
    int64_t content_length = 0;

    bool ok() const { return status >= 200 && status < 300; }
    std::string header(const std::string& name) const;
};

void to_json(json& j, const RequestHead& head);
void from_json(const json& j, RequestHead& head);
void to_json(json& j, const ResponseHead& head);
void from_json(const json& j, ResponseHead& head);

// [type: 1 byte][length: 4 bytes big-endian][JSON payload]
std::string encode_frame(FrameType type, std::string_view payload);

// Blocking helpers over a ByteStream. Throw ProtocolError on malformed input,
// ConnectionError when the stream ends or times out first.
void read_exact(ByteStream& stream, uint8_t* buf, size_t len, std::chrono::milliseconds timeout);
void write_all(ByteStream& stream, const void* data, size_t len);

void write_request_head(ByteStream& stream, const RequestHead& head);
void write_response_head(ByteStream& stream, const ResponseHead& head);
RequestHead read_request_head(ByteStream& stream, std::chrono::milliseconds timeout);
ResponseHead read_response_head(ByteStream& stream, std::chrono::milliseconds timeout);

} // namespace ferry::wire

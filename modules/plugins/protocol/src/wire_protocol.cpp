#include "wire_protocol.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <cctype>

namespace ferry::wire {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string find_header(const std::map<std::string, std::string>& headers, const std::string& name) {
    const std::string wanted = lower(name);
    for (const auto& kv : headers) {
        if (lower(kv.first) == wanted) {
            return kv.second;
        }
    }
    return "";
}

std::string read_frame(ByteStream& stream, FrameType expected, std::chrono::milliseconds timeout) {
    uint8_t header[5];
    read_exact(stream, header, sizeof(header), timeout);
    if (header[0] != static_cast<uint8_t>(expected)) {
        throw ProtocolError(0, "unexpected frame type " + std::to_string(header[0]));
    }
    const uint32_t length = (static_cast<uint32_t>(header[1]) << 24) |
                            (static_cast<uint32_t>(header[2]) << 16) |
                            (static_cast<uint32_t>(header[3]) << 8) |
                            static_cast<uint32_t>(header[4]);
    if (length > kMaxHeadSize) {
        throw ProtocolError(0, "head frame too large: " + std::to_string(length));
    }
    std::string payload(length, '\0');
    if (length > 0) {
        read_exact(stream, reinterpret_cast<uint8_t*>(&payload[0]), length, timeout);
    }
    return payload;
}

} // namespace

std::string RequestHead::param(const std::string& name, const std::string& fallback) const {
    auto it = params.find(name);
    return it == params.end() ? fallback : it->second;
}

std::string RequestHead::header(const std::string& name) const {
    return find_header(headers, name);
}

std::string ResponseHead::header(const std::string& name) const {
    return find_header(headers, name);
}

void to_json(json& j, const RequestHead& head) {
    j = json{{"method", head.method},
             {"action", head.action},
             {"params", head.params},
             {"headers", head.headers},
             {"content_length", head.content_length}};
}

void from_json(const json& j, RequestHead& head) {
    head.method = j.value("method", std::string("GET"));
    head.action = j.value("action", std::string());
    head.params = j.value("params", std::map<std::string, std::string>());
    head.headers = j.value("headers", std::map<std::string, std::string>());
    head.content_length = j.value("content_length", int64_t{0});
}

void to_json(json& j, const ResponseHead& head) {
    j = json{{"status", head.status},
             {"headers", head.headers},
             {"content_length", head.content_length}};
}

void from_json(const json& j, ResponseHead& head) {
    head.status = j.value("status", 0);
    head.headers = j.value("headers", std::map<std::string, std::string>());
    head.content_length = j.value("content_length", int64_t{0});
}

std::string encode_frame(FrameType type, std::string_view payload) {
    const uint32_t length = static_cast<uint32_t>(payload.size());

    std::string encoded;
    encoded.reserve(1 + sizeof(uint32_t) + length);
    encoded.push_back(static_cast<char>(type));

    // length big-endian
    encoded.push_back(static_cast<char>((length >> 24) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 16) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 8) & 0xFF));
    encoded.push_back(static_cast<char>(length & 0xFF));

    encoded.append(payload.data(), payload.size());
    return encoded;
}

void read_exact(ByteStream& stream, uint8_t* buf, size_t len, std::chrono::milliseconds timeout) {
    size_t got = 0;
    while (got < len) {
        size_t n = 0;
        IoStatus status = stream.read(buf + got, len - got, n, timeout);
        switch (status) {
            case IoStatus::Ok:
                got += n;
                break;
            case IoStatus::Timeout:
                throw ConnectionError("stream read timed out");
            case IoStatus::Eof:
                throw ConnectionError("stream ended after " + std::to_string(got) + " of " +
                                      std::to_string(len) + " bytes");
            case IoStatus::Closed:
                throw ConnectionError("stream closed");
        }
    }
}

void write_all(ByteStream& stream, const void* data, size_t len) {
    if (!stream.write(static_cast<const uint8_t*>(data), len)) {
        throw ConnectionError("stream closed while writing");
    }
}

void write_request_head(ByteStream& stream, const RequestHead& head) {
    std::string frame = encode_frame(FrameType::REQUEST_HEAD, json(head).dump());
    write_all(stream, frame.data(), frame.size());
}

void write_response_head(ByteStream& stream, const ResponseHead& head) {
    std::string frame = encode_frame(FrameType::RESPONSE_HEAD, json(head).dump());
    write_all(stream, frame.data(), frame.size());
}

RequestHead read_request_head(ByteStream& stream, std::chrono::milliseconds timeout) {
    std::string payload = read_frame(stream, FrameType::REQUEST_HEAD, timeout);
    try {
        return json::parse(payload).get<RequestHead>();
    } catch (const json::exception& e) {
        throw ProtocolError(kStatusBadRequest, std::string("malformed request head: ") + e.what());
    }
}

ResponseHead read_response_head(ByteStream& stream, std::chrono::milliseconds timeout) {
    std::string payload = read_frame(stream, FrameType::RESPONSE_HEAD, timeout);
    try {
        return json::parse(payload).get<ResponseHead>();
    } catch (const json::exception& e) {
        throw ProtocolError(0, std::string("malformed response head: ") + e.what());
    }
}

} // namespace ferry::wire

/**
 * @file invocation_codec.cpp
 * @brief InvocationCodec binary serialization for routed service calls.
 */

#include "network/invocation_codec.hpp"

namespace grid_deploy {

namespace {

constexpr size_t RESPONSE_HEADER = 1 + 1 + 4;
constexpr uint8_t STATUS_OK = 0;
constexpr uint8_t STATUS_ERROR = 1;

bool read_string(const Bytes& data, size_t& offset, std::string& out) {
    if (offset + 4 > data.size()) return false;
    auto len = InvocationCodec::get_u32(data.data() + offset);
    offset += 4;
    if (len > data.size() - offset) return false;
    out.assign(reinterpret_cast<const char*>(data.data() + offset), len);
    offset += len;
    return true;
}

void write_string(Bytes& buf, const std::string& value) {
    InvocationCodec::put_u32(buf, static_cast<uint32_t>(value.size()));
    buf.insert(buf.end(), value.begin(), value.end());
}

}  // anonymous namespace

void InvocationCodec::put_u32(Bytes& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint32_t InvocationCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

Bytes InvocationCodec::encode_request(const InvocationRequest& request) {
    Bytes buf;
    buf.reserve(8 + request.service.size() + request.method.size() + request.args.size());
    write_string(buf, request.service);
    write_string(buf, request.method);
    buf.insert(buf.end(), request.args.begin(), request.args.end());
    return buf;
}

bool InvocationCodec::decode_request(const Bytes& data, InvocationRequest& request) {
    size_t offset = 0;
    if (!read_string(data, offset, request.service)) return false;
    if (!read_string(data, offset, request.method)) return false;
    request.args.assign(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end());
    return true;
}

// ─────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────

Bytes InvocationCodec::encode_response(const Result<Bytes>& result) {
    Bytes buf;
    if (result.has_value()) {
        buf.reserve(RESPONSE_HEADER + result.value().size());
        buf.push_back(STATUS_OK);
        buf.push_back(0);
        put_u32(buf, 0);
        buf.insert(buf.end(), result.value().begin(), result.value().end());
    } else {
        const auto& err = result.error();
        buf.reserve(RESPONSE_HEADER + err.message.size());
        buf.push_back(STATUS_ERROR);
        buf.push_back(static_cast<uint8_t>(err.code));
        write_string(buf, err.message);
    }
    return buf;
}

bool InvocationCodec::decode_response(const Bytes& data, Result<Bytes>& result) {
    if (data.size() < RESPONSE_HEADER) return false;

    uint8_t status = data[0];
    auto code = static_cast<ErrorCode>(data[1]);
    size_t offset = 2;
    std::string message;
    if (!read_string(data, offset, message)) return false;

    if (status == STATUS_OK) {
        result = Bytes(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end());
        return true;
    }
    if (status != STATUS_ERROR || code > ErrorCode::Timeout) return false;
    result = Error{code, std::move(message)};
    return true;
}

}  // namespace grid_deploy

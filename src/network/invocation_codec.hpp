/**
 * @file invocation_codec.hpp
 * @brief Binary framing of routed service calls.
 *
 * Simple binary format (all multi-byte values are big-endian):
 *   Request:  [4B service_len][service][4B method_len][method][args...]
 *   Response: [1B status (0=ok,1=err)][1B error_code]
 *             [4B error_len][error_msg][payload...]
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "service/service.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace grid_deploy {

struct InvocationRequest {
    ServiceName service;
    std::string method;
    Bytes args;
};

struct InvocationCodec {
    static Bytes encode_request(const InvocationRequest& request);
    static bool decode_request(const Bytes& data, InvocationRequest& request);

    static Bytes encode_response(const Result<Bytes>& result);
    static bool decode_response(const Bytes& data, Result<Bytes>& result);

    static void put_u32(Bytes& buf, uint32_t val);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace grid_deploy

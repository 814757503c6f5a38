/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <grpcpp/support/string_ref.h>

namespace bastion
{
    // case sensitive multimap, the shape gRPC uses for headers and trailers
    using metadata_map = std::multimap<std::string, std::string>;

    namespace metadata_keys
    {
        // nanoseconds since the unix epoch at which the client sent the call
        inline constexpr const char* client_request_time = "client-request-time";
        inline constexpr const char* trace_id = "bastion-trace-id";

        // error propagation trailers
        inline constexpr const char* error_type = "errortype";
        inline constexpr const char* sub_errors = "suberrors";
        inline constexpr const char* retry_after = "retryafter";
    }

    std::vector<std::string> metadata_values(const metadata_map& md, std::string_view key);

    // gRPC refuses non binary metadata values outside 0x20-0x7E
    bool is_printable_metadata_value(std::string_view value);

    metadata_map to_metadata_map(const std::multimap<::grpc::string_ref, ::grpc::string_ref>& md);

    struct method_name
    {
        std::string service;
        std::string method;
    };

    // "/pkg.Service/Method" -> {"pkg.Service", "Method"}, anything unsplittable
    // yields {"unknown", "unknown"}
    method_name split_method_name(std::string_view full_method);
}

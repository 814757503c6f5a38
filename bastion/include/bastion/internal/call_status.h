/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <optional>
#include <string>

#include <grpcpp/support/status.h>

#include <bastion/internal/domain_error.h>

namespace bastion
{
    // Outcome of a single call: success, an opaque gRPC status, or a structured domain error.
    class call_status
    {
        ::grpc::Status status_;
        std::optional<domain_error> domain_;

    public:
        call_status() = default;
        call_status(::grpc::Status status);
        call_status(::grpc::StatusCode code, std::string message);
        call_status(domain_error err);

        bool ok() const { return !domain_ && status_.ok(); }
        bool is_domain_error() const { return domain_.has_value(); }
        const domain_error& domain() const { return *domain_; }

        // domain errors report UNKNOWN, which is how they look on the wire
        ::grpc::StatusCode code() const;
        std::string message() const;

        // the status handed to gRPC, domain errors collapse to UNKNOWN with their detail
        ::grpc::Status to_grpc_status() const;

        std::string to_string() const;
    };

    const char* status_code_name(::grpc::StatusCode code);
}

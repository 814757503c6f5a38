/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <bastion/internal/call_status.h>

namespace bastion
{
    call_status::call_status(::grpc::Status status)
        : status_(std::move(status))
    {
    }

    call_status::call_status(::grpc::StatusCode code, std::string message)
        : status_(code, std::move(message))
    {
    }

    call_status::call_status(domain_error err)
        : status_(::grpc::StatusCode::UNKNOWN, err.detail)
        , domain_(std::move(err))
    {
    }

    ::grpc::StatusCode call_status::code() const
    {
        if (domain_)
            return ::grpc::StatusCode::UNKNOWN;
        return status_.error_code();
    }

    std::string call_status::message() const
    {
        if (domain_)
            return domain_->detail;
        return status_.error_message();
    }

    ::grpc::Status call_status::to_grpc_status() const
    {
        if (domain_)
            return ::grpc::Status(::grpc::StatusCode::UNKNOWN, domain_->detail);
        return status_;
    }

    std::string call_status::to_string() const
    {
        if (ok())
            return "OK";
        if (domain_)
            return fmt::format("{}: {}", bastion::to_string(domain_->type), domain_->to_string());
        return fmt::format("{}: {}", status_code_name(status_.error_code()), status_.error_message());
    }

    const char* status_code_name(::grpc::StatusCode code)
    {
        switch (code)
        {
        case ::grpc::StatusCode::OK:
            return "OK";
        case ::grpc::StatusCode::CANCELLED:
            return "CANCELLED";
        case ::grpc::StatusCode::UNKNOWN:
            return "UNKNOWN";
        case ::grpc::StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ::grpc::StatusCode::DEADLINE_EXCEEDED:
            return "DEADLINE_EXCEEDED";
        case ::grpc::StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case ::grpc::StatusCode::ALREADY_EXISTS:
            return "ALREADY_EXISTS";
        case ::grpc::StatusCode::PERMISSION_DENIED:
            return "PERMISSION_DENIED";
        case ::grpc::StatusCode::UNAUTHENTICATED:
            return "UNAUTHENTICATED";
        case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
            return "RESOURCE_EXHAUSTED";
        case ::grpc::StatusCode::FAILED_PRECONDITION:
            return "FAILED_PRECONDITION";
        case ::grpc::StatusCode::ABORTED:
            return "ABORTED";
        case ::grpc::StatusCode::OUT_OF_RANGE:
            return "OUT_OF_RANGE";
        case ::grpc::StatusCode::UNIMPLEMENTED:
            return "UNIMPLEMENTED";
        case ::grpc::StatusCode::INTERNAL:
            return "INTERNAL";
        case ::grpc::StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case ::grpc::StatusCode::DATA_LOSS:
            return "DATA_LOSS";
        default:
            return "UNKNOWN";
        }
    }
}

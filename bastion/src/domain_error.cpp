/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <bastion/internal/domain_error.h>
#include <bastion/internal/duration.h>

namespace bastion
{
    const char* to_string(error_type type)
    {
        switch (type)
        {
        case error_type::internal_server:
            return "internalServerError";
        case error_type::not_supported:
            return "notSupported";
        case error_type::malformed:
            return "malformed";
        case error_type::unauthorized:
            return "unauthorized";
        case error_type::not_found:
            return "notFound";
        case error_type::rate_limit:
            return "rateLimit";
        case error_type::rejected_identifier:
            return "rejectedIdentifier";
        case error_type::invalid_email:
            return "invalidEmail";
        case error_type::connection_failure:
            return "connectionFailure";
        case error_type::wrong_authorization_state:
            return "wrongAuthorizationState";
        case error_type::caa:
            return "caa";
        case error_type::missing_scts:
            return "missingSCTs";
        case error_type::duplicate:
            return "duplicate";
        case error_type::order_not_ready:
            return "orderNotReady";
        case error_type::dns:
            return "dns";
        case error_type::bad_public_key:
            return "badPublicKey";
        case error_type::bad_csr:
            return "badCSR";
        case error_type::already_revoked:
            return "alreadyRevoked";
        case error_type::bad_revocation_reason:
            return "badRevocationReason";
        }
        return "unknown";
    }

    bool error_type_from_int(std::int64_t value, error_type& out)
    {
        if (value < static_cast<std::int64_t>(error_type::internal_server)
            || value > static_cast<std::int64_t>(error_type::bad_revocation_reason))
            return false;
        out = static_cast<error_type>(value);
        return true;
    }

    std::string domain_error::to_string() const
    {
        std::string text = subject ? fmt::format("{}: {}", subject->value, detail) : detail;
        if (retry_after.count() != 0)
            text += fmt::format(" (retry after {})", format_duration(retry_after));
        return text;
    }

    domain_error make_domain_error(error_type type, std::string detail)
    {
        domain_error err;
        err.type = type;
        err.detail = std::move(detail);
        return err;
    }

    domain_error internal_error(std::string detail)
    {
        return make_domain_error(error_type::internal_server, std::move(detail));
    }
}

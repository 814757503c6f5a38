/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bastion
{
    // Closed set of application level failures. The integer values are carried on
    // the wire in the errortype trailer and must never be renumbered.
    enum class error_type : int
    {
        internal_server = 0,
        not_supported = 1,
        malformed = 2,
        unauthorized = 3,
        not_found = 4,
        rate_limit = 5,
        rejected_identifier = 6,
        invalid_email = 7,
        connection_failure = 8,
        wrong_authorization_state = 9,
        caa = 10,
        missing_scts = 11,
        duplicate = 12,
        order_not_ready = 13,
        dns = 14,
        bad_public_key = 15,
        bad_csr = 16,
        already_revoked = 17,
        bad_revocation_reason = 18,
    };

    const char* to_string(error_type type);

    // rejects codes outside the catalogue instead of guessing
    bool error_type_from_int(std::int64_t value, error_type& out);

    // the subject a sub error is about, e.g. {"dns", "example.com"}
    struct identifier
    {
        std::string type;
        std::string value;

        bool operator==(const identifier&) const = default;
    };

    struct domain_error
    {
        error_type type = error_type::internal_server;
        std::string detail;
        std::vector<domain_error> sub_errors;
        std::chrono::nanoseconds retry_after{0};
        // only set on entries of another error's sub_errors
        std::optional<identifier> subject;

        bool operator==(const domain_error&) const = default;

        std::string to_string() const;
    };

    domain_error make_domain_error(error_type type, std::string detail);
    domain_error internal_error(std::string detail);
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

#include <bastion/internal/call_status.h>
#include <bastion/internal/metadata.h>

namespace bastion
{
    // Server side. Domain errors are flattened into an UNKNOWN status carrying the
    // detail text, with errortype / suberrors / retryafter appended to trailers.
    // Any other failure becomes a bare UNKNOWN status with the original message.
    // OK passes through untouched.
    call_status wrap_error(const call_status& status, metadata_map& trailers);

    // Client side inverse of wrap_error. Statuses without an errortype trailer are
    // returned unchanged. Malformed error trailers become an internal domain error.
    call_status unwrap_error(const call_status& status, const metadata_map& trailers);

    // JSON text of the suberrors trailer
    bool encode_sub_errors(const std::vector<domain_error>& sub_errors, std::string& out);
    bool decode_sub_errors(const std::string& text, std::vector<domain_error>& out, std::string& error);
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

// Setup time error codes. Per call failures travel as bastion::call_status instead.
namespace bastion::error
{
    int OK();
    int NIL_CLIENT_CONFIG();     // client builder was handed no client configuration
    int NIL_TLS_CONFIG();        // client builder was handed no TLS material
    int NIL_SERVER_TLS_CONFIG(); // server credentials were requested without TLS material
    int DUPLICATE_SERVICE();     // two services registered under the same name
    int UNKNOWN_SERVICE_POLICY(); // an access policy names a service that was never registered
    int INVALID_TARGET();
    int AMBIGUOUS_TARGET(); // both serverAddress and serverIPAddresses were set
    int MISSING_TARGET();   // neither serverAddress nor serverIPAddresses were set
    int LISTEN_FAILED();
    int INVALID_CONFIG();
    int CONFIG_IO_ERROR();
    int METRIC_CONFLICT();
    int INVALID_CERTIFICATE();

    int MIN();
    int MAX();

    const char* to_string(int err);
}

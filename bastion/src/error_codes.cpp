/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <bastion/internal/error_codes.h>

namespace bastion::error
{
    namespace
    {
        constexpr int offset_val = 0;
    }

    int OK()
    {
        return 0;
    }
    int NIL_CLIENT_CONFIG()
    {
        return offset_val + 1;
    }
    int NIL_TLS_CONFIG()
    {
        return offset_val + 2;
    }
    int NIL_SERVER_TLS_CONFIG()
    {
        return offset_val + 3;
    }
    int DUPLICATE_SERVICE()
    {
        return offset_val + 4;
    }
    int UNKNOWN_SERVICE_POLICY()
    {
        return offset_val + 5;
    }
    int INVALID_TARGET()
    {
        return offset_val + 6;
    }
    int AMBIGUOUS_TARGET()
    {
        return offset_val + 7;
    }
    int MISSING_TARGET()
    {
        return offset_val + 8;
    }
    int LISTEN_FAILED()
    {
        return offset_val + 9;
    }
    int INVALID_CONFIG()
    {
        return offset_val + 10;
    }
    int CONFIG_IO_ERROR()
    {
        return offset_val + 11;
    }
    int METRIC_CONFLICT()
    {
        return offset_val + 12;
    }
    int INVALID_CERTIFICATE()
    {
        return offset_val + 13;
    }

    int MIN()
    {
        return NIL_CLIENT_CONFIG();
    }
    int MAX()
    {
        return INVALID_CERTIFICATE();
    }

    const char* to_string(int err)
    {
        if (err == OK())
            return "OK";
        if (err == NIL_CLIENT_CONFIG())
            return "nil client config";
        if (err == NIL_TLS_CONFIG())
            return "nil TLS config";
        if (err == NIL_SERVER_TLS_CONFIG())
            return "nil server TLS config";
        if (err == DUPLICATE_SERVICE())
            return "duplicate service registration";
        if (err == UNKNOWN_SERVICE_POLICY())
            return "access policy names a service that is not registered";
        if (err == INVALID_TARGET())
            return "invalid connection target";
        if (err == AMBIGUOUS_TARGET())
            return "both serverAddress and serverIPAddresses are set";
        if (err == MISSING_TARGET())
            return "neither serverAddress nor serverIPAddresses is set";
        if (err == LISTEN_FAILED())
            return "server failed to listen";
        if (err == INVALID_CONFIG())
            return "invalid configuration";
        if (err == CONFIG_IO_ERROR())
            return "unable to read configuration material";
        if (err == METRIC_CONFLICT())
            return "metric already registered with a different shape";
        if (err == INVALID_CERTIFICATE())
            return "invalid certificate";
        return "invalid error code";
    }
}

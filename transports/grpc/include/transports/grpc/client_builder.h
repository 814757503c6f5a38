/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>

#include <bastion/internal/config.h>
#include <bastion/internal/pipeline.h>
#include <bastion/telemetry/i_metrics_registry.h>
#include <transports/grpc/client_connection.h>

namespace bastion::grpc_transport
{
    struct client_options
    {
        std::shared_ptr<telemetry::i_metrics_registry> metrics;
        pipeline_options pipeline;
    };

    // Dials the configured target over mutual TLS with round robin balancing and the
    // client pipeline installed. Dialling does not wait for a connection, problems
    // reaching the server surface on the first call.
    int create_client_connection(const client_config* config,
        const tls_material* tls,
        const client_options& options,
        std::shared_ptr<client_connection>& out);
}

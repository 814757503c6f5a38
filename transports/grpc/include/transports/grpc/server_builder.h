/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server.h>

#include <bastion/internal/config.h>
#include <bastion/internal/pipeline.h>
#include <bastion/telemetry/i_metrics_registry.h>
#include <transports/grpc/service_definition.h>

namespace bastion::grpc_transport
{
    inline constexpr const char* health_service_name = "grpc.health.v1.Health";

    // A running server. start() serves until stop() is called from elsewhere.
    class server_handle
    {
        std::unique_ptr<::grpc::Server> server_;
        std::vector<std::shared_ptr<service_definition>> services_;
        std::chrono::nanoseconds drain_timeout_;
        int port_ = 0;
        std::once_flag stop_once_;

    public:
        server_handle(std::unique_ptr<::grpc::Server> server,
            std::vector<std::shared_ptr<service_definition>> services,
            std::chrono::nanoseconds drain_timeout,
            int port);
        ~server_handle();

        server_handle(const server_handle&) = delete;
        server_handle& operator=(const server_handle&) = delete;

        // blocks until the server has been stopped, a clean shutdown returns OK
        int start();

        // marks the health service NOT_SERVING then drains in flight calls,
        // cancelling whatever is still running after the drain timeout
        void stop();

        // the bound port, useful when listening on port 0
        int port() const { return port_; }
    };

    // Assembles a listening server from configuration, TLS material and service
    // implementations. Mistakes in the configuration are reported by build().
    class server_builder
    {
        server_config config_;
        std::shared_ptr<telemetry::i_metrics_registry> metrics_;
        pipeline_options options_;
        std::vector<std::shared_ptr<service_definition>> services_;
        std::set<std::string> service_names_;
        std::vector<std::string> duplicates_;

        int check_services() const;

    public:
        server_builder(server_config config,
            std::shared_ptr<telemetry::i_metrics_registry> metrics,
            pipeline_options options = {});

        // duplicates are remembered and reported by build()
        server_builder& add(std::shared_ptr<service_definition> service);

        // mutual TLS server, NIL_SERVER_TLS_CONFIG when tls is missing
        int build(const tls_material* tls, std::unique_ptr<server_handle>& out);

        // plaintext server for local testing, per service authorization will reject
        // every call unless no service policies are configured
        int build_insecure(std::unique_ptr<server_handle>& out);

    private:
        int build_with(std::shared_ptr<::grpc::ServerCredentials> credentials, std::unique_ptr<server_handle>& out);
    };
}

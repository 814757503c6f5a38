/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <limits>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <grpc/grpc.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/server_builder.h>

#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>
#include <bastion/internal/net_address.h>
#include <transports/grpc/credentials.h>
#include <transports/grpc/server_builder.h>

namespace bastion::grpc_transport
{
    server_handle::server_handle(std::unique_ptr<::grpc::Server> server,
        std::vector<std::shared_ptr<service_definition>> services,
        std::chrono::nanoseconds drain_timeout,
        int port)
        : server_(std::move(server))
        , services_(std::move(services))
        , drain_timeout_(drain_timeout)
        , port_(port)
    {
    }

    server_handle::~server_handle()
    {
        stop();
    }

    int server_handle::start()
    {
        // returns once stop() has shut the server down, which is the normal way out
        server_->Wait();
        return error::OK();
    }

    void server_handle::stop()
    {
        std::call_once(stop_once_,
            [this]
            {
                BASTION_INFO("stopping server on port {}", port_);
                if (auto* health = server_->GetHealthCheckService())
                {
                    health->SetServingStatus(false);
                    health->Shutdown();
                }
                auto deadline = std::chrono::system_clock::now()
                              + std::chrono::duration_cast<std::chrono::system_clock::duration>(drain_timeout_);
                server_->Shutdown(deadline);
            });
    }

    server_builder::server_builder(
        server_config config, std::shared_ptr<telemetry::i_metrics_registry> metrics, pipeline_options options)
        : config_(std::move(config))
        , metrics_(std::move(metrics))
        , options_(options)
    {
    }

    server_builder& server_builder::add(std::shared_ptr<service_definition> service)
    {
        if (!service_names_.insert(service->name()).second)
        {
            duplicates_.push_back(service->name());
            return *this;
        }
        services_.push_back(std::move(service));
        return *this;
    }

    int server_builder::check_services() const
    {
        if (!duplicates_.empty())
        {
            BASTION_ERROR("services registered more than once: {}", fmt::join(duplicates_, ", "));
            return error::DUPLICATE_SERVICE();
        }

        std::vector<std::string> unknown;
        for (const auto& [name, service] : config_.services)
        {
            if (name != health_service_name && !service_names_.count(name))
                unknown.push_back(name);
        }
        if (!unknown.empty())
        {
            BASTION_ERROR("client names configured for services that are not registered: {} (registered: {})",
                fmt::join(unknown, ", "),
                fmt::join(service_names_, ", "));
            return error::UNKNOWN_SERVICE_POLICY();
        }
        return error::OK();
    }

    int server_builder::build(const tls_material* tls, std::unique_ptr<server_handle>& out)
    {
        auto err = check_services();
        if (err != error::OK())
            return err;

        std::unique_ptr<server_credentials> credentials;
        err = server_credentials::create(tls, accepted_identities(config_), credentials);
        if (err != error::OK())
        {
            BASTION_ERROR("cannot create server credentials: {}", error::to_string(err));
            return err;
        }
        return build_with(credentials->make_server_credentials(), out);
    }

    int server_builder::build_insecure(std::unique_ptr<server_handle>& out)
    {
        auto err = check_services();
        if (err != error::OK())
            return err;
        BASTION_WARNING("building a plaintext server on {}", config_.address);
        return build_with(::grpc::InsecureServerCredentials(), out);
    }

    int server_builder::build_with(std::shared_ptr<::grpc::ServerCredentials> credentials, std::unique_ptr<server_handle>& out)
    {
        if (!metrics_)
        {
            BASTION_ERROR("server builder needs a metrics registry");
            return error::INVALID_CONFIG();
        }

        std::shared_ptr<const server_pipeline> pipeline;
        auto err = make_server_pipeline(*metrics_, make_service_auth_policy(config_), options_, pipeline);
        if (err != error::OK())
            return err;
        for (const auto& service : services_)
            service->attach_pipeline(pipeline);

        std::string host;
        std::string port;
        std::string reason;
        if (!split_host_port(config_.address, host, port, reason))
        {
            BASTION_ERROR("invalid listen address: {}", reason);
            return error::INVALID_CONFIG();
        }
        auto listen_address = join_host_port(host.empty() ? "::" : host, port);

        ::grpc::EnableDefaultHealthCheckService(true);
        ::grpc::ServerBuilder builder;
        if (config_.max_connection_age.count() > 0)
        {
            auto age = std::chrono::duration_cast<std::chrono::milliseconds>(config_.max_connection_age).count();
            if (age > std::numeric_limits<int>::max())
                age = std::numeric_limits<int>::max();
            builder.AddChannelArgument(GRPC_ARG_MAX_CONNECTION_AGE_MS, static_cast<int>(age));
        }

        int selected_port = 0;
        builder.AddListeningPort(listen_address, credentials, &selected_port);
        for (const auto& service : services_)
            builder.RegisterService(service.get());

        auto server = builder.BuildAndStart();
        if (!server || selected_port == 0)
        {
            BASTION_ERROR("failed to listen on {}", listen_address);
            return error::LISTEN_FAILED();
        }
        if (auto* health = server->GetHealthCheckService())
            health->SetServingStatus(true);

        BASTION_INFO("listening on {} (port {}) with {} service(s)", listen_address, selected_port, services_.size());
        out = std::make_unique<server_handle>(std::move(server), services_, config_.drain_timeout, selected_port);
        return error::OK();
    }
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <grpcpp/create_channel.h>
#include <grpcpp/support/channel_arguments.h>

#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>
#include <transports/grpc/client_builder.h>
#include <transports/grpc/credentials.h>
#include <transports/grpc/static_resolver.h>

namespace bastion::grpc_transport
{
    int create_client_connection(const client_config* config,
        const tls_material* tls,
        const client_options& options,
        std::shared_ptr<client_connection>& out)
    {
        if (!config)
            return error::NIL_CLIENT_CONFIG();
        if (!tls)
            return error::NIL_TLS_CONFIG();
        if (!options.metrics)
        {
            BASTION_ERROR("client builder needs a metrics registry");
            return error::INVALID_CONFIG();
        }

        std::string target;
        std::string host_override;
        auto err = make_target_and_host_override(*config, target, host_override);
        if (err != error::OK())
            return err;

        std::string grpc_target;
        std::vector<std::string> endpoints;
        err = translate_target(target, grpc_target, endpoints);
        if (err != error::OK())
            return err;

        client_credentials credentials(*tls, host_override);
        std::shared_ptr<::grpc::ChannelCredentials> channel_credentials;
        err = credentials.make_channel_credentials(endpoints, channel_credentials);
        if (err != error::OK())
            return err;

        std::shared_ptr<const client_pipeline> pipeline;
        err = make_client_pipeline(*options.metrics, config->timeout, options.pipeline, pipeline);
        if (err != error::OK())
            return err;

        ::grpc::ChannelArguments args;
        args.SetLoadBalancingPolicyName("round_robin");
        if (!host_override.empty())
            args.SetSslTargetNameOverride(host_override);

        auto channel = ::grpc::CreateCustomChannel(grpc_target, channel_credentials, args);
        if (!channel)
        {
            BASTION_ERROR("could not create a channel for {}", grpc_target);
            return error::INVALID_TARGET();
        }

        BASTION_DEBUG("client channel to {} (dialled as {})", target, grpc_target);
        out = std::make_shared<client_connection>(std::move(channel), std::move(pipeline));
        return error::OK();
    }
}

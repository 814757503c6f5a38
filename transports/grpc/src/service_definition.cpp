/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <grpc/grpc_security_constants.h>
#include <grpcpp/security/auth_context.h>

#include <transports/grpc/service_definition.h>

namespace bastion::grpc_transport
{
    namespace
    {
        std::string first_property(const ::grpc::AuthContext& auth, const char* name)
        {
            auto values = auth.FindPropertyValues(name);
            if (values.empty())
                return {};
            return std::string(values.front().data(), values.front().size());
        }
    }

    peer_info peer_from_context(const ::grpc::ServerContext& context)
    {
        peer_info peer;
        auto auth = context.auth_context();
        if (!auth)
            return peer;

        peer.present = true;
        peer.transport_security_type = first_property(*auth, GRPC_TRANSPORT_SECURITY_TYPE_PROPERTY_NAME);
        peer.authenticated = auth->IsPeerAuthenticated();
        peer.leaf_certificate_pem = first_property(*auth, GRPC_X509_PEM_CERT_PROPERTY_NAME);
        return peer;
    }

    service_definition::service_definition(std::string name)
        : name_(std::move(name))
    {
    }

    const char* service_definition::register_name(const std::string& method)
    {
        method_names_.push_back(method);
        full_methods_.push_back(fmt::format("/{}/{}", name_, method));
        return full_methods_.back().c_str();
    }

    ::grpc::Status service_definition::dispatch(
        ::grpc::ServerContext* context, const std::string& full_method, call_kind kind, const next_handler& handler) const
    {
        auto call = make_server_call(full_method, kind);
        call.client_metadata = to_metadata_map(context->client_metadata());
        call.peer = peer_from_context(*context);

        auto ctx = call_context::from_server_context(context);
        call_status result;
        if (pipeline_)
            result = pipeline_->invoke(ctx, call, handler);
        else
            result = handler(ctx);

        for (const auto& [key, value] : call.trailers)
            context->AddTrailingMetadata(key, value);
        return result.to_grpc_status();
    }
}

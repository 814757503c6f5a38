/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <bastion/internal/error_codes.h>
#include <bastion/internal/interceptors.h>
#include <bastion/internal/logger.h>
#include <bastion/internal/x509_identity.h>

namespace bastion
{
    namespace
    {
        call_status denied(std::string message)
        {
            return call_status(::grpc::StatusCode::PERMISSION_DENIED, std::move(message));
        }
    }

    call_status check_service_authorization(const service_auth_policy& policy, const server_call& call)
    {
        // a service without an entry, or with an empty one, is closed to everybody
        auto it = policy.find(call.service);
        if (it == policy.end() || it->second.empty())
            return denied(fmt::format("service \"{}\" has no allowed client names", call.service));
        const auto& allowed = it->second;

        if (!call.peer.present)
            return denied("unable to fetch peer info from grpc context");
        if (call.peer.transport_security_type.empty() || call.peer.transport_security_type == "insecure")
            return denied("grpc connection appears to be plaintext");
        if (call.peer.transport_security_type != "ssl")
            return denied("connection is not TLS authed");
        if (!call.peer.authenticated || call.peer.leaf_certificate_pem.empty())
            return denied("connection auth not verified");

        certificate_identities identities;
        if (read_certificate_identities(call.peer.leaf_certificate_pem, identities) != error::OK())
            return denied("connection auth not verified");

        for (const auto& name : identities.dns_names)
        {
            if (allowed.count(name))
                return call_status();
        }

        return denied(fmt::format("client names [{}] are not authorized for service \"{}\" ([{}])",
            fmt::join(identities.dns_names, " "),
            call.service,
            fmt::join(allowed, " ")));
    }

    server_interceptor make_auth_interceptor(service_auth_policy policy)
    {
        return [policy = std::move(policy)](const call_context& ctx, server_call& call, const next_handler& next) -> call_status
        {
            auto verdict = check_service_authorization(policy, call);
            if (!verdict.ok())
            {
                BASTION_WARNING("rejected call to {}: {}", call.full_method, verdict.message());
                return verdict;
            }
            return next(ctx);
        };
    }
}

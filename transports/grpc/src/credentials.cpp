/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <functional>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <grpcpp/security/tls_certificate_provider.h>
#include <grpcpp/security/tls_certificate_verifier.h>
#include <grpcpp/security/tls_credentials_options.h>

#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>
#include <bastion/internal/net_address.h>
#include <transports/grpc/credentials.h>

namespace bastion::grpc_transport
{
    namespace
    {
        using peer_check = std::function<handshake_error(const peer_certificate_state&)>;

        peer_certificate_state to_peer_state(::grpc::experimental::TlsCustomVerificationCheckRequest* request)
        {
            peer_certificate_state state;
            state.has_peer_certificate = !request->peer_cert().empty();
            for (const auto& name : request->dns_names())
                state.dns_names.emplace_back(name.data(), name.size());
            for (const auto& ip : request->ip_names())
                state.ip_names.emplace_back(ip.data(), ip.size());
            return state;
        }

        // runs after the chain has been verified against the trust roots
        class san_verifier : public ::grpc::experimental::ExternalCertificateVerifier
        {
            peer_check check_;
            const char* side_;

        public:
            san_verifier(peer_check check, const char* side)
                : check_(std::move(check))
                , side_(side)
            {
            }

            bool Verify(::grpc::experimental::TlsCustomVerificationCheckRequest* request,
                std::function<void(::grpc::Status)>,
                ::grpc::Status* sync_status) override
            {
                auto err = check_(to_peer_state(request));
                if (err.ok())
                {
                    *sync_status = ::grpc::Status::OK;
                }
                else
                {
                    BASTION_WARNING("{} handshake rejected: {}", side_, err.message());
                    *sync_status = ::grpc::Status(::grpc::StatusCode::UNAUTHENTICATED, err.message());
                }
                return true;
            }

            void Cancel(::grpc::experimental::TlsCustomVerificationCheckRequest*) override { }
        };

        std::shared_ptr<::grpc::experimental::StaticDataCertificateProvider> make_provider(const tls_material& material)
        {
            std::vector<::grpc::experimental::IdentityKeyCertPair> pairs;
            for (const auto& identity : material.identities)
                pairs.push_back({identity.private_key_pem, identity.certificate_chain_pem});
            return std::make_shared<::grpc::experimental::StaticDataCertificateProvider>(
                material.root_certificates_pem, pairs);
        }

        bool wildcard_match(const std::string& pattern, const std::string& name)
        {
            if (pattern.size() < 3 || pattern.compare(0, 2, "*.") != 0)
                return false;
            auto dot = name.find('.');
            if (dot == std::string::npos || dot == 0)
                return false;
            return name.compare(dot, std::string::npos, pattern, 1, std::string::npos) == 0;
        }

        std::set<std::string> all_names(const peer_certificate_state& state)
        {
            std::set<std::string> names(state.dns_names.begin(), state.dns_names.end());
            names.insert(state.ip_names.begin(), state.ip_names.end());
            return names;
        }
    }

    std::string handshake_error::message() const
    {
        switch (kind)
        {
        case handshake_error_kind::none:
            return "OK";
        case handshake_error_kind::empty_peer_certs:
            return "peer presented no certificates";
        case handshake_error_kind::identity_mismatch:
            return fmt::format("peer certificate names [{}] are not in the accepted set [{}]",
                fmt::join(received, " "),
                fmt::join(expected, " "));
        case handshake_error_kind::unsupported_handshake:
            return "handshake direction not supported by these credentials";
        case handshake_error_kind::unsupported_override:
            return "server name override not supported";
        }
        return "unknown handshake error";
    }

    handshake_error validate_client(const std::set<std::string>& accepted, const peer_certificate_state& state)
    {
        if (accepted.empty())
            return {};
        if (!state.has_peer_certificate)
            return {handshake_error_kind::empty_peer_certs, {}, {}};

        auto received = all_names(state);
        for (const auto& name : received)
        {
            if (accepted.count(name))
                return {};
        }
        return {handshake_error_kind::identity_mismatch, std::move(received), accepted};
    }

    handshake_error validate_server_name(const std::set<std::string>& expected, const peer_certificate_state& state)
    {
        if (!state.has_peer_certificate)
            return {handshake_error_kind::empty_peer_certs, {}, {}};

        for (const auto& want : expected)
        {
            for (const auto& dns : state.dns_names)
            {
                if (dns == want || wildcard_match(dns, want))
                    return {};
            }
            for (const auto& ip : state.ip_names)
            {
                if (ip == want)
                    return {};
            }
        }
        return {handshake_error_kind::identity_mismatch, all_names(state), expected};
    }

    client_credentials::client_credentials(tls_material material, std::string host_override)
        : material_(std::make_shared<const tls_material>(std::move(material)))
        , host_override_(std::move(host_override))
    {
    }

    int client_credentials::make_channel_credentials(
        const std::vector<std::string>& endpoints, std::shared_ptr<::grpc::ChannelCredentials>& out) const
    {
        std::set<std::string> expected;
        if (!host_override_.empty())
        {
            expected.insert(host_override_);
        }
        else
        {
            for (const auto& endpoint : endpoints)
            {
                std::string host;
                std::string port;
                std::string reason;
                if (!split_host_port(endpoint, host, port, reason))
                {
                    BASTION_ERROR("cannot derive server name from \"{}\": {}", endpoint, reason);
                    return error::INVALID_TARGET();
                }
                expected.insert(host.empty() ? std::string("127.0.0.1") : host);
            }
        }
        if (expected.empty())
        {
            BASTION_ERROR("no server name to verify the TLS peer against");
            return error::INVALID_TARGET();
        }

        ::grpc::experimental::TlsChannelCredentialsOptions options;
        options.set_certificate_provider(make_provider(*material_));
        if (!material_->root_certificates_pem.empty())
            options.watch_root_certs();
        if (!material_->identities.empty())
            options.watch_identity_key_cert_pairs();
        options.set_verify_server_certs(true);
        options.set_check_call_host(false);
        options.set_certificate_verifier(::grpc::experimental::ExternalCertificateVerifier::Create<san_verifier>(
            peer_check([expected](const peer_certificate_state& state) { return validate_server_name(expected, state); }),
            "client"));

        out = ::grpc::experimental::TlsCredentials(options);
        if (!out)
        {
            BASTION_ERROR("grpc refused the client TLS options");
            return error::INVALID_CONFIG();
        }
        return error::OK();
    }

    handshake_error client_credentials::server_handshake() const
    {
        return {handshake_error_kind::unsupported_handshake, {}, {}};
    }

    handshake_error client_credentials::override_server_name(const std::string&) const
    {
        return {handshake_error_kind::unsupported_override, {}, {}};
    }

    protocol_info client_credentials::info() const
    {
        return {"tls", "1.2"};
    }

    client_credentials client_credentials::clone() const
    {
        return *this;
    }

    server_credentials::server_credentials(std::shared_ptr<const tls_material> material, std::set<std::string> accepted)
        : material_(std::move(material))
        , accepted_(std::move(accepted))
    {
    }

    int server_credentials::create(
        const tls_material* material, std::set<std::string> accepted_identities, std::unique_ptr<server_credentials>& out)
    {
        if (!material)
            return error::NIL_SERVER_TLS_CONFIG();
        if (material->identities.empty())
        {
            BASTION_ERROR("server TLS material has no certificate and key");
            return error::INVALID_CONFIG();
        }
        if (accepted_identities.empty())
            BASTION_WARNING("no accepted client names configured, any peer with a trusted certificate may connect");

        out.reset(new server_credentials(std::make_shared<const tls_material>(*material), std::move(accepted_identities)));
        return error::OK();
    }

    std::shared_ptr<::grpc::ServerCredentials> server_credentials::make_server_credentials() const
    {
        ::grpc::experimental::TlsServerCredentialsOptions options(make_provider(*material_));
        options.watch_identity_key_cert_pairs();
        options.watch_root_certs();
        options.set_cert_request_type(GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY);

        auto accepted = accepted_;
        options.set_certificate_verifier(::grpc::experimental::ExternalCertificateVerifier::Create<san_verifier>(
            peer_check([accepted](const peer_certificate_state& state) { return validate_client(accepted, state); }),
            "server"));
        return ::grpc::experimental::TlsServerCredentials(options);
    }

    handshake_error server_credentials::client_handshake() const
    {
        return {handshake_error_kind::unsupported_handshake, {}, {}};
    }

    handshake_error server_credentials::override_server_name(const std::string&) const
    {
        return {handshake_error_kind::unsupported_override, {}, {}};
    }

    protocol_info server_credentials::info() const
    {
        return {"tls", "1.2"};
    }
}

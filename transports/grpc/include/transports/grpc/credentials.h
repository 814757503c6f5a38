/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <grpcpp/security/credentials.h>
#include <grpcpp/security/server_credentials.h>

#include <bastion/internal/config.h>

namespace bastion::grpc_transport
{
    enum class handshake_error_kind
    {
        none,
        empty_peer_certs,
        identity_mismatch,
        unsupported_handshake,
        unsupported_override
    };

    struct handshake_error
    {
        handshake_error_kind kind = handshake_error_kind::none;
        // only filled in for identity_mismatch
        std::set<std::string> received;
        std::set<std::string> expected;

        bool ok() const { return kind == handshake_error_kind::none; }
        std::string message() const;
    };

    struct protocol_info
    {
        std::string security_protocol;
        std::string security_version;
    };

    // what the TLS layer reports about the peer's leaf certificate
    struct peer_certificate_state
    {
        bool has_peer_certificate = false;
        std::vector<std::string> dns_names;
        std::vector<std::string> ip_names;
    };

    // Transport level filter applied by servers. An empty accepted set lets every
    // authenticated peer through, per service authorization happens later in the
    // interceptor pipeline.
    handshake_error validate_client(const std::set<std::string>& accepted, const peer_certificate_state& state);

    // Client side name check: the server certificate must carry one of the expected
    // names, DNS SANs may use a single leading wildcard label.
    handshake_error validate_server_name(const std::set<std::string>& expected, const peer_certificate_state& state);

    class client_credentials
    {
        std::shared_ptr<const tls_material> material_;
        std::string host_override_;

    public:
        client_credentials(tls_material material, std::string host_override);

        // Channel credentials for a target whose endpoints are given as host:port.
        // The server is verified against the host override when there is one, else
        // against the host of whichever endpoint it was reached through.
        int make_channel_credentials(const std::vector<std::string>& endpoints,
            std::shared_ptr<::grpc::ChannelCredentials>& out) const;

        handshake_error server_handshake() const;
        handshake_error override_server_name(const std::string& name) const;

        protocol_info info() const;
        bool require_transport_security() const { return true; }
        const std::string& host_override() const { return host_override_; }

        // shares the PEM material with this instance
        client_credentials clone() const;
    };

    class server_credentials
    {
        std::shared_ptr<const tls_material> material_;
        std::set<std::string> accepted_;

        server_credentials(std::shared_ptr<const tls_material> material, std::set<std::string> accepted);

    public:
        static int create(const tls_material* material,
            std::set<std::string> accepted_identities,
            std::unique_ptr<server_credentials>& out);

        // requires and verifies a client certificate, then applies validate_client
        std::shared_ptr<::grpc::ServerCredentials> make_server_credentials() const;

        handshake_error validate(const peer_certificate_state& state) const { return validate_client(accepted_, state); }
        handshake_error client_handshake() const;
        handshake_error override_server_name(const std::string& name) const;

        protocol_info info() const;
        bool require_transport_security() const { return true; }
        const std::set<std::string>& accepted_identities() const { return accepted_; }
    };
}

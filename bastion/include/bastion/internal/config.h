/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace bastion
{
    struct service_config
    {
        // peer identities (DNS or IP SANs) allowed to call this service
        std::vector<std::string> client_names;
    };

    struct server_config
    {
        std::string address;
        // server wide allow list, checked at the TLS layer only
        std::vector<std::string> client_names;
        std::map<std::string, service_config> services;
        // zero disables the connection age limit
        std::chrono::nanoseconds max_connection_age{0};
        // how long stop() waits for in flight calls before cancelling them
        std::chrono::nanoseconds drain_timeout{std::chrono::seconds(30)};
    };

    struct client_config
    {
        // single host:port resolved through DNS
        std::string server_address;
        // fixed list of literal ip:port endpoints handed to the static resolver
        std::vector<std::string> server_ip_addresses;
        std::string dns_authority;
        std::string host_override;
        std::chrono::nanoseconds timeout{0};
    };

    // where the PEM material lives on disk
    struct tls_config
    {
        std::string ca_cert_file;
        std::string cert_file;
        std::string key_file;
    };

    struct identity_key_cert_pair
    {
        std::string private_key_pem;
        std::string certificate_chain_pem;
    };

    // in memory PEM material, everything after the loader works on this
    struct tls_material
    {
        std::string root_certificates_pem;
        std::vector<identity_key_cert_pair> identities;
    };

    // service name -> peer identities allowed to call it
    using service_auth_policy = std::map<std::string, std::set<std::string>>;

    // dial target and the name the server certificate must present.
    // serverAddress yields "dns://<authority>/<host:port>" verified against hostOverride or
    // the host part, serverIPAddresses yields "static:///<a>,<b>" with no override.
    int make_target_and_host_override(const client_config& config, std::string& target, std::string& host_override);

    // union of the server wide allow list and every per service allow list
    std::set<std::string> accepted_identities(const server_config& config);

    service_auth_policy make_service_auth_policy(const server_config& config);
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <bastion/internal/config.h>
#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>
#include <bastion/internal/net_address.h>

namespace bastion
{
    int make_target_and_host_override(const client_config& config, std::string& target, std::string& host_override)
    {
        bool has_address = !config.server_address.empty();
        bool has_ip_addresses = !config.server_ip_addresses.empty();

        if (has_address && has_ip_addresses)
        {
            BASTION_ERROR("both serverAddress ({}) and serverIPAddresses ({}) are set, only one is allowed",
                config.server_address,
                fmt::join(config.server_ip_addresses, ","));
            return error::AMBIGUOUS_TARGET();
        }

        if (has_address)
        {
            std::string host;
            std::string port;
            std::string reason;
            if (!split_host_port(config.server_address, host, port, reason))
            {
                BASTION_ERROR("invalid serverAddress: {}", reason);
                return error::INVALID_TARGET();
            }
            target = fmt::format("dns://{}/{}", config.dns_authority, config.server_address);
            host_override = config.host_override.empty() ? host : config.host_override;
            return error::OK();
        }

        if (has_ip_addresses)
        {
            target = fmt::format("static:///{}", fmt::join(config.server_ip_addresses, ","));
            host_override.clear();
            return error::OK();
        }

        BASTION_ERROR("neither serverAddress nor serverIPAddresses is set");
        return error::MISSING_TARGET();
    }

    std::set<std::string> accepted_identities(const server_config& config)
    {
        std::set<std::string> accepted(config.client_names.begin(), config.client_names.end());
        for (const auto& [name, service] : config.services)
            accepted.insert(service.client_names.begin(), service.client_names.end());
        return accepted;
    }

    service_auth_policy make_service_auth_policy(const server_config& config)
    {
        service_auth_policy policy;
        for (const auto& [name, service] : config.services)
            policy[name] = std::set<std::string>(service.client_names.begin(), service.client_names.end());
        return policy;
    }
}

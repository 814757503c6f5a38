/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <map>
#include <mutex>

#include <fmt/format.h>

#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>
#include <transports/grpc/static_resolver.h>

namespace bastion::grpc_transport
{
    namespace
    {
        struct scheme_table
        {
            std::mutex mtx;
            std::map<std::string, target_translator, std::less<>> translators;
        };

        scheme_table& schemes()
        {
            static scheme_table table;
            return table;
        }

        int translate_static(std::string_view endpoints, std::string& grpc_target, std::vector<std::string>& hosts)
        {
            std::unique_ptr<static_resolver> resolver;
            auto err = static_resolver::build(endpoints, resolver);
            if (err != error::OK())
                return err;

            grpc_target = resolver->grpc_target();
            hosts.clear();
            for (const auto& address : resolver->addresses())
                hosts.push_back(address.server_name);
            return error::OK();
        }
    }

    static_resolver::static_resolver(std::vector<resolved_address> addresses, ip_family family)
        : addresses_(std::move(addresses))
        , family_(family)
    {
    }

    int static_resolver::build(std::string_view target, std::unique_ptr<static_resolver>& out)
    {
        std::string_view endpoints = target;
        auto prefix = fmt::format("{}:///", static_scheme);
        if (endpoints.substr(0, prefix.size()) == prefix)
            endpoints.remove_prefix(prefix.size());

        std::vector<resolved_address> addresses;
        ip_family family = ip_family::none;
        while (true)
        {
            auto comma = endpoints.find(',');
            auto piece = endpoints.substr(0, comma);

            std::string host;
            std::string port;
            std::string reason;
            if (!split_host_port(piece, host, port, reason))
            {
                BASTION_ERROR("static resolver: {}", reason);
                return error::INVALID_TARGET();
            }
            if (host.empty())
                host = "127.0.0.1";

            auto piece_family = parse_ip_literal(host);
            if (piece_family == ip_family::none)
            {
                BASTION_ERROR("static resolver: \"{}\" is not an IP address, hostnames are not resolved", host);
                return error::INVALID_TARGET();
            }
            // gRPC's literal address targets carry a single family
            if (family != ip_family::none && family != piece_family)
            {
                BASTION_ERROR("static resolver: target {} mixes IPv4 and IPv6 addresses", target);
                return error::INVALID_TARGET();
            }
            family = piece_family;

            auto addr = join_host_port(host, port);
            addresses.push_back({addr, addr});

            if (comma == std::string_view::npos)
                break;
            endpoints.remove_prefix(comma + 1);
        }

        out.reset(new static_resolver(std::move(addresses), family));
        return error::OK();
    }

    std::string static_resolver::grpc_target() const
    {
        std::string target = family_ == ip_family::v6 ? "ipv6:" : "ipv4:";
        for (std::size_t i = 0; i < addresses_.size(); ++i)
        {
            if (i)
                target += ',';
            target += addresses_[i].addr;
        }
        return target;
    }

    bool register_scheme(const std::string& scheme, target_translator translator)
    {
        auto& table = schemes();
        std::scoped_lock lock(table.mtx);
        return table.translators.emplace(scheme, std::move(translator)).second;
    }

    void register_static_scheme()
    {
        static std::once_flag once;
        std::call_once(once,
            []
            {
                if (!register_scheme(static_scheme, translate_static))
                    BASTION_WARNING("resolver scheme \"{}\" was already registered", static_scheme);
            });
    }

    int translate_target(const std::string& target, std::string& grpc_target, std::vector<std::string>& endpoints)
    {
        register_static_scheme();

        auto separator = target.find(":///");
        if (separator != std::string::npos)
        {
            target_translator translator;
            {
                auto& table = schemes();
                std::scoped_lock lock(table.mtx);
                auto it = table.translators.find(std::string_view(target).substr(0, separator));
                if (it != table.translators.end())
                    translator = it->second;
            }
            if (translator)
                return translator(std::string_view(target).substr(separator + 4), grpc_target, endpoints);
        }

        // left for gRPC's own resolvers, only the trailing host:port matters for name checks
        grpc_target = target;
        endpoints.clear();
        auto slash = target.rfind('/');
        endpoints.push_back(slash == std::string::npos ? target : target.substr(slash + 1));
        return error::OK();
    }
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <bastion/internal/net_address.h>

namespace bastion::grpc_transport
{
    inline constexpr const char* static_scheme = "static";

    struct resolved_address
    {
        // host:port, bracketed for IPv6
        std::string addr;
        std::string server_name;
    };

    // Fixed list of literal endpoints parsed from "static:///a:1,[b]:2".
    // Membership never changes once built, there is nothing to re-resolve.
    class static_resolver
    {
        std::vector<resolved_address> addresses_;
        ip_family family_ = ip_family::none;

        explicit static_resolver(std::vector<resolved_address> addresses, ip_family family);

    public:
        // accepts either the full "static:///..." target or just the endpoint list
        static int build(std::string_view target, std::unique_ptr<static_resolver>& out);

        const std::vector<resolved_address>& addresses() const { return addresses_; }

        // gRPC's literal address form of the same list, "ipv4:a:1,b:2" or "ipv6:[a]:1,[b]:2"
        std::string grpc_target() const;

        void resolve_now() { }
        void close() { }
    };

    // Process wide table of schemes this layer rewrites before handing a target to gRPC.
    // Each entry receives the part after "scheme:///".
    using target_translator
        = std::function<int(std::string_view endpoints, std::string& grpc_target, std::vector<std::string>& hosts)>;

    // false if the scheme is already taken
    bool register_scheme(const std::string& scheme, target_translator translator);

    // claims static_scheme once per process
    void register_static_scheme();

    // Rewrites a dial target into one gRPC can dial directly. "static" targets become
    // literal address lists, everything else passes through. endpoints receives the
    // host:port of each address the target names, for server name checks.
    int translate_target(const std::string& target, std::string& grpc_target, std::vector<std::string>& endpoints);
}

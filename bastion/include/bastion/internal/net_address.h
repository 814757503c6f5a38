/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <string_view>

namespace bastion
{
    enum class ip_family
    {
        none,
        v4,
        v6
    };

    // splits "host:port", "[v6host]:port" or ":port" into its parts.
    // On failure returns false with a human readable reason in error.
    bool split_host_port(std::string_view hostport, std::string& host, std::string& port, std::string& error);

    // inverse of split_host_port, hosts containing ':' are bracketed
    std::string join_host_port(std::string_view host, std::string_view port);

    // classifies a literal address, hostnames are ip_family::none
    ip_family parse_ip_literal(const std::string& host);
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <arpa/inet.h>
#include <netinet/in.h>

#include <fmt/format.h>

#include <bastion/internal/net_address.h>

namespace bastion
{
    bool split_host_port(std::string_view hostport, std::string& host, std::string& port, std::string& error)
    {
        auto fail = [&](const char* reason)
        {
            error = fmt::format("address {}: {}", hostport, reason);
            return false;
        };

        auto last_colon = hostport.rfind(':');
        if (last_colon == std::string_view::npos)
            return fail("missing port in address");

        std::string_view host_part;
        if (!hostport.empty() && hostport.front() == '[')
        {
            auto close = hostport.find(']');
            if (close == std::string_view::npos)
                return fail("missing ']' in address");
            if (close + 1 == hostport.size())
                return fail("missing port in address");
            if (close + 1 != last_colon)
            {
                // either "]" is not followed by ":" or there are stray colons after it
                if (hostport[close + 1] == ':')
                    return fail("too many colons in address");
                return fail("missing port in address");
            }
            host_part = hostport.substr(1, close - 1);
            if (host_part.find('[') != std::string_view::npos || host_part.find(']') != std::string_view::npos)
                return fail("unexpected '[' or ']' in address");
        }
        else
        {
            host_part = hostport.substr(0, last_colon);
            if (host_part.find(':') != std::string_view::npos)
                return fail("too many colons in address");
            if (host_part.find('[') != std::string_view::npos || host_part.find(']') != std::string_view::npos)
                return fail("unexpected '[' or ']' in address");
        }

        auto port_part = hostport.substr(last_colon + 1);
        if (port_part.find('[') != std::string_view::npos || port_part.find(']') != std::string_view::npos)
            return fail("unexpected '[' or ']' in address");

        host.assign(host_part);
        port.assign(port_part);
        return true;
    }

    std::string join_host_port(std::string_view host, std::string_view port)
    {
        if (host.find(':') != std::string_view::npos)
            return fmt::format("[{}]:{}", host, port);
        return fmt::format("{}:{}", host, port);
    }

    ip_family parse_ip_literal(const std::string& host)
    {
        in_addr v4{};
        if (inet_pton(AF_INET, host.c_str(), &v4) == 1)
            return ip_family::v4;
        in6_addr v6{};
        if (inet_pton(AF_INET6, host.c_str(), &v6) == 1)
            return ip_family::v6;
        return ip_family::none;
    }
}

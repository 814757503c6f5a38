/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

namespace bastion
{
    // Subject alternative names of a certificate, IP addresses in textual form
    struct certificate_identities
    {
        std::vector<std::string> dns_names;
        std::vector<std::string> ip_addresses;
    };

    // reads the first certificate of a PEM blob (the leaf of a chain)
    int read_certificate_identities(const std::string& pem, certificate_identities& out);
}

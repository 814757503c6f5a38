/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <arpa/inet.h>
#include <memory>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>
#include <bastion/internal/x509_identity.h>

namespace bastion
{
    namespace
    {
        struct bio_deleter
        {
            void operator()(BIO* b) const { BIO_free(b); }
        };
        struct x509_deleter
        {
            void operator()(X509* x) const { X509_free(x); }
        };
        struct general_names_deleter
        {
            void operator()(GENERAL_NAMES* names) const { GENERAL_NAMES_free(names); }
        };

        std::string ip_to_string(const ASN1_OCTET_STRING* ip)
        {
            char buffer[INET6_ADDRSTRLEN] = {};
            auto length = ASN1_STRING_length(ip);
            const auto* data = ASN1_STRING_get0_data(ip);
            if (length == 4)
            {
                if (inet_ntop(AF_INET, data, buffer, sizeof(buffer)))
                    return buffer;
            }
            else if (length == 16)
            {
                if (inet_ntop(AF_INET6, data, buffer, sizeof(buffer)))
                    return buffer;
            }
            return {};
        }
    }

    int read_certificate_identities(const std::string& pem, certificate_identities& out)
    {
        std::unique_ptr<BIO, bio_deleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio)
            return error::INVALID_CERTIFICATE();

        std::unique_ptr<X509, x509_deleter> cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert)
        {
            BASTION_DEBUG("unable to parse PEM certificate: {}", ERR_error_string(ERR_get_error(), nullptr));
            ERR_clear_error();
            return error::INVALID_CERTIFICATE();
        }

        certificate_identities identities;
        std::unique_ptr<GENERAL_NAMES, general_names_deleter> names(static_cast<GENERAL_NAMES*>(
            X509_get_ext_d2i(cert.get(), NID_subject_alt_name, nullptr, nullptr)));
        if (names)
        {
            for (int i = 0; i < sk_GENERAL_NAME_num(names.get()); ++i)
            {
                const GENERAL_NAME* name = sk_GENERAL_NAME_value(names.get(), i);
                if (name->type == GEN_DNS)
                {
                    const auto* dns = name->d.dNSName;
                    identities.dns_names.emplace_back(
                        reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)), ASN1_STRING_length(dns));
                }
                else if (name->type == GEN_IPADD)
                {
                    auto text = ip_to_string(name->d.iPAddress);
                    if (!text.empty())
                        identities.ip_addresses.push_back(std::move(text));
                }
            }
        }

        out = std::move(identities);
        return error::OK();
    }
}

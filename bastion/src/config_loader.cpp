/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fstream>
#include <memory>
#include <sstream>

#include <bastion/internal/config_loader.h>
#include <bastion/internal/duration.h>
#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>

namespace bastion
{
    namespace
    {
        int read_string(const Json::Value& json, const char* key, std::string& out)
        {
            const auto& value = json[key];
            if (value.isNull())
                return error::OK();
            if (!value.isString())
            {
                BASTION_ERROR("configuration field \"{}\" must be a string", key);
                return error::INVALID_CONFIG();
            }
            out = value.asString();
            return error::OK();
        }

        int read_string_list(const Json::Value& json, const char* key, std::vector<std::string>& out)
        {
            const auto& value = json[key];
            if (value.isNull())
                return error::OK();
            if (!value.isArray())
            {
                BASTION_ERROR("configuration field \"{}\" must be an array of strings", key);
                return error::INVALID_CONFIG();
            }
            std::vector<std::string> items;
            for (const auto& item : value)
            {
                if (!item.isString())
                {
                    BASTION_ERROR("configuration field \"{}\" must only contain strings", key);
                    return error::INVALID_CONFIG();
                }
                items.push_back(item.asString());
            }
            out = std::move(items);
            return error::OK();
        }

        int read_duration(const Json::Value& json, const char* key, std::chrono::nanoseconds& out)
        {
            std::string text;
            auto err = read_string(json, key, text);
            if (err != error::OK() || text.empty())
                return err;
            if (!parse_duration(text, out))
            {
                BASTION_ERROR("configuration field \"{}\" is not a valid duration: \"{}\"", key, text);
                return error::INVALID_CONFIG();
            }
            return error::OK();
        }
    }

    int parse_json_document(const std::string& text, Json::Value& out)
    {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &out, &errors))
        {
            BASTION_ERROR("unable to parse configuration: {}", errors);
            return error::INVALID_CONFIG();
        }
        return error::OK();
    }

    int read_text_file(const std::string& path, std::string& out)
    {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file)
        {
            BASTION_ERROR("unable to open \"{}\"", path);
            return error::CONFIG_IO_ERROR();
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad())
        {
            BASTION_ERROR("unable to read \"{}\"", path);
            return error::CONFIG_IO_ERROR();
        }
        out = contents.str();
        return error::OK();
    }

    int load_server_config(const Json::Value& json, server_config& out)
    {
        if (!json.isObject())
        {
            BASTION_ERROR("server configuration must be a JSON object");
            return error::INVALID_CONFIG();
        }

        server_config config;
        auto err = read_string(json, "address", config.address);
        if (err != error::OK())
            return err;
        err = read_string_list(json, "clientNames", config.client_names);
        if (err != error::OK())
            return err;
        err = read_duration(json, "maxConnectionAge", config.max_connection_age);
        if (err != error::OK())
            return err;

        const auto& services = json["services"];
        if (!services.isNull())
        {
            if (!services.isObject())
            {
                BASTION_ERROR("configuration field \"services\" must be an object");
                return error::INVALID_CONFIG();
            }
            for (const auto& name : services.getMemberNames())
            {
                const auto& entry = services[name];
                if (!entry.isObject())
                {
                    BASTION_ERROR("service \"{}\" configuration must be an object", name);
                    return error::INVALID_CONFIG();
                }
                service_config service;
                err = read_string_list(entry, "clientNames", service.client_names);
                if (err != error::OK())
                    return err;
                config.services.emplace(name, std::move(service));
            }
        }

        out = std::move(config);
        return error::OK();
    }

    int load_client_config(const Json::Value& json, client_config& out)
    {
        if (!json.isObject())
        {
            BASTION_ERROR("client configuration must be a JSON object");
            return error::INVALID_CONFIG();
        }

        client_config config;
        auto err = read_string(json, "serverAddress", config.server_address);
        if (err != error::OK())
            return err;
        err = read_string_list(json, "serverIPAddresses", config.server_ip_addresses);
        if (err != error::OK())
            return err;
        err = read_string(json, "dnsAuthority", config.dns_authority);
        if (err != error::OK())
            return err;
        err = read_string(json, "hostOverride", config.host_override);
        if (err != error::OK())
            return err;
        err = read_duration(json, "timeout", config.timeout);
        if (err != error::OK())
            return err;

        out = std::move(config);
        return error::OK();
    }

    int load_tls_config(const Json::Value& json, tls_config& out)
    {
        if (!json.isObject())
        {
            BASTION_ERROR("TLS configuration must be a JSON object");
            return error::INVALID_CONFIG();
        }

        tls_config config;
        auto err = read_string(json, "caCertFile", config.ca_cert_file);
        if (err != error::OK())
            return err;
        err = read_string(json, "certFile", config.cert_file);
        if (err != error::OK())
            return err;
        err = read_string(json, "keyFile", config.key_file);
        if (err != error::OK())
            return err;

        out = std::move(config);
        return error::OK();
    }

    int load_tls_material(const tls_config& config, tls_material& out)
    {
        if (config.ca_cert_file.empty() || config.cert_file.empty() || config.key_file.empty())
        {
            BASTION_ERROR("TLS configuration requires caCertFile, certFile and keyFile");
            return error::INVALID_CONFIG();
        }

        tls_material material;
        auto err = read_text_file(config.ca_cert_file, material.root_certificates_pem);
        if (err != error::OK())
            return err;

        identity_key_cert_pair identity;
        err = read_text_file(config.cert_file, identity.certificate_chain_pem);
        if (err != error::OK())
            return err;
        err = read_text_file(config.key_file, identity.private_key_pem);
        if (err != error::OK())
            return err;
        material.identities.push_back(std::move(identity));

        out = std::move(material);
        return error::OK();
    }
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

#include <json/json.h>

#include <bastion/internal/config.h>

namespace bastion
{
    int parse_json_document(const std::string& text, Json::Value& out);
    int read_text_file(const std::string& path, std::string& out);

    // {"address": ":9090", "clientNames": [...], "services": {"pkg.Svc": {"clientNames": [...]}},
    //  "maxConnectionAge": "5m"}
    int load_server_config(const Json::Value& json, server_config& out);

    // {"serverAddress": "host:port"} or {"serverIPAddresses": ["10.0.0.1:9090", ...]}
    // plus optional "dnsAuthority", "hostOverride" and "timeout"
    int load_client_config(const Json::Value& json, client_config& out);

    // {"caCertFile": ..., "certFile": ..., "keyFile": ...}
    int load_tls_config(const Json::Value& json, tls_config& out);

    // reads the files named by config into PEM text
    int load_tls_material(const tls_config& config, tls_material& out);
}

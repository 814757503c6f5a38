/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include <bastion/internal/config.h>
#include <bastion/internal/config_loader.h>
#include <bastion/internal/error_codes.h>

using namespace std::chrono_literals;
namespace error = bastion::error;

TEST(config_test, server_address_dials_through_dns)
{
    bastion::client_config config;
    config.server_address = "ra.service.consul:9094";

    std::string target;
    std::string host_override;
    ASSERT_EQ(bastion::make_target_and_host_override(config, target, host_override), error::OK());
    EXPECT_EQ(target, "dns:///ra.service.consul:9094");
    EXPECT_EQ(host_override, "ra.service.consul");
}

TEST(config_test, explicit_host_override_and_authority_are_used)
{
    bastion::client_config config;
    config.server_address = "ra.service.consul:9094";
    config.dns_authority = "10.55.55.10:53";
    config.host_override = "ra.boulder";

    std::string target;
    std::string host_override;
    ASSERT_EQ(bastion::make_target_and_host_override(config, target, host_override), error::OK());
    EXPECT_EQ(target, "dns://10.55.55.10:53/ra.service.consul:9094");
    EXPECT_EQ(host_override, "ra.boulder");
}

TEST(config_test, ip_addresses_dial_through_the_static_resolver)
{
    bastion::client_config config;
    config.server_ip_addresses = {"10.77.77.77:9094", "10.88.88.88:9094"};

    std::string target;
    std::string host_override = "stale";
    ASSERT_EQ(bastion::make_target_and_host_override(config, target, host_override), error::OK());
    EXPECT_EQ(target, "static:///10.77.77.77:9094,10.88.88.88:9094");
    EXPECT_TRUE(host_override.empty());
}

TEST(config_test, exactly_one_addressing_style_is_required)
{
    std::string target;
    std::string host_override;

    bastion::client_config neither;
    EXPECT_EQ(bastion::make_target_and_host_override(neither, target, host_override), error::MISSING_TARGET());

    bastion::client_config both;
    both.server_address = "ra:9094";
    both.server_ip_addresses = {"10.77.77.77:9094"};
    EXPECT_EQ(bastion::make_target_and_host_override(both, target, host_override), error::AMBIGUOUS_TARGET());

    bastion::client_config no_port;
    no_port.server_address = "ra.service.consul";
    EXPECT_EQ(bastion::make_target_and_host_override(no_port, target, host_override), error::INVALID_TARGET());
}

TEST(config_test, accepted_identities_are_the_union_of_all_lists)
{
    bastion::server_config config;
    config.client_names = {"admin.boulder"};
    config.services["ra.RegistrationAuthority"].client_names = {"wfe.boulder", "admin.boulder"};
    config.services["grpc.health.v1.Health"].client_names = {"health.boulder"};

    auto accepted = bastion::accepted_identities(config);
    EXPECT_EQ(accepted, (std::set<std::string>{"admin.boulder", "health.boulder", "wfe.boulder"}));

    auto policy = bastion::make_service_auth_policy(config);
    ASSERT_EQ(policy.size(), 2u);
    EXPECT_EQ(policy["ra.RegistrationAuthority"], (std::set<std::string>{"admin.boulder", "wfe.boulder"}));
}

TEST(config_test, loads_server_config_from_json)
{
    Json::Value json;
    ASSERT_EQ(bastion::parse_json_document(R"({
        "address": ":9094",
        "clientNames": ["admin.boulder"],
        "maxConnectionAge": "30s",
        "services": {
            "ra.RegistrationAuthority": {"clientNames": ["wfe.boulder"]},
            "grpc.health.v1.Health": {"clientNames": []}
        }
    })",
                  json),
        error::OK());

    bastion::server_config config;
    ASSERT_EQ(bastion::load_server_config(json, config), error::OK());
    EXPECT_EQ(config.address, ":9094");
    EXPECT_EQ(config.client_names, std::vector<std::string>{"admin.boulder"});
    EXPECT_EQ(config.max_connection_age, 30s);
    ASSERT_EQ(config.services.size(), 2u);
    EXPECT_EQ(config.services["ra.RegistrationAuthority"].client_names, std::vector<std::string>{"wfe.boulder"});
    EXPECT_TRUE(config.services["grpc.health.v1.Health"].client_names.empty());
}

TEST(config_test, loads_client_config_from_json)
{
    Json::Value json;
    ASSERT_EQ(bastion::parse_json_document(
                  R"({"serverIPAddresses": ["127.0.0.1:1337", ":1338"], "hostOverride": "sa.boulder", "timeout": "1.5s"})",
                  json),
        error::OK());

    bastion::client_config config;
    ASSERT_EQ(bastion::load_client_config(json, config), error::OK());
    EXPECT_EQ(config.server_ip_addresses, (std::vector<std::string>{"127.0.0.1:1337", ":1338"}));
    EXPECT_EQ(config.host_override, "sa.boulder");
    EXPECT_EQ(config.timeout, 1500ms);
    EXPECT_TRUE(config.server_address.empty());
}

TEST(config_test, rejects_badly_typed_fields)
{
    Json::Value json;
    bastion::client_config client;
    bastion::server_config server;

    ASSERT_EQ(bastion::parse_json_document(R"({"timeout": "forever"})", json), error::OK());
    EXPECT_EQ(bastion::load_client_config(json, client), error::INVALID_CONFIG());

    ASSERT_EQ(bastion::parse_json_document(R"({"serverIPAddresses": "127.0.0.1:1"})", json), error::OK());
    EXPECT_EQ(bastion::load_client_config(json, client), error::INVALID_CONFIG());

    ASSERT_EQ(bastion::parse_json_document(R"({"services": {"a": {"clientNames": [1]}}})", json), error::OK());
    EXPECT_EQ(bastion::load_server_config(json, server), error::INVALID_CONFIG());

    ASSERT_EQ(bastion::parse_json_document(R"([1, 2])", json), error::OK());
    EXPECT_EQ(bastion::load_server_config(json, server), error::INVALID_CONFIG());

    EXPECT_EQ(bastion::parse_json_document("{not json", json), error::INVALID_CONFIG());
}

class tls_material_test : public testing::Test
{
protected:
    std::filesystem::path dir_;

    void SetUp() override
    {
        dir_ = std::filesystem::temp_directory_path()
             / ("bastion_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_"
                 + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string write(const std::string& name, const std::string& contents)
    {
        auto path = dir_ / name;
        std::ofstream(path) << contents;
        return path.string();
    }
};

TEST_F(tls_material_test, reads_all_three_files)
{
    bastion::tls_config config;
    config.ca_cert_file = write("ca.pem", "CA");
    config.cert_file = write("cert.pem", "CERT");
    config.key_file = write("key.pem", "KEY");

    bastion::tls_material material;
    ASSERT_EQ(bastion::load_tls_material(config, material), error::OK());
    EXPECT_EQ(material.root_certificates_pem, "CA");
    ASSERT_EQ(material.identities.size(), 1u);
    EXPECT_EQ(material.identities[0].certificate_chain_pem, "CERT");
    EXPECT_EQ(material.identities[0].private_key_pem, "KEY");
}

TEST_F(tls_material_test, missing_fields_and_files_are_errors)
{
    bastion::tls_material material;

    bastion::tls_config incomplete;
    incomplete.ca_cert_file = write("ca.pem", "CA");
    EXPECT_EQ(bastion::load_tls_material(incomplete, material), error::INVALID_CONFIG());

    bastion::tls_config missing;
    missing.ca_cert_file = write("ca.pem", "CA");
    missing.cert_file = (dir_ / "does-not-exist.pem").string();
    missing.key_file = write("key.pem", "KEY");
    EXPECT_EQ(bastion::load_tls_material(missing, material), error::CONFIG_IO_ERROR());
}

TEST_F(tls_material_test, tls_config_reads_file_names)
{
    Json::Value json;
    ASSERT_EQ(bastion::parse_json_document(
                  R"({"caCertFile": "/c/ca.pem", "certFile": "/c/cert.pem", "keyFile": "/c/key.pem"})", json),
        error::OK());
    bastion::tls_config config;
    ASSERT_EQ(bastion::load_tls_config(json, config), error::OK());
    EXPECT_EQ(config.ca_cert_file, "/c/ca.pem");
    EXPECT_EQ(config.cert_file, "/c/cert.pem");
    EXPECT_EQ(config.key_file, "/c/key.pem");
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <bastion/internal/error_codes.h>
#include <transports/grpc/static_resolver.h>

using namespace bastion::grpc_transport;
namespace error = bastion::error;

TEST(static_resolver_test, single_ipv4_address)
{
    std::unique_ptr<static_resolver> resolver;
    ASSERT_EQ(static_resolver::build("static:///127.0.0.1:1337", resolver), error::OK());
    ASSERT_EQ(resolver->addresses().size(), 1u);
    EXPECT_EQ(resolver->addresses()[0].addr, "127.0.0.1:1337");
    EXPECT_EQ(resolver->addresses()[0].server_name, "127.0.0.1:1337");
    EXPECT_EQ(resolver->grpc_target(), "ipv4:127.0.0.1:1337");
}

TEST(static_resolver_test, ipv6_keeps_its_brackets)
{
    std::unique_ptr<static_resolver> resolver;
    ASSERT_EQ(static_resolver::build("[::1]:1337", resolver), error::OK());
    ASSERT_EQ(resolver->addresses().size(), 1u);
    EXPECT_EQ(resolver->addresses()[0].addr, "[::1]:1337");
    EXPECT_EQ(resolver->grpc_target(), "ipv6:[::1]:1337");
}

TEST(static_resolver_test, empty_host_means_loopback)
{
    std::unique_ptr<static_resolver> resolver;
    ASSERT_EQ(static_resolver::build(":1337", resolver), error::OK());
    EXPECT_EQ(resolver->addresses()[0].addr, "127.0.0.1:1337");
}

TEST(static_resolver_test, order_is_preserved)
{
    std::unique_ptr<static_resolver> resolver;
    ASSERT_EQ(static_resolver::build("static:///10.88.88.88:2,10.77.77.77:1", resolver), error::OK());
    ASSERT_EQ(resolver->addresses().size(), 2u);
    EXPECT_EQ(resolver->addresses()[0].addr, "10.88.88.88:2");
    EXPECT_EQ(resolver->addresses()[1].addr, "10.77.77.77:1");
    EXPECT_EQ(resolver->grpc_target(), "ipv4:10.88.88.88:2,10.77.77.77:1");

    // nothing to do for a fixed list
    resolver->resolve_now();
    resolver->close();
    EXPECT_EQ(resolver->addresses().size(), 2u);
}

TEST(static_resolver_test, hostnames_are_rejected)
{
    std::unique_ptr<static_resolver> resolver;
    EXPECT_EQ(static_resolver::build("localhost:1337", resolver), error::INVALID_TARGET());
    EXPECT_EQ(resolver, nullptr);
}

TEST(static_resolver_test, malformed_pieces_are_rejected)
{
    std::unique_ptr<static_resolver> resolver;
    EXPECT_EQ(static_resolver::build("127.0.0.1", resolver), error::INVALID_TARGET());
    EXPECT_EQ(static_resolver::build("127.0.0.1:1,", resolver), error::INVALID_TARGET());
    EXPECT_EQ(static_resolver::build("", resolver), error::INVALID_TARGET());
}

TEST(static_resolver_test, mixed_families_are_rejected)
{
    std::unique_ptr<static_resolver> resolver;
    EXPECT_EQ(static_resolver::build("127.0.0.1:1,[::1]:2", resolver), error::INVALID_TARGET());
}

TEST(translate_target_test, static_targets_become_literal_lists)
{
    std::string grpc_target;
    std::vector<std::string> endpoints;
    ASSERT_EQ(translate_target("static:///10.77.77.77:9094,:9095", grpc_target, endpoints), error::OK());
    EXPECT_EQ(grpc_target, "ipv4:10.77.77.77:9094,127.0.0.1:9095");
    EXPECT_EQ(endpoints, (std::vector<std::string>{"10.77.77.77:9094", "127.0.0.1:9095"}));
}

TEST(translate_target_test, other_schemes_pass_through)
{
    std::string grpc_target;
    std::vector<std::string> endpoints;
    ASSERT_EQ(translate_target("dns://10.55.55.10:53/ra.service.consul:9094", grpc_target, endpoints), error::OK());
    EXPECT_EQ(grpc_target, "dns://10.55.55.10:53/ra.service.consul:9094");
    EXPECT_EQ(endpoints, std::vector<std::string>{"ra.service.consul:9094"});

    ASSERT_EQ(translate_target("dns:///ra.service.consul:9094", grpc_target, endpoints), error::OK());
    EXPECT_EQ(grpc_target, "dns:///ra.service.consul:9094");
}

TEST(translate_target_test, bad_static_target_fails)
{
    std::string grpc_target;
    std::vector<std::string> endpoints;
    EXPECT_EQ(translate_target("static:///ra.boulder:9094", grpc_target, endpoints), error::INVALID_TARGET());
}

TEST(translate_target_test, static_scheme_is_registered_once)
{
    register_static_scheme();
    register_static_scheme();
    EXPECT_FALSE(register_scheme(static_scheme, {}));
    EXPECT_TRUE(register_scheme("unit-test-scheme",
        [](std::string_view endpoints, std::string& grpc_target, std::vector<std::string>& hosts)
        {
            grpc_target = "ipv4:" + std::string(endpoints);
            hosts = {std::string(endpoints)};
            return error::OK();
        }));

    std::string grpc_target;
    std::vector<std::string> endpoints;
    ASSERT_EQ(translate_target("unit-test-scheme:///1.2.3.4:5", grpc_target, endpoints), error::OK());
    EXPECT_EQ(grpc_target, "ipv4:1.2.3.4:5");
}

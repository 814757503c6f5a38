/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <bastion/internal/error_codes.h>
#include <bastion/internal/interceptors.h>
#include <bastion/telemetry/local_metrics_registry.h>

using namespace bastion::telemetry;

TEST(metrics_registry_test, second_registration_reuses_the_family)
{
    local_metrics_registry registry;
    metric_descriptor descriptor{"calls_total", "calls", {"service"}, {}};

    auto first = registry.register_counter(descriptor);
    auto second = registry.register_counter(descriptor);
    EXPECT_EQ(first.status, registration_status::registered);
    EXPECT_EQ(second.status, registration_status::already_registered);
    EXPECT_EQ(first.family, second.family);
    EXPECT_EQ(adopt(second), first.family);
}

TEST(metrics_registry_test, different_shape_conflicts)
{
    local_metrics_registry registry;
    registry.register_counter({"calls_total", "calls", {"service"}, {}});

    auto other_labels = registry.register_counter({"calls_total", "calls", {"service", "method"}, {}});
    EXPECT_EQ(other_labels.status, registration_status::conflict);
    EXPECT_EQ(adopt(other_labels), nullptr);

    auto other_kind = registry.register_gauge({"calls_total", "calls", {"service"}, {}});
    EXPECT_EQ(other_kind.status, registration_status::conflict);
}

TEST(metrics_registry_test, histogram_bucket_order_does_not_matter)
{
    local_metrics_registry registry;
    auto first = registry.register_histogram({"latency", "", {}, {1, 0.1, 10}});
    auto second = registry.register_histogram({"latency", "", {}, {0.1, 1, 10}});
    EXPECT_EQ(second.status, registration_status::already_registered);

    auto different = registry.register_histogram({"latency", "", {}, {0.1, 1}});
    EXPECT_EQ(different.status, registration_status::conflict);
}

TEST(metrics_registry_test, series_are_keyed_by_label_values)
{
    local_metrics_registry registry;
    auto family = adopt(registry.register_gauge({"in_flight", "", {"service", "method"}, {}}));
    ASSERT_NE(family, nullptr);

    family->with_labels({"a", "x"})->inc();
    family->with_labels({"a", "x"})->inc();
    family->with_labels({"a", "y"})->inc();
    family->with_labels({"a", "x"})->dec();

    EXPECT_EQ(family->find({"a", "x"})->value(), 1);
    EXPECT_EQ(family->find({"a", "y"})->value(), 1);
    EXPECT_EQ(family->find({"b", "x"}), nullptr);
    EXPECT_EQ(family->series_count(), 2u);
    EXPECT_EQ(family->with_labels({"only one"}), nullptr);
}

TEST(metrics_registry_test, histogram_buckets_are_cumulative)
{
    local_metrics_registry registry;
    auto family = adopt(registry.register_histogram({"lag", "", {}, {0.1, 1}}));
    auto* h = family->with_labels({});
    h->observe(0.05);
    h->observe(0.1);
    h->observe(0.5);
    h->observe(7);

    EXPECT_EQ(h->count(), 4u);
    EXPECT_DOUBLE_EQ(h->sum(), 7.65);
    EXPECT_EQ(h->cumulative_count(0), 2u);
    EXPECT_EQ(h->cumulative_count(1), 3u);
    EXPECT_EQ(h->cumulative_count(2), 4u);
}

TEST(metrics_registry_test, concurrent_updates_are_not_lost)
{
    local_metrics_registry registry;
    auto family = adopt(registry.register_counter({"hits", "", {"thread"}, {}}));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back(
            [&family]
            {
                for (int i = 0; i < 1000; ++i)
                    family->with_labels({"shared"})->inc();
            });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(family->find({"shared"})->value(), 8000u);
}

TEST(metrics_registry_test, pipelines_share_families_across_builds)
{
    local_metrics_registry registry;
    bastion::server_metrics first;
    bastion::server_metrics second;
    ASSERT_EQ(bastion::register_server_metrics(registry, first), bastion::error::OK());
    ASSERT_EQ(bastion::register_server_metrics(registry, second), bastion::error::OK());
    EXPECT_EQ(first.rpc_lag, second.rpc_lag);
    EXPECT_EQ(first.handled, second.handled);

    bastion::client_metrics client;
    ASSERT_EQ(bastion::register_client_metrics(registry, client), bastion::error::OK());
    EXPECT_EQ(client.in_flight, registry.find_gauge("grpc_client_in_flight"));
}

TEST(metrics_registry_test, clashing_family_fails_pipeline_registration)
{
    local_metrics_registry registry;
    registry.register_counter({"grpc_server_rpc_lag_seconds", "not a histogram", {}, {}});

    bastion::server_metrics metrics;
    EXPECT_EQ(bastion::register_server_metrics(registry, metrics), bastion::error::METRIC_CONFLICT());
}

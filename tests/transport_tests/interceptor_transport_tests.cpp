/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <bastion/internal/error_codes.h>
#include <bastion/telemetry/local_metrics_registry.h>
#include <bastion_test/chiller_service.h>
#include <transports/grpc/client_connection.h>

using namespace std::chrono_literals;
using bastion::call_context;
using bastion::call_status;
using bastion::test::Time;
using testing::MatchesRegex;

// Plaintext server and client with the full interceptor chains on both ends.
class interceptor_transport_test : public testing::Test
{
protected:
    std::shared_ptr<bastion::telemetry::local_metrics_registry> server_registry_
        = std::make_shared<bastion::telemetry::local_metrics_registry>();
    bastion::telemetry::local_metrics_registry client_registry_;
    bastion_test::chiller_hooks hooks_;
    std::unique_ptr<bastion_test::running_server> server_;

    void start_server()
    {
        bastion::server_config config;
        config.address = "127.0.0.1:0";
        config.drain_timeout = 1s;

        bastion::grpc_transport::server_builder builder(config, server_registry_);
        builder.add(bastion_test::make_chiller_service(hooks_));
        std::unique_ptr<bastion::grpc_transport::server_handle> handle;
        ASSERT_EQ(builder.build_insecure(handle), bastion::error::OK());
        server_ = std::make_unique<bastion_test::running_server>(std::move(handle));
    }

    std::shared_ptr<bastion::grpc_transport::client_connection> connect(std::chrono::nanoseconds timeout)
    {
        std::shared_ptr<const bastion::client_pipeline> pipeline;
        EXPECT_EQ(bastion::make_client_pipeline(client_registry_, timeout, {}, pipeline), bastion::error::OK());
        auto channel = ::grpc::CreateChannel(server_->address(), ::grpc::InsecureChannelCredentials());
        return std::make_shared<bastion::grpc_transport::client_connection>(channel, pipeline);
    }

    std::int64_t in_flight() const
    {
        auto family = client_registry_.find_gauge("grpc_client_in_flight");
        if (!family)
            return 0;
        const auto* series = family->find({"bastion.test.Chiller", "Chill"});
        return series ? series->value() : 0;
    }

    void TearDown() override
    {
        if (server_)
            EXPECT_EQ(server_->stop(), bastion::error::OK());
    }
};

TEST_F(interceptor_transport_test, chill_within_the_timeout_succeeds)
{
    start_server();
    auto connection = connect(30s);

    Time request;
    request.set_duration_ns(std::chrono::nanoseconds(5s).count());
    Time response;
    auto result = connection->unary_call(call_context::background(), bastion_test::chill_method, request, response);
    ASSERT_TRUE(result.ok()) << result.to_string();
    EXPECT_GE(response.duration_ns(), std::chrono::nanoseconds(5s).count());

    auto lag = server_registry_->find_histogram("grpc_server_rpc_lag_seconds");
    ASSERT_NE(lag, nullptr);
    const auto* series = lag->find({});
    ASSERT_NE(series, nullptr);
    EXPECT_EQ(series->count(), 1u);
    EXPECT_EQ(in_flight(), 0);
}

TEST_F(interceptor_transport_test, client_timeout_names_the_method)
{
    start_server();
    auto connection = connect(100ms);

    Time request;
    request.set_duration_ns(std::chrono::nanoseconds(1s).count());
    Time response;
    auto result = connection->unary_call(call_context::background(), bastion_test::chill_method, request, response);
    EXPECT_EQ(result.code(), ::grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_THAT(result.message(), MatchesRegex("bastion\\.test\\.Chiller\\.Chill timed out after [0-9]+ ms"));
    EXPECT_EQ(in_flight(), 0);
}

TEST_F(interceptor_transport_test, caller_deadline_shorter_than_the_timeout_wins)
{
    start_server();
    auto connection = connect(30s);

    auto root = call_context::background();
    auto ctx = root.with_timeout(300ms);
    Time request;
    request.set_duration_ns(std::chrono::nanoseconds(5s).count());
    Time response;
    auto begin = std::chrono::steady_clock::now();
    auto result = connection->unary_call(ctx, bastion_test::chill_method, request, response);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 4s);
}

TEST_F(interceptor_transport_test, in_flight_gauge_tracks_concurrent_calls)
{
    constexpr int calls = 5;
    std::mutex mtx;
    std::condition_variable cv;
    int entered = 0;
    bool release = false;

    hooks_.on_chill = [&]
    {
        std::unique_lock lock(mtx);
        ++entered;
        cv.notify_all();
        cv.wait(lock, [&] { return release; });
    };
    start_server();
    auto connection = connect(30s);

    std::vector<std::thread> threads;
    std::vector<call_status> results(calls);
    for (int i = 0; i < calls; ++i)
    {
        threads.emplace_back(
            [&, i]
            {
                Time request;
                Time response;
                results[i] = connection->unary_call(
                    call_context::background(), bastion_test::chill_method, request, response);
            });
    }

    {
        std::unique_lock lock(mtx);
        EXPECT_TRUE(cv.wait_for(lock, 10s, [&] { return entered == calls; }));
    }
    EXPECT_EQ(in_flight(), calls);

    {
        std::scoped_lock lock(mtx);
        release = true;
    }
    cv.notify_all();
    for (auto& t : threads)
        t.join();

    for (const auto& result : results)
        EXPECT_TRUE(result.ok()) << result.to_string();
    EXPECT_EQ(in_flight(), 0);
}

TEST_F(interceptor_transport_test, domain_errors_survive_the_wire)
{
    start_server();
    auto connection = connect(5s);

    Time request;
    Time response;
    auto result = connection->unary_call(call_context::background(), bastion_test::fail_method, request, response);
    ASSERT_TRUE(result.is_domain_error()) << result.to_string();

    const auto& err = result.domain();
    EXPECT_EQ(err.type, bastion::error_type::rate_limit);
    EXPECT_EQ(err.detail, "too many chills");
    EXPECT_EQ(err.retry_after, 1500ms);
    ASSERT_EQ(err.sub_errors.size(), 1u);
    EXPECT_EQ(err.sub_errors[0].type, bastion::error_type::malformed);
    EXPECT_EQ(err.sub_errors[0].detail, "chill too cold");
    ASSERT_TRUE(err.sub_errors[0].subject.has_value());
    EXPECT_EQ(err.sub_errors[0].subject->value, "cold.example.com");
}

TEST_F(interceptor_transport_test, server_stream_delivers_every_step)
{
    start_server();
    auto connection = connect(5s);

    Time request;
    request.set_duration_ns(std::chrono::nanoseconds(90ms).count());
    std::unique_ptr<bastion::grpc_transport::client_reader<Time>> reader;
    ASSERT_TRUE(connection
                    ->server_streaming_call(call_context::background(), bastion_test::chill_stream_method, request, reader)
                    .ok());
    ASSERT_NE(reader, nullptr);

    int messages = 0;
    std::int64_t last = 0;
    Time message;
    while (reader->read(message))
    {
        EXPECT_GE(message.duration_ns(), last);
        last = message.duration_ns();
        ++messages;
    }
    EXPECT_EQ(messages, 3);
    ASSERT_TRUE(reader->finished());
    EXPECT_TRUE(reader->status().ok()) << reader->status().to_string();

    auto handled = client_registry_.find_counter("grpc_client_handled_total");
    ASSERT_NE(handled, nullptr);
    const auto* series = handled->find({"bastion.test.Chiller", "ChillStream", "OK"});
    ASSERT_NE(series, nullptr);
    EXPECT_EQ(series->value(), 1u);
}

TEST_F(interceptor_transport_test, server_counts_handled_calls)
{
    start_server();
    auto connection = connect(5s);

    Time request;
    Time response;
    ASSERT_TRUE(connection->unary_call(call_context::background(), bastion_test::chill_method, request, response).ok());
    EXPECT_FALSE(connection->unary_call(call_context::background(), bastion_test::fail_method, request, response).ok());

    auto handled = server_registry_->find_counter("grpc_server_handled_total");
    ASSERT_NE(handled, nullptr);
    EXPECT_EQ(handled->find({"bastion.test.Chiller", "Chill", "OK"})->value(), 1u);
    EXPECT_EQ(handled->find({"bastion.test.Chiller", "Fail", "UNKNOWN"})->value(), 1u);
}

TEST_F(interceptor_transport_test, sub_millisecond_retry_hint_survives_the_wire)
{
    hooks_.on_fail = []
    {
        auto err = bastion::make_domain_error(bastion::error_type::rate_limit, "slow down");
        err.retry_after = 1500ns;
        return err;
    };
    start_server();
    auto connection = connect(5s);

    Time request;
    Time response;
    auto result = connection->unary_call(call_context::background(), bastion_test::fail_method, request, response);
    ASSERT_TRUE(result.is_domain_error()) << result.to_string();
    EXPECT_EQ(result.domain().type, bastion::error_type::rate_limit);
    EXPECT_EQ(result.domain().retry_after, 1500ns);

    // the server is still answering
    EXPECT_TRUE(connection->unary_call(call_context::background(), bastion_test::chill_method, request, response).ok());
}

TEST_F(interceptor_transport_test, unprintable_sub_error_detail_survives_the_wire)
{
    const std::string detail = std::string("chill\x7f") + "cold caf\xc3\xa9";
    hooks_.on_fail = [detail]
    {
        auto err = bastion::make_domain_error(bastion::error_type::rejected_identifier, "rejected");
        err.sub_errors.push_back(bastion::make_domain_error(bastion::error_type::malformed, detail));
        return err;
    };
    start_server();
    auto connection = connect(5s);

    Time request;
    Time response;
    auto result = connection->unary_call(call_context::background(), bastion_test::fail_method, request, response);
    ASSERT_TRUE(result.is_domain_error()) << result.to_string();
    ASSERT_EQ(result.domain().sub_errors.size(), 1u);
    EXPECT_EQ(result.domain().sub_errors[0].detail, detail);

    EXPECT_TRUE(connection->unary_call(call_context::background(), bastion_test::chill_method, request, response).ok());
}

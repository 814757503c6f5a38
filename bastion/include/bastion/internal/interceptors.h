/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <bastion/internal/call_context.h>
#include <bastion/internal/call_status.h>
#include <bastion/internal/config.h>
#include <bastion/internal/metadata.h>
#include <bastion/telemetry/i_metrics_registry.h>

namespace bastion
{
    // time reserved for getting a response back to the caller once the handler gives up
    inline constexpr std::chrono::milliseconds return_overhead{20};
    // calls with less than this left after return_overhead are refused outright
    inline constexpr std::chrono::milliseconds meaningful_work_overhead{100};
    // deadline assumed when a client sent none
    inline constexpr std::chrono::seconds missing_deadline_allowance{100};

    static_assert(return_overhead < meaningful_work_overhead);

    enum class call_kind
    {
        unary,
        client_streaming,
        server_streaming,
        bidi_streaming
    };

    inline bool is_stream(call_kind kind)
    {
        return kind != call_kind::unary;
    }

    // what the transport layer learnt about the caller
    struct peer_info
    {
        bool present = false;
        // "ssl" for TLS connections, "insecure" or empty for plaintext
        std::string transport_security_type;
        // the peer certificate chain was verified against the trust roots
        bool authenticated = false;
        std::string leaf_certificate_pem;
    };

    struct server_call
    {
        std::string full_method;
        std::string service;
        std::string method;
        call_kind kind = call_kind::unary;
        metadata_map client_metadata;
        peer_info peer;
        // flushed onto the wire once the pipeline returns
        metadata_map trailers;
    };

    server_call make_server_call(std::string full_method, call_kind kind);

    struct client_call
    {
        std::string full_method;
        std::string service;
        std::string method;
        call_kind kind = call_kind::unary;

        // applied to the outgoing gRPC call by the transport
        std::optional<call_context::time_point> deadline;
        metadata_map outgoing_metadata;
        bool wait_for_ready = false;

        // filled in by the transport once the server has responded
        metadata_map trailers;

        // stream completion work registered by interceptors, run innermost first
        std::vector<std::function<call_status(const call_status&)>> finishers;
    };

    client_call make_client_call(std::string full_method, call_kind kind);

    // runs and clears the finishers of a stream, each sees the previous one's result
    call_status finish_stream(client_call& call, call_status status);

    using next_handler = std::function<call_status(const call_context&)>;

    // An interceptor either answers the call itself or forwards it by invoking next,
    // possibly with a derived context. The same signature serves unary and streaming
    // calls: for streams next returns once the stream is established and interceptors
    // that need to observe completion register a finisher on the client_call.
    using server_interceptor = std::function<call_status(const call_context&, server_call&, const next_handler&)>;
    using client_interceptor = std::function<call_status(const call_context&, client_call&, const next_handler&)>;

    struct server_metrics
    {
        std::shared_ptr<telemetry::histogram_family> rpc_lag;
        std::shared_ptr<telemetry::counter_family> started;
        std::shared_ptr<telemetry::counter_family> handled;
        std::shared_ptr<telemetry::histogram_family> handling_seconds;
    };

    struct client_metrics
    {
        std::shared_ptr<telemetry::gauge_family> in_flight;
        std::shared_ptr<telemetry::counter_family> started;
        std::shared_ptr<telemetry::counter_family> handled;
        std::shared_ptr<telemetry::histogram_family> handling_seconds;
    };

    // register (or reuse) every family the pipelines record into
    int register_server_metrics(telemetry::i_metrics_registry& registry, server_metrics& out);
    int register_client_metrics(telemetry::i_metrics_registry& registry, client_metrics& out);

    // server side
    server_interceptor make_server_metrics_interceptor(server_metrics metrics);
    server_interceptor make_auth_interceptor(service_auth_policy policy);
    server_interceptor make_noop_auth_interceptor();
    server_interceptor make_server_metadata_interceptor(std::shared_ptr<telemetry::histogram_family> rpc_lag);
    server_interceptor make_server_trace_interceptor();

    // the authorization decision on its own, OK when the peer may call the service
    call_status check_service_authorization(const service_auth_policy& policy, const server_call& call);

    // client side
    client_interceptor make_client_metadata_interceptor(
        std::chrono::nanoseconds timeout, std::shared_ptr<telemetry::gauge_family> in_flight);
    client_interceptor make_client_metrics_interceptor(client_metrics metrics);
    client_interceptor make_client_trace_interceptor();
}

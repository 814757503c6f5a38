/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <bastion/internal/error_codes.h>
#include <bastion/internal/logger.h>
#include <bastion/internal/pipeline.h>

namespace bastion
{
    namespace
    {
        template<class Family>
        int adopt_family(const telemetry::registration_result<Family>& result,
            const telemetry::metric_descriptor& descriptor,
            std::shared_ptr<Family>& out)
        {
            out = telemetry::adopt(result);
            if (!out)
            {
                BASTION_ERROR("metric {} is already registered with a different shape", descriptor.name);
                return error::METRIC_CONFLICT();
            }
            if (result.status == telemetry::registration_status::already_registered)
                BASTION_DEBUG("reusing existing metric {}", descriptor.name);
            return error::OK();
        }

        int register_counter(telemetry::i_metrics_registry& registry,
            const telemetry::metric_descriptor& descriptor,
            std::shared_ptr<telemetry::counter_family>& out)
        {
            return adopt_family(registry.register_counter(descriptor), descriptor, out);
        }

        int register_gauge(telemetry::i_metrics_registry& registry,
            const telemetry::metric_descriptor& descriptor,
            std::shared_ptr<telemetry::gauge_family>& out)
        {
            return adopt_family(registry.register_gauge(descriptor), descriptor, out);
        }

        int register_histogram(telemetry::i_metrics_registry& registry,
            const telemetry::metric_descriptor& descriptor,
            std::shared_ptr<telemetry::histogram_family>& out)
        {
            return adopt_family(registry.register_histogram(descriptor), descriptor, out);
        }
    }

    server_call make_server_call(std::string full_method, call_kind kind)
    {
        server_call call;
        auto names = split_method_name(full_method);
        call.full_method = std::move(full_method);
        call.service = std::move(names.service);
        call.method = std::move(names.method);
        call.kind = kind;
        return call;
    }

    client_call make_client_call(std::string full_method, call_kind kind)
    {
        client_call call;
        auto names = split_method_name(full_method);
        call.full_method = std::move(full_method);
        call.service = std::move(names.service);
        call.method = std::move(names.method);
        call.kind = kind;
        return call;
    }

    call_status finish_stream(client_call& call, call_status status)
    {
        auto finishers = std::move(call.finishers);
        call.finishers.clear();
        for (auto& finisher : finishers)
            status = finisher(status);
        return status;
    }

    int register_server_metrics(telemetry::i_metrics_registry& registry, server_metrics& out)
    {
        server_metrics metrics;
        auto err = register_histogram(registry,
            {"grpc_server_rpc_lag_seconds",
                "Delta between client RPC send time and server RPC receipt time",
                {},
                telemetry::default_buckets()},
            metrics.rpc_lag);
        if (err != error::OK())
            return err;
        err = register_counter(registry,
            {"grpc_server_started_total", "Total number of RPCs started on the server", {"grpc_service", "grpc_method"}, {}},
            metrics.started);
        if (err != error::OK())
            return err;
        err = register_counter(registry,
            {"grpc_server_handled_total",
                "Total number of RPCs completed on the server, regardless of success or failure",
                {"grpc_service", "grpc_method", "grpc_code"},
                {}},
            metrics.handled);
        if (err != error::OK())
            return err;
        err = register_histogram(registry,
            {"grpc_server_handling_seconds",
                "Histogram of response latency of RPCs handled by the server",
                {"grpc_service", "grpc_method"},
                telemetry::default_buckets()},
            metrics.handling_seconds);
        if (err != error::OK())
            return err;

        out = std::move(metrics);
        return error::OK();
    }

    int register_client_metrics(telemetry::i_metrics_registry& registry, client_metrics& out)
    {
        client_metrics metrics;
        auto err = register_gauge(
            registry, {"grpc_client_in_flight", "Number of RPCs currently in flight", {"service", "method"}, {}}, metrics.in_flight);
        if (err != error::OK())
            return err;
        err = register_counter(registry,
            {"grpc_client_started_total", "Total number of RPCs started by the client", {"grpc_service", "grpc_method"}, {}},
            metrics.started);
        if (err != error::OK())
            return err;
        err = register_counter(registry,
            {"grpc_client_handled_total",
                "Total number of RPCs completed by the client, regardless of success or failure",
                {"grpc_service", "grpc_method", "grpc_code"},
                {}},
            metrics.handled);
        if (err != error::OK())
            return err;
        err = register_histogram(registry,
            {"grpc_client_handling_seconds",
                "Histogram of response latency of RPCs made by the client",
                {"grpc_service", "grpc_method"},
                telemetry::default_buckets()},
            metrics.handling_seconds);
        if (err != error::OK())
            return err;

        out = std::move(metrics);
        return error::OK();
    }

    int make_server_pipeline(telemetry::i_metrics_registry& registry,
        const service_auth_policy& policy,
        const pipeline_options& options,
        std::shared_ptr<const server_pipeline>& out)
    {
        server_metrics metrics;
        auto err = register_server_metrics(registry, metrics);
        if (err != error::OK())
            return err;

        std::vector<server_interceptor> interceptors;
        interceptors.push_back(make_server_metrics_interceptor(metrics));
        if (policy.empty())
        {
            BASTION_INFO("no per service client names configured, every service is open to authenticated peers");
            interceptors.push_back(make_noop_auth_interceptor());
        }
        else
        {
            interceptors.push_back(make_auth_interceptor(policy));
        }
        interceptors.push_back(make_server_metadata_interceptor(metrics.rpc_lag));
        if (options.enable_tracing)
            interceptors.push_back(make_server_trace_interceptor());

        out = std::make_shared<const server_pipeline>(std::move(interceptors));
        return error::OK();
    }

    int make_client_pipeline(telemetry::i_metrics_registry& registry,
        std::chrono::nanoseconds timeout,
        const pipeline_options& options,
        std::shared_ptr<const client_pipeline>& out)
    {
        client_metrics metrics;
        auto err = register_client_metrics(registry, metrics);
        if (err != error::OK())
            return err;

        std::vector<client_interceptor> interceptors;
        interceptors.push_back(make_client_metadata_interceptor(timeout, metrics.in_flight));
        interceptors.push_back(make_client_metrics_interceptor(metrics));
        if (options.enable_tracing)
            interceptors.push_back(make_client_trace_interceptor());

        out = std::make_shared<const client_pipeline>(std::move(interceptors));
        return error::OK();
    }
}

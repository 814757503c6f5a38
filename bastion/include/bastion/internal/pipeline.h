/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <vector>

#include <bastion/internal/interceptors.h>

namespace bastion
{
    struct pipeline_options
    {
        bool enable_tracing = false;
    };

    // Fixed ordered chain of interceptors, outermost first
    template<class Call, class Interceptor> class basic_pipeline
    {
        std::vector<Interceptor> interceptors_;

        call_status run(std::size_t index, const call_context& ctx, Call& call, const next_handler& terminal) const
        {
            if (index == interceptors_.size())
                return terminal(ctx);
            return interceptors_[index](
                ctx, call, [&](const call_context& inner_ctx) { return run(index + 1, inner_ctx, call, terminal); });
        }

    public:
        explicit basic_pipeline(std::vector<Interceptor> interceptors)
            : interceptors_(std::move(interceptors))
        {
        }

        std::size_t size() const { return interceptors_.size(); }

        call_status invoke(const call_context& ctx, Call& call, const next_handler& terminal) const
        {
            return run(0, ctx, call, terminal);
        }
    };

    using server_pipeline = basic_pipeline<server_call, server_interceptor>;
    using client_pipeline = basic_pipeline<client_call, client_interceptor>;

    // [metrics] -> [authorization or no-op when policy is empty] -> [lag + deadline budget + error wrapping] -> [trace]
    int make_server_pipeline(telemetry::i_metrics_registry& registry,
        const service_auth_policy& policy,
        const pipeline_options& options,
        std::shared_ptr<const server_pipeline>& out);

    // [timestamp + deadline + in flight + error unwrapping] -> [metrics] -> [trace]
    int make_client_pipeline(telemetry::i_metrics_registry& registry,
        std::chrono::nanoseconds timeout,
        const pipeline_options& options,
        std::shared_ptr<const client_pipeline>& out);
}

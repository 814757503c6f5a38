/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <bastion/internal/error_codec.h>
#include <bastion/internal/interceptors.h>
#include <bastion/internal/logger.h>

namespace bastion
{
    client_interceptor make_client_metadata_interceptor(
        std::chrono::nanoseconds timeout, std::shared_ptr<telemetry::gauge_family> in_flight)
    {
        return [timeout, in_flight](const call_context& ctx, client_call& call, const next_handler& next) -> call_status
        {
            if (!in_flight)
                return internal_error("client interceptor has nil in flight gauge");

            // bounded sub context, released by the finish step below on every path
            auto local_ctx = std::make_shared<call_context>(ctx.with_timeout(timeout));
            call.deadline = local_ctx->deadline();

            auto sent_at = std::chrono::duration_cast<std::chrono::nanoseconds>(
                call_context::clock::now().time_since_epoch());
            call.outgoing_metadata.emplace(metadata_keys::client_request_time, std::to_string(sent_at.count()));

            // keep retrying until the deadline rather than failing while every backend is briefly down
            call.wait_for_ready = true;
            call.trailers.clear();

            auto* live = in_flight->with_labels({call.service, call.method});
            if (live)
                live->inc();
            auto begin = std::chrono::steady_clock::now();

            auto finish = [local_ctx, live, begin, &call](const call_status& status) -> call_status
            {
                local_ctx->cancel();
                if (live)
                    live->dec();
                if (status.ok())
                    return status;

                auto result = unwrap_error(status, call.trailers);
                if (!result.is_domain_error() && result.code() == ::grpc::StatusCode::DEADLINE_EXCEEDED)
                {
                    auto latency
                        = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
                    return call_status(::grpc::StatusCode::DEADLINE_EXCEEDED,
                        fmt::format("{}.{} timed out after {} ms", call.service, call.method, latency.count()));
                }
                return result;
            };

            auto result = next(*local_ctx);
            if (is_stream(call.kind) && result.ok())
            {
                call.finishers.push_back(std::move(finish));
                return result;
            }
            return finish(result);
        };
    }

    client_interceptor make_client_metrics_interceptor(client_metrics metrics)
    {
        return [metrics](const call_context& ctx, client_call& call, const next_handler& next) -> call_status
        {
            if (metrics.started)
            {
                if (auto* started = metrics.started->with_labels({call.service, call.method}))
                    started->inc();
            }
            auto begin = std::chrono::steady_clock::now();

            auto record = [metrics, begin, &call](const call_status& status) -> call_status
            {
                std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - begin;
                if (metrics.handled)
                {
                    if (auto* handled
                        = metrics.handled->with_labels({call.service, call.method, status_code_name(status.code())}))
                        handled->inc();
                }
                if (metrics.handling_seconds)
                {
                    if (auto* handling = metrics.handling_seconds->with_labels({call.service, call.method}))
                        handling->observe(elapsed.count());
                }
                return status;
            };

            auto result = next(ctx);
            if (is_stream(call.kind) && result.ok())
            {
                call.finishers.push_back(std::move(record));
                return result;
            }
            return record(result);
        };
    }
}

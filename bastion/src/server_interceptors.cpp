/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <charconv>

#include <fmt/format.h>

#include <bastion/internal/duration.h>
#include <bastion/internal/error_codec.h>
#include <bastion/internal/interceptors.h>
#include <bastion/internal/logger.h>

namespace bastion
{
    namespace
    {
        // records the time between the client stamping the call and the server receiving it
        call_status observe_lag(telemetry::histogram_family* rpc_lag, const std::string& stamp)
        {
            std::int64_t sent_at_ns = 0;
            auto [ptr, ec] = std::from_chars(stamp.data(), stamp.data() + stamp.size(), sent_at_ns);
            if (ec != std::errc() || ptr != stamp.data() + stamp.size())
            {
                return internal_error(fmt::format(
                    "grpc metadata had illegal {} value: \"{}\"", metadata_keys::client_request_time, stamp));
            }

            auto sent_at = call_context::time_point(
                std::chrono::duration_cast<call_context::clock::duration>(std::chrono::nanoseconds(sent_at_ns)));
            std::chrono::duration<double> elapsed = call_context::clock::now() - sent_at;
            if (rpc_lag)
            {
                if (auto* series = rpc_lag->with_labels({}))
                    series->observe(elapsed.count());
            }
            return call_status();
        }
    }

    server_interceptor make_server_metadata_interceptor(std::shared_ptr<telemetry::histogram_family> rpc_lag)
    {
        return [rpc_lag](const call_context& ctx, server_call& call, const next_handler& next) -> call_status
        {
            auto stamps = metadata_values(call.client_metadata, metadata_keys::client_request_time);
            if (!stamps.empty())
            {
                auto lag_status = observe_lag(rpc_lag.get(), stamps.front());
                if (!lag_status.ok())
                {
                    BASTION_WARNING("{}: {}", call.full_method, lag_status.to_string());
                    return wrap_error(lag_status, call.trailers);
                }
            }

            // keep back enough time to report a timeout of our own downstream work to the caller,
            // then insist on a minimum amount of time to do anything useful at all
            auto now = call_context::clock::now();
            auto deadline = ctx.deadline().value_or(now + missing_deadline_allowance);
            deadline -= return_overhead;
            auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - now);
            if (remaining < meaningful_work_overhead)
            {
                return call_status(::grpc::StatusCode::DEADLINE_EXCEEDED,
                    fmt::format("not enough time left on clock: {}", format_duration(remaining)));
            }

            auto local_ctx = ctx.with_deadline(deadline);
            auto result = next(local_ctx);
            if (!result.ok())
                result = wrap_error(result, call.trailers);
            return result;
        };
    }

    server_interceptor make_server_metrics_interceptor(server_metrics metrics)
    {
        return [metrics](const call_context& ctx, server_call& call, const next_handler& next) -> call_status
        {
            if (metrics.started)
            {
                if (auto* started = metrics.started->with_labels({call.service, call.method}))
                    started->inc();
            }

            auto begin = std::chrono::steady_clock::now();
            auto result = next(ctx);
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - begin;

            if (metrics.handled)
            {
                if (auto* handled = metrics.handled->with_labels({call.service, call.method, status_code_name(result.code())}))
                    handled->inc();
            }
            if (metrics.handling_seconds)
            {
                if (auto* handling = metrics.handling_seconds->with_labels({call.service, call.method}))
                    handling->observe(elapsed.count());
            }
            return result;
        };
    }

    server_interceptor make_noop_auth_interceptor()
    {
        return [](const call_context& ctx, server_call&, const next_handler& next) { return next(ctx); };
    }
}

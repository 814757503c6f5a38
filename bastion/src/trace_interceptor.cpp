/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <mutex>
#include <random>

#include <fmt/format.h>

#include <bastion/internal/interceptors.h>
#include <bastion/internal/logger.h>

namespace bastion
{
    namespace
    {
        std::string random_id()
        {
            static std::mutex mtx;
            static std::mt19937_64 engine{std::random_device{}()};
            std::scoped_lock lock(mtx);
            return fmt::format("{:016x}", engine());
        }

        void log_span_end(
            const char* side, const std::string& trace_id, const std::string& span_id, const std::string& full_method,
            std::chrono::steady_clock::time_point begin, const call_status& status)
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - begin);
            BASTION_DEBUG("{} span {}/{} {} finished in {}us with {}",
                side,
                trace_id,
                span_id,
                full_method,
                elapsed.count(),
                status_code_name(status.code()));
        }
    }

    client_interceptor make_client_trace_interceptor()
    {
        return [](const call_context& ctx, client_call& call, const next_handler& next) -> call_status
        {
            auto trace_id = ctx.trace_id().empty() ? random_id() : ctx.trace_id();
            auto span_id = random_id();
            call.outgoing_metadata.emplace(metadata_keys::trace_id, trace_id);
            BASTION_DEBUG("client span {}/{} {} started", trace_id, span_id, call.full_method);

            auto begin = std::chrono::steady_clock::now();
            auto end_span = [trace_id, span_id, begin, &call](const call_status& status)
            {
                log_span_end("client", trace_id, span_id, call.full_method, begin, status);
                return status;
            };

            auto traced_ctx = ctx.with_trace_id(trace_id);
            auto result = next(traced_ctx);
            if (is_stream(call.kind) && result.ok())
            {
                call.finishers.push_back(std::move(end_span));
                return result;
            }
            return end_span(result);
        };
    }

    server_interceptor make_server_trace_interceptor()
    {
        return [](const call_context& ctx, server_call& call, const next_handler& next) -> call_status
        {
            auto ids = metadata_values(call.client_metadata, metadata_keys::trace_id);
            auto trace_id = ids.empty() ? random_id() : ids.front();
            auto span_id = random_id();
            BASTION_DEBUG("server span {}/{} {} started", trace_id, span_id, call.full_method);

            auto begin = std::chrono::steady_clock::now();
            auto traced_ctx = ctx.with_trace_id(trace_id);
            auto result = next(traced_ctx);
            log_span_end("server", trace_id, span_id, call.full_method, begin, result);
            return result;
        };
    }
}

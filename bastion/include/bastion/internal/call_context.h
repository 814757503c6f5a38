/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace grpc
{
    class ServerContext;
}

namespace bastion
{
    // Deadline and cancellation token threaded through every call.
    //
    // A call_context owns a scope: destroying it (or calling cancel) ends that scope
    // and every context derived from it. Derived contexts can only shorten the
    // deadline of their parent. The type is move only so that exactly one owner
    // releases each scope.
    class call_context
    {
    public:
        using clock = std::chrono::system_clock;
        using time_point = clock::time_point;

    private:
        struct state;
        std::shared_ptr<state> state_;

        explicit call_context(std::shared_ptr<state> s);

    public:
        // root context with no deadline
        static call_context background();

        // root context for a server handler: carries the deadline the client sent
        // and observes the server side cancellation of the call
        static call_context from_server_context(const ::grpc::ServerContext* server_context);

        call_context(const call_context&) = delete;
        call_context& operator=(const call_context&) = delete;
        call_context(call_context&& other) noexcept;
        call_context& operator=(call_context&& other) noexcept;
        ~call_context();

        call_context with_deadline(time_point deadline) const;
        call_context with_timeout(std::chrono::nanoseconds timeout) const;
        call_context with_trace_id(std::string trace_id) const;

        std::optional<time_point> deadline() const;
        // nanoseconds::max() when there is no deadline, negative once it has passed
        std::chrono::nanoseconds remaining() const;

        bool cancelled() const;
        bool deadline_exceeded() const;
        bool done() const { return cancelled() || deadline_exceeded(); }
        void cancel();

        // sleeps for d or until the context is done, returns true only if the full duration elapsed
        bool sleep_for(std::chrono::nanoseconds d) const;

        const std::string& trace_id() const;
    };
}

/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>

#include <grpcpp/server_context.h>

#include <bastion/internal/call_context.h>

namespace bastion
{
    namespace
    {
        // cancellation of an ancestor is noticed by polling at this granularity
        constexpr auto poll_interval = std::chrono::milliseconds(5);
    }

    struct call_context::state
    {
        std::shared_ptr<state> parent;
        std::optional<time_point> deadline;
        const ::grpc::ServerContext* server_context = nullptr;
        std::string trace_id;
        std::atomic<bool> cancelled{false};

        std::mutex mtx;
        std::condition_variable cv;

        bool is_cancelled() const
        {
            for (auto* s = this; s; s = s->parent.get())
            {
                if (s->cancelled.load(std::memory_order_acquire))
                    return true;
                if (s->server_context && s->server_context->IsCancelled())
                    return true;
            }
            return false;
        }

        void cancel()
        {
            {
                std::scoped_lock lock(mtx);
                cancelled.store(true, std::memory_order_release);
            }
            cv.notify_all();
        }
    };

    call_context::call_context(std::shared_ptr<state> s)
        : state_(std::move(s))
    {
    }

    call_context call_context::background()
    {
        return call_context(std::make_shared<state>());
    }

    call_context call_context::from_server_context(const ::grpc::ServerContext* server_context)
    {
        auto s = std::make_shared<state>();
        s->server_context = server_context;
        if (server_context)
        {
            auto deadline = server_context->deadline();
            if (deadline != time_point::max())
                s->deadline = deadline;
        }
        return call_context(std::move(s));
    }

    call_context::call_context(call_context&& other) noexcept
        : state_(std::move(other.state_))
    {
    }

    call_context& call_context::operator=(call_context&& other) noexcept
    {
        if (this != &other)
        {
            if (state_)
                state_->cancel();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    call_context::~call_context()
    {
        if (state_)
            state_->cancel();
    }

    call_context call_context::with_deadline(time_point deadline) const
    {
        auto s = std::make_shared<state>();
        s->parent = state_;
        s->trace_id = state_->trace_id;
        s->deadline = state_->deadline ? std::min(*state_->deadline, deadline) : deadline;
        return call_context(std::move(s));
    }

    call_context call_context::with_timeout(std::chrono::nanoseconds timeout) const
    {
        return with_deadline(clock::now() + std::chrono::duration_cast<clock::duration>(timeout));
    }

    call_context call_context::with_trace_id(std::string trace_id) const
    {
        auto s = std::make_shared<state>();
        s->parent = state_;
        s->deadline = state_->deadline;
        s->trace_id = std::move(trace_id);
        return call_context(std::move(s));
    }

    std::optional<call_context::time_point> call_context::deadline() const
    {
        return state_->deadline;
    }

    std::chrono::nanoseconds call_context::remaining() const
    {
        if (!state_->deadline)
            return std::chrono::nanoseconds::max();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(*state_->deadline - clock::now());
    }

    bool call_context::cancelled() const
    {
        return state_->is_cancelled();
    }

    bool call_context::deadline_exceeded() const
    {
        return state_->deadline && clock::now() >= *state_->deadline;
    }

    void call_context::cancel()
    {
        state_->cancel();
    }

    bool call_context::sleep_for(std::chrono::nanoseconds d) const
    {
        auto wake_at = clock::now() + std::chrono::duration_cast<clock::duration>(d);
        std::unique_lock lock(state_->mtx);
        while (true)
        {
            if (done())
                return false;
            auto now = clock::now();
            if (now >= wake_at)
                return true;
            auto until = std::min(wake_at, now + poll_interval);
            if (state_->deadline)
                until = std::min(until, *state_->deadline);
            state_->cv.wait_until(lock, until);
        }
    }

    const std::string& call_context::trace_id() const
    {
        return state_->trace_id;
    }
}

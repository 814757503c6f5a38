/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <transports/grpc/client_connection.h>

namespace bastion::grpc_transport
{
    void apply_call_options(const client_call& call, ::grpc::ClientContext& context)
    {
        if (call.deadline)
            context.set_deadline(*call.deadline);
        for (const auto& [key, value] : call.outgoing_metadata)
            context.AddMetadata(key, value);
        context.set_wait_for_ready(call.wait_for_ready);
    }

    stream_base::stream_base(std::unique_ptr<client_call> call, std::unique_ptr<::grpc::ClientContext> context)
        : call_(std::move(call))
        , context_(std::move(context))
    {
    }

    const call_status& stream_base::complete(const ::grpc::Status& status)
    {
        if (!final_)
        {
            call_->trailers = to_metadata_map(context_->GetServerTrailingMetadata());
            final_ = finish_stream(*call_, status);
        }
        return *final_;
    }

    void stream_base::cancel_if_open()
    {
        if (!final_)
            context_->TryCancel();
    }

    client_connection::client_connection(
        std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<const client_pipeline> pipeline)
        : channel_(std::move(channel))
        , pipeline_(std::move(pipeline))
    {
    }

    call_status client_connection::invoke(const call_context& ctx, client_call& call, const next_handler& terminal) const
    {
        if (!pipeline_)
            return terminal(ctx);
        return pipeline_->invoke(ctx, call, terminal);
    }
}

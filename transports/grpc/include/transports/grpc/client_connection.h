/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/impl/client_unary_call.h>
#include <grpcpp/impl/rpc_method.h>
#include <grpcpp/support/sync_stream.h>

#include <bastion/internal/pipeline.h>

namespace bastion::grpc_transport
{
    // copies deadline, metadata and wait for ready from the pipeline onto the gRPC call
    void apply_call_options(const client_call& call, ::grpc::ClientContext& context);

    // Shared state of a client stream. The first operation that fails, end of stream
    // included, collects the final status and runs the finishers the pipeline registered.
    class stream_base
    {
    protected:
        std::unique_ptr<client_call> call_;
        std::unique_ptr<::grpc::ClientContext> context_;
        std::optional<call_status> final_;

        stream_base(std::unique_ptr<client_call> call, std::unique_ptr<::grpc::ClientContext> context);

        // records status as the outcome of the stream, returns the decoded result
        const call_status& complete(const ::grpc::Status& status);

        // for destructors of derived streams: cancel an unfinished call
        void cancel_if_open();

    public:
        stream_base(const stream_base&) = delete;
        stream_base& operator=(const stream_base&) = delete;
        virtual ~stream_base() = default;

        bool finished() const { return final_.has_value(); }
        // meaningful once finished() is true
        const call_status& status() const { return *final_; }
    };

    template<class Resp> class client_reader : public stream_base
    {
        std::unique_ptr<::grpc::ClientReader<Resp>> reader_;

    public:
        client_reader(std::unique_ptr<client_call> call,
            std::unique_ptr<::grpc::ClientContext> context,
            std::unique_ptr<::grpc::ClientReader<Resp>> reader)
            : stream_base(std::move(call), std::move(context))
            , reader_(std::move(reader))
        {
        }

        ~client_reader() override
        {
            if (!finished())
            {
                cancel_if_open();
                complete(reader_->Finish());
            }
        }

        // false at the end of the stream or on failure, status() then holds the outcome
        bool read(Resp& message)
        {
            if (finished())
                return false;
            if (reader_->Read(&message))
                return true;
            complete(reader_->Finish());
            return false;
        }

        call_status finish()
        {
            if (!finished())
            {
                // drain anything the server still sends
                Resp ignored;
                while (reader_->Read(&ignored))
                {
                }
                complete(reader_->Finish());
            }
            return status();
        }
    };

    template<class Req, class Resp> class client_writer : public stream_base
    {
        std::unique_ptr<Resp> response_;
        std::unique_ptr<::grpc::ClientWriter<Req>> writer_;

    public:
        client_writer(std::unique_ptr<client_call> call,
            std::unique_ptr<::grpc::ClientContext> context,
            std::unique_ptr<Resp> response,
            std::unique_ptr<::grpc::ClientWriter<Req>> writer)
            : stream_base(std::move(call), std::move(context))
            , response_(std::move(response))
            , writer_(std::move(writer))
        {
        }

        ~client_writer() override
        {
            if (!finished())
            {
                cancel_if_open();
                complete(writer_->Finish());
            }
        }

        bool write(const Req& message)
        {
            if (finished())
                return false;
            if (writer_->Write(message))
                return true;
            complete(writer_->Finish());
            return false;
        }

        // closes the sending side and waits for the single response
        call_status finish()
        {
            if (!finished())
            {
                writer_->WritesDone();
                complete(writer_->Finish());
            }
            return status();
        }

        const Resp& response() const { return *response_; }
    };

    template<class Req, class Resp> class client_reader_writer : public stream_base
    {
        std::unique_ptr<::grpc::ClientReaderWriter<Req, Resp>> stream_;

    public:
        client_reader_writer(std::unique_ptr<client_call> call,
            std::unique_ptr<::grpc::ClientContext> context,
            std::unique_ptr<::grpc::ClientReaderWriter<Req, Resp>> stream)
            : stream_base(std::move(call), std::move(context))
            , stream_(std::move(stream))
        {
        }

        ~client_reader_writer() override
        {
            if (!finished())
            {
                cancel_if_open();
                complete(stream_->Finish());
            }
        }

        bool write(const Req& message)
        {
            if (finished())
                return false;
            if (stream_->Write(message))
                return true;
            complete(stream_->Finish());
            return false;
        }

        bool read(Resp& message)
        {
            if (finished())
                return false;
            if (stream_->Read(&message))
                return true;
            complete(stream_->Finish());
            return false;
        }

        bool writes_done()
        {
            if (finished())
                return false;
            if (stream_->WritesDone())
                return true;
            complete(stream_->Finish());
            return false;
        }

        call_status finish()
        {
            if (!finished())
            {
                stream_->WritesDone();
                Resp ignored;
                while (stream_->Read(&ignored))
                {
                }
                complete(stream_->Finish());
            }
            return status();
        }
    };

    // A dialled channel with the client pipeline in front of every call.
    class client_connection
    {
        std::shared_ptr<::grpc::Channel> channel_;
        std::shared_ptr<const client_pipeline> pipeline_;

        call_status invoke(const call_context& ctx, client_call& call, const next_handler& terminal) const;

    public:
        // pipeline may be null, calls then go straight to the channel
        client_connection(std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<const client_pipeline> pipeline);

        const std::shared_ptr<::grpc::Channel>& channel() const { return channel_; }

        // full_method is "/package.Service/Method"
        template<class Req, class Resp>
        call_status unary_call(const call_context& ctx, const std::string& full_method, const Req& request, Resp& response) const
        {
            auto call = make_client_call(full_method, call_kind::unary);
            return invoke(ctx,
                call,
                [&](const call_context&) -> call_status
                {
                    ::grpc::ClientContext context;
                    apply_call_options(call, context);
                    auto status = ::grpc::internal::BlockingUnaryCall(channel_.get(),
                        ::grpc::internal::RpcMethod(call.full_method.c_str(), ::grpc::internal::RpcMethod::NORMAL_RPC),
                        &context,
                        request,
                        &response);
                    call.trailers = to_metadata_map(context.GetServerTrailingMetadata());
                    return status;
                });
        }

        // on failure out stays empty and the returned status explains why
        template<class Req, class Resp>
        call_status server_streaming_call(const call_context& ctx,
            const std::string& full_method,
            const Req& request,
            std::unique_ptr<client_reader<Resp>>& out) const
        {
            auto call = std::make_unique<client_call>(make_client_call(full_method, call_kind::server_streaming));
            auto context = std::make_unique<::grpc::ClientContext>();
            std::unique_ptr<::grpc::ClientReader<Resp>> reader;
            auto status = invoke(ctx,
                *call,
                [&](const call_context&) -> call_status
                {
                    apply_call_options(*call, *context);
                    reader.reset(::grpc::internal::ClientReaderFactory<Resp>::Create(channel_.get(),
                        ::grpc::internal::RpcMethod(call->full_method.c_str(), ::grpc::internal::RpcMethod::SERVER_STREAMING),
                        context.get(),
                        request));
                    return call_status();
                });
            if (status.ok())
                out = std::make_unique<client_reader<Resp>>(std::move(call), std::move(context), std::move(reader));
            return status;
        }

        template<class Req, class Resp>
        call_status client_streaming_call(
            const call_context& ctx, const std::string& full_method, std::unique_ptr<client_writer<Req, Resp>>& out) const
        {
            auto call = std::make_unique<client_call>(make_client_call(full_method, call_kind::client_streaming));
            auto context = std::make_unique<::grpc::ClientContext>();
            auto response = std::make_unique<Resp>();
            std::unique_ptr<::grpc::ClientWriter<Req>> writer;
            auto status = invoke(ctx,
                *call,
                [&](const call_context&) -> call_status
                {
                    apply_call_options(*call, *context);
                    writer.reset(::grpc::internal::ClientWriterFactory<Req>::Create(channel_.get(),
                        ::grpc::internal::RpcMethod(call->full_method.c_str(), ::grpc::internal::RpcMethod::CLIENT_STREAMING),
                        context.get(),
                        response.get()));
                    return call_status();
                });
            if (status.ok())
            {
                out = std::make_unique<client_writer<Req, Resp>>(
                    std::move(call), std::move(context), std::move(response), std::move(writer));
            }
            return status;
        }

        template<class Req, class Resp>
        call_status bidi_streaming_call(
            const call_context& ctx, const std::string& full_method, std::unique_ptr<client_reader_writer<Req, Resp>>& out) const
        {
            auto call = std::make_unique<client_call>(make_client_call(full_method, call_kind::bidi_streaming));
            auto context = std::make_unique<::grpc::ClientContext>();
            std::unique_ptr<::grpc::ClientReaderWriter<Req, Resp>> stream;
            auto status = invoke(ctx,
                *call,
                [&](const call_context&) -> call_status
                {
                    apply_call_options(*call, *context);
                    stream.reset(::grpc::internal::ClientReaderWriterFactory<Req, Resp>::Create(channel_.get(),
                        ::grpc::internal::RpcMethod(call->full_method.c_str(), ::grpc::internal::RpcMethod::BIDI_STREAMING),
                        context.get()));
                    return call_status();
                });
            if (status.ok())
                out = std::make_unique<client_reader_writer<Req, Resp>>(std::move(call), std::move(context), std::move(stream));
            return status;
        }
    };
}

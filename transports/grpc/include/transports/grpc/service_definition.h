/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/impl/rpc_service_method.h>
#include <grpcpp/impl/service_type.h>
#include <grpcpp/server_context.h>
#include <grpcpp/support/method_handler.h>
#include <grpcpp/support/sync_stream.h>

#include <bastion/internal/pipeline.h>

namespace bastion::grpc_transport
{
    template<class Req, class Resp>
    using unary_handler = std::function<call_status(const call_context&, const Req&, Resp&)>;
    template<class Req, class Resp>
    using server_streaming_handler = std::function<call_status(const call_context&, const Req&, ::grpc::ServerWriter<Resp>&)>;
    template<class Req, class Resp>
    using client_streaming_handler = std::function<call_status(const call_context&, ::grpc::ServerReader<Req>&, Resp&)>;
    template<class Req, class Resp>
    using bidi_streaming_handler
        = std::function<call_status(const call_context&, ::grpc::ServerReaderWriter<Resp, Req>&)>;

    // reads the peer's transport security details off a live call
    peer_info peer_from_context(const ::grpc::ServerContext& context);

    // A gRPC service declared at runtime. Methods are registered the way generated
    // service code registers them, and every call is run through the server pipeline
    // attached by the server builder before it reaches the handler.
    class service_definition : public ::grpc::Service
    {
        std::string name_;
        // RpcServiceMethod keeps a raw pointer to its name
        std::deque<std::string> full_methods_;
        std::vector<std::string> method_names_;
        std::shared_ptr<const server_pipeline> pipeline_;

        const char* register_name(const std::string& method);

        ::grpc::Status dispatch(::grpc::ServerContext* context,
            const std::string& full_method,
            call_kind kind,
            const next_handler& handler) const;

    public:
        // name is the fully qualified service name, e.g. "bastion.test.Chiller"
        explicit service_definition(std::string name);

        service_definition(const service_definition&) = delete;
        service_definition& operator=(const service_definition&) = delete;

        const std::string& name() const { return name_; }
        const std::vector<std::string>& method_names() const { return method_names_; }

        // must happen before the server starts
        void attach_pipeline(std::shared_ptr<const server_pipeline> pipeline) { pipeline_ = std::move(pipeline); }

        template<class Req, class Resp> void add_unary(const std::string& method, unary_handler<Req, Resp> handler)
        {
            auto* full_method = register_name(method);
            AddMethod(new ::grpc::internal::RpcServiceMethod(full_method,
                ::grpc::internal::RpcMethod::NORMAL_RPC,
                new ::grpc::internal::RpcMethodHandler<service_definition, Req, Resp>(
                    [full_method, handler = std::move(handler)](service_definition* self,
                        ::grpc::ServerContext* context,
                        const Req* request,
                        Resp* response)
                    {
                        return self->dispatch(context,
                            full_method,
                            call_kind::unary,
                            [&](const call_context& ctx) { return handler(ctx, *request, *response); });
                    },
                    this)));
        }

        template<class Req, class Resp>
        void add_server_streaming(const std::string& method, server_streaming_handler<Req, Resp> handler)
        {
            auto* full_method = register_name(method);
            AddMethod(new ::grpc::internal::RpcServiceMethod(full_method,
                ::grpc::internal::RpcMethod::SERVER_STREAMING,
                new ::grpc::internal::ServerStreamingHandler<service_definition, Req, Resp>(
                    [full_method, handler = std::move(handler)](service_definition* self,
                        ::grpc::ServerContext* context,
                        const Req* request,
                        ::grpc::ServerWriter<Resp>* writer)
                    {
                        return self->dispatch(context,
                            full_method,
                            call_kind::server_streaming,
                            [&](const call_context& ctx) { return handler(ctx, *request, *writer); });
                    },
                    this)));
        }

        template<class Req, class Resp>
        void add_client_streaming(const std::string& method, client_streaming_handler<Req, Resp> handler)
        {
            auto* full_method = register_name(method);
            AddMethod(new ::grpc::internal::RpcServiceMethod(full_method,
                ::grpc::internal::RpcMethod::CLIENT_STREAMING,
                new ::grpc::internal::ClientStreamingHandler<service_definition, Req, Resp>(
                    [full_method, handler = std::move(handler)](service_definition* self,
                        ::grpc::ServerContext* context,
                        ::grpc::ServerReader<Req>* reader,
                        Resp* response)
                    {
                        return self->dispatch(context,
                            full_method,
                            call_kind::client_streaming,
                            [&](const call_context& ctx) { return handler(ctx, *reader, *response); });
                    },
                    this)));
        }

        template<class Req, class Resp>
        void add_bidi_streaming(const std::string& method, bidi_streaming_handler<Req, Resp> handler)
        {
            auto* full_method = register_name(method);
            AddMethod(new ::grpc::internal::RpcServiceMethod(full_method,
                ::grpc::internal::RpcMethod::BIDI_STREAMING,
                new ::grpc::internal::BidiStreamingHandler<service_definition, Req, Resp>(
                    [full_method, handler = std::move(handler)](service_definition* self,
                        ::grpc::ServerContext* context,
                        ::grpc::ServerReaderWriter<Resp, Req>* stream)
                    {
                        return self->dispatch(context,
                            full_method,
                            call_kind::bidi_streaming,
                            [&](const call_context& ctx) { return handler(ctx, *stream); });
                    },
                    this)));
        }
    };
}

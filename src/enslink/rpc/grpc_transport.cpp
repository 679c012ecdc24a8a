#include <enslink/rpc/channel.hpp>
#include <enslink/rpc/codec.hpp>
#include <enslink/rpc/grpc_transport.hpp>

#include <grpcpp/create_channel.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace enslink::rpc {

    namespace {

        // Completion queue tags: each operation is identified by the address of its own tag
        struct OperationTag {
            const char *name;
        };

        OperationTag START_TAG{"start"};
        OperationTag WRITE_TAG{"write"};
        OperationTag WRITES_DONE_TAG{"writes_done"};
        OperationTag READ_TAG{"read"};
        OperationTag FINISH_TAG{"finish"};

        void *tag(OperationTag &operation) { return &operation; }

        // One server-streaming call driven through its own completion queue
        struct StreamCall {
            grpc::ClientContext context;
            grpc::CompletionQueue cq;
            std::unique_ptr<grpc::GenericClientAsyncReaderWriter> call;

            // Wait for the single outstanding operation
            bool wait(OperationTag &expected) {
                void *got = nullptr;
                bool ok = false;
                if (!cq.Next(&got, &ok)) {
                    return false;
                }
                if (got != tag(expected)) {
                    spdlog::debug("Unexpected completion while waiting for {}", expected.name);
                    return false;
                }
                return ok;
            }

            ~StreamCall() {
                if (call) {
                    context.TryCancel();
                    grpc::Status status;
                    call->Finish(&status, tag(FINISH_TAG));
                }
                cq.Shutdown();
                void *got = nullptr;
                bool ok = false;
                while (cq.Next(&got, &ok)) {
                }
            }
        };

        class GrpcEventReader : public EventReader {
          public:
            explicit GrpcEventReader(std::shared_ptr<StreamCall> stream) : stream_(std::move(stream)) {}

            Result<std::vector<uint8_t>> read() override {
                grpc::ByteBuffer buffer;
                stream_->call->Read(&buffer, tag(READ_TAG));
                if (!stream_->wait(READ_TAG)) {
                    return Result<std::vector<uint8_t>>::io_error("gRPC event stream closed");
                }

                std::vector<uint8_t> data;
                if (!codec::from_byte_buffer(buffer, data)) {
                    return Result<std::vector<uint8_t>>::io_error("Failed to read event stream message");
                }
                return Result<std::vector<uint8_t>>::ok(std::move(data));
            }

            void cancel() override { stream_->context.TryCancel(); }

          private:
            std::shared_ptr<StreamCall> stream_;
        };

    } // namespace

    // PIMPL implementation
    class GrpcTransport::Impl {
      public:
        std::string address;
        std::shared_ptr<grpc::Channel> channel;
        std::shared_ptr<grpc::GenericStub> stub;
        std::vector<std::weak_ptr<StreamCall>> streams;
        std::mutex mutex;

        explicit Impl(std::string addr) : address(std::move(addr)) {
            grpc::ChannelArguments args;
            args.SetMaxReceiveMessageSize(-1);

            channel = grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(), args);
            stub = std::make_shared<grpc::GenericStub>(channel);
        }

        std::shared_ptr<grpc::GenericStub> current_stub() {
            std::lock_guard<std::mutex> lock(mutex);
            return stub;
        }
    };

    GrpcTransport::GrpcTransport(const std::string &address) : impl_(std::make_unique<Impl>(address)) {}

    GrpcTransport::~GrpcTransport() { close(); }

    const std::string &GrpcTransport::address() const { return impl_->address; }

    bool GrpcTransport::wait_ready(std::chrono::milliseconds timeout) {
        std::shared_ptr<grpc::Channel> channel;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            channel = impl_->channel;
        }
        if (!channel) {
            return false;
        }
        return channel->WaitForConnected(std::chrono::system_clock::now() + timeout);
    }

    Result<std::vector<uint8_t>> GrpcTransport::call(const std::string &method, const std::vector<uint8_t> &request,
                                                     const Metadata &metadata) {
        auto stub = impl_->current_stub();
        if (!stub) {
            return Result<std::vector<uint8_t>>::io_error("gRPC channel is closed");
        }

        // Setup RPC context
        grpc::ClientContext context;
        for (const auto &[key, value] : metadata) {
            context.AddMetadata(key, value);
        }

        grpc::ByteBuffer request_buffer = codec::to_byte_buffer(request);
        grpc::ByteBuffer response_buffer;

        // Use synchronous wrapper for async callback API
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        grpc::Status status;

        stub->UnaryCall(&context, method, grpc::StubOptions(), &request_buffer, &response_buffer,
                        [&](grpc::Status s) {
                            std::lock_guard<std::mutex> lock(mutex);
                            status = std::move(s);
                            done = true;
                            cv.notify_one();
                        });

        // Wait for completion
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return done; });
        }

        if (!status.ok()) {
            spdlog::debug("gRPC call {} failed: {}", method, status.error_message());
            return Result<std::vector<uint8_t>>::io_error("gRPC connection dropped: " + status.error_message());
        }

        std::vector<uint8_t> response;
        if (!codec::from_byte_buffer(response_buffer, response)) {
            return Result<std::vector<uint8_t>>::io_error("Failed to read response buffer");
        }
        return Result<std::vector<uint8_t>>::ok(std::move(response));
    }

    Result<std::unique_ptr<EventReader>> GrpcTransport::open_stream(const std::string &method,
                                                                    const std::vector<uint8_t> &request,
                                                                    const Metadata &metadata) {
        using StreamResult = Result<std::unique_ptr<EventReader>>;

        auto stub = impl_->current_stub();
        if (!stub) {
            return StreamResult::io_error("gRPC channel is closed");
        }

        auto stream = std::make_shared<StreamCall>();
        for (const auto &[key, value] : metadata) {
            stream->context.AddMetadata(key, value);
        }

        stream->call = stub->PrepareCall(&stream->context, method, &stream->cq);
        if (!stream->call) {
            return StreamResult::io_error("Failed to prepare event stream call");
        }

        stream->call->StartCall(tag(START_TAG));
        if (!stream->wait(START_TAG)) {
            return StreamResult::io_error("Failed to start event stream");
        }

        auto request_buffer = codec::to_byte_buffer(request);
        stream->call->Write(request_buffer, tag(WRITE_TAG));
        if (!stream->wait(WRITE_TAG)) {
            return StreamResult::io_error("Failed to send event stream request");
        }

        stream->call->WritesDone(tag(WRITES_DONE_TAG));
        if (!stream->wait(WRITES_DONE_TAG)) {
            return StreamResult::io_error("Failed to half-close event stream");
        }

        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (!impl_->channel) {
                return StreamResult::io_error("gRPC channel is closed");
            }
            impl_->streams.push_back(stream);
        }

        return StreamResult::ok(std::make_unique<GrpcEventReader>(std::move(stream)));
    }

    void GrpcTransport::close() {
        std::vector<std::weak_ptr<StreamCall>> streams;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (!impl_->channel) {
                return;
            }
            impl_->stub.reset();
            impl_->channel.reset();
            streams.swap(impl_->streams);
        }

        for (auto &weak : streams) {
            if (auto stream = weak.lock()) {
                stream->context.TryCancel();
            }
        }
        spdlog::debug("gRPC transport to {} closed", impl_->address);
    }

    TransportFactory grpc_transport_factory() {
        return [](const ChannelConfig &config) -> std::unique_ptr<Transport> {
            return std::make_unique<GrpcTransport>(config.address());
        };
    }

} // namespace enslink::rpc

#include <enslink/rpc/codec.hpp>
#include <enslink/rpc/executor.hpp>

#include "ensight.pb.h"

#include <spdlog/spdlog.h>

namespace enslink::rpc {

    namespace {

        ensightservice::PythonRequest::ExecType to_exec_type(ExecMode mode) {
            switch (mode) {
            case ExecMode::NoResult:
                return ensightservice::PythonRequest::EXEC_NO_RESULT;
            case ExecMode::Evaluated:
                return ensightservice::PythonRequest::EXEC_RETURN_PYTHON;
            case ExecMode::Structured:
                return ensightservice::PythonRequest::EXEC_RETURN_JSON;
            }
            return ensightservice::PythonRequest::EXEC_NO_RESULT;
        }

        std::vector<uint8_t> to_bytes(const std::string &value) { return {value.begin(), value.end()}; }

        constexpr const char *NOT_CONNECTED = "gRPC connection dropped: unable to connect";

    } // namespace

    NotificationStream::NotificationStream(std::unique_ptr<EventReader> reader) : reader_(std::move(reader)) {}

    Result<std::string> NotificationStream::next() {
        auto message = reader_->read();
        if (!message) {
            return message.error_as<std::string>();
        }

        ensightservice::EventReply reply;
        if (!codec::decode(message.value, reply)) {
            return Result<std::string>::io_error("Malformed event stream message");
        }
        return Result<std::string>::ok(reply.tag());
    }

    void NotificationStream::cancel() { reader_->cancel(); }

    Executor::Executor(Channel &channel) : channel_(channel) {}

    bool Executor::ensure_connected() {
        channel_.connect();
        return channel_.is_connected();
    }

    Result<CommandResult> Executor::execute(const std::string &command, ExecMode mode) {
        if (!ensure_connected()) {
            return Result<CommandResult>::io_error(NOT_CONNECTED);
        }

        ensightservice::PythonRequest request;
        request.set_type(to_exec_type(mode));
        request.set_command(command);

        auto response = channel_.call(methods::RUN_PYTHON, codec::encode(request));
        if (!response) {
            return response.error_as<CommandResult>();
        }

        ensightservice::PythonReply reply;
        if (!codec::decode(response.value, reply)) {
            return Result<CommandResult>::io_error("Malformed RunPython reply");
        }

        if (reply.error() < 0) {
            spdlog::debug("Remote execution of '{}' failed with code {}", command, reply.error());
            return Result<CommandResult>::remote_error();
        }

        CommandResult result;
        result.mode = mode;
        if (mode != ExecMode::NoResult) {
            result.text = reply.value();
        }
        return Result<CommandResult>::ok(std::move(result));
    }

    Result<std::vector<uint8_t>> Executor::render(const RenderOptions &options) {
        if (!ensure_connected()) {
            return Result<std::vector<uint8_t>>::io_error(NOT_CONNECTED);
        }

        ensightservice::RenderRequest request;
        request.set_type(options.png ? ensightservice::RenderRequest::IMAGE_PNG
                                     : ensightservice::RenderRequest::IMAGE_RAW);
        request.set_image_width(options.width);
        request.set_image_height(options.height);
        request.set_image_aa_passes(options.aa_passes);
        request.set_include_highlighting(options.highlighting);

        auto response = channel_.call(methods::RENDER_IMAGE, codec::encode(request));
        if (!response) {
            return response;
        }

        ensightservice::RenderReply reply;
        if (!codec::decode(response.value, reply)) {
            return Result<std::vector<uint8_t>>::io_error("Malformed RenderImage reply");
        }
        return Result<std::vector<uint8_t>>::ok(to_bytes(reply.value()));
    }

    Result<std::vector<uint8_t>> Executor::geometry() {
        if (!ensure_connected()) {
            return Result<std::vector<uint8_t>>::io_error(NOT_CONNECTED);
        }

        ensightservice::GeometryRequest request;
        request.set_type(ensightservice::GeometryRequest::GEOMETRY_GLB);

        auto response = channel_.call(methods::GET_GEOMETRY, codec::encode(request));
        if (!response) {
            return response;
        }

        ensightservice::GeometryReply reply;
        if (!codec::decode(response.value, reply)) {
            return Result<std::vector<uint8_t>>::io_error("Malformed GetGeometry reply");
        }
        return Result<std::vector<uint8_t>>::ok(to_bytes(reply.value()));
    }

    Result<std::unique_ptr<NotificationStream>> Executor::open_event_stream(const std::string &prefix) {
        using StreamResult = Result<std::unique_ptr<NotificationStream>>;

        if (!ensure_connected()) {
            return StreamResult::io_error(NOT_CONNECTED);
        }

        ensightservice::EventStreamRequest request;
        request.set_prefix(prefix);

        auto reader = channel_.open_stream(methods::GET_EVENT_STREAM, codec::encode(request));
        if (!reader) {
            return reader.error_as<std::unique_ptr<NotificationStream>>();
        }
        return StreamResult::ok(std::make_unique<NotificationStream>(std::move(reader.value)));
    }

} // namespace enslink::rpc

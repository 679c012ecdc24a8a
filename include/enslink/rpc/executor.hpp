#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <enslink/rpc/channel.hpp>
#include <enslink/utils/result.hpp>

namespace enslink::rpc {

    // How the remote interpreter treats a command string
    enum class ExecMode {
        NoResult,  // statement, nothing returned
        Evaluated, // expression, textual representation returned
        Structured // expression, JSON-encoded value returned
    };

    struct CommandResult {
        ExecMode mode{ExecMode::NoResult};
        std::string text; // empty for NoResult
    };

    struct RenderOptions {
        int width{640};
        int height{480};
        int aa_passes{1};
        bool png{true};
        bool highlighting{false};
    };

    // Decoded notification URLs from a server-push stream
    class NotificationStream {
      public:
        explicit NotificationStream(std::unique_ptr<EventReader> reader);

        // Blocks for the next notification; Io failure when the stream ends
        Result<std::string> next();

        // Unblocks a pending next() from another thread
        void cancel();

      private:
        std::unique_ptr<EventReader> reader_;
    };

    // Command executor
    // Every call connects on demand and performs no retry of its own.
    class Executor {
      public:
        explicit Executor(Channel &channel);

        Executor(const Executor &) = delete;
        Executor &operator=(const Executor &) = delete;

        // Io failure when the transport drops, Remote failure on a negative remote error code
        Result<CommandResult> execute(const std::string &command, ExecMode mode);

        Result<std::vector<uint8_t>> render(const RenderOptions &options = {});

        // Scene geometry as a GLB container
        Result<std::vector<uint8_t>> geometry();

        Result<std::unique_ptr<NotificationStream>> open_event_stream(const std::string &prefix);

        Channel &channel() { return channel_; }

      private:
        bool ensure_connected();

        Channel &channel_;
    };

} // namespace enslink::rpc

#pragma once

#include <string>
#include <utility>

namespace enslink {

    // Failure categories surfaced by the client
    enum class ErrorKind {
        None,
        Io,          // transport unreachable or dropped mid-call
        Remote,      // remote side reported a negative error code
        Precondition // duplicate/unknown tag, malformed input, bad state
    };

    inline const char *to_string(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Io:
            return "io";
        case ErrorKind::Remote:
            return "remote";
        case ErrorKind::Precondition:
            return "precondition";
        }
        return "unknown";
    }

    // Result type for operations
    template <typename T> struct Result {
        bool success{false};
        T value{};
        std::string error;
        ErrorKind kind{ErrorKind::None};

        static Result<T> ok(T val) { return Result<T>{true, std::move(val), "", ErrorKind::None}; }

        static Result<T> failure(ErrorKind kind, std::string err) {
            return Result<T>{false, T{}, std::move(err), kind};
        }

        static Result<T> io_error(std::string err) { return failure(ErrorKind::Io, std::move(err)); }

        static Result<T> remote_error(std::string err = "Remote execution error") {
            return failure(ErrorKind::Remote, std::move(err));
        }

        static Result<T> precondition(std::string err) { return failure(ErrorKind::Precondition, std::move(err)); }

        // Re-wrap a failure as another result type
        template <typename U> Result<U> error_as() const { return Result<U>::failure(kind, error); }

        explicit operator bool() const { return success; }
    };

    template <> struct Result<void> {
        bool success{false};
        std::string error;
        ErrorKind kind{ErrorKind::None};

        static Result<void> ok() { return Result<void>{true, "", ErrorKind::None}; }

        static Result<void> failure(ErrorKind kind, std::string err) {
            return Result<void>{false, std::move(err), kind};
        }

        static Result<void> io_error(std::string err) { return failure(ErrorKind::Io, std::move(err)); }

        static Result<void> remote_error(std::string err = "Remote execution error") {
            return failure(ErrorKind::Remote, std::move(err));
        }

        static Result<void> precondition(std::string err) { return failure(ErrorKind::Precondition, std::move(err)); }

        template <typename U> Result<U> error_as() const { return Result<U>::failure(kind, error); }

        explicit operator bool() const { return success; }
    };

} // namespace enslink

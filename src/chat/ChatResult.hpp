#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace chat
{

enum class ErrorKind
{
    Configuration,      // invalid client settings, rejected at construction
    UnsupportedFeature, // e.g. tool calls against a model family without them
    Transport,          // HTTP layer failure on submit or poll
    RemoteJob,          // job finished as failed or canceled
    MalformedResponse,  // payload missing fields or carrying an unknown status
    InvalidMessage,     // assistant message could not be built from the output
    PollTimeout,        // poll deadline or attempt budget exhausted
    Cancelled           // caller raised the cancel flag
};

const char* errorKindName(ErrorKind kind);

struct ChatError
{
    ErrorKind kind = ErrorKind::Transport;
    std::string message;

    bool operator==(const ChatError& other) const = default;
};

// Value-or-error returned by every fallible operation of the client.
template <typename T>
struct Result
{
    std::optional<T> value;
    std::optional<ChatError> error;

    static Result success(T v)
    {
        Result res;
        res.value = std::move(v);
        return res;
    }

    static Result failure(ChatError err)
    {
        Result res;
        res.error = std::move(err);
        return res;
    }

    static Result failure(ErrorKind kind, std::string message)
    {
        return failure(ChatError{ kind, std::move(message) });
    }

    bool ok() const { return value.has_value(); }

    explicit operator bool() const { return ok(); }

    bool operator==(const Result& other) const = default;
};

} // namespace chat

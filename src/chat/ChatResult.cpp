#include "ChatResult.hpp"

namespace chat
{

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::UnsupportedFeature:
        return "unsupported_feature";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::RemoteJob:
        return "remote_job";
    case ErrorKind::MalformedResponse:
        return "malformed_response";
    case ErrorKind::InvalidMessage:
        return "invalid_message";
    case ErrorKind::PollTimeout:
        return "poll_timeout";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace chat

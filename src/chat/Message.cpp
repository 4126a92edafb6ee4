#include "Message.hpp"

#include <utf8proc.h>

namespace chat
{

namespace
{

bool is_valid_utf8(const std::string& s)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(s.data());
    const auto len = static_cast<utf8proc_ssize_t>(s.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            return false;
        pos += bytes;
    }
    return true;
}

} // namespace

const char* roleToString(Role role)
{
    switch (role)
    {
    case Role::System:
        return "system";
    case Role::User:
        return "user";
    case Role::Assistant:
        return "assistant";
    }
    return "unknown";
}

std::optional<Role> roleFromString(std::string_view name)
{
    if (name == "system")
        return Role::System;
    if (name == "user")
        return Role::User;
    if (name == "assistant")
        return Role::Assistant;
    return std::nullopt;
}

const char* statusToString(MessageStatus status)
{
    switch (status)
    {
    case MessageStatus::Complete:
        return "complete";
    case MessageStatus::Cancelled:
        return "cancelled";
    case MessageStatus::Length:
        return "length";
    }
    return "unknown";
}

std::string formatFieldErrors(const std::vector<FieldError>& errors)
{
    std::string out;
    for (std::size_t i = 0; i < errors.size(); ++i)
    {
        if (i)
            out += ", ";
        out += errors[i].field;
        out += ": ";
        out += errors[i].message;
    }
    return out;
}

Result<Message> Message::create(Role role, std::string content, MessageStatus status)
{
    std::vector<FieldError> errors;
    if (!roleFromString(roleToString(role)))
        errors.push_back({ "role", "is invalid" });
    if (content.empty())
        errors.push_back({ "content", "can't be blank" });
    else if (!is_valid_utf8(content))
        errors.push_back({ "content", "is invalid" });

    if (!errors.empty())
        return Result<Message>::failure(ErrorKind::InvalidMessage, formatFieldErrors(errors));

    Message msg;
    msg.role = role;
    msg.content = std::move(content);
    msg.status = status;
    return Result<Message>::success(std::move(msg));
}

Message Message::system(std::string content)
{
    return Message{ Role::System, std::move(content), MessageStatus::Complete };
}

Message Message::user(std::string content)
{
    return Message{ Role::User, std::move(content), MessageStatus::Complete };
}

Message Message::assistant(std::string content)
{
    return Message{ Role::Assistant, std::move(content), MessageStatus::Complete };
}

} // namespace chat

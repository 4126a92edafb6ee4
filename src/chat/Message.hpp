#pragma once

#include "ChatResult.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chat
{

enum class Role
{
    System,
    User,
    Assistant
};

enum class MessageStatus
{
    Complete,
    Cancelled,
    Length
};

const char* roleToString(Role role);
std::optional<Role> roleFromString(std::string_view name);
const char* statusToString(MessageStatus status);

struct FieldError
{
    std::string field;
    std::string message;
};

// Renders field errors as "field: message, field: message".
std::string formatFieldErrors(const std::vector<FieldError>& errors);

struct Message
{
    static constexpr const char* kDefaultSystemPrompt = "You are a helpful assistant.";

    Role role = Role::User;
    std::string content;
    MessageStatus status = MessageStatus::Complete;

    bool operator==(const Message& other) const = default;

    // Validated construction; failure kind is InvalidMessage.
    static Result<Message> create(Role role, std::string content, MessageStatus status = MessageStatus::Complete);

    static Message system(std::string content = kDefaultSystemPrompt);
    static Message user(std::string content);
    static Message assistant(std::string content);
};

using ChatResult = Result<Message>;
using ResultObserver = std::function<void(const ChatResult&)>;

// Tool/function descriptor. The Replicate client only checks whether any were supplied.
struct ToolDescriptor
{
    std::string name;
    std::string description;
};

} // namespace chat

#include "ChatReplicate.hpp"

#include "CallbackDispatcher.hpp"
#include "PromptRenderer.hpp"
#include "ResponseNormalizer.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace replicate
{

namespace
{

// Errors that mean the prediction finished remotely; the observer sees these too.
bool reached_terminal_state(const chat::ChatError& error)
{
    return error.kind == chat::ErrorKind::RemoteJob || error.kind == chat::ErrorKind::InvalidMessage;
}

} // namespace

chat::Result<ChatReplicate> ChatReplicate::create(ReplicateConfig cfg, std::shared_ptr<IPredictionBackend> backend)
{
    auto validated = ReplicateConfig::create(std::move(cfg));
    if (!validated)
    {
        PLOG_WARNING << "invalid Replicate configuration: " << validated.error->message;
        return chat::Result<ChatReplicate>::failure(*validated.error);
    }

    if (!backend)
        backend = std::make_shared<HttpPredictionBackend>();

    return chat::Result<ChatReplicate>::success(ChatReplicate(std::move(*validated.value), std::move(backend)));
}

ChatReplicate::ChatReplicate(ReplicateConfig cfg, std::shared_ptr<IPredictionBackend> backend)
    : cfg_(std::move(cfg))
    , backend_(std::move(backend))
{
}

nlohmann::json ChatReplicate::forApi(const std::vector<chat::Message>& messages) const
{
    return PromptRenderer::buildPredictionBody(cfg_, PromptRenderer::renderPrompt(messages));
}

chat::ChatResult ChatReplicate::call(const std::vector<chat::Message>& messages,
                                     const std::vector<chat::ToolDescriptor>& tools,
                                     const chat::ResultObserver& observer, std::atomic<bool>* cancel_flag)
{
    if (!tools.empty())
    {
        PLOG_ERROR << kToolsUnsupportedMessage << " (" << tools.size() << " supplied)";
        return chat::ChatResult::failure(chat::ErrorKind::UnsupportedFeature, kToolsUnsupportedMessage);
    }

    RenderedPrompt rendered;
    try
    {
        rendered = PromptRenderer::renderPrompt(messages);
    }
    catch (const std::invalid_argument& ex)
    {
        return chat::ChatResult::failure(chat::ErrorKind::InvalidMessage, ex.what());
    }

    auto job_id = backend_->submit(cfg_, rendered, cancel_flag);
    if (!job_id)
        return chat::ChatResult::failure(*job_id.error);

    auto terminal = backend_->await(cfg_, *job_id.value, cancel_flag);
    if (!terminal)
    {
        auto failure = chat::ChatResult::failure(*terminal.error);
        if (reached_terminal_state(*terminal.error))
            CallbackDispatcher::dispatch(failure, observer);
        else
            PLOG_WARNING << "prediction " << *job_id.value << " was not observed to finish: "
                         << terminal.error->message;
        return failure;
    }

    auto result = ResponseNormalizer::normalize(*terminal.value);
    if (!result)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Protocol, "Could not build assistant message",
                                            result.error->message);
    }

    CallbackDispatcher::dispatch(result, observer);
    return result;
}

chat::ChatResult ChatReplicate::call(const std::string& prompt, const std::vector<chat::ToolDescriptor>& tools,
                                     const chat::ResultObserver& observer, std::atomic<bool>* cancel_flag)
{
    const std::vector<chat::Message> messages{ chat::Message::system(), chat::Message::user(prompt) };
    return call(messages, tools, observer, cancel_flag);
}

chat::Result<std::string> ChatReplicate::latestVersion(const std::string& model_id)
{
    return backend_->latestVersion(cfg_, model_id);
}

} // namespace replicate

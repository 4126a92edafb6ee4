#include "CallbackDispatcher.hpp"

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <exception>

namespace replicate
{

void CallbackDispatcher::dispatch(const chat::ChatResult& result, const chat::ResultObserver& observer)
{
    if (!observer)
        return;

    PLOG_DEBUG << "dispatching " << (result.ok() ? "message" : "error") << " to result observer";
    try
    {
        observer(result);
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Callback, "Result observer threw an exception",
                                            ex.what());
    }
    catch (...)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Callback, "Result observer threw an exception",
                                            "non-standard exception");
    }
}

} // namespace replicate

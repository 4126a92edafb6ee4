#pragma once

#include "chat/Message.hpp"

namespace replicate
{

class CallbackDispatcher
{
public:
    // Invokes observer once with result. An empty observer is a no-op.
    // Anything thrown by the observer is reported and never reaches the caller.
    static void dispatch(const chat::ChatResult& result, const chat::ResultObserver& observer);
};

} // namespace replicate

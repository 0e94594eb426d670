#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace PandaPrint {

// Fire and forget command channel to a printer.
class CommandPublisher
{
public:
    virtual ~CommandPublisher() = default;

    // Never blocks on the network and reports nothing back.
    virtual void publish(const std::string& topic, const nlohmann::json& payload) = 0;
    virtual void shutdown()                                                       = 0;
};

} // namespace PandaPrint

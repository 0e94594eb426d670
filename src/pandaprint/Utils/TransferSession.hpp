#pragma once

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace PandaPrint {

// A file transfer session to a printer. Errors are reported as TransferError.
class TransferSession
{
public:
    virtual ~TransferSession() = default;

    virtual void connect(const std::string& host, unsigned short port, std::chrono::seconds timeout) = 0;
    virtual void login(const std::string& user, const std::string& password)                          = 0;
    virtual void enable_private_data_protection()                                                     = 0;
    // Overwrites the remote file.
    virtual void store_binary(const std::string& remote_path, std::istream& content)  = 0;
    virtual void retrieve_binary(const std::string& remote_path, std::ostream& out)   = 0;
    // Ends the session. Called by implementations' destructors when not done explicitly.
    virtual void quit() = 0;
};

using TransferSessionFactory = std::function<std::unique_ptr<TransferSession>()>;

} // namespace PandaPrint

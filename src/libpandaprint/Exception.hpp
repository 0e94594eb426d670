#ifndef pandaprint_Exception_hpp_
#define pandaprint_Exception_hpp_

#include <stdexcept>
#include <string>

namespace PandaPrint {

// Base for the relay's own exceptions.
class Exception : public std::runtime_error { using std::runtime_error::runtime_error; };
#define PANDAPRINT_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { using PARENT_EXCEPTION::PARENT_EXCEPTION; }
PANDAPRINT_DERIVE_EXCEPTION(RuntimeError,          Exception);
PANDAPRINT_DERIVE_EXCEPTION(LogicError,            Exception);
PANDAPRINT_DERIVE_EXCEPTION(InvalidArgument,       LogicError);
PANDAPRINT_DERIVE_EXCEPTION(ConfigError,           InvalidArgument);
PANDAPRINT_DERIVE_EXCEPTION(IOError,               Exception);
// Uploaded data is not a readable ZIP archive. Reported to the client as 400.
PANDAPRINT_DERIVE_EXCEPTION(MalformedArchiveError, InvalidArgument);
// Requested device is not in the registry. Reported to the client as 404.
PANDAPRINT_DERIVE_EXCEPTION(UnknownDeviceError,    InvalidArgument);
// File transfer to the printer failed. Fatal for the current upload.
PANDAPRINT_DERIVE_EXCEPTION(TransferError,         IOError);
#undef PANDAPRINT_DERIVE_EXCEPTION

// The FTP server answered with an unexpected reply. what() is the reply text verbatim.
class FtpReplyError : public TransferError
{
public:
    FtpReplyError(int code, const std::string& text) : TransferError(text), m_code(code) {}

    int code() const { return m_code; }
    // 4xx replies are transient, 5xx are permanent.
    bool is_permanent() const { return m_code >= 500 && m_code < 600; }

private:
    int m_code;
};

} // namespace PandaPrint

#endif // pandaprint_Exception_hpp_

#ifndef pandaprint_PrintUploader_hpp_
#define pandaprint_PrintUploader_hpp_

#include "TransferSession.hpp"

#include <chrono>
#include <iosfwd>
#include <string>

namespace PandaPrint {

class BambuMachine;

// Sends an uploaded print package to a printer: one file per plate over FTPS,
// then optionally the command starting the first one.
class PrintUploader
{
public:
    static constexpr std::chrono::seconds TRANSFER_TIMEOUT{30};

    explicit PrintUploader(TransferSessionFactory session_factory = ftps_session_factory());

    // Returns the name of the first file stored on the printer.
    // Throws MalformedArchiveError for packages without plates or unreadable
    // packages, TransferError when a file cannot be stored.
    std::string upload(BambuMachine& machine, const std::string& filename, std::istream& content, bool do_print);
    std::string upload(BambuMachine& machine, const std::string& filename, const std::string& archive, bool do_print);

    static TransferSessionFactory ftps_session_factory();

private:
    TransferSessionFactory m_session_factory;
};

} // namespace PandaPrint

#endif // pandaprint_PrintUploader_hpp_

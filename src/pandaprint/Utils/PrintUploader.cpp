#include "PrintUploader.hpp"
#include "BambuMachine.hpp"
#include "FTPS.hpp"
#include "PrintCommand.hpp"

#include "libpandaprint/Exception.hpp"
#include "libpandaprint/Utils.hpp"
#include "libpandaprint/Format/PlateArchive.hpp"

#include <iterator>
#include <sstream>

namespace PandaPrint {

PrintUploader::PrintUploader(TransferSessionFactory session_factory) : m_session_factory(std::move(session_factory)) {}

TransferSessionFactory PrintUploader::ftps_session_factory()
{
    return []() -> std::unique_ptr<TransferSession> { return std::make_unique<FTPS>(); };
}

std::string PrintUploader::upload(BambuMachine& machine, const std::string& filename, std::istream& content, bool do_print)
{
    std::string archive{std::istreambuf_iterator<char>(content), std::istreambuf_iterator<char>()};
    if (content.bad())
        throw IOError("Cannot read upload " + filename);
    return upload(machine, filename, archive, do_print);
}

std::string PrintUploader::upload(BambuMachine& machine, const std::string& filename, const std::string& archive, bool do_print)
{
    if (filename.empty())
        throw InvalidArgument("Upload has no filename");

    const PrinterConfig& printer = machine.config();
    BOOST_LOG_TRIVIAL(info) << boost::format("PrintUploader - %1%: received %2% (%3% bytes), print: %4%") % printer.name %
                                   filename % archive.size() % do_print;

    auto plates = split_plates(archive, filename);
    if (plates.empty())
        throw MalformedArchiveError(filename + " contains no plate machine code");

    std::string first_filename;
    {
        std::unique_ptr<TransferSession> session = m_session_factory();
        session->connect(printer.host, printer.ftp_port, TRANSFER_TIMEOUT);
        session->login(PRINTER_USERNAME, printer.key);
        session->enable_private_data_protection();
        for (const auto& plate : plates) {
            if (first_filename.empty())
                first_filename = plate.filename;
            std::istringstream stream(plate.content);
            session->store_binary("/model/" + plate.filename, stream);
        }
        session->quit();
    }

    if (do_print) {
        const std::string topic = printer_request_topic(printer.serial);
        BOOST_LOG_TRIVIAL(info) << boost::format("PrintUploader - %1%: starting %2%") % printer.name % first_filename;
        machine.mqtt().publish(topic, make_print_command(first_filename, printer.print_options));
    }
    return first_filename;
}

} // namespace PandaPrint

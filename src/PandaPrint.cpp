#include "libpandaprint/Exception.hpp"
#include "libpandaprint/PandaConfig.hpp"
#include "libpandaprint/Utils.hpp"
#include "pandaprint/Server/HttpServer.hpp"
#include "pandaprint/Server/MachineRegistry.hpp"
#include "pandaprint/Server/PrintAPI.hpp"
#include "pandaprint/Utils/PrintUploader.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>

using namespace PandaPrint;
namespace po = boost::program_options;
namespace fs = boost::filesystem;

int main(int argc, char* argv[])
{
    po::options_description desc("PandaPrint, OctoPrint upload relay for Bambu Lab printers\nUsage: pandaprint <config_file> [options]");
    // clang-format off
    desc.add_options()("help,h", "help")
    ("config_file", po::value<std::string>(), "Configuration file (YAML)")
    ("log-level,l", po::value<unsigned int>()->default_value(3), "Log level, 0 fatal to 5 trace. Default is 3 (info).")
    ("log-file", po::value<std::string>(), "Also write the log to this file, rotated at 100 MB");
    // clang-format on
    po::positional_options_description positional;
    positional.add("config_file", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    if (!vm.count("config_file")) {
        std::cerr << "Error: missing config_file\n" << desc << "\n";
        return 1;
    }

    const std::string  config_file = vm["config_file"].as<std::string>();
    const unsigned int log_level   = vm["log-level"].as<unsigned int>();
    if (!fs::exists(config_file) || !fs::is_regular_file(config_file)) {
        std::cerr << "Error: " << config_file << " is not a file\n";
        return 1;
    }

    init_console_log(log_level);
    if (vm.count("log-file"))
        set_log_path_and_level(vm["log-file"].as<std::string>(), log_level);

    try {
        PandaConfig config;
        config.load_from_file(config_file);

        MachineRegistry registry(config.printers);
        PrintUploader   uploader;
        PrintAPI        api(registry, uploader);
        HttpServer      server(api, config.listen_address, config.listen_port, config.threads);

        // Registered before the listener starts so a signal during startup still stops the server.
        net::io_context signals_ioc;
        net::signal_set signals(signals_ioc, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
            if (!ec)
                BOOST_LOG_TRIVIAL(info) << "PandaPrint - received signal " << signal_number << ", shutting down";
        });

        server.start();
        signals_ioc.run();

        server.stop();
        registry.shutdown_all();
    } catch (const ConfigError& e) {
        BOOST_LOG_TRIVIAL(fatal) << "PandaPrint - configuration error: " << e.what();
        flush_logs();
        return 2;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(fatal) << "PandaPrint - " << e.what();
        flush_logs();
        return 1;
    }

    flush_logs();
    return 0;
}

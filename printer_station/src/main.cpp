#include <csignal>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include "identifier.hpp"
#include "logger.hpp"
#include "preview_server.hpp"
#include "printer_service.hpp"
#include "settings.hpp"
#include "tcp_prober.hpp"
#include "version.hpp"

#define DEFAULT_USER_NAME   "station"
#define DEFAULT_USER_ROLE   "admin"

namespace {

volatile sig_atomic_t stop_requested = 0;

void handle_signal(int)
{
    stop_requested = 1;
}

bool read_file(const std::string &path, std::string &content)
{
    std::ifstream file(path);
    if (!file)
        return false;

    std::stringstream ss;
    ss << file.rdbuf();
    content = ss.str();
    return true;
}

}

static void print_help(char *program_name)
{
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "    --config <path>                   Read settings from path (default " DEFAULT_CONFIG_PATH ")\n"
              << "    --discover                        List printers\n"
              << "    --connect <address>               Connect to host:port or Bluetooth MAC\n"
              << "    --print <file>                    Print file content\n"
              << "    --report <file>                   Print nightly report\n"
              << "    --user <name>                     User named on the report\n"
              << "    --role <role>                     Role of the user\n"
              << "    --version, -v                     Print version\n"
              << "    --help, -h                        Print help\n"
              << std::flush;
}

static void wait_ms(unsigned int ms)
{
    struct timespec req, rem;
    req.tv_sec = ms / 1000;
    req.tv_nsec = (ms - req.tv_sec * 1000) * 1000 * 1000;
    while (nanosleep(&req, &rem) && !stop_requested)
        req = rem;
}

int main(int argc, char **argv)
{
    char *program_name = argv[0];
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool config_given = false;
    bool discover = false;
    std::string connect_address;
    std::string print_path;
    std::string report_path;
    std::string user_name = DEFAULT_USER_NAME;
    std::string user_role = DEFAULT_USER_ROLE;

    argc--;
    argv++;
    while (argc) {
        std::string opt(argv[0]);
        if (opt == "--config" && argc >= 2) {
            config_path = argv[1];
            config_given = true;
            argc--;
            argv++;
        } else if (opt == "--discover") {
            discover = true;
        } else if (opt == "--connect" && argc >= 2) {
            connect_address = argv[1];
            argc--;
            argv++;
        } else if (opt == "--print" && argc >= 2) {
            print_path = argv[1];
            argc--;
            argv++;
        } else if (opt == "--report" && argc >= 2) {
            report_path = argv[1];
            argc--;
            argv++;
        } else if (opt == "--user" && argc >= 2) {
            user_name = argv[1];
            argc--;
            argv++;
        } else if (opt == "--role" && argc >= 2) {
            user_role = argv[1];
            argc--;
            argv++;
        } else if (opt == "--help" || opt == "-h") {
            print_help(program_name);
            return 0;
        } else if (opt == "--version" || opt == "-v") {
            std::cout << get_version_str() << std::endl;
            return 0;
        } else {
            std::cerr << "Invalid option: \"" << opt << '\"' << std::endl;
            print_help(program_name);
            return -1;
        }

        argc--;
        argv++;
    }

    Settings settings;
    if (!settings.load(config_path) && config_given)
        return -1;

    Logger::instance().setLevel(settings.log_level);
    if (!settings.log_dir.empty())
        Logger::instance().startLogging(settings.log_dir);
    {
        std::stringstream ss;
        ss << program_name << " (version: " << get_version_str() <<  ") started";
        Logger::info(ss.str());
    }

    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    ProbeTimeouts timeouts;
    timeouts.attempt_ms = settings.attempt_timeout_ms;
    timeouts.handshake_ms = settings.handshake_timeout_ms;
    timeouts.endpoint_ms = settings.endpoint_timeout_ms;
    timeouts.raw_ms = settings.raw_timeout_ms;

    Identifier identifier;
    TcpProber prober(identifier, settings.capabilities.probe_strategy, timeouts);

    std::unique_ptr<RfcommAdapter> adapter;
    if (settings.capabilities.supports_bluetooth)
        adapter.reset(new RfcommAdapter(settings.bluetooth_device));

    PrinterService service(settings, prober, adapter.get());

    std::unique_ptr<PreviewServer> preview;
    if (settings.capabilities.preview_only) {
        preview.reset(new PreviewServer(settings.preview_port));
        try {
            preview->start();
        } catch (const std::runtime_error &) {
            Logger::instance().stopLogging();
            return -1;
        }
        service.setPreviewPublisher(std::bind(&PreviewServer::publish, preview.get(), std::placeholders::_1));
    }

    int ret = 0;

    if (discover) {
        std::vector<PrinterDevice> devices = service.discoverPrinters();
        if (devices.empty())
            std::cout << "No printer found" << std::endl;
        for (auto &device : devices) {
            std::cout << device.name << '\t' << transport_to_string(device.transport)
                      << '\t' << device.address << std::endl;
        }
        if (preview)
            preview->setPrinters(devices);
    }

    if (!connect_address.empty()) {
        PrinterDevice device;
        try {
            if (!service.findPrinter(connect_address, device) || !service.connectToPrinter(device))
                ret = -1;
        } catch (const UnsupportedTransportError &e) {
            Logger::err(e.what());
            ret = -1;
        }
    }

    std::string content;
    if (ret == 0 && !report_path.empty()) {
        NightlyReport report;
        if (load_report(report_path, report))
            content = service.formatReceiptContent(report, user_name, user_role);
        else
            ret = -1;
    }

    if (ret == 0 && !print_path.empty()) {
        std::string text;
        if (read_file(print_path, text)) {
            content += text;
        } else {
            std::stringstream ss;
            ss << "Could not read file " << print_path;
            Logger::err(ss.str());
            ret = -1;
        }
    }

    if (ret == 0 && !content.empty()) {
        try {
            if (!service.printReceipt(content))
                ret = -1;
        } catch (const NoPrinterConnectedError &) {
            Logger::err("Cannot print: no printer connected, use --connect");
            ret = -1;
        }
    }

    if (preview) {
        Logger::info("Serving print preview, press Ctrl+C to quit");
        while (!stop_requested)
            wait_ms(200);
        preview->stop();
    }

    service.disconnectPrinter();
    Logger::info("Stopped");
    Logger::instance().stopLogging();

    return ret;
}

#include "printer_service.hpp"
#include "logger.hpp"
#include "topology.hpp"
#include <functional>
#include <sstream>
#include <stdexcept>

PrinterService::PrinterService(const Settings &settings, Prober &prober,
                               BluetoothAdapter *adapter, const TimeSource &clock):
m_prober(prober),
m_subnets(settings.subnets.empty() ? default_subnets() : settings.subnets),
m_ports(settings.ports.empty() ? default_ports() : make_port_list(settings.ports)),
m_scan_mutex(),
m_scheduler(prober, settings.batch_size, settings.batch_delay_ms),
m_cache(settings.cache_ttl_s),
m_bluetooth(settings.capabilities, adapter),
m_connection(settings.capabilities, adapter, settings.connect_timeout_ms),
m_encoder(clock, settings.credit_card_fee_percent)
{

}

std::vector<PrinterDevice> PrinterService::discoverPrinters()
{
    try {
        return m_cache.get(std::bind(&PrinterService::sweep, this));
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Printer discovery failed: " << e.what();
        Logger::err(ss.str());
    }

    return std::vector<PrinterDevice>();
}

bool PrinterService::connectToPrinter(const PrinterDevice &device)
{
    return m_connection.connect(device);
}

bool PrinterService::printReceipt(const std::string &content)
{
    return m_connection.print(content);
}

void PrinterService::disconnectPrinter()
{
    m_connection.disconnect();
}

bool PrinterService::getConnectedPrinter(PrinterDevice &device) const
{
    return m_connection.connectedPrinter(device);
}

std::string PrinterService::formatReceiptContent(const NightlyReport &report,
                                                 const std::string &user_name,
                                                 const std::string &user_role) const
{
    return m_encoder.formatReceiptContent(report, user_name, user_role);
}

std::string PrinterService::formatForPrintPreview(const std::string &text)
{
    return ReceiptEncoder::formatForPrintPreview(text);
}

bool PrinterService::findPrinter(const std::string &address, PrinterDevice &device)
{
    ScanResult cached;
    if (m_cache.peek(cached)) {
        for (auto &d : cached.devices) {
            if (d.address == address) {
                device = d;
                return true;
            }
        }
    }

    if (is_bluetooth_address(address)) {
        device = make_bluetooth_device(address, address);
        return true;
    }

    std::string host;
    uint16_t port;
    if (!split_address(address, host, port)) {
        std::stringstream ss;
        ss << "Invalid printer address " << address;
        Logger::err(ss.str());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_scan_mutex);
    std::vector<PortCandidate> candidates = make_port_list(std::vector<uint16_t>(1, port));
    if (!m_prober.checkAddress(host, candidates[0], device)) {
        std::stringstream ss;
        ss << "No printer answers at " << address;
        Logger::warn(ss.str());
        return false;
    }

    return true;
}

void PrinterService::clearCache()
{
    m_cache.clear();
}

BatchStats PrinterService::scanStats() const
{
    return m_scheduler.stats();
}

unsigned int PrinterService::sweepCount() const
{
    return m_cache.sweepCount();
}

void PrinterService::setPreviewPublisher(const PreviewPublisher &publisher)
{
    m_connection.setPreviewPublisher(publisher);
}

std::vector<PrinterDevice> PrinterService::sweep()
{
    std::vector<PrinterDevice> devices;

    {
        std::stringstream ss;
        ss << "Sweeping " << m_subnets.size() << " subnets on " << m_ports.size() << " ports";
        Logger::info(ss.str());
    }

    {
        std::lock_guard<std::mutex> lock(m_scan_mutex);
        m_scheduler.resetStats();
        devices = m_scheduler.sweep(m_subnets, default_host_suffixes(), m_ports);
    }

    std::vector<PrinterDevice> paired = m_bluetooth.enumerate();
    devices.insert(devices.end(), paired.begin(), paired.end());

    return devices;
}

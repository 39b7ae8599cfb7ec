#ifndef PRINTER_SERVICE_HPP
#define PRINTER_SERVICE_HPP

#include "batch_scheduler.hpp"
#include "bluetooth.hpp"
#include "connection_manager.hpp"
#include "device_cache.hpp"
#include "printer_device.hpp"
#include "prober.hpp"
#include "receipt_encoder.hpp"
#include "settings.hpp"
#include <mutex>
#include <string>
#include <vector>

/*
 * Receipt printer access of the station: discovery, the connected
 * printer and receipt rendering.
 */
class PrinterService {
public:
    PrinterService(const Settings &settings, Prober &prober,
                   BluetoothAdapter *adapter = NULL,
                   const TimeSource &clock = TimeSource());

    /**
     * @brief Printers on the network and paired Bluetooth printers.
     *
     * Served from cache when the last sweep is recent and found
     * something. Never throws, failures give an empty list.
     */
    std::vector<PrinterDevice> discoverPrinters();

    /**
     * @throws UnsupportedTransportError for Bluetooth printers when
     * Bluetooth is not supported
     */
    bool connectToPrinter(const PrinterDevice &device);

    /**
     * @throws NoPrinterConnectedError when no printer is connected
     */
    bool printReceipt(const std::string &content);

    void disconnectPrinter();
    bool getConnectedPrinter(PrinterDevice &device) const;

    std::string formatReceiptContent(const NightlyReport &report,
                                     const std::string &user_name,
                                     const std::string &user_role) const;
    static std::string formatForPrintPreview(const std::string &text);

    /**
     * @brief Resolve an address typed by the operator: a Bluetooth MAC
     * or host:port, the latter probed directly.
     */
    bool findPrinter(const std::string &address, PrinterDevice &device);

    void clearCache();
    BatchStats scanStats() const;
    unsigned int sweepCount() const;

    void setPreviewPublisher(const PreviewPublisher &publisher);

private:
    std::vector<PrinterDevice> sweep();

    Prober &m_prober;
    std::vector<std::string> m_subnets;
    std::vector<PortCandidate> m_ports;

    mutable std::mutex m_scan_mutex;
    BatchScheduler m_scheduler;
    DeviceCache m_cache;
    BluetoothEnumerator m_bluetooth;
    ConnectionManager m_connection;
    ReceiptEncoder m_encoder;
};

#endif

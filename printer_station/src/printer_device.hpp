#ifndef PRINTER_DEVICE_HPP
#define PRINTER_DEVICE_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

enum PrinterTransport {
    TRANSPORT_NETWORK,
    TRANSPORT_BLUETOOTH,
};

struct PrinterDevice {
    PrinterDevice();

    std::string id;
    std::string name;
    PrinterTransport transport;
    std::string address;        /* host:port or Bluetooth MAC */
    bool connected;
};

/* Devices found by one sweep */
struct ScanResult {
    std::vector<PrinterDevice> devices;
    std::chrono::steady_clock::time_point timestamp;
};

std::string transport_to_string(PrinterTransport transport);

std::string make_network_address(const std::string &host, uint16_t port);

/**
 * @brief Split "host:port"
 *
 * @return false if address has no valid port
 */
bool split_address(const std::string &address, std::string &host, uint16_t &port);

/**
 * @brief Dedup key of a device: host part for network devices,
 * full address for Bluetooth devices.
 */
std::string device_host(const PrinterDevice &device);

PrinterDevice make_network_device(const std::string &host, uint16_t port, const std::string &name);
PrinterDevice make_bluetooth_device(const std::string &mac, const std::string &name);

bool is_bluetooth_address(const std::string &address);

/* Keep the first device of each host, preserving order */
void dedup_by_host(std::vector<PrinterDevice> &devices);

#endif

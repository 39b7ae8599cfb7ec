#ifndef BLUETOOTH_HPP
#define BLUETOOTH_HPP

#include "capabilities.hpp"
#include "printer_device.hpp"
#include <string>
#include <vector>

#define DEFAULT_RFCOMM_DEVICE   "/dev/rfcomm0"

struct BluetoothPeer {
    std::string address;    /* MAC, e.g. 00:11:22:33:44:55 */
    std::string name;
};

/*
 * Platform Bluetooth access. One serial channel at most is open.
 */
class BluetoothAdapter {
public:
    virtual ~BluetoothAdapter() = default;

    /* Adapter present and powered */
    virtual bool available() = 0;

    virtual bool pairedDevices(std::vector<BluetoothPeer> &peers) = 0;

    /* Open the serial channel to a paired device, closing any previous one */
    virtual bool open(const std::string &address) = 0;
    virtual bool write(const std::string &data) = 0;
    virtual void close() = 0;
};

/*
 * BlueZ adapter: paired devices are listed by bluetoothctl and data is
 * sent through an RFCOMM serial device node.
 */
class RfcommAdapter : public BluetoothAdapter {
public:
    explicit RfcommAdapter(const std::string &device_node = DEFAULT_RFCOMM_DEVICE);
    ~RfcommAdapter();

    bool available() override;
    bool pairedDevices(std::vector<BluetoothPeer> &peers) override;
    bool open(const std::string &address) override;
    bool write(const std::string &data) override;
    void close() override;

private:
    bool openNode();

    std::string m_node;
    std::string m_address;
    int m_fd;
};

/* Parse "Device <MAC> <name>" lines printed by bluetoothctl */
std::vector<BluetoothPeer> parse_paired_devices(const std::string &output);

/* Name heuristic: printer, receipt, pos and common printer brands/models */
bool is_bluetooth_printer_name(const std::string &name);

/*
 * Lists paired Bluetooth printers. Empty when Bluetooth is not supported
 * by the runtime or not available.
 */
class BluetoothEnumerator {
public:
    BluetoothEnumerator(const TransportCapabilities &capabilities, BluetoothAdapter *adapter);

    std::vector<PrinterDevice> enumerate();

private:
    TransportCapabilities m_capabilities;
    BluetoothAdapter *m_adapter;
};

#endif

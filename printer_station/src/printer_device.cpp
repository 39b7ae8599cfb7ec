#include "printer_device.hpp"
#include <cctype>
#include <cstdlib>
#include <set>
#include <sstream>
#include <string>

PrinterDevice::PrinterDevice():
id(),
name(),
transport(TRANSPORT_NETWORK),
address(),
connected(false)
{

}

std::string transport_to_string(PrinterTransport transport)
{
    switch (transport) {
    case TRANSPORT_NETWORK: return "network";
    case TRANSPORT_BLUETOOTH: return "bluetooth";
    default: return "unknown";
    }
}

std::string make_network_address(const std::string &host, uint16_t port)
{
    std::stringstream ss;
    ss << host << ':' << port;
    return ss.str();
}

bool split_address(const std::string &address, std::string &host, uint16_t &port)
{
    size_t pos = address.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= address.length())
        return false;

    std::string port_str = address.substr(pos + 1);
    for (unsigned int i = 0; i < port_str.length(); ++i) {
        if (!isdigit(static_cast<unsigned char>(port_str[i])))
            return false;
    }

    unsigned long value = strtoul(port_str.c_str(), NULL, 10);
    if (value == 0 || value > 65535)
        return false;

    host = address.substr(0, pos);
    port = static_cast<uint16_t>(value);
    return true;
}

std::string device_host(const PrinterDevice &device)
{
    if (device.transport == TRANSPORT_BLUETOOTH)
        return device.address;

    size_t pos = device.address.rfind(':');
    if (pos == std::string::npos)
        return device.address;

    return device.address.substr(0, pos);
}

PrinterDevice make_network_device(const std::string &host, uint16_t port, const std::string &name)
{
    PrinterDevice device;

    std::stringstream id;
    id << "ethernet-" << host << '-' << port;
    device.id = id.str();
    device.name = name;
    device.transport = TRANSPORT_NETWORK;
    device.address = make_network_address(host, port);
    device.connected = false;

    return device;
}

PrinterDevice make_bluetooth_device(const std::string &mac, const std::string &name)
{
    PrinterDevice device;

    device.id = "bluetooth-" + mac;
    device.name = name;
    device.transport = TRANSPORT_BLUETOOTH;
    device.address = mac;
    device.connected = false;

    return device;
}

/* XX:XX:XX:XX:XX:XX */
bool is_bluetooth_address(const std::string &address)
{
    if (address.length() != 17)
        return false;

    for (unsigned int i = 0; i < address.length(); ++i) {
        if (i % 3 == 2) {
            if (address[i] != ':')
                return false;
        } else if (!isxdigit(static_cast<unsigned char>(address[i]))) {
            return false;
        }
    }

    return true;
}

void dedup_by_host(std::vector<PrinterDevice> &devices)
{
    std::set<std::string> hosts;

    auto itor = devices.begin();
    while (itor != devices.end()) {
        if (hosts.insert(device_host(*itor)).second)
            ++itor;
        else
            itor = devices.erase(itor);
    }
}

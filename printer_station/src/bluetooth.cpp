#include "bluetooth.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sstream>
#include <termios.h>
#include <unistd.h>

#define RFCOMM_CHANNEL  (1)

namespace {

const char *PRINTER_KEYWORDS[] = {
    "printer",
    "receipt",
    "pos",
    "star",
    "epson",
    "citizen",
    "bixolon",
    "tsp",
    "tm-",
    "rp-",
    "ct-",
    "srp-",
    "spp-",
};

bool run_command(const std::string &cmd, std::string &output)
{
    std::array<char, 256> buffer;
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe)
        return false;

    output.clear();
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr)
        output += buffer.data();

    return true;
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [] (unsigned char c){ return std::tolower(c); });
    return s;
}

}

RfcommAdapter::RfcommAdapter(const std::string &device_node):
m_node(device_node),
m_address(),
m_fd(-1)
{

}

RfcommAdapter::~RfcommAdapter()
{
    close();
}

bool RfcommAdapter::available()
{
    std::string output;
    if (!run_command("bluetoothctl show 2>/dev/null", output))
        return false;

    return output.find("Powered: yes") != std::string::npos;
}

bool RfcommAdapter::pairedDevices(std::vector<BluetoothPeer> &peers)
{
    std::string output;
    if (!run_command("bluetoothctl devices Paired 2>/dev/null", output))
        return false;

    peers = parse_paired_devices(output);
    return true;
}

bool RfcommAdapter::open(const std::string &address)
{
    close();

    /* Both end up on a command line */
    if (!is_bluetooth_address(address)) {
        std::stringstream ss;
        ss << "Invalid Bluetooth address " << address;
        Logger::err(ss.str());
        return false;
    }
    if (m_node.compare(0, 5, "/dev/") != 0 || m_node.find_first_of(" ;&|$`'\"") != std::string::npos) {
        std::stringstream ss;
        ss << "Invalid RFCOMM device " << m_node;
        Logger::err(ss.str());
        return false;
    }

    {
        std::stringstream cmd;
        cmd << "rfcomm release " << m_node << " 2>/dev/null; rfcomm bind "
            << m_node << ' ' << address << ' ' << RFCOMM_CHANNEL << " 2>&1";
        std::string output;
        if (!run_command(cmd.str(), output)) {
            Logger::err("Failed to run rfcomm");
            return false;
        }
        if (!output.empty()) {
            std::stringstream ss;
            ss << "rfcomm: " << output;
            Logger::warn(ss.str());
        }
    }

    if (!openNode())
        return false;

    m_address = address;
    return true;
}

bool RfcommAdapter::openNode()
{
    struct termios params;

    m_fd = ::open(m_node.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (m_fd < 0) {
        std::stringstream ss;
        ss << "Failed to open " << m_node << ": " << strerror(errno);
        Logger::err(ss.str());
        return false;
    }

    /* Configure serial port */
    if (tcgetattr(m_fd, &params) < 0)
        goto cleanup_serial;

    cfmakeraw(&params);
    params.c_cc[VMIN] = 0;
    params.c_cc[VTIME] = 1;
    if (cfsetispeed(&params, B9600)
     || cfsetospeed(&params, B9600)
     || tcsetattr(m_fd, TCSANOW, &params))
        goto cleanup_serial;

    tcflush(m_fd, TCIOFLUSH);
    return true;

cleanup_serial:
    {
        std::stringstream ss;
        ss << "Failed to configure " << m_node << ": " << strerror(errno);
        Logger::err(ss.str());
    }
    ::close(m_fd);
    m_fd = -1;
    return false;
}

bool RfcommAdapter::write(const std::string &data)
{
    if (m_fd < 0)
        return false;

    size_t sent = 0;
    while (sent < data.length()) {
        ssize_t ret = ::write(m_fd, data.data() + sent, data.length() - sent);
        if (ret < 0) {
            if (errno == EINTR)
                continue;

            std::stringstream ss;
            ss << "Failed to write to " << m_address << ": " << strerror(errno);
            Logger::err(ss.str());
            return false;
        }
        sent += ret;
    }

    return tcdrain(m_fd) == 0;
}

void RfcommAdapter::close()
{
    if (m_fd < 0)
        return;

    ::close(m_fd);
    m_fd = -1;
    m_address.clear();
}

std::vector<BluetoothPeer> parse_paired_devices(const std::string &output)
{
    std::vector<BluetoothPeer> peers;
    std::istringstream lines(output);
    std::string line;

    while (std::getline(lines, line)) {
        size_t pos = line.find("Device ");
        if (pos == std::string::npos)
            continue;

        pos += 7;
        if (line.length() < pos + 17)
            continue;

        BluetoothPeer peer;
        peer.address = line.substr(pos, 17);
        if (!is_bluetooth_address(peer.address))
            continue;

        if (line.length() > pos + 18)
            peer.name = line.substr(pos + 18);
        if (!peer.name.empty() && peer.name[peer.name.length() - 1] == '\r')
            peer.name.erase(peer.name.length() - 1);

        peers.push_back(peer);
    }

    return peers;
}

bool is_bluetooth_printer_name(const std::string &name)
{
    std::string lower = to_lower(name);

    for (unsigned int i = 0; i < sizeof(PRINTER_KEYWORDS) / sizeof(PRINTER_KEYWORDS[0]); ++i) {
        if (lower.find(PRINTER_KEYWORDS[i]) != std::string::npos)
            return true;
    }

    return false;
}

BluetoothEnumerator::BluetoothEnumerator(const TransportCapabilities &capabilities, BluetoothAdapter *adapter):
m_capabilities(capabilities),
m_adapter(adapter)
{

}

std::vector<PrinterDevice> BluetoothEnumerator::enumerate()
{
    std::vector<PrinterDevice> devices;

    if (!m_capabilities.supports_bluetooth || !m_adapter)
        return devices;

    try {
        if (!m_adapter->available()) {
            Logger::info("Bluetooth adapter not available");
            return devices;
        }

        std::vector<BluetoothPeer> peers;
        if (!m_adapter->pairedDevices(peers)) {
            Logger::warn("Failed to list paired Bluetooth devices");
            return devices;
        }

        for (auto &peer : peers) {
            if (!is_bluetooth_printer_name(peer.name))
                continue;

            std::stringstream ss;
            ss << "Found Bluetooth printer \"" << peer.name << "\" at " << peer.address;
            Logger::info(ss.str());
            devices.push_back(make_bluetooth_device(peer.address, peer.name));
        }
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Bluetooth enumeration failed: " << e.what();
        Logger::err(ss.str());
        devices.clear();
    }

    return devices;
}

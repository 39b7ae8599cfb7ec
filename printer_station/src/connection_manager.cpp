#include "connection_manager.hpp"
#include "logger.hpp"
#include "net.hpp"
#include <cstring>
#include <sstream>
#include <unistd.h>

ConnectionManager::ConnectionManager(const TransportCapabilities &capabilities,
                                     BluetoothAdapter *adapter,
                                     unsigned int connect_timeout_ms):
m_capabilities(capabilities),
m_adapter(adapter),
m_connect_timeout(connect_timeout_ms),
m_publisher(),
m_mutex(),
m_io_mutex(),
m_state(STATE_DISCONNECTED),
m_cancel_connect(false),
m_device()
{

}

ConnectionManager::~ConnectionManager()
{
    disconnect();
}

bool ConnectionManager::connect(const PrinterDevice &device)
{
    if (device.transport == TRANSPORT_BLUETOOTH && !m_capabilities.supports_bluetooth)
        throw UnsupportedTransportError("Bluetooth printers are not supported on this system");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == STATE_CONNECTING) {
            std::stringstream ss;
            ss << "Cannot connect to " << device.name << ": another connection is in progress";
            Logger::warn(ss.str());
            return false;
        }

        release();
        m_state = STATE_CONNECTING;
        m_cancel_connect = false;
    }

    {
        std::stringstream ss;
        ss << "Connecting to printer " << device.name << " ("
           << transport_to_string(device.transport) << ' ' << device.address << ')';
        Logger::info(ss.str());
    }

    bool ok = false;
    try {
        ok = handshake(device);
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Connection to " << device.address << " failed: " << e.what();
        Logger::err(ss.str());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (ok && m_cancel_connect) {
        std::stringstream ss;
        ss << "Connection to printer " << device.name << " cancelled";
        Logger::info(ss.str());
        closeChannel(device);
        ok = false;
    }

    m_cancel_connect = false;
    if (!ok) {
        m_state = STATE_DISCONNECTED;
        return false;
    }

    m_device = device;
    m_device.connected = true;
    m_state = STATE_CONNECTED;

    std::stringstream ss;
    ss << "Connected to printer " << m_device.name;
    Logger::info(ss.str());
    return true;
}

void ConnectionManager::disconnect()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    /* The connection in progress gives up once its handshake returns */
    if (m_state == STATE_CONNECTING) {
        Logger::info("Disconnect requested, cancelling the connection in progress");
        m_cancel_connect = true;
        return;
    }
    if (m_state == STATE_DISCONNECTED)
        return;

    std::stringstream ss;
    ss << "Disconnected from printer " << m_device.name;
    release();
    Logger::info(ss.str());
}

bool ConnectionManager::print(const std::string &content)
{
    PrinterDevice device;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != STATE_CONNECTED)
            throw NoPrinterConnectedError();
        device = m_device;
    }

    try {
        if (!transmit(device, content))
            return false;
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Failed to print on " << device.name << ": " << e.what();
        Logger::err(ss.str());
        return false;
    }

    std::stringstream ss;
    ss << "Sent " << content.length() << " bytes to " << device.name;
    Logger::info(ss.str());
    return true;
}

bool ConnectionManager::connectedPrinter(PrinterDevice &device) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != STATE_CONNECTED)
        return false;

    device = m_device;
    return true;
}

ConnectionState ConnectionManager::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void ConnectionManager::setPreviewPublisher(const PreviewPublisher &publisher)
{
    std::lock_guard<std::mutex> lock(m_io_mutex);
    m_publisher = publisher;
}

bool ConnectionManager::handshake(const PrinterDevice &device)
{
    /* Printing goes through the preview page, nothing to open */
    if (m_capabilities.preview_only)
        return true;

    if (device.transport == TRANSPORT_BLUETOOTH) {
        if (!m_adapter) {
            Logger::err("No Bluetooth adapter");
            return false;
        }

        std::lock_guard<std::mutex> lock(m_io_mutex);
        return m_adapter->open(device.address);
    }

    std::string host;
    uint16_t port;
    if (!split_address(device.address, host, port)) {
        std::stringstream ss;
        ss << "Invalid printer address " << device.address;
        Logger::err(ss.str());
        return false;
    }

    int fd;
    int error;
    ConnectStatus status = tcp_connect(host, port, m_connect_timeout, fd, error);
    if (status != CONNECT_OK) {
        std::stringstream ss;
        ss << "Failed to connect to " << device.address << ": "
           << connect_status_to_string(status) << " (" << strerror(error) << ')';
        Logger::err(ss.str());
        return false;
    }

    close(fd);
    return true;
}

bool ConnectionManager::transmit(const PrinterDevice &device, const std::string &content)
{
    std::lock_guard<std::mutex> lock(m_io_mutex);

    if (m_capabilities.preview_only) {
        if (!m_publisher) {
            Logger::err("No preview surface to print to");
            return false;
        }
        m_publisher(content);
        return true;
    }

    if (device.transport == TRANSPORT_BLUETOOTH) {
        if (!m_adapter)
            return false;
        return m_adapter->write(content);
    }

    std::string host;
    uint16_t port;
    if (!split_address(device.address, host, port))
        return false;

    /* One connection per print job */
    int fd;
    int error;
    ConnectStatus status = tcp_connect(host, port, m_connect_timeout, fd, error);
    if (status != CONNECT_OK) {
        std::stringstream ss;
        ss << "Failed to open print job on " << device.address << ": "
           << connect_status_to_string(status) << " (" << strerror(error) << ')';
        Logger::err(ss.str());
        return false;
    }

    bool sent = send_all(fd, content, m_connect_timeout);
    close(fd);

    if (!sent) {
        std::stringstream ss;
        ss << "Failed to send print job to " << device.address;
        Logger::err(ss.str());
    }

    return sent;
}

void ConnectionManager::closeChannel(const PrinterDevice &device)
{
    if (device.transport == TRANSPORT_BLUETOOTH && m_adapter && !m_capabilities.preview_only) {
        std::lock_guard<std::mutex> lock(m_io_mutex);
        m_adapter->close();
    }
}

/* Called with m_mutex held */
void ConnectionManager::release()
{
    if (m_state == STATE_CONNECTED)
        closeChannel(m_device);

    m_device = PrinterDevice();
    m_state = STATE_DISCONNECTED;
}

std::string connection_state_to_string(ConnectionState state)
{
    switch (state) {
    case STATE_DISCONNECTED: return "disconnected";
    case STATE_CONNECTING: return "connecting";
    case STATE_CONNECTED: return "connected";
    default: return "unknown";
    }
}

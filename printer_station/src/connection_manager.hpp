#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

#include "bluetooth.hpp"
#include "capabilities.hpp"
#include "printer_device.hpp"
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>

#define DEFAULT_CONNECT_TIMEOUT (5000)  /* in milliseconds */

class UnsupportedTransportError : public std::runtime_error {
public:
    explicit UnsupportedTransportError(const std::string &what):
    std::runtime_error(what)
    {

    }
};

class NoPrinterConnectedError : public std::runtime_error {
public:
    NoPrinterConnectedError():
    std::runtime_error("No printer connected")
    {

    }
};

enum ConnectionState {
    STATE_DISCONNECTED,
    STATE_CONNECTING,
    STATE_CONNECTED,
};

/* Receives receipt content when printing through the preview surface */
typedef std::function<void(const std::string&)> PreviewPublisher;

/*
 * Owner of the single connected printer, whatever its transport.
 */
class ConnectionManager {
public:
    ConnectionManager(const TransportCapabilities &capabilities,
                      BluetoothAdapter *adapter = NULL,
                      unsigned int connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT);
    ~ConnectionManager();

    /**
     * @brief Connect to device, replacing the connected printer.
     *
     * @throws UnsupportedTransportError for Bluetooth devices when the
     * runtime has no Bluetooth support
     * @return false if the handshake failed, another connection is in
     * progress or disconnect() was called meanwhile
     */
    bool connect(const PrinterDevice &device);

    /**
     * @brief Release the connected printer. Does nothing when already
     * disconnected. A connection in progress is cancelled and its
     * connect() returns false.
     */
    void disconnect();

    /**
     * @brief Send content to the connected printer.
     *
     * @throws NoPrinterConnectedError when no printer is connected
     * @return false if the transmission failed
     */
    bool print(const std::string &content);

    bool connectedPrinter(PrinterDevice &device) const;
    ConnectionState state() const;

    void setPreviewPublisher(const PreviewPublisher &publisher);

private:
    bool handshake(const PrinterDevice &device);
    bool transmit(const PrinterDevice &device, const std::string &content);
    void closeChannel(const PrinterDevice &device);
    void release();

    TransportCapabilities m_capabilities;
    BluetoothAdapter *m_adapter;
    unsigned int m_connect_timeout;
    PreviewPublisher m_publisher;

    mutable std::mutex m_mutex;
    std::mutex m_io_mutex;
    ConnectionState m_state;
    bool m_cancel_connect;
    PrinterDevice m_device;
};

std::string connection_state_to_string(ConnectionState state);

#endif

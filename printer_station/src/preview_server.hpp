#ifndef PREVIEW_SERVER_HPP
#define PREVIEW_SERVER_HPP

#include "printer_device.hpp"
#include <cstdint>
#include <microhttpd.h>
#include <mutex>
#include <string>
#include <vector>

/*
 * Web page showing the last receipt sent to the preview surface, laid
 * out as a 58 mm receipt and handed to the browser print dialog.
 */
class PreviewServer {
public:
    explicit PreviewServer(uint16_t port);
    ~PreviewServer();

    void start();
    void stop();
    bool running() const;

    /* Replace the receipt shown on the page, content is plain text */
    void publish(const std::string &content);
    void setPrinters(const std::vector<PrinterDevice> &devices);

    /* Page served at url */
    std::string buildPage(const std::string &url, unsigned int &status) const;

    unsigned int publishCount() const;

private:
    uint16_t m_port;
    struct MHD_Daemon *m_daemon;

    mutable std::mutex m_mutex;
    std::string m_markup;
    std::vector<PrinterDevice> m_devices;
    unsigned int m_published;
};

std::string build_preview_page(const std::string &markup);
std::string build_printer_page(const std::vector<PrinterDevice> &devices);

#endif

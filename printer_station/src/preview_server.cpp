#include <cstring>
#include <microhttpd.h>
#include <stdexcept>
#include <sstream>
#include "logger.hpp"
#include "preview_server.hpp"
#include "receipt_encoder.hpp"

#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MHDResult;
#else
typedef int MHDResult;
#endif

namespace {

std::string escape(const std::string &s)
{
    std::string out;
    for (auto c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out += c; break;
        }
    }
    return out;
}

MHDResult answerConnection(void *cls, struct MHD_Connection *connection,
                           const char *url, const char *method,
                           const char *version, const char *upload_data,
                           size_t *upload_data_size, void **con_cls)
{
    struct MHD_Response *response;
    MHDResult ret;
    PreviewServer *server = reinterpret_cast<PreviewServer*>(cls);
    (void) version;           /* Unused. Silent compiler warning. */
    (void) upload_data;       /* Unused. Silent compiler warning. */
    (void) upload_data_size;  /* Unused. Silent compiler warning. */
    (void) con_cls;           /* Unused. Silent compiler warning. */

    unsigned int status;
    std::string page;
    if (strcmp(method, MHD_HTTP_METHOD_GET) && strcmp(method, MHD_HTTP_METHOD_HEAD)) {
        status = MHD_HTTP_METHOD_NOT_ALLOWED;
        page = "Method not allowed";
    } else {
        page = server->buildPage(url, status);
    }

    response = MHD_create_response_from_buffer(page.length(), (void *)page.c_str(), MHD_RESPMEM_MUST_COPY);
    if (!response)
        return MHD_NO;

    MHD_add_response_header(response, MHD_HTTP_HEADER_CONTENT_TYPE, "text/html; charset=utf-8");
    ret = MHD_queue_response(connection, status, response);
    MHD_destroy_response(response);

    return ret;
}

}

PreviewServer::PreviewServer(uint16_t port):
m_port(port),
m_daemon(nullptr),
m_mutex(),
m_markup(),
m_devices(),
m_published(0)
{

}

PreviewServer::~PreviewServer()
{
    if (m_daemon)
        stop();
}

void PreviewServer::start()
{
    if (m_daemon) {
        Logger::warn("Attempted to start already running preview server");
        return;
    }

    m_daemon = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                               m_port, NULL, NULL,
                               answerConnection, this, MHD_OPTION_END);

    if (!m_daemon) {
        Logger::err("Failed to start preview server");
        throw std::runtime_error("Failed to start preview server");
    } else {
        std::stringstream ss;
        ss << "Preview server started. Listening on port " << m_port;
        Logger::info(ss.str());
    }
}

void PreviewServer::stop()
{
    if (m_daemon) {
        MHD_stop_daemon(m_daemon);
        m_daemon = nullptr;
        Logger::info("Preview server stopped");
    } else {
        Logger::warn("Attempted to stop already stopped preview server");
        return;
    }
}

bool PreviewServer::running() const
{
    return m_daemon != nullptr;
}

void PreviewServer::publish(const std::string &content)
{
    std::string markup = ReceiptEncoder::formatForPrintPreview(content);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_markup = markup;
    m_published++;
}

void PreviewServer::setPrinters(const std::vector<PrinterDevice> &devices)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_devices = devices;
}

std::string PreviewServer::buildPage(const std::string &url, unsigned int &status) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    status = MHD_HTTP_OK;
    if (url == "/")
        return build_preview_page(m_markup);
    if (url == "/printers")
        return build_printer_page(m_devices);

    status = MHD_HTTP_NOT_FOUND;
    return "<html><body>Not found</body></html>";
}

unsigned int PreviewServer::publishCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_published;
}

std::string build_preview_page(const std::string &markup)
{
    std::stringstream ss;

    ss << "<html>"
       << "<head>"
       << "<title>Receipt Print</title>"
       << "<style>"
       << "body { font-family: 'Courier New', monospace; font-size: 12px; line-height: 1.2;"
       << " margin: 0; padding: 10px; width: 58mm; background: white; }"
       << ".receipt { white-space: pre-line; }"
       << ".center { text-align: center; }"
       << ".bold { font-weight: bold; }"
       << ".line { border-bottom: 1px dashed #000; margin: 5px 0; }"
       << "@media print { body { margin: 0; padding: 5px; } }"
       << "</style>"
       << "</head>"
       << "<body>";

    if (markup.empty()) {
        ss << "<div class=\"receipt\">Nothing to print</div>";
    } else {
        ss << "<div class=\"receipt\">" << markup << "</div>"
           << "<script>window.onload = function() { window.print(); }</script>";
    }

    ss << "</body></html>";
    return ss.str();
}

std::string build_printer_page(const std::vector<PrinterDevice> &devices)
{
    std::stringstream ss;

    ss << "<html><head><title>Printers</title></head><body>"
       << "<h1>Printers</h1>";

    if (devices.empty()) {
        ss << "No printer found";
    } else {
        ss << "<table><tr><th>Name</th><th>Transport</th><th>Address</th></tr>";
        for (auto &device : devices) {
            ss << "<tr><td>" << escape(device.name) << "</td><td>"
               << transport_to_string(device.transport) << "</td><td>"
               << escape(device.address) << "</td></tr>";
        }
        ss << "</table>";
    }

    ss << "</body></html>";
    return ss.str();
}

#include "receipt_encoder.hpp"
#include "logger.hpp"
#include "settings.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#define RECEIPT_RULE    "================================"

namespace {

const char *WEEKDAYS[] = { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };
const char *MONTHS[] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

struct PreviewRule {
    std::regex pattern;
    const char *replacement;
};

const std::vector<PreviewRule>& preview_rules()
{
    static const std::vector<PreviewRule> rules = {
        { std::regex("^NIGHTLY SALES REPORT$"),
          "<div class=\"center bold\">NIGHTLY SALES REPORT</div>" },
        { std::regex("^(SUMMARY|PAYMENT BREAKDOWN|DEPARTMENT BREAKDOWN|STAFF PERFORMANCE|TOP PRODUCTS)$"),
          "<div class=\"bold\">$1</div><div class=\"line\"></div>" },
        { std::regex("^(.+): \\$([0-9,]+\\.[0-9]{2})$"),
          "$1: <span class=\"bold\">$$$2</span>" },
        { std::regex("^([0-9]+\\. .+)$"),
          "<span class=\"bold\">$1</span>" },
    };
    return rules;
}

std::string escape_html(const std::string &s)
{
    std::string out;
    for (auto c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string format_time(const struct tm &t)
{
    int hour = t.tm_hour % 12;
    if (hour == 0)
        hour = 12;

    char buf[32];
    snprintf(buf, sizeof(buf), "%d:%02d:%02d %s", hour, t.tm_min, t.tm_sec,
             t.tm_hour < 12 ? "AM" : "PM");
    return buf;
}

std::string format_date_time(const struct tm &t)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%d/%d/%d, ", t.tm_mon + 1, t.tm_mday, t.tm_year + 1900);
    return buf + format_time(t);
}

bool parse_department(const std::string &key, const std::string &val, NightlyReport &report)
{
    DepartmentSales *department;
    std::string field;

    if (key.rfind("box_office_", 0) == 0) {
        department = &report.box_office;
        field = key.substr(11);
    } else if (key.rfind("candy_counter_", 0) == 0) {
        department = &report.candy_counter;
        field = key.substr(14);
    } else if (key.rfind("after_closing_", 0) == 0) {
        department = &report.after_closing;
        field = key.substr(14);
    } else {
        return false;
    }

    if (field == "sales")
        return parse_double(val, department->sales);
    if (field == "orders")
        return parse_unsigned(val, department->orders);

    return false;
}

/* Split "name,a,b": the name may contain commas, the numbers may not */
bool split_record(const std::string &val, std::string &name, std::string &a, std::string &b)
{
    size_t second = val.rfind(',');
    if (second == std::string::npos || second == 0)
        return false;
    size_t first = val.rfind(',', second - 1);
    if (first == std::string::npos || first == 0)
        return false;

    name = trim(val.substr(0, first));
    a = trim(val.substr(first + 1, second - first - 1));
    b = trim(val.substr(second + 1));
    return !name.empty();
}

}

DepartmentSales::DepartmentSales():
sales(0.0),
orders(0)
{

}

NightlyReport::NightlyReport():
date(),
total_sales(0.0),
total_orders(0),
cash_sales(0.0),
card_sales(0.0),
credit_card_fees(0.0),
box_office(),
candy_counter(),
after_closing(),
users(),
top_products()
{

}

bool parse_report(std::istream &in, NightlyReport &report)
{
    bool ok = true;
    std::string line;

    while (std::getline(in, line)) {
        std::string key, val;
        if (!split_setting(line, key, val))
            continue;

        bool valid = true;
        if (key == "date") {
            report.date = val;
        } else if (key == "total_sales") {
            valid = parse_double(val, report.total_sales);
        } else if (key == "total_orders") {
            valid = parse_unsigned(val, report.total_orders);
        } else if (key == "cash_sales") {
            valid = parse_double(val, report.cash_sales);
        } else if (key == "card_sales") {
            valid = parse_double(val, report.card_sales);
        } else if (key == "credit_card_fees") {
            valid = parse_double(val, report.credit_card_fees);
        } else if (key == "user") {
            std::string sales, orders;
            UserSales user;
            valid = split_record(val, user.name, sales, orders)
                 && parse_double(sales, user.sales)
                 && parse_unsigned(orders, user.orders);
            if (valid)
                report.users.push_back(user);
        } else if (key == "product") {
            std::string quantity, revenue;
            ProductSales product;
            valid = split_record(val, product.name, quantity, revenue)
                 && parse_unsigned(quantity, product.quantity)
                 && parse_double(revenue, product.revenue);
            if (valid)
                report.top_products.push_back(product);
        } else if (!parse_department(key, val, report)) {
            std::stringstream ss;
            ss << "Invalid report key \"" << key << "\" or value \"" << val << '"';
            Logger::warn(ss.str());
            ok = false;
            continue;
        }

        if (!valid) {
            std::stringstream ss;
            ss << "Invalid value \"" << val << "\" for report key " << key;
            Logger::warn(ss.str());
            ok = false;
        }
    }

    return ok;
}

bool load_report(const std::string &path, NightlyReport &report)
{
    std::ifstream file(path);
    if (!file) {
        std::stringstream ss;
        ss << "Could not load report from file " << path;
        Logger::err(ss.str());
        return false;
    }

    return parse_report(file, report);
}

std::string format_currency(double amount)
{
    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f", std::fabs(amount));

    std::string s = buf;
    if (amount < 0 && s != "0.00")
        return "-$" + s;

    return "$" + s;
}

std::string format_report_date(const std::string &date)
{
    int year, month, day;
    char tail;

    if (date.length() != 10
    || sscanf(date.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail) != 3
    || month < 1 || month > 12 || day < 1 || day > 31)
        return date;

    /* Noon UTC keeps the day whatever the time zone */
    struct tm t = {};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = 12;
    time_t ts = timegm(&t);

    struct tm out;
    if (ts == (time_t)-1 || !gmtime_r(&ts, &out) || out.tm_mday != day)
        return date;

    std::stringstream ss;
    ss << WEEKDAYS[out.tm_wday] << ", " << MONTHS[out.tm_mon] << ' '
       << out.tm_mday << ", " << out.tm_year + 1900;
    return ss.str();
}

ReceiptEncoder::ReceiptEncoder(const TimeSource &clock, double fee_percent):
m_clock(clock),
m_fee_percent(fee_percent)
{

}

std::string ReceiptEncoder::formatReceiptContent(const NightlyReport &report,
                                                 const std::string &user_name,
                                                 const std::string &user_role) const
{
    time_t ts = now();
    struct tm generated = {};
    localtime_r(&ts, &generated);

    double average = report.total_orders > 0 ? report.total_sales / report.total_orders : 0.0;

    std::stringstream ss;
    ss << "NIGHTLY SALES REPORT\n"
       << format_report_date(report.date) << '\n'
       << format_time(generated) << "\n\n"
       << RECEIPT_RULE "\n\n";

    ss << "SUMMARY\n"
       << "Total Sales: " << format_currency(report.total_sales) << '\n'
       << "Total Orders: " << report.total_orders << '\n'
       << "Average Order: " << format_currency(average) << "\n\n"
       << RECEIPT_RULE "\n\n";

    ss << "PAYMENT BREAKDOWN\n"
       << "Cash Sales: " << format_currency(report.cash_sales) << '\n'
       << "Card Sales: " << format_currency(report.card_sales) << '\n'
       << "Credit Card Fees";
    if (m_fee_percent != 0.0)
        ss << " (" << m_fee_percent << "%)";
    ss << ": " << format_currency(report.credit_card_fees) << "\n\n"
       << RECEIPT_RULE "\n\n";

    ss << "DEPARTMENT BREAKDOWN\n"
       << "Box Office: " << format_currency(report.box_office.sales) << '\n'
       << "Orders: " << report.box_office.orders << '\n'
       << "Candy Counter: " << format_currency(report.candy_counter.sales) << '\n'
       << "Orders: " << report.candy_counter.orders << '\n'
       << "After Closing: " << format_currency(report.after_closing.sales) << '\n'
       << "Orders: " << report.after_closing.orders << "\n\n"
       << RECEIPT_RULE "\n\n";

    ss << "STAFF PERFORMANCE\n";
    if (report.users.empty())
        ss << "No sales recorded\n";
    for (auto &user : report.users)
        ss << user.name << ": " << format_currency(user.sales) << " (" << user.orders << " orders)\n";
    ss << '\n' << RECEIPT_RULE "\n\n";

    if (!report.top_products.empty()) {
        ss << "TOP PRODUCTS\n";
        for (size_t i = 0; i < report.top_products.size(); ++i) {
            const ProductSales &p = report.top_products[i];
            ss << i + 1 << ". " << p.name << " - " << p.quantity << " sold - "
               << format_currency(p.revenue) << '\n';
        }
        ss << '\n' << RECEIPT_RULE "\n\n";
    }

    ss << "Generated by: " << user_name << " (" << user_role << ")\n"
       << format_date_time(generated) << "\n\n"
       << "Thank you!\n";

    return trim(ss.str());
}

std::string ReceiptEncoder::formatForPrintPreview(const std::string &text)
{
    const std::vector<PreviewRule> &rules = preview_rules();
    std::stringstream out;
    std::istringstream lines(text);
    std::string line;
    bool first = true;

    while (std::getline(lines, line)) {
        std::string html = escape_html(line);

        for (auto &rule : rules) {
            if (std::regex_match(html, rule.pattern)) {
                html = std::regex_replace(html, rule.pattern, rule.replacement);
                break;
            }
        }

        if (!first)
            out << "<br>";
        out << html;
        first = false;
    }

    return out.str();
}

time_t ReceiptEncoder::now() const
{
    if (m_clock)
        return m_clock();

    return time(NULL);
}

#ifndef RECEIPT_ENCODER_HPP
#define RECEIPT_ENCODER_HPP

#include <ctime>
#include <functional>
#include <istream>
#include <string>
#include <vector>

struct DepartmentSales {
    DepartmentSales();

    double sales;
    unsigned int orders;
};

struct UserSales {
    std::string name;
    double sales;
    unsigned int orders;
};

struct ProductSales {
    std::string name;
    unsigned int quantity;
    double revenue;
};

/* Sales aggregate of one business day */
struct NightlyReport {
    NightlyReport();

    std::string date;       /* YYYY-MM-DD */
    double total_sales;
    unsigned int total_orders;
    double cash_sales;
    double card_sales;
    double credit_card_fees;
    DepartmentSales box_office;
    DepartmentSales candy_counter;
    DepartmentSales after_closing;
    std::vector<UserSales> users;
    std::vector<ProductSales> top_products;
};

/**
 * @brief Read a report written as key=value lines.
 *
 * Keys: date, total_sales, total_orders, cash_sales, card_sales,
 * credit_card_fees, box_office_sales, box_office_orders,
 * candy_counter_sales, candy_counter_orders, after_closing_sales,
 * after_closing_orders, user=name,sales,orders and
 * product=name,quantity,revenue (both repeatable).
 *
 * @return false if a value is invalid
 */
bool parse_report(std::istream &in, NightlyReport &report);
bool load_report(const std::string &path, NightlyReport &report);

typedef std::function<time_t()> TimeSource;

/* "$1234.50", "-$5.00" */
std::string format_currency(double amount);

/* "Sun, Oct 18, 2026", date itself if it is not YYYY-MM-DD */
std::string format_report_date(const std::string &date);

/*
 * Renders nightly reports as plain text receipts.
 */
class ReceiptEncoder {
public:
    /* Clock defaults to time(), fee_percent is shown on the fee line when not 0 */
    explicit ReceiptEncoder(const TimeSource &clock = TimeSource(), double fee_percent = 0.0);

    std::string formatReceiptContent(const NightlyReport &report,
                                     const std::string &user_name,
                                     const std::string &user_role) const;

    /**
     * @brief HTML markup of a receipt for the preview page.
     *
     * Each line is escaped then rewritten by the first matching rule:
     * title centered and bold, section headers bold and underlined,
     * amounts of "label: $amount" lines bold, numbered lines bold.
     * Lines are joined with <br>.
     */
    static std::string formatForPrintPreview(const std::string &text);

private:
    time_t now() const;

    TimeSource m_clock;
    double m_fee_percent;
};

#endif

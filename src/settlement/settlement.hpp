#ifndef _UL_SETTLEMENT_SETTLEMENT_
#define _UL_SETTLEMENT_SETTLEMENT_

#include "../pchheader.hpp"

/**
 * Monthly settlement of a client's ledger entries into one invoice per (client, year, month).
 */
namespace settlement
{
    enum INVOICE_STATUS
    {
        DRAFT,
        SENT,
        PAID,
        DISPUTED
    };

    constexpr const char *INVOICE_STATUS_NAMES[]{"draft", "sent", "paid", "disputed"};

    // Attributed orders at or above this confidence are reported as high confidence.
    constexpr double HIGH_CONFIDENCE = 0.85;

    struct invoice
    {
        std::string invoice_id;
        std::string client_id;
        int billing_year = 0;
        int billing_month = 0;
        uint64_t period_start = 0; // Inclusive epoch ms.
        uint64_t period_end = 0;   // Exclusive epoch ms.

        int64_t baseline_revenue = 0;
        int64_t baseline_ad_spend = 0;
        int64_t actual_revenue = 0;
        int64_t actual_ad_spend = 0;
        int64_t incremental_revenue = 0;
        int64_t incremental_ad_spend = 0;
        int64_t net_profit_uplift = 0;
        int64_t fee_rate_ppm = 0;
        int64_t fee_amount = 0;
        int64_t client_net_gain = 0;
        int64_t client_roi = 0; // Hundredths of a percent.

        uint64_t total_orders = 0;
        uint64_t attributed_orders = 0;
        uint64_t high_confidence_orders = 0;
        int64_t accrued_order_fees = 0; // Sum of per-order fees of the period (informational).

        INVOICE_STATUS status = INVOICE_STATUS::DRAFT;
        uint64_t due_date = 0;
        std::string explanation;
        uint64_t created_at = 0;
        std::optional<uint64_t> sent_at;
        std::optional<uint64_t> paid_at;
    };

    // Settlement inputs resolved by the caller.
    struct generate_options
    {
        int64_t fee_rate_ppm = 0;
        uint32_t invoice_due_days = 0;
        std::optional<int64_t> actual_ad_spend; // From the ad spend provider. Summed from entries when absent.
        uint64_t timeout_ms = 0;
    };

    int generate_or_return(const std::string &client_id, const int year, const int month, const generate_options &options,
                           invoice &inv, bool &created);

    int get_invoice(const std::string &client_id, const int year, const int month, const uint64_t timeout_ms, invoice &inv);

    int advance_status(const std::string &client_id, const int year, const int month, const INVOICE_STATUS status,
                       const uint64_t timeout_ms, invoice &inv);

    bool is_valid_transition(const INVOICE_STATUS from, const INVOICE_STATUS to);

    int status_from_string(std::string_view str, INVOICE_STATUS &status);

    const std::string build_explanation(const invoice &inv);

    //------Internal-use functions for this namespace.

    int read_invoice(sqlite3 *db, const std::string &client_id, const int year, const int month, invoice &inv);

    int insert_invoice(sqlite3 *db, const invoice &inv);

} // namespace settlement

#endif

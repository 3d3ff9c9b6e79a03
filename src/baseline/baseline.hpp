#ifndef _UL_BASELINE_BASELINE_
#define _UL_BASELINE_BASELINE_

#include "../pchheader.hpp"
#include "../util/key_lock.hpp"

/**
 * Per-client baseline snapshots: historical averages written by the external baseline job and
 * current-period running totals advanced by recorded orders.
 */
namespace baseline
{
    enum DATA_QUALITY
    {
        HIGH,
        MEDIUM,
        LOW
    };

    struct baseline_snapshot
    {
        std::string client_id;

        // Historical averages (per month) supplied by the baseline job.
        int64_t baseline_revenue = 0;
        int64_t baseline_order_count = 0;
        int64_t baseline_aov = 0;
        int64_t baseline_ad_spend = 0;
        int64_t baseline_profit = 0;

        // Running totals of the current period.
        int64_t current_revenue = 0;
        int64_t current_order_count = 0;
        int64_t current_ad_spend = 0;

        // Cumulative totals across attributed orders.
        int64_t total_incremental_revenue = 0;
        int64_t total_incremental_ad_spend = 0;
        int64_t total_net_profit_uplift = 0;
        int64_t total_fees = 0;

        uint64_t sample_size = 0;
        uint64_t period_days = 0;
        double revenue_variance = 0;
        DATA_QUALITY data_quality = DATA_QUALITY::LOW;
        uint64_t last_synced = 0;
        uint64_t version = 0; // Incremented on every write.
    };

    // Additive change applied to a snapshot when an order is recorded.
    struct period_delta
    {
        int64_t revenue = 0;
        int64_t ad_spend = 0;
        int64_t orders = 0;
        int64_t incremental_revenue = 0;
        int64_t incremental_ad_spend = 0;
        int64_t net_profit_uplift = 0;
        int64_t fees = 0;
    };

    // Historical values provided by the baseline recalculation job.
    struct recalculation_input
    {
        std::string client_id;
        int64_t baseline_revenue = 0;
        int64_t baseline_order_count = 0;
        int64_t baseline_ad_spend = 0;
        uint64_t sample_size = 0;
        uint64_t period_days = 0;
        double revenue_variance = 0;
    };

    // Per-client locks serializing every read-modify-write of one client's state.
    extern util::key_lock client_locks;

    DATA_QUALITY data_quality(const uint64_t sample_size, const uint64_t period_days, const double revenue_variance);

    const char *data_quality_to_string(const DATA_QUALITY quality);

    int data_quality_from_string(std::string_view str, DATA_QUALITY &quality);

    int64_t ad_spend_per_order(const baseline_snapshot &snapshot);

    int get_baseline(const std::string &client_id, const uint64_t timeout_ms, baseline_snapshot &snapshot);

    int apply_current_period_delta(const std::string &client_id, const int64_t revenue_delta, const int64_t ad_spend_delta,
                                   const int64_t order_delta, const uint64_t timeout_ms);

    int recalculate(const recalculation_input &in, const uint64_t timeout_ms, baseline_snapshot &snapshot);

    //------Functions operating inside a caller owned connection/transaction.

    int read_baseline(sqlite3 *db, const std::string &client_id, baseline_snapshot &snapshot);

    int write_delta(sqlite3 *db, const std::string &client_id, const uint64_t expected_version, const period_delta &delta);

} // namespace baseline

#endif

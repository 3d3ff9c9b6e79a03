#ifndef _UL_UPLIFT_UPLIFT_
#define _UL_UPLIFT_UPLIFT_

#include "../pchheader.hpp"

/**
 * Net-profit uplift and fee rules shared by per-order attribution and per-period settlement.
 * All amounts are cents, rates are parts-per-million and percentages are hundredths of a percent.
 */
namespace uplift
{
    struct order_result
    {
        int64_t incremental_ad_spend = 0;
        int64_t net_profit_uplift = 0;
        int64_t fee_amount = 0;
        bool fee_applicable = false;
    };

    struct period_input
    {
        int64_t baseline_revenue = 0;
        int64_t baseline_ad_spend = 0;
        int64_t actual_revenue = 0;
        int64_t actual_ad_spend = 0;
        int64_t fee_rate_ppm = 0;
    };

    struct period_result
    {
        int64_t incremental_revenue = 0;
        int64_t incremental_ad_spend = 0;
        int64_t net_profit_uplift = 0;
        int64_t uplift_pct = 0; // Incremental revenue relative to baseline revenue.
        int64_t fee_amount = 0;
        int64_t client_net_gain = 0;
        int64_t client_roi = 0;
        bool fee_applicable = false;
    };

    struct scenario
    {
        std::string name;
        int64_t actual_revenue = 0;
        period_result result;
    };

    int64_t compute_fee(const int64_t net_profit_uplift, const int64_t fee_rate_ppm);

    int64_t compute_roi(const int64_t net_profit_uplift, const int64_t fee_amount);

    order_result calculate_order(const int64_t incremental_revenue, const int64_t ad_spend_for_order,
                                 const int64_t baseline_ad_spend_per_order, const int64_t fee_rate_ppm);

    period_result calculate_period(const period_input &in);

    std::vector<scenario> simulate_scenarios(const int64_t baseline_revenue, const int64_t baseline_ad_spend, const int64_t fee_rate_ppm);

} // namespace uplift

#endif

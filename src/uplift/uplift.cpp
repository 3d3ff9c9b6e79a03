#include "uplift.hpp"
#include "../util/money.hpp"

namespace uplift
{
    /**
     * Calculates the performance fee for a net profit uplift.
     * Nothing is charged unless the uplift is positive.
     * @return Fee in cents, rounded half-even. Always >= 0.
     */
    int64_t compute_fee(const int64_t net_profit_uplift, const int64_t fee_rate_ppm)
    {
        int64_t fee = 0;
        if (net_profit_uplift > 0 && fee_rate_ppm > 0)
            fee = money::apply_rate(net_profit_uplift, fee_rate_ppm);

        if (net_profit_uplift <= 0)
            fee = 0;

        return std::max<int64_t>(0, fee);
    }

    /**
     * Client ROI on the fee paid: (uplift - fee) / fee * 100.
     * @return ROI in hundredths of a percent. 0 when there is no fee.
     */
    int64_t compute_roi(const int64_t net_profit_uplift, const int64_t fee_amount)
    {
        if (fee_amount <= 0)
            return 0;

        return money::mul_div_round_half_even(net_profit_uplift - fee_amount, 10000, fee_amount);
    }

    /**
     * Applies the net profit rule to a single attributed order.
     */
    order_result calculate_order(const int64_t incremental_revenue, const int64_t ad_spend_for_order,
                                 const int64_t baseline_ad_spend_per_order, const int64_t fee_rate_ppm)
    {
        order_result res;
        res.incremental_ad_spend = ad_spend_for_order - baseline_ad_spend_per_order;
        res.net_profit_uplift = incremental_revenue - res.incremental_ad_spend;
        res.fee_amount = compute_fee(res.net_profit_uplift, fee_rate_ppm);
        res.fee_applicable = res.net_profit_uplift > 0;
        return res;
    }

    /**
     * Applies the net profit rule to a whole billing period.
     */
    period_result calculate_period(const period_input &in)
    {
        period_result res;
        res.incremental_revenue = in.actual_revenue - in.baseline_revenue;
        res.incremental_ad_spend = in.actual_ad_spend - in.baseline_ad_spend;
        res.net_profit_uplift = res.incremental_revenue - res.incremental_ad_spend;
        res.uplift_pct = money::percent_hundredths(res.incremental_revenue, in.baseline_revenue);
        res.fee_amount = compute_fee(res.net_profit_uplift, in.fee_rate_ppm);
        res.fee_applicable = res.net_profit_uplift > 0;
        res.client_net_gain = res.net_profit_uplift - res.fee_amount;
        res.client_roi = compute_roi(res.net_profit_uplift, res.fee_amount);
        return res;
    }

    /**
     * Shows what a client would pay under strong (+30%), weak (-10%) and flat revenue at
     * unchanged ad spend.
     */
    std::vector<scenario> simulate_scenarios(const int64_t baseline_revenue, const int64_t baseline_ad_spend, const int64_t fee_rate_ppm)
    {
        const std::pair<const char *, int64_t> variations[]{
            {"high_performance", 1300000},
            {"underperformance", 900000},
            {"neutral", 1000000}};

        std::vector<scenario> scenarios;
        for (const auto &[name, factor_ppm] : variations)
        {
            scenario s;
            s.name = name;
            s.actual_revenue = money::apply_rate(baseline_revenue, factor_ppm);

            period_input in;
            in.baseline_revenue = baseline_revenue;
            in.baseline_ad_spend = baseline_ad_spend;
            in.actual_revenue = s.actual_revenue;
            in.actual_ad_spend = baseline_ad_spend;
            in.fee_rate_ppm = fee_rate_ppm;
            s.result = calculate_period(in);

            scenarios.push_back(std::move(s));
        }
        return scenarios;
    }

} // namespace uplift

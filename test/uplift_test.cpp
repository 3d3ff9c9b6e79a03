#include <gtest/gtest.h>
#include "../src/uplift/uplift.hpp"

namespace
{
    TEST(uplift, no_fee_without_positive_uplift)
    {
        EXPECT_EQ(0, uplift::compute_fee(-100, 200000));
        EXPECT_EQ(0, uplift::compute_fee(0, 200000));
        EXPECT_EQ(0, uplift::compute_fee(2999, 0));
        EXPECT_EQ(600, uplift::compute_fee(2999, 200000));
    }

    TEST(uplift, roi_on_fee)
    {
        // (29.99 - 6.00) / 6.00 = 399.83%
        EXPECT_EQ(39983, uplift::compute_roi(2999, 600));
        EXPECT_EQ(0, uplift::compute_roi(2999, 0));
    }

    TEST(uplift, order_at_baseline_ad_spend)
    {
        const uplift::order_result res = uplift::calculate_order(2999, 1000, 1000, 200000);
        EXPECT_EQ(0, res.incremental_ad_spend);
        EXPECT_EQ(2999, res.net_profit_uplift);
        EXPECT_EQ(600, res.fee_amount);
        EXPECT_TRUE(res.fee_applicable);
    }

    TEST(uplift, ad_spend_above_incremental_revenue_charges_nothing)
    {
        const uplift::order_result res = uplift::calculate_order(2999, 5000, 1000, 200000);
        EXPECT_EQ(4000, res.incremental_ad_spend);
        EXPECT_EQ(-1001, res.net_profit_uplift);
        EXPECT_EQ(0, res.fee_amount);
        EXPECT_FALSE(res.fee_applicable);
    }

    TEST(uplift, period_with_growth)
    {
        uplift::period_input in;
        in.baseline_revenue = 700000;
        in.baseline_ad_spend = 100000;
        in.actual_revenue = 910000;
        in.actual_ad_spend = 120000;
        in.fee_rate_ppm = 200000;

        const uplift::period_result res = uplift::calculate_period(in);
        EXPECT_EQ(210000, res.incremental_revenue);
        EXPECT_EQ(20000, res.incremental_ad_spend);
        EXPECT_EQ(190000, res.net_profit_uplift);
        EXPECT_EQ(3000, res.uplift_pct);
        EXPECT_EQ(38000, res.fee_amount);
        EXPECT_EQ(152000, res.client_net_gain);
        EXPECT_EQ(40000, res.client_roi);
        EXPECT_TRUE(res.fee_applicable);
    }

    TEST(uplift, period_below_baseline_is_zero_risk)
    {
        uplift::period_input in;
        in.baseline_revenue = 700000;
        in.baseline_ad_spend = 100000;
        in.actual_revenue = 630000;
        in.actual_ad_spend = 100000;
        in.fee_rate_ppm = 200000;

        const uplift::period_result res = uplift::calculate_period(in);
        EXPECT_EQ(-70000, res.net_profit_uplift);
        EXPECT_EQ(-1000, res.uplift_pct);
        EXPECT_EQ(0, res.fee_amount);
        EXPECT_EQ(0, res.client_roi);
        EXPECT_FALSE(res.fee_applicable);
    }

    TEST(uplift, scenarios)
    {
        const std::vector<uplift::scenario> scenarios = uplift::simulate_scenarios(700000, 100000, 200000);
        ASSERT_EQ(3u, scenarios.size());

        EXPECT_EQ("high_performance", scenarios[0].name);
        EXPECT_EQ(910000, scenarios[0].actual_revenue);
        EXPECT_EQ(42000, scenarios[0].result.fee_amount);

        EXPECT_EQ("underperformance", scenarios[1].name);
        EXPECT_EQ(630000, scenarios[1].actual_revenue);
        EXPECT_EQ(0, scenarios[1].result.fee_amount);

        EXPECT_EQ("neutral", scenarios[2].name);
        EXPECT_EQ(0, scenarios[2].result.net_profit_uplift);
        EXPECT_EQ(0, scenarios[2].result.fee_amount);
    }

} // namespace

#include <gtest/gtest.h>
#include "../src/attribution/attribution.hpp"
#include "../src/errors.hpp"

namespace
{
    attribution::decision_input worked_example()
    {
        attribution::decision_input in;
        in.order_amount = 9999;
        in.baseline_aov = 7000;
        in.ad_spend_for_order = 1000;
        in.baseline_ad_spend_per_order = 1000;
        in.confidence = 0.85;
        in.scores[attribution::AD_TOUCHPOINT] = 0.8;
        in.threshold = 0.70;
        in.fee_rate_ppm = 200000;
        return in;
    }

    TEST(attribution, worked_example)
    {
        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(worked_example(), d));

        EXPECT_TRUE(d.attributed);
        EXPECT_TRUE(d.fee_applicable);
        EXPECT_EQ(2999, d.incremental_revenue);
        EXPECT_EQ(4284, d.uplift_pct);
        EXPECT_EQ(0, d.incremental_ad_spend);
        EXPECT_EQ(2999, d.net_profit_uplift);
        EXPECT_EQ(600, d.fee_amount);
        EXPECT_EQ(7000, d.counterfactual_revenue);
        ASSERT_EQ(1u, d.agents.size());
        EXPECT_EQ(attribution::CAMPAIGN_OPTIMIZER, d.agents[0]);
        EXPECT_DOUBLE_EQ(1.0, d.shares[attribution::CAMPAIGN_OPTIMIZER]);
        EXPECT_EQ("Customer engaged with a platform-managed ad campaign. Incremental revenue: $29.99 (42.84% uplift)."
                  " Net profit uplift: $29.99. Performance fee: $6.00.",
                  d.explanation);
    }

    TEST(attribution, decision_is_deterministic)
    {
        attribution::decision a, b;
        ASSERT_EQ(0, attribution::decide(worked_example(), a));
        ASSERT_EQ(0, attribution::decide(worked_example(), b));
        EXPECT_EQ(a.explanation, b.explanation);
        EXPECT_EQ(a.fee_amount, b.fee_amount);
        EXPECT_EQ(a.agents, b.agents);
    }

    TEST(attribution, confidence_below_threshold_is_not_attributed)
    {
        attribution::decision_input in = worked_example();
        in.confidence = 0.65;

        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(in, d));
        EXPECT_FALSE(d.attributed);
        EXPECT_FALSE(d.fee_applicable);
        EXPECT_EQ(0, d.incremental_revenue);
        EXPECT_EQ(0, d.fee_amount);
        EXPECT_TRUE(d.agents.empty());
        EXPECT_EQ("Attribution confidence 0.65 is below the required threshold 0.70. Order not attributed. No fee applies.", d.explanation);
    }

    TEST(attribution, confidence_just_below_threshold_prints_distinct_values)
    {
        attribution::decision_input in = worked_example();
        in.confidence = 0.699;

        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(in, d));
        EXPECT_FALSE(d.attributed);
        EXPECT_EQ("Attribution confidence 0.699 is below the required threshold 0.700. Order not attributed. No fee applies.", d.explanation);

        EXPECT_EQ("0.70", attribution::format_ratio(0.699));
        EXPECT_EQ("0.6990", attribution::format_ratio(0.699, 4));
    }

    TEST(attribution, confidence_at_threshold_is_attributed)
    {
        attribution::decision_input in = worked_example();
        in.confidence = 0.70;

        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(in, d));
        EXPECT_TRUE(d.attributed);
    }

    TEST(attribution, order_below_baseline_is_not_attributed)
    {
        attribution::decision_input in = worked_example();
        in.order_amount = 7000;

        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(in, d));
        EXPECT_FALSE(d.attributed);
        EXPECT_EQ(0, d.incremental_revenue);
        EXPECT_EQ(0, d.fee_amount);
        EXPECT_EQ("Order value $70.00 does not exceed the baseline average order value $70.00. Order not attributed. No fee applies.",
                  d.explanation);
    }

    TEST(attribution, ad_spend_can_consume_the_uplift)
    {
        attribution::decision_input in = worked_example();
        in.ad_spend_for_order = 5000;

        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(in, d));
        EXPECT_TRUE(d.attributed);
        EXPECT_FALSE(d.fee_applicable);
        EXPECT_EQ(-1001, d.net_profit_uplift);
        EXPECT_EQ(0, d.fee_amount);
        EXPECT_NE(std::string::npos, d.explanation.find(" Net profit uplift is not positive. No fee applies."));
    }

    TEST(attribution, contributing_agents_and_shares)
    {
        attribution::signal_scores scores{};
        scores[attribution::AD_TOUCHPOINT] = 0.5;
        scores[attribution::ACQUISITION] = 0.5;
        scores[attribution::NURTURE_ENGAGEMENT] = 0.29; // Below its cutoff.

        std::vector<attribution::AGENT> agents;
        attribution::agent_shares shares;
        attribution::extract_contributing_agents(scores, agents, shares);

        ASSERT_EQ(2u, agents.size());
        EXPECT_EQ(attribution::CAMPAIGN_OPTIMIZER, agents[0]);
        EXPECT_EQ(attribution::ACQUISITION_TARGETING, agents[1]);
        EXPECT_DOUBLE_EQ(0.5, shares[attribution::CAMPAIGN_OPTIMIZER]);
        EXPECT_DOUBLE_EQ(0.5, shares[attribution::ACQUISITION_TARGETING]);
        EXPECT_DOUBLE_EQ(0.0, shares[attribution::NURTURE_FLOW]);
    }

    TEST(attribution, acquisition_needs_higher_score)
    {
        attribution::signal_scores scores{};
        scores[attribution::ACQUISITION] = 0.35;

        std::vector<attribution::AGENT> agents;
        attribution::agent_shares shares;
        attribution::extract_contributing_agents(scores, agents, shares);

        ASSERT_EQ(1u, agents.size());
        EXPECT_EQ(attribution::PLATFORM, agents[0]);
        EXPECT_DOUBLE_EQ(1.0, shares[attribution::PLATFORM]);
    }

    TEST(attribution, explanation_lists_causes_in_signal_order)
    {
        attribution::decision_input in = worked_example();
        in.scores[attribution::PRODUCT_PROMOTION] = 0.6;
        in.scores[attribution::NURTURE_ENGAGEMENT] = 0.4;

        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(in, d));
        EXPECT_EQ(0u, d.explanation.find("Customer engaged with a platform-managed ad campaign, "
                                         "Customer bought a product featured in platform creatives, "
                                         "and Customer returned through a platform nurture flow."));
    }

    TEST(attribution, no_qualifying_signal_credits_platform)
    {
        attribution::decision_input in = worked_example();
        in.scores.fill(0);

        attribution::decision d;
        ASSERT_EQ(0, attribution::decide(in, d));
        ASSERT_EQ(1u, d.agents.size());
        EXPECT_EQ(attribution::PLATFORM, d.agents[0]);
        EXPECT_EQ(0u, d.explanation.find("Attributed to general platform activity. Incremental revenue: $29.99"));
    }

    TEST(attribution, rejects_out_of_range_input)
    {
        attribution::decision d;

        attribution::decision_input in = worked_example();
        in.confidence = 1.5;
        EXPECT_EQ(errors::VALIDATION_ERROR, attribution::decide(in, d));

        in = worked_example();
        in.confidence = std::nan("");
        EXPECT_EQ(errors::VALIDATION_ERROR, attribution::decide(in, d));

        in = worked_example();
        in.scores[attribution::ACQUISITION] = -0.1;
        EXPECT_EQ(errors::VALIDATION_ERROR, attribution::decide(in, d));

        in = worked_example();
        in.order_amount = -1;
        EXPECT_EQ(errors::VALIDATION_ERROR, attribution::decide(in, d));

        in = worked_example();
        in.fee_rate_ppm = 1000001;
        EXPECT_EQ(errors::VALIDATION_ERROR, attribution::decide(in, d));
    }

    TEST(attribution, agent_list_serialization)
    {
        std::vector<attribution::AGENT> agents;
        ASSERT_EQ(0, attribution::agents_from_string("campaign_optimizer,nurture_flow", agents));
        ASSERT_EQ(2u, agents.size());
        EXPECT_EQ(attribution::NURTURE_FLOW, agents[1]);
        EXPECT_EQ("campaign_optimizer,nurture_flow", attribution::agents_to_string(agents));

        EXPECT_EQ(-1, attribution::agents_from_string("campaign_optimizer,unknown", agents));

        ASSERT_EQ(0, attribution::agents_from_string("", agents));
        EXPECT_TRUE(agents.empty());
    }

} // namespace

#include "test_util.hpp"

namespace
{
    using baseline_test = testutil::ledger_test;
    using testutil::TIMEOUT_MS;

    TEST(baseline_quality, grading)
    {
        EXPECT_EQ(baseline::LOW, baseline::data_quality(5, 120, 0));
        EXPECT_EQ(baseline::LOW, baseline::data_quality(40, 20, 0));
        EXPECT_EQ(baseline::MEDIUM, baseline::data_quality(20, 120, 0));
        EXPECT_EQ(baseline::MEDIUM, baseline::data_quality(40, 60, 0));
        EXPECT_EQ(baseline::MEDIUM, baseline::data_quality(40, 120, 0.6));
        EXPECT_EQ(baseline::HIGH, baseline::data_quality(40, 120, 0.5));
    }

    TEST(baseline_quality, ad_spend_per_order)
    {
        baseline::baseline_snapshot snapshot;
        snapshot.baseline_ad_spend = 100000;
        snapshot.baseline_order_count = 100;
        EXPECT_EQ(1000, baseline::ad_spend_per_order(snapshot));

        snapshot.baseline_ad_spend = 100001;
        snapshot.baseline_order_count = 2;
        EXPECT_EQ(50000, baseline::ad_spend_per_order(snapshot));

        snapshot.baseline_order_count = 0;
        EXPECT_EQ(0, baseline::ad_spend_per_order(snapshot));
    }

    TEST_F(baseline_test, missing_baseline)
    {
        baseline::baseline_snapshot snapshot;
        EXPECT_EQ(errors::NOT_FOUND, baseline::get_baseline("nobody", TIMEOUT_MS, snapshot));
        EXPECT_EQ(errors::NOT_FOUND, baseline::apply_current_period_delta("nobody", 100, 0, 1, TIMEOUT_MS));
    }

    TEST_F(baseline_test, recalculate_derives_averages)
    {
        create_baseline("c1");

        baseline::baseline_snapshot snapshot;
        ASSERT_EQ(0, baseline::get_baseline("c1", TIMEOUT_MS, snapshot));
        EXPECT_EQ(700000, snapshot.baseline_revenue);
        EXPECT_EQ(100, snapshot.baseline_order_count);
        EXPECT_EQ(7000, snapshot.baseline_aov);
        EXPECT_EQ(100000, snapshot.baseline_ad_spend);
        EXPECT_EQ(600000, snapshot.baseline_profit);
        EXPECT_EQ(baseline::HIGH, snapshot.data_quality);
        EXPECT_EQ(1u, snapshot.version);
        EXPECT_GT(snapshot.last_synced, 0u);
    }

    TEST_F(baseline_test, delta_accumulates_and_recalculation_resets_period)
    {
        create_baseline("c1");

        ASSERT_EQ(0, baseline::apply_current_period_delta("c1", 9999, 1000, 1, TIMEOUT_MS));
        ASSERT_EQ(0, baseline::apply_current_period_delta("c1", 5000, 0, 1, TIMEOUT_MS));

        baseline::baseline_snapshot snapshot;
        ASSERT_EQ(0, baseline::get_baseline("c1", TIMEOUT_MS, snapshot));
        EXPECT_EQ(14999, snapshot.current_revenue);
        EXPECT_EQ(1000, snapshot.current_ad_spend);
        EXPECT_EQ(2, snapshot.current_order_count);
        EXPECT_EQ(3u, snapshot.version);

        create_baseline("c1", 800000, 100, 100000);
        ASSERT_EQ(0, baseline::get_baseline("c1", TIMEOUT_MS, snapshot));
        EXPECT_EQ(8000, snapshot.baseline_aov);
        EXPECT_EQ(0, snapshot.current_revenue);
        EXPECT_EQ(0, snapshot.current_order_count);
        EXPECT_EQ(4u, snapshot.version);
    }

    TEST_F(baseline_test, rejects_invalid_values)
    {
        create_baseline("c1");
        EXPECT_EQ(errors::VALIDATION_ERROR, baseline::apply_current_period_delta("c1", -1, 0, 1, TIMEOUT_MS));
        EXPECT_EQ(errors::VALIDATION_ERROR, baseline::apply_current_period_delta("", 1, 0, 1, TIMEOUT_MS));

        baseline::recalculation_input in;
        in.client_id = "c1";
        in.baseline_revenue = -5;
        baseline::baseline_snapshot snapshot;
        EXPECT_EQ(errors::VALIDATION_ERROR, baseline::recalculate(in, TIMEOUT_MS, snapshot));

        in.baseline_revenue = 100;
        in.revenue_variance = std::nan("");
        EXPECT_EQ(errors::VALIDATION_ERROR, baseline::recalculate(in, TIMEOUT_MS, snapshot));
    }

    TEST_F(baseline_test, stale_version_write_conflicts)
    {
        create_baseline("c1");

        sqlite3 *db = NULL;
        ASSERT_EQ(0, store::open(&db, TIMEOUT_MS));

        baseline::baseline_snapshot snapshot;
        ASSERT_EQ(1, baseline::read_baseline(db, "c1", snapshot));

        baseline::period_delta delta;
        delta.revenue = 100;
        delta.orders = 1;
        EXPECT_EQ(0, baseline::write_delta(db, "c1", snapshot.version, delta));
        EXPECT_EQ(errors::CONFLICT, baseline::write_delta(db, "c1", snapshot.version, delta));

        store::close(&db);
    }

} // namespace

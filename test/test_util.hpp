#ifndef _UL_TEST_TEST_UTIL_
#define _UL_TEST_TEST_UTIL_

#include <gtest/gtest.h>
#include "../src/pchheader.hpp"
#include "../src/conf.hpp"
#include "../src/crypto.hpp"
#include "../src/errors.hpp"
#include "../src/baseline/baseline.hpp"
#include "../src/engine/engine.hpp"
#include "../src/ledger/ledger.hpp"
#include "../src/store/store.hpp"
#include "../src/util/util.hpp"

namespace testutil
{
    constexpr uint64_t TIMEOUT_MS = 5000;

    /**
     * Gives every test a fresh ledger database under a temp directory and the default config
     * with a freshly generated api credential.
     */
    class ledger_test : public ::testing::Test
    {
    protected:
        std::string dir;

        void SetUp() override
        {
            char tmpl[] = "/tmp/ul_test_XXXXXX";
            ASSERT_NE(nullptr, mkdtemp(tmpl));
            dir = tmpl;

            conf::set_defaults(conf::cfg);
            conf::cfg.node.api_key_hex = crypto::generate_credential_hex();
            ASSERT_EQ(0, conf::validate_config(conf::cfg));
            ASSERT_EQ(0, store::init(dir + "/ledger.sqlite"));
        }

        void TearDown() override
        {
            store::deinit();
            util::remove_directory_recursively(dir);
        }

        // Baseline with an average order value of 70.00 and 10.00 ad spend per order.
        void create_baseline(const std::string &client_id, const int64_t revenue = 700000, const int64_t order_count = 100,
                             const int64_t ad_spend = 100000)
        {
            baseline::recalculation_input in;
            in.client_id = client_id;
            in.baseline_revenue = revenue;
            in.baseline_order_count = order_count;
            in.baseline_ad_spend = ad_spend;
            in.sample_size = 40;
            in.period_days = 120;
            in.revenue_variance = 0.1;

            baseline::baseline_snapshot snapshot;
            ASSERT_EQ(0, baseline::recalculate(in, TIMEOUT_MS, snapshot));
        }

        // Appends an entry directly through the ledger within its own transaction.
        ledger::ledger_entry append_entry(const std::string &client_id, const std::string &external_order_id, const uint64_t created_at,
                                          const int64_t order_amount = 9999, const bool attributed = true)
        {
            ledger::ledger_entry entry;
            entry.client_id = client_id;
            entry.platform = "shopify";
            entry.internal_order_id = "int-" + external_order_id;
            entry.external_order_id = external_order_id;
            entry.order_amount = order_amount;
            entry.attributed = attributed;
            entry.confidence = attributed ? 0.9 : 0.5;
            entry.baseline_revenue = 7000;
            entry.incremental_revenue = attributed ? order_amount - 7000 : 0;
            entry.ad_spend_for_order = 1000;
            entry.baseline_ad_spend = 1000;
            entry.net_profit_uplift = entry.incremental_revenue;
            entry.fee_rate_ppm = 200000;
            entry.agents = {attribution::CAMPAIGN_OPTIMIZER};
            entry.explanation = "test entry";
            entry.campaign_id = "cmp-1";
            entry.created_at = created_at;

            ledger::attribution_log log;
            log.decision_engine = "multi_signal_v1";

            sqlite3 *db = NULL;
            EXPECT_EQ(0, store::open(&db, TIMEOUT_MS));
            EXPECT_EQ(0, store::sqlite::begin_transaction(db));
            EXPECT_EQ(0, ledger::append(db, entry, log));
            EXPECT_EQ(0, store::sqlite::commit_transaction(db));
            store::close(&db);
            return entry;
        }

        // Runs raw sql on a fresh connection. Returns the exec_sql result.
        int exec(const std::string &sql)
        {
            sqlite3 *db = NULL;
            if (store::open(&db, TIMEOUT_MS) == -1)
                return -1;
            const int res = store::sqlite::exec_sql(db, sql);
            store::close(&db);
            return res;
        }
    };

    inline engine::order_event make_order(const std::string &client_id, const std::string &external_order_id,
                                          const int64_t order_amount = 9999, const double confidence = 0.85)
    {
        engine::order_event ev;
        ev.client_id = client_id;
        ev.external_order_id = external_order_id;
        ev.internal_order_id = "int-" + external_order_id;
        ev.order_amount = order_amount;
        ev.confidence = confidence;
        ev.scores[attribution::AD_TOUCHPOINT] = 0.8;
        return ev;
    }

    // Epoch ms of the given UTC date at noon.
    inline uint64_t date_ms(const int year, const int month, const int day)
    {
        return static_cast<uint64_t>(util::days_from_civil(year, month, day)) * util::MS_PER_DAY + util::MS_PER_DAY / 2;
    }

    inline void current_month(int &year, int &month)
    {
        int day;
        util::civil_from_days(util::get_epoch_milliseconds() / util::MS_PER_DAY, year, month, day);
    }

    // The most recent billing month that has already ended.
    inline void previous_month(int &year, int &month)
    {
        current_month(year, month);
        if (--month == 0)
        {
            month = 12;
            year--;
        }
    }

} // namespace testutil

#endif

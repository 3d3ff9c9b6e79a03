#include "test_util.hpp"
#include "../src/settlement/settlement.hpp"

namespace
{
    using testutil::date_ms;
    using testutil::TIMEOUT_MS;

    class settlement_test : public testutil::ledger_test
    {
    protected:
        settlement::generate_options options;

        void SetUp() override
        {
            testutil::ledger_test::SetUp();
            options.fee_rate_ppm = 200000;
            options.invoice_due_days = 30;
            options.timeout_ms = TIMEOUT_MS;
        }

        // Monthly baseline of 100.00 revenue over 2 orders with 20.00 ad spend.
        void create_small_baseline(const std::string &client_id)
        {
            create_baseline(client_id, 10000, 2, 2000);
        }
    };

    TEST_F(settlement_test, empty_month_charges_nothing)
    {
        create_small_baseline("c1");

        settlement::invoice inv;
        bool created = false;
        ASSERT_EQ(0, settlement::generate_or_return("c1", 2026, 1, options, inv, created));
        EXPECT_TRUE(created);
        EXPECT_EQ(0u, inv.total_orders);
        EXPECT_EQ(0, inv.actual_revenue);
        EXPECT_EQ(-10000, inv.net_profit_uplift);
        EXPECT_EQ(0, inv.fee_amount);
        EXPECT_EQ(settlement::DRAFT, inv.status);
        EXPECT_NE(std::string::npos, inv.explanation.find("No performance fee is charged."));

        settlement::invoice again;
        ASSERT_EQ(0, settlement::generate_or_return("c1", 2026, 1, options, again, created));
        EXPECT_FALSE(created);
        EXPECT_EQ(inv.invoice_id, again.invoice_id);
        EXPECT_EQ(inv.created_at, again.created_at);
    }

    TEST_F(settlement_test, settles_month_and_stamps_entries)
    {
        create_small_baseline("c1");
        const ledger::ledger_entry a = append_entry("c1", "o-1", date_ms(2026, 1, 5), 9000);
        const ledger::ledger_entry b = append_entry("c1", "o-2", date_ms(2026, 1, 20), 6000, false);
        const ledger::ledger_entry feb = append_entry("c1", "o-3", date_ms(2026, 2, 2), 8000);

        settlement::invoice inv;
        bool created = false;
        ASSERT_EQ(0, settlement::generate_or_return("c1", 2026, 1, options, inv, created));
        EXPECT_TRUE(created);
        EXPECT_EQ(2u, inv.total_orders);
        EXPECT_EQ(1u, inv.attributed_orders);
        EXPECT_EQ(1u, inv.high_confidence_orders);
        EXPECT_EQ(15000, inv.actual_revenue);
        EXPECT_EQ(2000, inv.actual_ad_spend);
        EXPECT_EQ(5000, inv.incremental_revenue);
        EXPECT_EQ(0, inv.incremental_ad_spend);
        EXPECT_EQ(5000, inv.net_profit_uplift);
        EXPECT_EQ(1000, inv.fee_amount);
        EXPECT_EQ(4000, inv.client_net_gain);
        EXPECT_EQ(40000, inv.client_roi);
        EXPECT_NE(std::string::npos, inv.explanation.find("Performance fee at rate 0.20: $10.00."));

        sqlite3 *db = NULL;
        ASSERT_EQ(0, store::open(&db, TIMEOUT_MS, false));
        ledger::ledger_entry stored;
        ASSERT_EQ(1, ledger::get_by_seq_no(db, a.seq_no, stored));
        EXPECT_EQ(inv.invoice_id, stored.invoice_id.value_or(""));
        ASSERT_EQ(1, ledger::get_by_seq_no(db, b.seq_no, stored));
        EXPECT_EQ(inv.invoice_id, stored.invoice_id.value_or(""));
        ASSERT_EQ(1, ledger::get_by_seq_no(db, feb.seq_no, stored));
        EXPECT_FALSE(stored.invoice_id.has_value());
        store::close(&db);
    }

    TEST_F(settlement_test, reported_ad_spend_overrides_entries)
    {
        create_small_baseline("c1");
        append_entry("c1", "o-1", date_ms(2026, 1, 5), 9000);
        append_entry("c1", "o-2", date_ms(2026, 1, 6), 6000);

        options.actual_ad_spend = 7000;
        settlement::invoice inv;
        bool created = false;
        ASSERT_EQ(0, settlement::generate_or_return("c1", 2026, 1, options, inv, created));
        EXPECT_EQ(7000, inv.actual_ad_spend);
        EXPECT_EQ(5000, inv.incremental_ad_spend);
        EXPECT_EQ(0, inv.net_profit_uplift);
        EXPECT_EQ(0, inv.fee_amount);
    }

    TEST_F(settlement_test, due_date_follows_period_end)
    {
        create_small_baseline("c1");

        settlement::invoice inv;
        bool created = false;
        ASSERT_EQ(0, settlement::generate_or_return("c1", 2026, 2, options, inv, created));

        uint64_t from_ms, to_ms;
        ASSERT_EQ(0, util::get_month_range(2026, 2, from_ms, to_ms));
        EXPECT_EQ(from_ms, inv.period_start);
        EXPECT_EQ(to_ms, inv.period_end);
        EXPECT_EQ(to_ms + 30 * util::MS_PER_DAY, inv.due_date);
        EXPECT_EQ("2026-03-31", util::to_iso_date(inv.due_date));
    }

    TEST_F(settlement_test, rejects_bad_input)
    {
        settlement::invoice inv;
        bool created = false;
        EXPECT_EQ(errors::NOT_FOUND, settlement::generate_or_return("c1", 2026, 1, options, inv, created));

        create_small_baseline("c1");
        EXPECT_EQ(errors::VALIDATION_ERROR, settlement::generate_or_return("c1", 2026, 13, options, inv, created));
        EXPECT_EQ(errors::VALIDATION_ERROR, settlement::generate_or_return("c1", 2026, 0, options, inv, created));
        EXPECT_EQ(errors::VALIDATION_ERROR, settlement::generate_or_return("", 2026, 1, options, inv, created));

        options.actual_ad_spend = -1;
        EXPECT_EQ(errors::VALIDATION_ERROR, settlement::generate_or_return("c1", 2026, 1, options, inv, created));
        EXPECT_FALSE(created);
    }

    TEST_F(settlement_test, status_lifecycle)
    {
        create_small_baseline("c1");

        settlement::invoice inv;
        bool created = false;
        ASSERT_EQ(0, settlement::generate_or_return("c1", 2026, 1, options, inv, created));
        EXPECT_FALSE(inv.sent_at.has_value());

        EXPECT_EQ(errors::CONFLICT, settlement::advance_status("c1", 2026, 1, settlement::PAID, TIMEOUT_MS, inv));

        ASSERT_EQ(0, settlement::advance_status("c1", 2026, 1, settlement::SENT, TIMEOUT_MS, inv));
        EXPECT_EQ(settlement::SENT, inv.status);
        ASSERT_TRUE(inv.sent_at.has_value());
        EXPECT_FALSE(inv.paid_at.has_value());

        ASSERT_EQ(0, settlement::advance_status("c1", 2026, 1, settlement::PAID, TIMEOUT_MS, inv));
        EXPECT_EQ(settlement::PAID, inv.status);
        EXPECT_TRUE(inv.paid_at.has_value());

        EXPECT_EQ(errors::CONFLICT, settlement::advance_status("c1", 2026, 1, settlement::DISPUTED, TIMEOUT_MS, inv));
        EXPECT_EQ(errors::NOT_FOUND, settlement::advance_status("c1", 2026, 2, settlement::SENT, TIMEOUT_MS, inv));

        settlement::invoice stored;
        ASSERT_EQ(0, settlement::get_invoice("c1", 2026, 1, TIMEOUT_MS, stored));
        EXPECT_EQ(settlement::PAID, stored.status);
    }

    TEST(settlement_status, transitions)
    {
        EXPECT_TRUE(settlement::is_valid_transition(settlement::DRAFT, settlement::SENT));
        EXPECT_TRUE(settlement::is_valid_transition(settlement::SENT, settlement::PAID));
        EXPECT_TRUE(settlement::is_valid_transition(settlement::SENT, settlement::DISPUTED));
        EXPECT_FALSE(settlement::is_valid_transition(settlement::DRAFT, settlement::PAID));
        EXPECT_FALSE(settlement::is_valid_transition(settlement::PAID, settlement::SENT));
        EXPECT_FALSE(settlement::is_valid_transition(settlement::DISPUTED, settlement::PAID));
        EXPECT_FALSE(settlement::is_valid_transition(settlement::SENT, settlement::SENT));

        settlement::INVOICE_STATUS status;
        ASSERT_EQ(0, settlement::status_from_string("disputed", status));
        EXPECT_EQ(settlement::DISPUTED, status);
        EXPECT_EQ(-1, settlement::status_from_string("void", status));
    }

    TEST_F(settlement_test, invoice_amounts_are_immutable)
    {
        create_small_baseline("c1");

        settlement::invoice inv;
        bool created = false;
        ASSERT_EQ(0, settlement::generate_or_return("c1", 2026, 1, options, inv, created));

        EXPECT_EQ(-1, exec("UPDATE invoices SET fee_amount=99"));
        EXPECT_EQ(-1, exec("DELETE FROM invoices"));

        settlement::invoice stored;
        ASSERT_EQ(0, settlement::get_invoice("c1", 2026, 1, TIMEOUT_MS, stored));
        EXPECT_EQ(inv.fee_amount, stored.fee_amount);
    }

} // namespace

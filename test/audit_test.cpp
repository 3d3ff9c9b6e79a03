#include "test_util.hpp"
#include <fstream>
#include "../src/audit/audit_export.hpp"

namespace
{
    using audit_test = testutil::ledger_test;
    using testutil::date_ms;
    using testutil::TIMEOUT_MS;

    TEST_F(audit_test, exports_range_in_append_order)
    {
        append_entry("c1", "o-1", date_ms(2026, 1, 1));
        append_entry("c2", "x-1", date_ms(2026, 1, 1));
        append_entry("c1", "o-2", date_ms(2026, 1, 2));
        append_entry("c1", "o-3", date_ms(2026, 2, 1));

        std::vector<audit::audit_record> records;
        ASSERT_EQ(0, audit::export_records("c1", 0, date_ms(2026, 1, 31), TIMEOUT_MS, records));
        ASSERT_EQ(2u, records.size());
        EXPECT_EQ("o-1", records[0].external_order_id);
        EXPECT_EQ("o-2", records[1].external_order_id);
        EXPECT_EQ(ledger::GENESIS_HASH, records[0].prev_hash);
        EXPECT_EQ(records[0].entry_hash, records[1].prev_hash);

        size_t broken = 0;
        EXPECT_EQ(1, audit::verify_chain(records, broken));
    }

    TEST_F(audit_test, range_may_start_mid_chain)
    {
        append_entry("c1", "o-1", date_ms(2026, 1, 1));
        append_entry("c1", "o-2", date_ms(2026, 1, 2));
        append_entry("c1", "o-3", date_ms(2026, 1, 3));

        std::vector<audit::audit_record> records;
        ASSERT_EQ(0, audit::export_records("c1", date_ms(2026, 1, 2), UINT64_MAX, TIMEOUT_MS, records));
        ASSERT_EQ(2u, records.size());
        EXPECT_NE(ledger::GENESIS_HASH, records[0].prev_hash);

        size_t broken = 0;
        EXPECT_EQ(1, audit::verify_chain(records, broken));
    }

    TEST_F(audit_test, verify_detects_broken_link)
    {
        append_entry("c1", "o-1", date_ms(2026, 1, 1));
        append_entry("c1", "o-2", date_ms(2026, 1, 2));
        append_entry("c1", "o-3", date_ms(2026, 1, 3));

        std::vector<audit::audit_record> records;
        ASSERT_EQ(0, audit::export_records("c1", 0, UINT64_MAX, TIMEOUT_MS, records));
        ASSERT_EQ(3u, records.size());

        size_t broken = 0;
        std::vector<audit::audit_record> tampered = records;
        tampered[1].data_hash = tampered[0].data_hash;
        EXPECT_EQ(0, audit::verify_chain(tampered, broken));
        EXPECT_EQ(1u, broken);

        // Dropping a record breaks the link of its successor.
        tampered = records;
        tampered.erase(tampered.begin() + 1);
        EXPECT_EQ(0, audit::verify_chain(tampered, broken));
        EXPECT_EQ(1u, broken);

        EXPECT_EQ(1, audit::verify_chain({}, broken));
    }

    TEST_F(audit_test, rejects_inverted_range)
    {
        std::vector<audit::audit_record> records;
        EXPECT_EQ(errors::VALIDATION_ERROR, audit::export_records("c1", 10, 5, TIMEOUT_MS, records));
        EXPECT_EQ(errors::VALIDATION_ERROR, audit::export_records("", 0, 5, TIMEOUT_MS, records));

        ASSERT_EQ(0, audit::export_records("nobody", 0, UINT64_MAX, TIMEOUT_MS, records));
        EXPECT_TRUE(records.empty());
    }

    TEST_F(audit_test, export_pages_through_large_ledgers)
    {
        constexpr int count = 505;

        sqlite3 *db = NULL;
        ASSERT_EQ(0, store::open(&db, TIMEOUT_MS));
        ASSERT_EQ(0, store::sqlite::begin_transaction(db));
        for (int i = 0; i < count; i++)
        {
            ledger::ledger_entry entry;
            entry.client_id = "c1";
            entry.platform = "shopify";
            entry.internal_order_id = "int-" + std::to_string(i);
            entry.external_order_id = "o-" + std::to_string(i);
            entry.order_amount = 1000 + i;
            entry.created_at = date_ms(2026, 1, 1) + i;
            ledger::attribution_log log;
            ASSERT_EQ(0, ledger::append(db, entry, log));
        }
        ASSERT_EQ(0, store::sqlite::commit_transaction(db));
        store::close(&db);

        std::vector<audit::audit_record> records;
        ASSERT_EQ(0, audit::export_records("c1", 0, UINT64_MAX, TIMEOUT_MS, records));
        ASSERT_EQ(static_cast<size_t>(count), records.size());
        EXPECT_EQ("o-0", records.front().external_order_id);
        EXPECT_EQ("o-504", records.back().external_order_id);

        size_t broken = 0;
        EXPECT_EQ(1, audit::verify_chain(records, broken));
    }

    TEST(audit_csv, quotes_fields_with_separators)
    {
        audit::audit_record record;
        record.seq_no = 7;
        record.entry_hash = "e";
        record.prev_hash = "p";
        record.data_hash = "d";
        record.external_order_id = "ord,\"1\"";
        record.internal_order_id = "int-1";
        record.order_amount = 9999;
        record.incremental_revenue = 2999;
        record.net_profit_uplift = 2999;
        record.fee_amount = 600;
        record.confidence = 0.85;
        record.attributed = true;
        record.created_at = 1700000000000;

        EXPECT_EQ("7,e,p,d,\"ord,\"\"1\"\"\",int-1,99.99,29.99,29.99,6.00,0.8500,true,,1700000000000\n",
                  audit::to_csv_line(record));

        record.invoice_id = "inv-1";
        record.attributed = false;
        EXPECT_NE(std::string::npos, audit::to_csv_line(record).find(",false,inv-1,"));
    }

    TEST_F(audit_test, writes_flat_file)
    {
        append_entry("c1", "o-1", date_ms(2026, 1, 1));
        append_entry("c1", "o-2", date_ms(2026, 1, 2));

        std::vector<audit::audit_record> records;
        ASSERT_EQ(0, audit::export_records("c1", 0, UINT64_MAX, TIMEOUT_MS, records));

        const std::string file_path = dir + "/audit.csv";
        ASSERT_EQ(0, audit::write_flat_file(file_path, records));

        std::ifstream file(file_path);
        ASSERT_TRUE(file.is_open());
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line))
            lines.push_back(line);

        ASSERT_EQ(3u, lines.size());
        EXPECT_EQ(0u, lines[0].find("seq_no,entry_hash,prev_hash,data_hash,"));
        EXPECT_EQ(0u, lines[1].find(std::to_string(records[0].seq_no) + "," + records[0].entry_hash + "," + ledger::GENESIS_HASH));
        EXPECT_NE(std::string::npos, lines[2].find(",o-2,int-o-2,99.99,"));
    }

} // namespace

#include "test_util.hpp"
#include "../src/util/key_lock.hpp"

namespace
{
    using concurrency_test = testutil::ledger_test;
    using testutil::make_order;
    using testutil::TIMEOUT_MS;

    constexpr int THREAD_COUNT = 8;

    TEST(key_lock, distinct_keys_do_not_block)
    {
        util::key_lock locks;
        util::key_guard a, b;
        ASSERT_EQ(0, locks.lock("a", 100, a));
        ASSERT_EQ(0, locks.lock("b", 100, b));
        EXPECT_TRUE(a.is_locked());
        EXPECT_TRUE(b.is_locked());
        EXPECT_EQ(2u, locks.active_keys());

        a.release();
        EXPECT_FALSE(a.is_locked());
        EXPECT_EQ(1u, locks.active_keys());
    }

    TEST(key_lock, same_key_times_out_while_held)
    {
        util::key_lock locks;
        util::key_guard held;
        ASSERT_EQ(0, locks.lock("a", 100, held));

        int res = 0;
        std::thread waiter([&]() {
            util::key_guard guard;
            res = locks.lock("a", 50, guard);
        });
        waiter.join();
        EXPECT_EQ(-1, res);

        held.release();
        EXPECT_EQ(0u, locks.active_keys());

        util::key_guard again;
        EXPECT_EQ(0, locks.lock("a", 50, again));
    }

    TEST(key_lock, guard_moves_ownership)
    {
        util::key_lock locks;
        util::key_guard moved;
        {
            util::key_guard guard;
            ASSERT_EQ(0, locks.lock("a", 100, guard));
            moved = std::move(guard);
            EXPECT_FALSE(guard.is_locked());
        }
        EXPECT_TRUE(moved.is_locked());
        EXPECT_EQ(1u, locks.active_keys());
    }

    TEST_F(concurrency_test, parallel_duplicates_record_once)
    {
        create_baseline("c1");

        std::vector<std::thread> threads;
        std::array<int, THREAD_COUNT> results{};
        std::array<engine::attribution_result, THREAD_COUNT> recorded;
        for (int i = 0; i < THREAD_COUNT; i++)
        {
            threads.emplace_back([&, i]() {
                results[i] = engine::record_order(make_order("c1", "o-1"), TIMEOUT_MS, recorded[i]);
            });
        }
        for (std::thread &t : threads)
            t.join();

        int originals = 0;
        for (int i = 0; i < THREAD_COUNT; i++)
        {
            EXPECT_EQ(0, results[i]);
            EXPECT_EQ(recorded[0].entry.seq_no, recorded[i].entry.seq_no);
            if (!recorded[i].duplicate)
                originals++;
        }
        EXPECT_EQ(1, originals);

        baseline::baseline_snapshot snapshot;
        ASSERT_EQ(0, baseline::get_baseline("c1", TIMEOUT_MS, snapshot));
        EXPECT_EQ(1, snapshot.current_order_count);
    }

    TEST_F(concurrency_test, parallel_distinct_orders_keep_chain)
    {
        create_baseline("c1");
        create_baseline("c2");

        std::vector<std::thread> threads;
        std::array<int, THREAD_COUNT> results{};
        for (int i = 0; i < THREAD_COUNT; i++)
        {
            threads.emplace_back([&, i]() {
                engine::attribution_result result;
                const std::string client_id = i % 2 == 0 ? "c1" : "c2";
                results[i] = engine::record_order(make_order(client_id, "o-" + std::to_string(i)), TIMEOUT_MS, result);
            });
        }
        for (std::thread &t : threads)
            t.join();

        for (const int res : results)
            EXPECT_EQ(0, res);

        for (const std::string client_id : {"c1", "c2"})
        {
            bool intact = false;
            uint64_t checked = 0, broken = 0;
            ASSERT_EQ(0, engine::verify_client_chain(client_id, TIMEOUT_MS, intact, checked, broken));
            EXPECT_TRUE(intact);
            EXPECT_EQ(static_cast<uint64_t>(THREAD_COUNT / 2), checked);

            baseline::baseline_snapshot snapshot;
            ASSERT_EQ(0, baseline::get_baseline(client_id, TIMEOUT_MS, snapshot));
            EXPECT_EQ(THREAD_COUNT / 2, snapshot.current_order_count);
        }
    }

    TEST_F(concurrency_test, parallel_settlement_generates_one_invoice)
    {
        create_baseline("c1");

        int year, month;
        testutil::previous_month(year, month);
        append_entry("c1", "o-1", testutil::date_ms(year, month, 10));

        std::vector<std::thread> threads;
        std::array<int, THREAD_COUNT> results{};
        std::array<settlement::invoice, THREAD_COUNT> invoices;
        for (int i = 0; i < THREAD_COUNT; i++)
        {
            threads.emplace_back([&, i]() {
                results[i] = engine::get_settlement("c1", year, month, std::nullopt, TIMEOUT_MS, invoices[i]);
            });
        }
        for (std::thread &t : threads)
            t.join();

        for (int i = 0; i < THREAD_COUNT; i++)
        {
            EXPECT_EQ(0, results[i]);
            EXPECT_EQ(invoices[0].invoice_id, invoices[i].invoice_id);
        }
        EXPECT_FALSE(invoices[0].invoice_id.empty());
        EXPECT_EQ(1u, invoices[0].total_orders);
    }

} // namespace

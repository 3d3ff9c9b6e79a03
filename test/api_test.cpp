#include "test_util.hpp"
#include "../src/api/api_server.hpp"

namespace
{
    using testutil::TIMEOUT_MS;

    class api_test : public testutil::ledger_test
    {
    protected:
        // Sends one request with the configured credential and parses the response line.
        jsoncons::ojson request(jsoncons::ojson req)
        {
            if (!req.contains("credential"))
                req["credential"] = conf::cfg.node.api_key_hex;

            std::string line;
            req.dump(line);
            return send_line(line);
        }

        jsoncons::ojson send_line(std::string_view line)
        {
            const std::string res = api::handle_request(line);
            EXPECT_FALSE(res.empty());
            EXPECT_EQ('\n', res.back());
            return jsoncons::ojson::parse(res);
        }

        jsoncons::ojson recalculate_request(const std::string &client_id)
        {
            jsoncons::ojson req;
            req["type"] = "baseline_recalculate";
            req["client_id"] = client_id;
            req["baseline_revenue"] = "7000.00";
            req["baseline_order_count"] = 100;
            req["baseline_ad_spend"] = "1000.00";
            req["sample_size"] = 40;
            req["period_days"] = 120;
            req["revenue_variance"] = 0.1;
            return req;
        }

        jsoncons::ojson order_request(const std::string &client_id, const std::string &external_order_id)
        {
            jsoncons::ojson scores;
            scores["ad_touchpoint"] = 0.8;

            jsoncons::ojson req;
            req["type"] = "record_order";
            req["id"] = "req-" + external_order_id;
            req["client_id"] = client_id;
            req["external_order_id"] = external_order_id;
            req["internal_order_id"] = "int-" + external_order_id;
            req["order_amount"] = "99.99";
            req["confidence"] = 0.85;
            req["signal_scores"] = std::move(scores);
            return req;
        }
    };

    TEST_F(api_test, rejects_wrong_credential)
    {
        jsoncons::ojson req = recalculate_request("c1");
        req["credential"] = std::string(64, '0');

        const jsoncons::ojson res = request(req);
        EXPECT_EQ("baseline_recalculate_result", res["type"].as<std::string>());
        EXPECT_EQ("error", res["status"].as<std::string>());
        EXPECT_EQ("unauthorized", res["error"].as<std::string>());

        baseline::baseline_snapshot snapshot;
        EXPECT_EQ(errors::NOT_FOUND, baseline::get_baseline("c1", TIMEOUT_MS, snapshot));
    }

    TEST_F(api_test, rejects_malformed_requests)
    {
        jsoncons::ojson res = send_line("{not json");
        EXPECT_EQ("invalid_request_result", res["type"].as<std::string>());
        EXPECT_EQ("validation_error", res["error"].as<std::string>());

        res = send_line("[1,2]");
        EXPECT_EQ("invalid_request_result", res["type"].as<std::string>());

        jsoncons::ojson req;
        req["type"] = "drop_tables";
        req["id"] = "x1";
        res = request(req);
        EXPECT_EQ("drop_tables_result", res["type"].as<std::string>());
        EXPECT_EQ("x1", res["id"].as<std::string>());
        EXPECT_EQ("validation_error", res["error"].as<std::string>());

        // Floating point amounts are not accepted.
        req = order_request("c1", "o-1");
        req["order_amount"] = 99.99;
        res = request(req);
        EXPECT_EQ("validation_error", res["error"].as<std::string>());

        req = order_request("c1", "o-1");
        req.at("signal_scores").insert_or_assign("unknown_signal", 0.5);
        res = request(req);
        EXPECT_EQ("validation_error", res["error"].as<std::string>());
    }

    TEST_F(api_test, record_order_flow)
    {
        jsoncons::ojson res = request(recalculate_request("c1"));
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_EQ("70.00", res["baseline"]["average_order_value"].as<std::string>());
        EXPECT_EQ("high", res["baseline"]["data_quality"].as<std::string>());

        res = request(order_request("c1", "o-1"));
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_EQ("record_order_result", res["type"].as<std::string>());
        EXPECT_EQ("req-o-1", res["id"].as<std::string>());
        EXPECT_FALSE(res["duplicate"].as<bool>());

        const jsoncons::ojson &entry = res["entry"];
        EXPECT_TRUE(entry["attributed"].as<bool>());
        EXPECT_EQ("99.99", entry["order_amount"].as<std::string>());
        EXPECT_EQ("29.99", entry["incremental_revenue"].as<std::string>());
        EXPECT_EQ("42.84", entry["uplift_pct"].as<std::string>());
        EXPECT_EQ("6.00", entry["fee_amount"].as<std::string>());
        EXPECT_EQ("0.20", entry["fee_rate"].as<std::string>());
        EXPECT_EQ("campaign_optimizer", entry["agents"][0].as<std::string>());
        EXPECT_TRUE(entry["campaign_id"].is_null());
        EXPECT_TRUE(entry["invoice_id"].is_null());

        res = request(order_request("c1", "o-1"));
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_TRUE(res["duplicate"].as<bool>());

        jsoncons::ojson req;
        req["type"] = "order_attribution";
        req["client_id"] = "c1";
        req["external_order_id"] = "o-1";
        res = request(req);
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_EQ("multi_signal_v1", res["attribution"]["decision_engine"].as<std::string>());
        EXPECT_EQ("70.00", res["attribution"]["counterfactual_revenue"].as<std::string>());

        req = jsoncons::ojson();
        req["type"] = "live_attributions";
        req["client_id"] = "c1";
        req["limit"] = 5;
        res = request(req);
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_EQ(1u, res["entries"].size());

        req = jsoncons::ojson();
        req["type"] = "client_summary";
        req["client_id"] = "c1";
        res = request(req);
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_EQ(1u, res["total_orders"].as<uint64_t>());
        EXPECT_EQ("100.00", res["attribution_rate"].as<std::string>());
        EXPECT_EQ("6.00", res["incremental"]["fees"].as<std::string>());
        EXPECT_EQ(3u, res["scenarios"].size());
    }

    TEST_F(api_test, record_order_without_baseline)
    {
        const jsoncons::ojson res = request(order_request("c9", "o-1"));
        EXPECT_EQ("error", res["status"].as<std::string>());
        EXPECT_EQ("not_found", res["error"].as<std::string>());
    }

    TEST_F(api_test, settlement_and_status)
    {
        request(recalculate_request("c1"));
        request(order_request("c1", "o-1"));

        int year, month;
        testutil::current_month(year, month);

        jsoncons::ojson open_month;
        open_month["type"] = "settlement";
        open_month["client_id"] = "c1";
        open_month["year"] = year;
        open_month["month"] = month;
        const jsoncons::ojson rejected = request(open_month);
        EXPECT_EQ("validation_error", rejected.at("error").as<std::string>());

        testutil::previous_month(year, month);
        append_entry("c1", "o-0", testutil::date_ms(year, month, 20));

        jsoncons::ojson spend;
        spend["meta"] = "5.00";
        spend["google"] = 500;

        jsoncons::ojson req;
        req["type"] = "settlement";
        req["client_id"] = "c1";
        req["year"] = year;
        req["month"] = month;
        req["ad_spend_by_platform"] = std::move(spend);
        jsoncons::ojson res = request(req);
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_EQ("505.00", res["actual_ad_spend"].as<std::string>());
        EXPECT_EQ("99.99", res["actual_revenue"].as<std::string>());
        EXPECT_EQ("0.00", res["fee_amount"].as<std::string>());
        EXPECT_EQ("draft", res["invoice_status"].as<std::string>());
        EXPECT_EQ(10u, res["due_date"].as<std::string>().size());
        const std::string invoice_id = res["invoice_id"].as<std::string>();

        req.erase("ad_spend_by_platform");
        res = request(req);
        EXPECT_EQ(invoice_id, res["invoice_id"].as<std::string>());

        req["type"] = "invoice_status";
        req["invoice_status"] = "paid";
        res = request(req);
        EXPECT_EQ("conflict", res["error"].as<std::string>());

        req["invoice_status"] = "sent";
        res = request(req);
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_EQ("sent", res["invoice_status"].as<std::string>());
        EXPECT_FALSE(res["sent_at"].is_null());

        req["month"] = 13;
        res = request(req);
        EXPECT_EQ("validation_error", res["error"].as<std::string>());
    }

    TEST_F(api_test, audit_export_and_anonymize)
    {
        request(recalculate_request("c1"));
        request(order_request("c1", "o-1"));
        request(order_request("c1", "o-2"));

        jsoncons::ojson req;
        req["type"] = "anonymize";
        req["client_id"] = "c1";
        req["external_order_id"] = "o-1";
        jsoncons::ojson res = request(req);
        ASSERT_EQ("ok", res["status"].as<std::string>());
        EXPECT_TRUE(res["entry"]["anonymized"].as<bool>());

        req = jsoncons::ojson();
        req["type"] = "audit_export";
        req["client_id"] = "c1";
        res = request(req);
        ASSERT_EQ("ok", res["status"].as<std::string>());
        ASSERT_EQ(2u, res["records"].size());
        EXPECT_TRUE(res["chain_intact"].as<bool>());
        EXPECT_FALSE(res.contains("broken_seq_no"));
        EXPECT_EQ(0u, res["records"][0]["external_order_id"].as<std::string>().find("anon-"));

        req["from"] = 10;
        req["to"] = 5;
        res = request(req);
        EXPECT_EQ("validation_error", res["error"].as<std::string>());
    }

} // namespace

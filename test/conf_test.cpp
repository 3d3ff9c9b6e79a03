#include <gtest/gtest.h>
#include "../src/conf.hpp"
#include "../src/crypto.hpp"

namespace
{
    conf::ul_config valid_config()
    {
        conf::ul_config cfg = {};
        conf::set_defaults(cfg);
        cfg.node.api_key_hex = crypto::generate_credential_hex();
        return cfg;
    }

    TEST(conf, defaults_are_valid)
    {
        conf::ul_config cfg = valid_config();
        ASSERT_EQ(0, conf::validate_config(cfg));
        EXPECT_EQ(200000, cfg.billing.fee_rate_ppm);
        EXPECT_DOUBLE_EQ(0.70, cfg.attribution.confidence_threshold);
        EXPECT_EQ(30u, cfg.billing.invoice_due_days);
    }

    TEST(conf, rejects_invalid_values)
    {
        conf::ul_config cfg = valid_config();
        cfg.billing.fee_rate = "1.5";
        EXPECT_EQ(-1, conf::validate_config(cfg));

        cfg = valid_config();
        cfg.attribution.confidence_threshold = 1.1;
        EXPECT_EQ(-1, conf::validate_config(cfg));

        cfg = valid_config();
        cfg.node.api_key_hex = "abcd";
        EXPECT_EQ(-1, conf::validate_config(cfg));

        cfg = valid_config();
        cfg.store.timeout_ms = 0;
        EXPECT_EQ(-1, conf::validate_config(cfg));

        cfg = valid_config();
        cfg.log.loggers.emplace("syslog");
        EXPECT_EQ(-1, conf::validate_config(cfg));

        cfg = valid_config();
        cfg.billing.client_fee_rates["c1"] = "x";
        EXPECT_EQ(-1, conf::validate_config(cfg));
    }

    TEST(conf, client_fee_overrides)
    {
        conf::ul_config cfg = valid_config();
        cfg.billing.client_fee_rates["c1"] = "0.10";
        ASSERT_EQ(0, conf::validate_config(cfg));
        EXPECT_EQ(100000, cfg.billing.client_fee_ppm["c1"]);

        conf::cfg = cfg;
        EXPECT_EQ(100000, conf::get_fee_rate_ppm("c1"));
        EXPECT_EQ(200000, conf::get_fee_rate_ppm("c2"));
    }

    TEST(conf, parses_written_document)
    {
        conf::ul_config cfg = valid_config();
        cfg.billing.client_fee_rates["c1"] = "0.15";
        cfg.api.max_connections = 4;

        jsoncons::ojson d;
        conf::populate_config_json(d, cfg);

        conf::ul_config parsed = {};
        ASSERT_EQ(0, conf::parse_config(parsed, d));
        ASSERT_EQ(0, conf::validate_config(parsed));
        EXPECT_EQ(cfg.node.api_key_hex, parsed.node.api_key_hex);
        EXPECT_EQ(150000, parsed.billing.client_fee_ppm["c1"]);
        EXPECT_EQ(4, parsed.api.max_connections);
        EXPECT_EQ(conf::LOG_SEVERITY::INFO, parsed.log.log_level_type);

        d.at("billing").erase("fee_rate");
        EXPECT_EQ(-1, conf::parse_config(parsed, d));
    }

    TEST(conf, ledger_directory_lifecycle)
    {
        char tmpl[] = "/tmp/ul_conf_XXXXXX";
        ASSERT_NE(nullptr, mkdtemp(tmpl));
        const std::string base = std::string(tmpl) + "/ledger";

        ASSERT_EQ(0, conf::set_dir_paths(base));
        EXPECT_EQ(base + "/cfg/ul.cfg", conf::ctx.config_file);
        ASSERT_EQ(0, conf::create_ledger_dir());
        EXPECT_EQ(-1, conf::create_ledger_dir());

        ASSERT_EQ(0, conf::init());
        const std::string key = conf::cfg.node.api_key_hex;
        conf::deinit();

        ASSERT_EQ(0, conf::rekey());
        ASSERT_EQ(0, conf::init_readonly());
        EXPECT_NE(key, conf::cfg.node.api_key_hex);

        util::remove_directory_recursively(tmpl);
    }

} // namespace

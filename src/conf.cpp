#include "pchheader.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "util/util.hpp"
#include "util/money.hpp"
#include "util/version.hpp"

namespace conf
{
    // Global ledger context struct exposed to the application.
    ledger_ctx ctx;

    // Global configuration struct exposed to the application.
    ul_config cfg;

    constexpr mode_t CONFIG_FILE_PERMS = 0600;

    // Upper bounds for sanity checking loaded values.
    constexpr uint32_t MAX_STORE_TIMEOUT_MS = 600000;
    constexpr uint32_t MAX_INVOICE_DUE_DAYS = 365;

    bool init_success = false;

    /**
     * Locks, loads and validates the config of the serving instance. The lock is held until deinit().
     * @return 0 for success. -1 for failure.
     */
    int init()
    {
        if (set_config_lock() == -1)
            return -1;

        if (read_config(cfg) == -1 ||
            validate_config(cfg) == -1)
        {
            release_config_lock();
            return -1;
        }

        init_success = true;
        return 0;
    }

    /**
     * Loads the config without taking the instance lock. Used by read-only commands which may run
     * alongside a serving instance.
     * @return 0 for success. -1 for failure.
     */
    int init_readonly()
    {
        ctx.config_fd = open(ctx.config_file.data(), O_RDONLY);
        if (ctx.config_fd == -1)
        {
            std::cerr << "Config file not found at " << ctx.config_file << "\n";
            return -1;
        }

        const int res = (read_config(cfg) == -1 || validate_config(cfg) == -1) ? -1 : 0;
        close(ctx.config_fd);
        ctx.config_fd = -1;
        return res;
    }

    void deinit()
    {
        if (init_success)
        {
            release_config_lock();
            init_success = false;
        }
    }

    /**
     * Replaces the API credential in the config. Fails while a serving instance holds the lock.
     */
    int rekey()
    {
        if (set_config_lock() == -1)
            return -1;

        ul_config cfg = {};
        if (read_config(cfg) != 0)
        {
            release_config_lock();
            return -1;
        }

        cfg.node.api_key_hex = crypto::generate_credential_hex();

        if (write_config(cfg) != 0)
        {
            release_config_lock();
            return -1;
        }

        std::cout << "New API credential written to " << ctx.config_file << std::endl;
        release_config_lock();
        return 0;
    }

    void set_defaults(ul_config &cfg)
    {
        cfg.ul_version = version::UL_VERSION;

        cfg.billing.fee_rate = "0.20";
        cfg.billing.fee_rate_ppm = 200000;
        cfg.billing.invoice_due_days = 30;
        cfg.billing.client_fee_rates.clear();
        cfg.billing.client_fee_ppm.clear();

        cfg.attribution.confidence_threshold = 0.70;

        cfg.store.timeout_ms = 5000;

        cfg.api.enabled = true;
        cfg.api.max_connections = 32;
        cfg.api.max_request_bytes = 64 * 1024;

        cfg.log.max_file_count = 50;
        cfg.log.max_mbytes_per_file = 10;
        cfg.log.log_level = "inf";
        cfg.log.log_level_type = LOG_SEVERITY::INFO;
        cfg.log.loggers.clear();
        cfg.log.loggers.emplace("console");
        cfg.log.loggers.emplace("file");
    }

    /**
     * Lays out cfg/, data/ and log/ under ctx.base_dir and writes a default config with a fresh credential.
     * Refuses to touch an existing directory.
     */
    int create_ledger_dir()
    {
        if (util::is_dir_exists(ctx.base_dir))
        {
            std::cerr << ctx.base_dir << " already exists. Choose a new location for the ledger.\n";
            return -1;
        }

        if (util::create_dir_tree_recursive(ctx.config_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.data_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.log_dir) == -1)
        {
            std::cerr << "Could not create the ledger directory layout under " << ctx.base_dir << "\n";
            return -1;
        }

        ul_config cfg = {};
        set_defaults(cfg);
        cfg.node.api_key_hex = crypto::generate_credential_hex();

        if (write_config(cfg) != 0)
            return -1;

        std::cout << "Ledger directory created at " << ctx.base_dir << std::endl;
        return 0;
    }

    /**
     * Derives every ledger file location from the base directory given on the command line.
     * @return 0 on success. -1 if the base directory is empty.
     */
    int set_dir_paths(std::string basedir)
    {
        if (basedir.empty())
        {
            std::cerr << "a ledger directory must be specified\n";
            return -1;
        }

        // Existing directories are canonicalised. A directory that 'new' is about to create is kept as given.
        const std::string resolved = util::realpath(basedir);
        if (!resolved.empty())
            basedir = resolved;
        else if (basedir.size() > 1 && basedir.back() == '/')
            basedir.pop_back();

        ctx.base_dir = basedir;
        ctx.config_dir = basedir + "/cfg";
        ctx.config_file = ctx.config_dir + "/ul.cfg";
        ctx.data_dir = basedir + "/data";
        ctx.db_file = ctx.data_dir + "/ledger.sqlite";
        ctx.log_dir = basedir + "/log";
        ctx.socket_file = basedir + "/ul.sock";
        return 0;
    }

    /**
     * Returns the fee rate applicable to the given client in parts-per-million.
     */
    int64_t get_fee_rate_ppm(const std::string &client_id)
    {
        const auto itr = cfg.billing.client_fee_ppm.find(client_id);
        return itr == cfg.billing.client_fee_ppm.end() ? cfg.billing.fee_rate_ppm : itr->second;
    }

    /**
     * Parses the config file behind ctx.config_fd into the struct. Comments and trailing commas are rejected.
     */
    int read_config(ul_config &cfg)
    {
        std::string buf;
        if (util::read_from_fd(ctx.config_fd, buf) == -1)
        {
            std::cerr << errno << ": Could not read " << ctx.config_file << "\n";
            return -1;
        }

        jsoncons::ojson d;
        try
        {
            d = jsoncons::ojson::parse(buf, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            std::cerr << ctx.config_file << " is not valid JSON. " << e.what() << '\n';
            return -1;
        }
        buf.clear();

        return parse_config(cfg, d);
    }

    /**
     * Runs the reader over one top level config section. A missing section or field is reported
     * with the field name taken from the jsoncons error.
     * @return 0 on success. -1 if the reader threw.
     */
    template <typename F>
    int read_section(const jsoncons::ojson &d, const char *section, F reader)
    {
        try
        {
            reader(d.at(section));
            return 0;
        }
        catch (const std::exception &e)
        {
            std::cerr << "Config section '" << section << "' is missing field " << extract_missing_field(e.what())
                      << " (" << ctx.config_file << ")\n";
            return -1;
        }
    }

    /**
     * Populates the config struct from a parsed config json document.
     * @return 0 on success. -1 on missing or malformed fields.
     */
    int parse_config(ul_config &cfg, const jsoncons::ojson &d)
    {
        if (!d.contains("version") || !d.at("version").is_string())
        {
            std::cerr << "Config has no version string (" << ctx.config_file << ")\n";
            return -1;
        }

        cfg.ul_version = d.at("version").as<std::string>();
        switch (version::version_compare(cfg.ul_version, version::MIN_CONFIG_VERSION))
        {
        case -2:
            std::cerr << "Malformed config version '" << cfg.ul_version << "'\n";
            return -1;
        case -1:
            std::cerr << "Config version " << cfg.ul_version << " is older than the minimum " << version::MIN_CONFIG_VERSION << "\n";
            return -1;
        default:
            break;
        }

        const int res =
            read_section(d, "node", [&](const jsoncons::ojson &node) {
                cfg.node.api_key_hex = node.at("api_key").as<std::string>();
            }) |
            read_section(d, "billing", [&](const jsoncons::ojson &billing) {
                cfg.billing.fee_rate = billing.at("fee_rate").as<std::string>();
                cfg.billing.invoice_due_days = billing.at("invoice_due_days").as<uint32_t>();
                cfg.billing.client_fee_rates.clear();
                if (billing.contains("client_fee_rates"))
                {
                    for (const auto &member : billing.at("client_fee_rates").object_range())
                        cfg.billing.client_fee_rates.emplace(std::string(member.key()), member.value().as<std::string>());
                }
            }) |
            read_section(d, "attribution", [&](const jsoncons::ojson &attribution) {
                cfg.attribution.confidence_threshold = attribution.at("confidence_threshold").as<double>();
            }) |
            read_section(d, "store", [&](const jsoncons::ojson &store) {
                cfg.store.timeout_ms = store.at("timeout_ms").as<uint32_t>();
            }) |
            read_section(d, "api", [&](const jsoncons::ojson &api) {
                cfg.api.enabled = api.at("enabled").as<bool>();
                cfg.api.max_connections = api.at("max_connections").as<uint16_t>();
                cfg.api.max_request_bytes = api.at("max_request_bytes").as<uint64_t>();
            }) |
            read_section(d, "log", [&](const jsoncons::ojson &log) {
                cfg.log.log_level = log.at("log_level").as<std::string>();
                cfg.log.log_level_type = get_loglevel_type(cfg.log.log_level);
                cfg.log.max_mbytes_per_file = log.at("max_mbytes_per_file").as<size_t>();
                cfg.log.max_file_count = log.at("max_file_count").as<size_t>();
                cfg.log.loggers.clear();
                for (const auto &v : log.at("loggers").array_range())
                    cfg.log.loggers.emplace(v.as<std::string>());
            });

        return res == 0 ? 0 : -1;
    }

    int write_config(const ul_config &cfg)
    {
        jsoncons::ojson d;
        populate_config_json(d, cfg);
        return write_json_file(ctx.config_file, d);
    }

    /**
     * Builds the config document. ojson keeps the sections in the order written here.
     */
    void populate_config_json(jsoncons::ojson &d, const ul_config &cfg)
    {
        d.insert_or_assign("version", cfg.ul_version);

        jsoncons::ojson node;
        node.insert_or_assign("api_key", cfg.node.api_key_hex);
        d.insert_or_assign("node", std::move(node));

        jsoncons::ojson client_rates;
        for (const auto &[client_id, rate] : cfg.billing.client_fee_rates)
            client_rates.insert_or_assign(client_id, rate);

        jsoncons::ojson billing;
        billing.insert_or_assign("fee_rate", cfg.billing.fee_rate);
        billing.insert_or_assign("invoice_due_days", cfg.billing.invoice_due_days);
        billing.insert_or_assign("client_fee_rates", std::move(client_rates));
        d.insert_or_assign("billing", std::move(billing));

        jsoncons::ojson attribution;
        attribution.insert_or_assign("confidence_threshold", cfg.attribution.confidence_threshold);
        d.insert_or_assign("attribution", std::move(attribution));

        jsoncons::ojson store;
        store.insert_or_assign("timeout_ms", cfg.store.timeout_ms);
        d.insert_or_assign("store", std::move(store));

        jsoncons::ojson api;
        api.insert_or_assign("enabled", cfg.api.enabled);
        api.insert_or_assign("max_connections", cfg.api.max_connections);
        api.insert_or_assign("max_request_bytes", cfg.api.max_request_bytes);
        d.insert_or_assign("api", std::move(api));

        // Sorted so the file does not churn between rewrites.
        std::vector<std::string> logger_names(cfg.log.loggers.begin(), cfg.log.loggers.end());
        std::sort(logger_names.begin(), logger_names.end());
        jsoncons::ojson loggers(jsoncons::json_array_arg);
        for (const std::string &name : logger_names)
            loggers.push_back(name);

        jsoncons::ojson log;
        log.insert_or_assign("log_level", cfg.log.log_level);
        log.insert_or_assign("max_mbytes_per_file", cfg.log.max_mbytes_per_file);
        log.insert_or_assign("max_file_count", cfg.log.max_file_count);
        log.insert_or_assign("loggers", std::move(loggers));
        d.insert_or_assign("log", std::move(log));
    }

    /**
     * Validates the 'cfg' struct for invalid values and populates the derived in-memory fields.
     *
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_config(ul_config &cfg)
    {
        if (cfg.node.api_key_hex.empty() || util::to_bin(cfg.node.api_key_hex).size() != crypto::CREDENTIAL_LEN)
        {
            std::cerr << "API credential missing or malformed. Run with 'rekey' to generate a new credential.\n";
            return -1;
        }

        bool fields_missing = false;

        fields_missing |= cfg.billing.fee_rate.empty() && std::cerr << "Missing cfg field: fee_rate\n";
        fields_missing |= cfg.log.log_level.empty() && std::cerr << "Missing cfg field: log_level\n";
        fields_missing |= cfg.log.loggers.empty() && std::cerr << "Missing cfg field: loggers\n";

        if (fields_missing)
        {
            std::cerr << "Required configuration fields missing at " << ctx.config_file << std::endl;
            return -1;
        }

        // Billing settings
        if (money::parse_rate(cfg.billing.fee_rate, cfg.billing.fee_rate_ppm) == -1)
        {
            std::cerr << "Invalid fee_rate " << cfg.billing.fee_rate << ". Decimal between 0 and 1 expected.\n";
            return -1;
        }

        cfg.billing.client_fee_ppm.clear();
        for (const auto &[client_id, rate] : cfg.billing.client_fee_rates)
        {
            int64_t ppm = 0;
            if (client_id.empty() || money::parse_rate(rate, ppm) == -1)
            {
                std::cerr << "Invalid client fee rate for '" << client_id << "'. Decimal between 0 and 1 expected.\n";
                return -1;
            }
            cfg.billing.client_fee_ppm.emplace(client_id, ppm);
        }

        if (cfg.billing.invoice_due_days > MAX_INVOICE_DUE_DAYS)
        {
            std::cerr << "invoice_due_days cannot exceed " << MAX_INVOICE_DUE_DAYS << "\n";
            return -1;
        }

        // Attribution settings
        if (!(cfg.attribution.confidence_threshold >= 0 && cfg.attribution.confidence_threshold <= 1))
        {
            std::cerr << "Invalid confidence_threshold. Value between 0 and 1 expected.\n";
            return -1;
        }

        // Store settings
        if (cfg.store.timeout_ms == 0 || cfg.store.timeout_ms > MAX_STORE_TIMEOUT_MS)
        {
            std::cerr << "Invalid store timeout_ms. Value between 1 and " << MAX_STORE_TIMEOUT_MS << " expected.\n";
            return -1;
        }

        // Api settings
        if (cfg.api.enabled && (cfg.api.max_connections == 0 || cfg.api.max_request_bytes == 0))
        {
            std::cerr << "Api max_connections and max_request_bytes must be positive.\n";
            return -1;
        }

        // Log settings
        const std::unordered_set<std::string> valid_loglevels({"dbg", "inf", "wrn", "err"});
        if (valid_loglevels.count(cfg.log.log_level) != 1)
        {
            std::cerr << "Invalid loglevel configured. Valid values: dbg|inf|wrn|err\n";
            return -1;
        }

        const std::unordered_set<std::string> valid_loggers({"console", "file"});
        for (const std::string &logger : cfg.log.loggers)
        {
            if (valid_loggers.count(logger) != 1)
            {
                std::cerr << "Invalid logger. Valid values: console|file\n";
                return -1;
            }
        }

        return 0;
    }

    // Unknown codes map to ERROR.
    LOG_SEVERITY get_loglevel_type(std::string_view severity)
    {
        if (severity == "dbg")
            return LOG_SEVERITY::DEBUG;
        else if (severity == "wrn")
            return LOG_SEVERITY::WARN;
        else if (severity == "inf")
            return LOG_SEVERITY::INFO;
        else
            return LOG_SEVERITY::ERROR;
    }

    // jsoncons names the missing key in single quotes.
    const std::string extract_missing_field(std::string err_message)
    {
        err_message.erase(0, err_message.find("'") + 1);
        return err_message.substr(0, err_message.find("'"));
    }

    /**
     * Opens the config and takes an exclusive fcntl lock on it. One writer per ledger directory.
     * @return 0 when locked. -1 if missing or held by another process.
     */
    int set_config_lock()
    {
        ctx.config_fd = open(ctx.config_file.data(), O_RDWR);
        if (ctx.config_fd == -1)
        {
            std::cerr << "Config file not found at " << ctx.config_file << "\n";
            return -1;
        }

        if (util::set_lock(ctx.config_fd, ctx.config_lock, true, 0, 0) == -1)
        {
            if (errno == EACCES || errno == EAGAIN)
                std::cerr << "Ledger at " << ctx.base_dir << " is in use by another upliftledger process.\n";
            else
                std::cerr << errno << ": Could not lock " << ctx.config_file << "\n";
            close(ctx.config_fd);
            ctx.config_fd = -1;
            return -1;
        }

        return 0;
    }


    int release_config_lock()
    {
        if (ctx.config_fd == -1)
            return 0;

        const int res = util::release_lock(ctx.config_fd, ctx.config_lock);
        close(ctx.config_fd);
        ctx.config_fd = -1;
        return res;
    }

    /**
     * Pretty prints the document to the file.
     * @return 0 on success. -1 on failure.
     */
    int write_json_file(const std::string &file_path, const jsoncons::ojson &d)
    {
        std::string json;
        try
        {
            jsoncons::json_options options;
            options.object_array_line_splits(jsoncons::line_split_kind::multi_line);
            options.spaces_around_comma(jsoncons::spaces_option::no_spaces);
            std::ostringstream os;
            os << jsoncons::pretty_print(d, options) << "\n";
            json = os.str();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Could not serialise " << file_path << ": " << e.what() << "\n";
            return -1;
        }

        // Closing a second descriptor of the locked config would drop our fcntl lock,
        // so the locked file is rewritten in place through the lock holder.
        if (file_path == ctx.config_file && ctx.config_fd != -1)
        {
            if (ftruncate(ctx.config_fd, 0) == -1 ||
                pwrite(ctx.config_fd, json.data(), json.size(), 0) != static_cast<ssize_t>(json.size()) ||
                fsync(ctx.config_fd) == -1)
            {
                std::cerr << errno << ": Could not rewrite " << file_path << "\n";
                return -1;
            }
            return 0;
        }

        return util::write_file(file_path, json, CONFIG_FILE_PERMS);
    }

} // namespace conf

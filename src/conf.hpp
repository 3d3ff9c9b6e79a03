#ifndef _UL_CONF_
#define _UL_CONF_

#include "pchheader.hpp"
#include "util/util.hpp"

/**
 * Manages the central config and context structs.
 * Contains functions to config operations such as create/rekey/load.
 */
namespace conf
{
    struct node_config
    {
        std::string api_key_hex; // Pre-shared internal credential (hex) required by every API request.
    };

    struct billing_config
    {
        std::string fee_rate;                                     // Default performance fee rate as a decimal string ("0.20").
        std::map<std::string, std::string> client_fee_rates;      // Per-client fee rate overrides (client id -> decimal string).
        uint32_t invoice_due_days = 0;                            // Invoice due date offset from the end of the billing month.

        // Config elements which are initialized in memory (these are not directly loaded from the config file)
        int64_t fee_rate_ppm = 0;                                 // Default fee rate in parts-per-million.
        std::unordered_map<std::string, int64_t> client_fee_ppm;  // Parsed per-client overrides.
    };

    struct attribution_config
    {
        double confidence_threshold = 0; // Minimum attribution confidence for an order to be attributed.
    };

    struct store_config
    {
        uint32_t timeout_ms = 0; // Default store timeout applied when a caller does not supply one.
    };

    struct api_config
    {
        bool enabled = false;           // Whether to serve the local API socket.
        uint16_t max_connections = 0;   // Max concurrent API connections.
        uint64_t max_request_bytes = 0; // Max size of a single request line.
    };

    // Log severity levels used in upliftledger.
    enum LOG_SEVERITY
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct log_config
    {
        std::string log_level;                   // Log severity level (dbg, inf, wrn, err)
        LOG_SEVERITY log_level_type;             // Log severity level enum (debug, info, warn, error)
        std::unordered_set<std::string> loggers; // List of enabled loggers (console, file)
        size_t max_mbytes_per_file = 0;          // Max MB size of a single log file.
        size_t max_file_count = 0;               // Max no. of log files to keep.
    };

    // Holds all the config values.
    struct ul_config
    {
        std::string ul_version;
        node_config node;
        billing_config billing;
        attribution_config attribution;
        store_config store;
        api_config api;
        log_config log;
    };

    // Holds contextual information about the currently loaded ledger directory.
    struct ledger_ctx
    {
        std::string command; // The CLI command issued to launch upliftledger.

        std::string base_dir;    // Ledger base directory full path.
        std::string config_dir;  // Config dir full path.
        std::string config_file; // Full path to the config file.
        std::string data_dir;    // Database dir full path.
        std::string db_file;     // Full path to the ledger database.
        std::string log_dir;     // Log dir full path.
        std::string socket_file; // Full path to the API unix socket.

        // Arguments of the 'export' command.
        std::string export_client_id;
        uint64_t export_from_ms = 0;
        uint64_t export_to_ms = 0;
        std::string export_file;

        int config_fd = -1;       // Config file file descriptor.
        struct flock config_lock; // Config file lock.
    };

    // Global ledger context struct exposed to the application.
    // Other modules will access context values via this.
    extern ledger_ctx ctx;

    // Global configuration struct exposed to the application.
    // Other modules will access config values via this.
    extern ul_config cfg;

    int init();

    int init_readonly();

    void deinit();

    int rekey();

    int create_ledger_dir();

    int set_dir_paths(std::string basedir);

    void set_defaults(ul_config &cfg);

    int64_t get_fee_rate_ppm(const std::string &client_id);

    //------Internal-use functions for this namespace.

    int read_config(ul_config &cfg);

    int parse_config(ul_config &cfg, const jsoncons::ojson &d);

    int write_config(const ul_config &cfg);

    void populate_config_json(jsoncons::ojson &d, const ul_config &cfg);

    int validate_config(ul_config &cfg);

    LOG_SEVERITY get_loglevel_type(std::string_view severity);

    const std::string extract_missing_field(std::string err_message);

    int set_config_lock();

    int release_config_lock();

    int write_json_file(const std::string &file_path, const jsoncons::ojson &d);

} // namespace conf

#endif

#include "pchheader.hpp"
#include "util/version.hpp"
#include "util/util.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "ullog.hpp"
#include "store/store.hpp"
#include "engine/engine.hpp"
#include "api/api_server.hpp"

void print_usage()
{
    std::cout << "Usage:\n"
              << "  upliftledger version\n"
              << "  upliftledger new|run|rekey <ledger dir>\n"
              << "  upliftledger verify <ledger dir> <client id>\n"
              << "  upliftledger export <ledger dir> <client id> <from epoch ms> <to epoch ms> <output csv>\n";
}

/**
 * Fills conf::ctx from the command line. Every command except 'version' starts with the ledger directory.
 * @return 0 if the command and its arguments are well formed. -1 otherwise.
 */
int parse_cmd(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return -1;
    }

    conf::ctx.command = argv[1];
    const std::string &cmd = conf::ctx.command;

    // Expected argc per command.
    const std::unordered_map<std::string, int> arities{
        {"version", 2}, {"new", 3}, {"run", 3}, {"rekey", 3}, {"verify", 4}, {"export", 7}};

    const auto itr = arities.find(cmd);
    if (itr == arities.end())
    {
        std::cerr << "Unknown command '" << cmd << "'\n";
        print_usage();
        return -1;
    }

    if (argc != itr->second)
    {
        std::cerr << "Wrong number of arguments for '" << cmd << "'\n";
        print_usage();
        return -1;
    }

    if (cmd == "version")
        return 0;

    if (conf::set_dir_paths(argv[2]) == -1)
        return -1;

    if (cmd == "verify" || cmd == "export")
        conf::ctx.export_client_id = argv[3];

    if (cmd == "export")
    {
        if (util::stoull(argv[4], conf::ctx.export_from_ms) == -1 ||
            util::stoull(argv[5], conf::ctx.export_to_ms) == -1)
        {
            std::cerr << "Export range must be given as epoch milliseconds.\n";
            return -1;
        }
        conf::ctx.export_file = argv[6];
    }

    return 0;
}

// Set by SIGINT/SIGTERM. The run loop performs the shutdown outside the handler.
std::atomic<int> exit_signal{0};

void deinit()
{
    api::deinit();
    store::deinit();
    conf::deinit();
}

void sig_exit_handler(int signum)
{
    exit_signal = signum;
}

void segfault_handler(int signum)
{
    std::cerr << "Fatal signal " << signum << "\n"
              << boost::stacktrace::stacktrace() << "\n";
    _exit(128 + signum);
}

/**
 * Logs the in-flight exception, if any, and a stack trace before exiting.
 */
void std_terminate() noexcept
{
    const std::exception_ptr exptr = std::current_exception();
    if (!exptr)
    {
        LOG_FATAL << "Terminated without an active exception.";
    }
    else
    {
        try
        {
            std::rethrow_exception(exptr);
        }
        catch (const std::exception &ex)
        {
            LOG_FATAL << "Unhandled exception: " << ex.what();
        }
        catch (...)
        {
            LOG_FATAL << "Unhandled exception of unknown type.";
        }
    }

    LOG_FATAL << boost::stacktrace::stacktrace();
    exit(1);
}

/**
 * Serves the api until SIGINT or SIGTERM arrives.
 */
int run()
{
    if (conf::init() != 0)
        return -1;

    ullog::init();

    LOG_INFO << "upliftledger " << version::UL_VERSION << " serving " << conf::ctx.base_dir;
    LOG_INFO << "fee_rate " << conf::cfg.billing.fee_rate << ", confidence_threshold " << conf::cfg.attribution.confidence_threshold
             << ", store timeout " << conf::cfg.store.timeout_ms << "ms";

    if (store::init(conf::ctx.db_file) == -1 || api::init() == -1)
    {
        deinit();
        return -1;
    }

    signal(SIGINT, &sig_exit_handler);
    signal(SIGTERM, &sig_exit_handler);

    while (exit_signal == 0)
        util::sleep(200);

    LOG_WARNING << "Signal " << exit_signal << " received. Shutting down.";
    deinit();
    return 0;
}

/**
 * Loads the config without the instance lock and opens the store, so these
 * commands can run next to a serving instance.
 */
int open_readonly()
{
    if (conf::init_readonly() != 0)
        return -1;

    ullog::init();
    return store::init(conf::ctx.db_file);
}

int verify()
{
    if (open_readonly() == -1)
        return -1;

    const std::string &client_id = conf::ctx.export_client_id;
    bool intact = false;
    uint64_t checked = 0, broken_seq_no = 0;
    const int ret = engine::verify_client_chain(client_id, conf::cfg.store.timeout_ms, intact, checked, broken_seq_no);
    store::deinit();

    if (ret != 0)
    {
        std::cerr << "verify " << client_id << ": " << errors::to_string(ret) << "\n";
        return -1;
    }

    if (!intact)
    {
        std::cout << client_id << ": chain broken at seq_no " << broken_seq_no << " after " << checked << " entries.\n";
        return -1;
    }

    std::cout << client_id << ": " << checked << " entries, chain intact.\n";
    return 0;
}

int export_audit()
{
    if (open_readonly() == -1)
        return -1;

    size_t count = 0;
    const int ret = engine::export_audit_file(conf::ctx.export_client_id, conf::ctx.export_from_ms, conf::ctx.export_to_ms,
                                              conf::cfg.store.timeout_ms, conf::ctx.export_file, count);
    store::deinit();

    if (ret != 0)
    {
        std::cerr << "export " << conf::ctx.export_client_id << ": " << errors::to_string(ret) << "\n";
        return -1;
    }

    std::cout << count << " records exported to " << conf::ctx.export_file << "\n";
    return 0;
}

int main(int argc, char **argv)
{
    std::set_terminate(&std_terminate);
    signal(SIGSEGV, &segfault_handler);
    signal(SIGABRT, &segfault_handler);

    // A client dropping its socket must not kill the process.
    signal(SIGPIPE, SIG_IGN);

    if (parse_cmd(argc, argv) != 0)
        return -1;

    if (conf::ctx.command == "version")
    {
        std::cout << "upliftledger " << version::UL_VERSION << " (ledger version " << version::LEDGER_VERSION << ")" << std::endl;
        return 0;
    }

    // Hashing and credential generation.
    if (crypto::init() != 0)
        return -1;

    int res = 0;
    if (conf::ctx.command == "new")
        res = conf::create_ledger_dir();
    else if (conf::ctx.command == "rekey")
        res = conf::rekey();
    else if (conf::ctx.command == "run")
        res = run();
    else if (conf::ctx.command == "verify")
        res = verify();
    else if (conf::ctx.command == "export")
        res = export_audit();

    return res == 0 ? 0 : -1;
}

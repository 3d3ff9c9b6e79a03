#include "pchheader.hpp"
#include "conf.hpp"
#include "ullog.hpp"

namespace ullog
{
    constexpr size_t BYTES_PER_MB = 1024 * 1024;

    /**
     * Single line plog formatter: "2026-01-31T23:59:59.123Z inf [ul] message".
     * Time is UTC so log lines line up with ledger created_at values.
     */
    class line_formatter
    {
    public:
        static plog::util::nstring header()
        {
            return {};
        }

        static const char *severity_tag(const plog::Severity severity)
        {
            static constexpr const char *tags[] = {"---", "fat", "err", "wrn", "inf", "dbg", "ver"};
            const size_t idx = static_cast<size_t>(severity);
            return idx < std::size(tags) ? tags[idx] : "---";
        }

        static plog::util::nstring format(const plog::Record &record)
        {
            tm t;
            plog::util::gmtime_s(&t, &record.getTime().time);

            plog::util::nostringstream ss;
            ss << std::setfill(PLOG_NSTR('0'))
               << std::setw(4) << t.tm_year + 1900 << PLOG_NSTR("-") << std::setw(2) << t.tm_mon + 1 << PLOG_NSTR("-") << std::setw(2) << t.tm_mday
               << PLOG_NSTR("T") << std::setw(2) << t.tm_hour << PLOG_NSTR(":") << std::setw(2) << t.tm_min << PLOG_NSTR(":") << std::setw(2) << t.tm_sec
               << PLOG_NSTR(".") << std::setw(3) << record.getTime().millitm << PLOG_NSTR("Z ")
               << severity_tag(record.getSeverity()) << PLOG_NSTR(" [ul] ")
               << record.getMessage() << PLOG_NSTR("\n");
            return ss.str();
        }
    };

    plog::Severity to_plog_severity(const conf::LOG_SEVERITY level)
    {
        switch (level)
        {
        case conf::LOG_SEVERITY::DEBUG:
            return plog::Severity::debug;
        case conf::LOG_SEVERITY::INFO:
            return plog::Severity::info;
        case conf::LOG_SEVERITY::WARN:
            return plog::Severity::warning;
        default:
            return plog::Severity::error;
        }
    }

    /**
     * Wires the console and rolling file appenders selected in the config to the default plog instance.
     * Appenders are function statics and live until process exit.
     */
    void init()
    {
        const conf::log_config &log = conf::cfg.log;
        plog::Logger<0> &logger = plog::init(to_plog_severity(log.log_level_type));

        if (log.loggers.count("console") == 1)
        {
            static plog::ConsoleAppender<line_formatter> console;
            logger.addAppender(&console);
        }

        if (log.loggers.count("file") == 1)
        {
            static const std::string log_file = conf::ctx.log_dir + "/ul.log";
            static plog::RollingFileAppender<line_formatter> rolling(log_file.c_str(),
                                                                     log.max_mbytes_per_file * BYTES_PER_MB,
                                                                     log.max_file_count);
            logger.addAppender(&rolling);
        }
    }
} // namespace ullog

#include "api_server.hpp"
#include "api_common.hpp"
#include "api_json.hpp"
#include "../conf.hpp"
#include "../crypto.hpp"
#include "../errors.hpp"
#include "../engine/engine.hpp"
#include "../util/util.hpp"

namespace api
{
    constexpr uint32_t POLL_TIMEOUT = 500;
    constexpr uint32_t READ_BUFFER_SIZE = 64 * 1024;
    constexpr int LISTEN_BACKLOG = 32;

    api_context ctx;

    int init()
    {
        // Do not initialize if disabled in config.
        if (!conf::cfg.api.enabled)
            return 0;

        ctx.is_shutting_down = false;
        ctx.listen_fd = create_listen_socket(conf::ctx.socket_file);
        if (ctx.listen_fd == -1)
            return -1;

        ctx.listener_thread = std::thread(listener_loop);
        ctx.is_initialized = true;

        LOG_INFO << "Api listening on " << conf::ctx.socket_file;
        return 0;
    }

    void deinit()
    {
        if (!ctx.is_initialized)
            return;

        ctx.is_shutting_down = true;

        if (ctx.listener_thread.joinable())
            ctx.listener_thread.join();

        close(ctx.listen_fd);
        ctx.listen_fd = -1;
        if (unlink(conf::ctx.socket_file.c_str()) == -1 && errno != ENOENT)
            LOG_WARNING << "Could not remove api socket " << conf::ctx.socket_file;
        ctx.is_initialized = false;

        LOG_INFO << "Api stopped.";
    }

    /**
     * Creates the unix domain socket the api listens on. A stale socket file from a previous run is replaced.
     * @return The listening fd. -1 on error.
     */
    int create_listen_socket(const std::string &socket_path)
    {
        sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        if (socket_path.size() >= sizeof(addr.sun_path))
        {
            LOG_ERROR << "Api socket path too long: " << socket_path;
            return -1;
        }
        strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

        if (unlink(socket_path.c_str()) == -1 && errno != ENOENT)
        {
            LOG_ERROR << "Could not remove stale api socket " << socket_path;
            return -1;
        }

        const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Error creating api socket.";
            return -1;
        }

        if (bind(fd, (sockaddr *)&addr, sizeof(addr)) == -1 ||
            chmod(socket_path.c_str(), 0660) == -1 ||
            listen(fd, LISTEN_BACKLOG) == -1)
        {
            LOG_ERROR << errno << ": Error binding api socket " << socket_path;
            close(fd);
            return -1;
        }

        return fd;
    }

    void listener_loop()
    {
        util::mask_signal();

        while (!ctx.is_shutting_down)
        {
            pollfd pfd;
            pfd.fd = ctx.listen_fd;
            pfd.events = POLLIN;

            const int poll_res = poll(&pfd, 1, POLL_TIMEOUT);
            if (poll_res == -1 && errno != EINTR)
            {
                LOG_ERROR << errno << ": Error in api listener poll.";
                util::sleep(100);
            }
            else if (poll_res > 0 && (pfd.revents & POLLIN))
            {
                accept_connection();
            }

            // Cleanup sessions which have ended.
            for (auto itr = ctx.sessions.begin(); itr != ctx.sessions.end();)
            {
                if (itr->is_closed)
                {
                    itr->thread.join();
                    itr = ctx.sessions.erase(itr);
                }
                else
                {
                    ++itr;
                }
            }
        }

        // If we reach this point that means we are shutting down.
        // Sessions observe the shutdown flag within one poll interval.
        for (api_session &session : ctx.sessions)
        {
            if (session.thread.joinable())
                session.thread.join();
        }
        ctx.sessions.clear();

        LOG_INFO << "Api listener stopped.";
    }

    void accept_connection()
    {
        const int fd = accept(ctx.listen_fd, NULL, NULL);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Error in api accept.";
            return;
        }

        if (ctx.sessions.size() >= conf::cfg.api.max_connections)
        {
            LOG_WARNING << "Dropping api connection. Max connections (" << conf::cfg.api.max_connections << ") reached.";
            close(fd);
            return;
        }

        api_session &session = ctx.sessions.emplace_back();
        session.fd = fd;

        // Thread is started after the session is placed in the list so it refers to a stable address.
        session.thread = std::thread(session_loop, std::ref(session));
        LOG_DEBUG << "Api connection accepted. fd:" << fd;
    }

    /**
     * Reads newline terminated requests from one connection and writes one response line per request.
     * The connection is closed when the peer disconnects, a request exceeds the size limit or we are shutting down.
     */
    void session_loop(api_session &session)
    {
        util::mask_signal();

        std::string buffer;
        std::string read_buf;
        read_buf.resize(READ_BUFFER_SIZE);

        while (!ctx.is_shutting_down)
        {
            pollfd pfd;
            pfd.fd = session.fd;
            pfd.events = POLLIN;

            const int poll_res = poll(&pfd, 1, POLL_TIMEOUT);
            if (poll_res == 0 || (poll_res == -1 && errno == EINTR))
                continue;

            if (poll_res == -1)
            {
                LOG_ERROR << errno << ": Error in api session poll.";
                break;
            }

            const ssize_t res = read(session.fd, read_buf.data(), read_buf.size());
            if (res == -1)
            {
                LOG_ERROR << errno << ": Error reading from api session.";
                break;
            }
            if (res == 0)
            {
                LOG_DEBUG << "Api peer closed the connection. fd:" << session.fd;
                break;
            }

            buffer.append(read_buf.data(), res);

            bool must_close = false;
            size_t pos = 0;
            size_t newline = 0;
            while (!must_close && (newline = buffer.find('\n', pos)) != std::string::npos)
            {
                const std::string_view line(buffer.data() + pos, newline - pos);
                pos = newline + 1;

                // Blank lines are ignored.
                if (line.find_first_not_of(" \t\r") == std::string_view::npos)
                    continue;

                if (line.size() > conf::cfg.api.max_request_bytes)
                {
                    send_response(session.fd, json::create_error_response(MSGTYPE_INVALID_REQUEST, "", errors::VALIDATION_ERROR));
                    must_close = true;
                }
                else if (send_response(session.fd, handle_request(line)) == -1)
                {
                    must_close = true;
                }
            }
            buffer.erase(0, pos);

            if (!must_close && buffer.size() > conf::cfg.api.max_request_bytes)
            {
                LOG_DEBUG << "Api request exceeded max size. fd:" << session.fd;
                send_response(session.fd, json::create_error_response(MSGTYPE_INVALID_REQUEST, "", errors::VALIDATION_ERROR));
                must_close = true;
            }

            if (must_close)
                break;
        }

        close(session.fd);
        session.is_closed = true;
    }

    int send_response(const int fd, std::string_view response)
    {
        size_t sent = 0;
        while (sent < response.size())
        {
            const ssize_t res = send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (res == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_DEBUG << errno << ": Error writing api response.";
                return -1;
            }
            sent += res;
        }
        return 0;
    }

    /**
     * Handles one request line and produces the response line.
     * The credential is checked before anything else in the request is looked at.
     */
    const std::string handle_request(std::string_view line)
    {
        jsoncons::ojson d;
        if (json::parse_request(d, line) == -1)
            return json::create_error_response(MSGTYPE_INVALID_REQUEST, "", errors::VALIDATION_ERROR);

        json::request_header header;
        if (json::extract_header(header, d) == -1)
            return json::create_error_response(d[FLD_TYPE].as<std::string>(), header.id, errors::VALIDATION_ERROR);

        if (!crypto::is_credential_match(conf::cfg.node.api_key_hex, header.credential))
        {
            LOG_WARNING << "Api request rejected. Invalid credential. type:" << header.type;
            return json::create_error_response(header.type, header.id, errors::UNAUTHORIZED);
        }

        const uint64_t timeout_ms = header.timeout_ms > 0 ? header.timeout_ms : conf::cfg.store.timeout_ms;
        return dispatch(header.type, header.id, timeout_ms, d);
    }

    const std::string dispatch(const std::string &type, const std::string &id, const uint64_t timeout_ms, const jsoncons::ojson &d)
    {
        jsoncons::ojson payload;

        if (type == MSGTYPE_RECORD_ORDER)
        {
            engine::order_event ev;
            if (json::extract_order_event(ev, d) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            engine::attribution_result result;
            const int ret = engine::record_order(ev, timeout_ms, result);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            jsoncons::ojson entry;
            json::populate_entry(entry, result.entry);
            payload["duplicate"] = result.duplicate;
            payload["entry"] = std::move(entry);
        }
        else if (type == MSGTYPE_CLIENT_SUMMARY)
        {
            std::string client_id;
            if (json::extract_string(client_id, d, FLD_CLIENT_ID) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            engine::client_summary summary;
            const int ret = engine::get_client_summary(client_id, timeout_ms, summary);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            json::populate_summary(payload, summary);
        }
        else if (type == MSGTYPE_SETTLEMENT)
        {
            std::string client_id;
            int year = 0, month = 0;
            std::optional<int64_t> actual_ad_spend;
            if (json::extract_period(client_id, year, month, d) == -1 ||
                json::extract_ad_spend_total(actual_ad_spend, d) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            settlement::invoice inv;
            const int ret = engine::get_settlement(client_id, year, month, actual_ad_spend, timeout_ms, inv);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            json::populate_invoice(payload, inv);
        }
        else if (type == MSGTYPE_INVOICE_STATUS)
        {
            std::string client_id, status_str;
            int year = 0, month = 0;
            settlement::INVOICE_STATUS status;
            if (json::extract_period(client_id, year, month, d) == -1 ||
                json::extract_string(status_str, d, FLD_INVOICE_STATUS) == -1 ||
                settlement::status_from_string(status_str, status) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            settlement::invoice inv;
            const int ret = engine::advance_invoice_status(client_id, year, month, status, timeout_ms, inv);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            json::populate_invoice(payload, inv);
        }
        else if (type == MSGTYPE_LIVE_ATTRIBUTIONS)
        {
            std::string client_id;
            uint64_t limit = 0;
            if (json::extract_string(client_id, d, FLD_CLIENT_ID) == -1 ||
                json::extract_uint64(limit, d, FLD_LIMIT, false) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            std::vector<ledger::ledger_entry> entries;
            const int ret = engine::get_live_attributions(client_id, limit, timeout_ms, entries);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            jsoncons::ojson list(jsoncons::json_array_arg);
            for (const ledger::ledger_entry &entry : entries)
            {
                jsoncons::ojson e;
                json::populate_entry(e, entry);
                list.push_back(std::move(e));
            }
            payload["entries"] = std::move(list);
        }
        else if (type == MSGTYPE_ORDER_ATTRIBUTION)
        {
            std::string client_id, external_order_id;
            if (json::extract_string(client_id, d, FLD_CLIENT_ID) == -1 ||
                json::extract_string(external_order_id, d, FLD_EXTERNAL_ORDER_ID) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            ledger::ledger_entry entry;
            ledger::attribution_log log;
            const int ret = engine::get_order_attribution(client_id, external_order_id, timeout_ms, entry, log);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            jsoncons::ojson e, l;
            json::populate_entry(e, entry);
            json::populate_attribution_log(l, log);
            payload["entry"] = std::move(e);
            payload["attribution"] = std::move(l);
        }
        else if (type == MSGTYPE_AUDIT_EXPORT)
        {
            std::string client_id;
            uint64_t from_ms = 0, to_ms = 0;
            if (json::extract_range(client_id, from_ms, to_ms, d) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            std::vector<audit::audit_record> records;
            const int ret = engine::export_audit_trail(client_id, from_ms, to_ms, timeout_ms, records);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            size_t broken_index = 0;
            const bool intact = audit::verify_chain(records, broken_index) == 1;

            jsoncons::ojson list(jsoncons::json_array_arg);
            for (const audit::audit_record &record : records)
            {
                jsoncons::ojson r;
                json::populate_audit_record(r, record);
                list.push_back(std::move(r));
            }
            payload["records"] = std::move(list);
            payload["chain_intact"] = intact;
            if (!intact)
                payload["broken_seq_no"] = records[broken_index].seq_no;
        }
        else if (type == MSGTYPE_ANONYMIZE)
        {
            std::string client_id, external_order_id;
            if (json::extract_string(client_id, d, FLD_CLIENT_ID) == -1 ||
                json::extract_string(external_order_id, d, FLD_EXTERNAL_ORDER_ID) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            ledger::ledger_entry entry;
            const int ret = engine::anonymize(client_id, external_order_id, timeout_ms, entry);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            jsoncons::ojson e;
            json::populate_entry(e, entry);
            payload["entry"] = std::move(e);
        }
        else if (type == MSGTYPE_BASELINE_RECALCULATE)
        {
            baseline::recalculation_input in;
            if (json::extract_recalculation(in, d) == -1)
                return json::create_error_response(type, id, errors::VALIDATION_ERROR);

            baseline::baseline_snapshot snapshot;
            const int ret = engine::recalculate_baseline(in, timeout_ms, snapshot);
            if (ret != 0)
                return json::create_error_response(type, id, ret);

            json::populate_snapshot(payload, snapshot);
        }
        else
        {
            LOG_DEBUG << "Api request type not supported: " << type;
            return json::create_error_response(type, id, errors::VALIDATION_ERROR);
        }

        return json::create_response(type, id, 0, payload);
    }

} // namespace api

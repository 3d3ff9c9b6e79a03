#ifndef _UL_API_API_SERVER_
#define _UL_API_API_SERVER_

#include "../pchheader.hpp"

/**
 * Local request/response API served over a unix domain socket. Each request and each response
 * is a single line of json.
 */
namespace api
{
    struct api_session
    {
        int fd = -1;
        std::thread thread;
        std::atomic<bool> is_closed = false;
    };

    struct api_context
    {
        int listen_fd = -1;
        std::thread listener_thread;
        std::list<api_session> sessions; // Only accessed by the listener thread after init.
        std::atomic<bool> is_shutting_down = false;
        bool is_initialized = false;
    };

    extern api_context ctx;

    int init();

    void deinit();

    const std::string handle_request(std::string_view line);

    //------Internal-use functions for this namespace.

    int create_listen_socket(const std::string &socket_path);

    void listener_loop();

    void accept_connection();

    void session_loop(api_session &session);

    int send_response(const int fd, std::string_view response);

    const std::string dispatch(const std::string &type, const std::string &id, const uint64_t timeout_ms, const jsoncons::ojson &d);

} // namespace api

#endif

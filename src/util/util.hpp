#ifndef _UL_UTIL_UTIL_
#define _UL_UTIL_UTIL_

#include "../pchheader.hpp"

/**
 * Hex, time, filesystem, fd lock and calendar helpers shared across the ledger modules.
 */

namespace util
{
    constexpr uint64_t MS_PER_DAY = 86400000;

    const std::string to_hex(const std::string_view bin);

    const std::string to_bin(const std::string_view hex);

    uint64_t get_epoch_milliseconds();

    void sleep(const uint64_t milliseconds);

    const std::string realpath(const std::string &path);

    void mask_signal();

    bool is_dir_exists(std::string_view path);

    bool is_file_exists(std::string_view path);

    int create_dir_tree_recursive(std::string_view path);

    int remove_directory_recursively(std::string_view dir_path);

    int stoull(const std::string &str, uint64_t &result);

    int read_from_fd(const int fd, std::string &buf, const off_t offset = 0);

    int write_file(const std::string &file_path, std::string_view content, const mode_t perms);

    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len);

    int release_lock(const int fd, struct flock &lock);

    void uint64_to_bytes(uint8_t *dest, const uint64_t x);

    const std::string uint64_to_string_bytes(const uint64_t x);

    int64_t days_from_civil(int64_t y, const unsigned m, const unsigned d);

    void civil_from_days(int64_t z, int &y, int &m, int &d);

    int get_month_range(const int year, const int month, uint64_t &from_ms, uint64_t &to_ms);

    const std::string to_iso_date(const uint64_t epoch_ms);

} // namespace util

#endif

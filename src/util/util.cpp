#include "../pchheader.hpp"
#include "util.hpp"

namespace util
{
    constexpr mode_t LEDGER_DIR_PERMS = 0755;

    const std::string to_hex(const std::string_view bin)
    {
        // sodium writes a terminating '\0' so the buffer is one byte larger than the hex text.
        std::string hex(bin.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(),
                       reinterpret_cast<const unsigned char *>(bin.data()), bin.size());
        hex.pop_back();
        return hex;
    }

    /**
     * Decodes a hex string. Odd lengths and non-hex characters yield an empty result.
     */
    const std::string to_bin(const std::string_view hex)
    {
        if (hex.size() % 2 != 0)
            return {};

        std::string bin(hex.size() / 2, '\0');
        size_t decoded = 0;
        const char *stop = nullptr;
        const int res = sodium_hex2bin(reinterpret_cast<unsigned char *>(bin.data()), bin.size(),
                                       hex.data(), hex.size(), nullptr, &decoded, &stop);
        if (res != 0 || stop != hex.data() + hex.size() || decoded != bin.size())
            return {};

        return bin;
    }

    uint64_t get_epoch_milliseconds()
    {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
    }

    void sleep(const uint64_t milliseconds)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }

    /**
     * Canonical absolute form of the path. Empty if it cannot be resolved.
     */
    const std::string realpath(const std::string &path)
    {
        char *resolved = ::realpath(path.c_str(), nullptr);
        if (resolved == nullptr)
            return {};

        std::string canonical(resolved);
        free(resolved);
        return canonical;
    }

    // Worker threads leave SIGINT and SIGPIPE to the main thread.
    void mask_signal()
    {
        sigset_t blocked;
        sigemptyset(&blocked);
        sigaddset(&blocked, SIGINT);
        sigaddset(&blocked, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &blocked, nullptr);
    }

    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return stat(path.data(), &st) == 0 && S_ISDIR(st.st_mode);
    }

    bool is_file_exists(std::string_view path)
    {
        struct stat st;
        return stat(path.data(), &st) == 0 && S_ISREG(st.st_mode);
    }

    /**
     * Creates the directory along with any missing parents.
     * @return 0 if the directory exists afterwards. -1 on failure.
     */
    int create_dir_tree_recursive(std::string_view path)
    {
        const std::string dir(path);
        if (dir.empty() || dir == "/" || is_dir_exists(dir))
            return 0;

        const size_t slash = dir.find_last_of('/');
        if (slash != std::string::npos && slash > 0 &&
            create_dir_tree_recursive(std::string_view(dir).substr(0, slash)) == -1)
            return -1;

        if (mkdir(dir.c_str(), LEDGER_DIR_PERMS) == -1 && errno != EEXIST)
        {
            LOG_ERROR << errno << ": Could not create directory " << dir;
            return -1;
        }
        return 0;
    }

    /**
     * Deletes the directory tree bottom-up without following symlinks.
     */
    int remove_directory_recursively(std::string_view dir_path)
    {
        const auto remove_entry = [](const char *entry_path, const struct stat *, int, struct FTW *) {
            return remove(entry_path);
        };
        return nftw(dir_path.data(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
    }

    /**
     * Parses an unsigned decimal with no sign or whitespace.
     * @return 0 on success. -1 if the text is not a number or overflows.
     */
    int stoull(const std::string &str, uint64_t &result)
    {
        if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos)
            return -1;

        uint64_t value = 0;
        for (const char c : str)
        {
            const uint64_t digit = c - '0';
            if (value > (UINT64_MAX - digit) / 10)
                return -1;
            value = value * 10 + digit;
        }
        result = value;
        return 0;
    }

    /**
     * Reads from the given offset to the end of the file.
     * @return Bytes read, or -1 on error.
     */
    int read_from_fd(const int fd, std::string &buf, const off_t offset)
    {
        struct stat st;
        if (fstat(fd, &st) == -1)
        {
            LOG_ERROR << errno << ": fstat failed on fd " << fd;
            return -1;
        }

        if (st.st_size < offset)
        {
            buf.clear();
            return 0;
        }

        buf.resize(st.st_size - offset);
        const ssize_t res = pread(fd, buf.data(), buf.size(), offset);
        if (res == -1)
            LOG_ERROR << errno << ": pread failed on fd " << fd;
        return res;
    }

    /**
     * Replaces the file content and flushes it to disk.
     * @return 0 on success. -1 on failure.
     */
    int write_file(const std::string &file_path, std::string_view content, const mode_t perms)
    {
        const int fd = open(file_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, perms);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Could not open " << file_path << " for writing.";
            return -1;
        }

        const char *cursor = content.data();
        size_t remaining = content.size();
        int res = 0;
        while (remaining > 0)
        {
            const ssize_t n = write(fd, cursor, remaining);
            if (n == -1)
            {
                if (errno == EINTR)
                    continue;
                LOG_ERROR << errno << ": Write failed on " << file_path;
                res = -1;
                break;
            }
            cursor += n;
            remaining -= n;
        }

        if (res == 0 && fsync(fd) == -1)
        {
            LOG_ERROR << errno << ": fsync failed on " << file_path;
            res = -1;
        }

        close(fd);
        return res;
    }

    /**
     * Takes a non-blocking process level record lock over [start, start + len). A len of 0 covers the rest of the file.
     * @return 0 when the lock is held. -1 if another process holds it or on error.
     */
    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len)
    {
        memset(&lock, 0, sizeof(lock));
        lock.l_type = is_rwlock ? F_WRLCK : F_RDLCK;
        lock.l_whence = SEEK_SET;
        lock.l_start = start;
        lock.l_len = len;
        return fcntl(fd, F_SETLK, &lock);
    }

    int release_lock(const int fd, struct flock &lock)
    {
        lock.l_type = F_UNLCK;
        return fcntl(fd, F_SETLK, &lock);
    }

    // Big endian, most significant byte first.
    void uint64_to_bytes(uint8_t *dest, const uint64_t x)
    {
        for (int i = 0; i < 8; i++)
            dest[i] = static_cast<uint8_t>(x >> (56 - 8 * i));
    }

    const std::string uint64_to_string_bytes(const uint64_t x)
    {
        std::string bytes(sizeof(uint64_t), '\0');
        uint64_to_bytes(reinterpret_cast<uint8_t *>(bytes.data()), x);
        return bytes;
    }

    /**
     * Returns the number of days since 1970-01-01 for the given proleptic gregorian date.
     */
    int64_t days_from_civil(int64_t y, const unsigned m, const unsigned d)
    {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    /**
     * Inverse of days_from_civil.
     */
    void civil_from_days(int64_t z, int &y, int &m, int &d)
    {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
    }

    /**
     * Calculates the UTC millisecond range [from_ms, to_ms) covering the given calendar month.
     * @return 0 on success. -1 if the year/month is out of range.
     */
    int get_month_range(const int year, const int month, uint64_t &from_ms, uint64_t &to_ms)
    {
        if (year < 1970 || year > 9999 || month < 1 || month > 12)
            return -1;

        const int next_year = month == 12 ? year + 1 : year;
        const int next_month = month == 12 ? 1 : month + 1;
        from_ms = static_cast<uint64_t>(days_from_civil(year, month, 1)) * MS_PER_DAY;
        to_ms = static_cast<uint64_t>(days_from_civil(next_year, next_month, 1)) * MS_PER_DAY;
        return 0;
    }

    /**
     * Formats the UTC date of the given epoch milliseconds as YYYY-MM-DD.
     */
    const std::string to_iso_date(const uint64_t epoch_ms)
    {
        int y, m, d;
        civil_from_days(epoch_ms / MS_PER_DAY, y, m, d);

        std::ostringstream os;
        os << std::setfill('0') << std::setw(4) << y << "-" << std::setw(2) << m << "-" << std::setw(2) << d;
        return os.str();
    }

} // namespace util

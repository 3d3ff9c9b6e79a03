#include "pchheader.hpp"
#include "crypto.hpp"
#include "util/util.hpp"

namespace crypto
{
    // Must run before any other crypto or util hex call. Safe to call more than once.
    int init()
    {
        if (sodium_init() == -1)
        {
            std::cerr << "libsodium could not be initialised.\n";
            return -1;
        }
        return 0;
    }

    void random_bytes(std::string &result, const size_t len)
    {
        result.resize(len);
        randombytes_buf(result.data(), len);
    }

    namespace
    {
        void absorb(blake3_hasher &hasher, std::string_view data)
        {
            blake3_hasher_update(&hasher, data.data(), data.size());
        }

        const std::string digest(blake3_hasher &hasher)
        {
            std::string out(BLAKE3_OUT_LEN, '\0');
            blake3_hasher_finalize(&hasher, reinterpret_cast<uint8_t *>(out.data()), out.size());
            return out;
        }
    }

    /**
     * blake3 over the plain concatenation of both inputs. Used to link a ledger entry to its predecessor.
     */
    const std::string get_hash(std::string_view s1, std::string_view s2)
    {
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        absorb(hasher, s1);
        absorb(hasher, s2);
        return digest(hasher);
    }

    /**
     * blake3 over a list of fields. Each field is preceded by its length as 8 big endian bytes,
     * so moving bytes between neighbouring fields changes the hash.
     */
    const std::string get_hash(const std::vector<std::string_view> &fields)
    {
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        for (const std::string_view field : fields)
        {
            absorb(hasher, util::uint64_to_string_bytes(field.size()));
            absorb(hasher, field);
        }
        return digest(hasher);
    }

    /**
     * Random version 4 uuid in canonical 8-4-4-4-12 form.
     */
    const std::string generate_uuid()
    {
        std::string rand_bytes;
        random_bytes(rand_bytes, 16);

        rand_bytes[6] = static_cast<char>((rand_bytes[6] & 0x0F) | 0x40);
        rand_bytes[8] = static_cast<char>((rand_bytes[8] & 0x3F) | 0x80);

        const std::string hex = util::to_hex(rand_bytes);
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
    }

    /**
     * Generates a new random pre-shared API credential in hex form.
     */
    const std::string generate_credential_hex()
    {
        std::string credential;
        random_bytes(credential, CREDENTIAL_LEN);
        return util::to_hex(credential);
    }

    /**
     * Compares a presented hex credential against the configured one in constant time.
     * @return true if both decode to the same credential bytes.
     */
    bool is_credential_match(std::string_view expected_hex, std::string_view given_hex)
    {
        if (expected_hex.empty() || given_hex.size() != expected_hex.size())
            return false;

        const std::string expected = util::to_bin(expected_hex);
        const std::string given = util::to_bin(given_hex);
        if (expected.empty() || given.size() != expected.size())
            return false;

        return sodium_memcmp(expected.data(), given.data(), expected.size()) == 0;
    }

} // namespace crypto

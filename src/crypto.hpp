#ifndef _UL_CRYPTO_
#define _UL_CRYPTO_

#include "pchheader.hpp"

/**
 * Offers convenience functions for cryptographic operations wrapping libsodium and blake3.
 * These functions are used for ledger hashing, invoice ids and API credential checks.
 */
namespace crypto
{
    // Length in bytes of the pre-shared API credential.
    constexpr size_t CREDENTIAL_LEN = 32;

    int init();

    void random_bytes(std::string &result, const size_t len);

    const std::string get_hash(std::string_view s1, std::string_view s2);

    const std::string get_hash(const std::vector<std::string_view> &fields);

    const std::string generate_uuid();

    const std::string generate_credential_hex();

    bool is_credential_match(std::string_view expected_hex, std::string_view given_hex);

} // namespace crypto

#endif

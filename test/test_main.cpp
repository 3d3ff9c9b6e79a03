#include <gtest/gtest.h>
#include "../src/crypto.hpp"

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Hashing, uuids and credentials all need libsodium.
    if (crypto::init() != 0)
        return 1;

    return RUN_ALL_TESTS();
}

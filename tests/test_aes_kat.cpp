#include <gtest/gtest.h>
#include "cipher/AES/aes.hpp"
#include "KeyExpansion.hpp"
#include "KATHarness.hpp"

#ifndef RIJNDAEL_KAT_DIR
#define RIJNDAEL_KAT_DIR "tests/kat"
#endif

// =======================
// AES single block (FIPS-197, SP 800-38A ECB)
// =======================

TEST(AES, KAT_ECB)
{
    auto cases = LoadKATFile(std::string(RIJNDAEL_KAT_DIR) + "/aes_ecb.csv");
    ASSERT_FALSE(cases.empty());

    for (auto& tc : cases) {
        try {
            KeySchedule schedule = KeyExpansion::schedule(tc.key);

            // ENCRYPT
            auto ct = AES::encrypt(newPlain(tc.plaintext), schedule).bytes();

            EXPECT_EQ(ct, tc.ciphertext)
                << "ENC failed: " << tc.name
                << "\nKey:        " << BytesToHex(tc.key)
                << "\nPlaintext:  " << BytesToHex(tc.plaintext)
                << "\nExpected CT:" << BytesToHex(tc.ciphertext)
                << "\nActual CT:  " << BytesToHex(ct);

            // DECRYPT
            auto pt = AES::decrypt(newCipher(tc.ciphertext), schedule).bytes();

            EXPECT_EQ(pt, tc.plaintext)
                << "DEC failed: " << tc.name
                << "\nKey:        " << BytesToHex(tc.key)
                << "\nCiphertext: " << BytesToHex(tc.ciphertext)
                << "\nExpected PT:" << BytesToHex(tc.plaintext)
                << "\nActual PT:  " << BytesToHex(pt);
        }
        catch (const std::exception& ex) {
            ADD_FAILURE() << "Exception in case " << tc.name << ": " << ex.what();
        }
    }
}

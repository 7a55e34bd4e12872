#include "../include/cipher.hpp"

#include <openssl/evp.h>

#include <climits>
#include <string>

/**
 * @file cipher.cpp
 * @brief Feistel encryption and decryption of the master secret.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        uint64_t roundIterations(unsigned iterationExponent) {
            return (static_cast<uint64_t>(BASE_ITERATION_COUNT) << iterationExponent) / ROUND_COUNT;
        }

        SecureBytes salt(uint16_t identifier) {
            SecureBytes s(CUSTOMIZATION_STRING, CUSTOMIZATION_STRING + CUSTOMIZATION_STRING_LENGTH);
            s.push_back(static_cast<uint8_t>((identifier >> 8) & 0xFF));
            s.push_back(static_cast<uint8_t>(identifier & 0xFF));
            return s;
        }

        /**
         * @brief F(i, R) = PBKDF2-HMAC-SHA256(i || passphrase, salt || R), len(R) bytes.
         */
        SecureBytes roundFunction(uint8_t round,
                                  const secure_string& passphrase,
                                  unsigned iterationExponent,
                                  const SecureBytes& salt,
                                  const SecureBytes& r) {
            SecureBytes password = passphrase.bytes();
            password.insert(password.begin(), round);

            SecureBytes fullSalt(salt);
            fullSalt.insert(fullSalt.end(), r.begin(), r.end());

            const int iterations = static_cast<int>(roundIterations(iterationExponent));

            SecureBytes out(r.size());
            if (PKCS5_PBKDF2_HMAC(
                    reinterpret_cast<const char*>(password.data()),
                    static_cast<int>(password.size()),
                    fullSalt.data(),
                    static_cast<int>(fullSalt.size()),
                    iterations,
                    EVP_sha256(),
                    static_cast<int>(out.size()),
                    out.data()
                ) != 1)
            {
                throw CryptoException("PBKDF2-HMAC-SHA256 round function failed");
            }

            return out;
        }

        void checkArguments(const SecureBytes& data,
                            const secure_string& passphrase,
                            unsigned iterationExponent,
                            uint16_t identifier) {
            if (data.size() % 2 != 0)
                throw InvalidSecretLength("The length of the master secret in bytes must be an even number.");
            Cipher::validatePassphrase(passphrase);
            if (iterationExponent > MAX_ITERATION_EXPONENT)
                throw InvalidParameters("The iteration exponent must be between 0 and " +
                                        std::to_string(MAX_ITERATION_EXPONENT) + ".");
            // PKCS5_PBKDF2_HMAC takes the iteration count as an int.
            if (roundIterations(iterationExponent) > static_cast<uint64_t>(INT_MAX))
                throw InvalidParameters("The iteration exponent " + std::to_string(iterationExponent) +
                                        " exceeds the supported key stretching cost.");
            if (identifier > MAX_IDENTIFIER)
                throw InvalidParameters("The identifier must fit in " + std::to_string(ID_LENGTH_BITS) + " bits.");
        }

        /**
         * @brief Run the Feistel rounds in the given order and return R || L.
         */
        SecureBytes feistel(const SecureBytes& input,
                            const secure_string& passphrase,
                            unsigned iterationExponent,
                            uint16_t identifier,
                            bool reverse) {
            const std::size_t half = input.size() / 2;
            SecureBytes l(input.begin(), input.begin() + half);
            SecureBytes r(input.begin() + half, input.end());
            const SecureBytes s = salt(identifier);

            for (unsigned n = 0; n < ROUND_COUNT; ++n) {
                const auto round = static_cast<uint8_t>(reverse ? ROUND_COUNT - 1 - n : n);
                SecureBytes f = roundFunction(round, passphrase, iterationExponent, s, r);
                for (std::size_t i = 0; i < half; ++i) {
                    f[i] ^= l[i];
                }
                l.swap(r);
                r.swap(f);
            }

            SecureBytes out(r);
            out.insert(out.end(), l.begin(), l.end());
            return out;
        }
    }

    void Cipher::validatePassphrase(const secure_string& passphrase) {
        if (!passphrase.isPrintableAscii())
            throw InvalidPassphraseEncoding("The passphrase must contain only printable ASCII characters (code points 32-126).");
    }

    SecureBytes Cipher::encrypt(const SecureBytes& masterSecret,
                                const secure_string& passphrase,
                                unsigned iterationExponent,
                                uint16_t identifier) {
        checkArguments(masterSecret, passphrase, iterationExponent, identifier);
        return feistel(masterSecret, passphrase, iterationExponent, identifier, false);
    }

    SecureBytes Cipher::decrypt(const SecureBytes& encryptedMasterSecret,
                                const secure_string& passphrase,
                                unsigned iterationExponent,
                                uint16_t identifier) {
        checkArguments(encryptedMasterSecret, passphrase, iterationExponent, identifier);
        return feistel(encryptedMasterSecret, passphrase, iterationExponent, identifier, true);
    }

} // namespace Arkenstone

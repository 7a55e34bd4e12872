#ifndef CIPHER_HPP
#define CIPHER_HPP

#include <cstdint>

#include "constants.hpp"
#include "exceptions.hpp"
#include "secure_string.hpp"

/**
 * @file cipher.hpp
 * @brief Passphrase-keyed Feistel cipher applied to the master secret before splitting.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @class Cipher
     * @brief Four-round Feistel network whose round function is PBKDF2-HMAC-SHA256.
     *
     * The salt is "shamir" followed by the 15-bit identifier, so the same
     * passphrase under another identifier yields a different plaintext.
     * An empty passphrase is a valid key like any other.
     */
    class Cipher {
    public:
        /**
         * @brief Encrypt a master secret.
         *
         * @param masterSecret Even number of bytes.
         * @param passphrase Printable ASCII (32..126), possibly empty.
         * @param iterationExponent Key stretching cost, 0..31.
         * @param identifier Identifier of the split, 0..32767.
         * @return Encrypted master secret, same length as the input.
         *
         * @throw InvalidSecretLength If the secret length is odd.
         * @throw InvalidPassphraseEncoding If the passphrase is not printable ASCII.
         * @throw InvalidParameters If the exponent or identifier is out of range.
         * @throw CryptoException If PBKDF2 fails.
         */
        static SecureBytes encrypt(const SecureBytes& masterSecret,
                                   const secure_string& passphrase,
                                   unsigned iterationExponent,
                                   uint16_t identifier);

        /**
         * @brief Inverse of encrypt. A wrong passphrase gives a wrong result, never an error.
         * @throw Same as encrypt.
         */
        static SecureBytes decrypt(const SecureBytes& encryptedMasterSecret,
                                   const secure_string& passphrase,
                                   unsigned iterationExponent,
                                   uint16_t identifier);

        /**
         * @throw InvalidPassphraseEncoding If the passphrase is not printable ASCII.
         */
        static void validatePassphrase(const secure_string& passphrase);
    };

} // namespace Arkenstone

#endif // CIPHER_HPP

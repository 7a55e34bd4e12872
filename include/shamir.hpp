#ifndef SHAMIR_HPP
#define SHAMIR_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "constants.hpp"
#include "exceptions.hpp"
#include "gf256.hpp"
#include "secure_string.hpp"

/**
 * @file shamir.hpp
 * @brief Shamir secret sharing over GF(256) with an integrity digest fragment.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @brief One point (x, y) of the sharing polynomials, one polynomial per byte of y.
     *
     * x is 0..252 for ordinary fragments, DIGEST_INDEX for the digest
     * fragment and SECRET_INDEX for the secret itself.
     */
    struct ShareFragment {
        uint8_t x = 0;
        SecureBytes y;
    };

    /**
     * @class Shamir
     * @brief Splits a byte string into fragments and recombines them.
     *
     * For threshold >= 2 the polynomial passes through the secret at
     * SECRET_INDEX and through digest(secret, salt) || salt at DIGEST_INDEX,
     * so recombination can tell whether the fragments belong together.
     */
    class Shamir {
    public:
        using Digest = std::array<uint8_t, DIGEST_LENGTH_BYTES>;

        explicit Shamir(const GF256& field) : field_(field) {}

        /**
         * @brief Split a secret into count fragments at x = 0..count-1.
         *
         * With threshold 1 every fragment is a copy of the secret.
         *
         * @param threshold Fragments needed to recombine (1..count).
         * @param count Number of fragments to produce (at most MAX_SHARE_COUNT).
         * @param secret Bytes to share. At least DIGEST_LENGTH_BYTES long when threshold > 1.
         * @throw InvalidParameters If threshold or count are out of range.
         * @throw InvalidSecretLength If the secret is too short to carry a digest.
         */
        std::vector<ShareFragment> split(uint8_t threshold, uint8_t count, const SecureBytes& secret) const;

        /**
         * @brief Recover the secret from exactly threshold fragments.
         * @throw NotEnoughFragments If fewer than threshold distinct x are supplied.
         * @throw InvalidParameters If more than threshold fragments are supplied or lengths differ.
         * @throw DigestMismatch If the fragments do not come from one split.
         */
        SecureBytes recombine(uint8_t threshold, const std::vector<ShareFragment>& fragments) const;

        /**
         * @brief Value at x of the polynomials through the given fragments (Lagrange form).
         * @throw InvalidParameters If x coordinates repeat or value lengths differ.
         */
        SecureBytes interpolate(const std::vector<ShareFragment>& fragments, uint8_t x) const;

        /**
         * @brief First DIGEST_LENGTH_BYTES of HMAC-SHA256 keyed by salt over secret.
         * @throw CryptoException If HMAC fails.
         */
        static Digest digest(const SecureBytes& secret, const uint8_t* salt, std::size_t saltLen);

    private:
        const GF256& field_;
    };

} // namespace Arkenstone

#endif // SHAMIR_HPP

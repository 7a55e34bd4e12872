#include "../include/shamir.hpp"
#include "../include/random.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <set>
#include <string>

/**
 * @file shamir.cpp
 * @brief Fragment generation, Lagrange interpolation and digest verification.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        inline unsigned mod255(long value) {
            long r = value % 255;
            return static_cast<unsigned>(r < 0 ? r + 255 : r);
        }
    }

    Shamir::Digest Shamir::digest(const SecureBytes& secret, const uint8_t* salt, std::size_t saltLen) {
        std::array<uint8_t, EVP_MAX_MD_SIZE> mac;
        unsigned int macLen = 0;

        // HMAC-SHA256(Key=salt, Data=secret)
        if (HMAC(EVP_sha256(), salt, static_cast<int>(saltLen),
                 secret.data(), secret.size(), mac.data(), &macLen) == nullptr) {
            throw CryptoException("HMAC-SHA256 digest computation failed");
        }

        Digest out;
        std::copy(mac.begin(), mac.begin() + out.size(), out.begin());
        secure_memzero(mac.data(), mac.size());
        return out;
    }

    SecureBytes Shamir::interpolate(const std::vector<ShareFragment>& fragments, uint8_t x) const {
        if (fragments.empty())
            throw NotEnoughFragments("No fragments to interpolate");

        std::set<uint8_t> xs;
        for (const auto& f : fragments) {
            if (!xs.insert(f.x).second)
                throw InvalidParameters("Invalid set of shares. Share indices must be unique.");
            if (f.y.size() != fragments.front().y.size())
                throw InvalidParameters("Invalid set of shares. All share values must have the same length.");
        }

        for (const auto& f : fragments) {
            if (f.x == x) return f.y;
        }

        // log of prod_j (x_j - x); each basis polynomial divides one factor back out.
        long logProd = 0;
        for (const auto& f : fragments) {
            logProd += field_.log(GF256::add(f.x, x));
        }

        SecureBytes result(fragments.front().y.size(), 0);

        for (const auto& fi : fragments) {
            long logBasis = logProd - field_.log(GF256::add(fi.x, x));
            // the j == i term is log(0) = 0
            for (const auto& fj : fragments) {
                logBasis -= field_.log(GF256::add(fi.x, fj.x));
            }
            const unsigned basis = mod255(logBasis);

            for (std::size_t k = 0; k < result.size(); ++k) {
                const uint8_t v = fi.y[k];
                if (v != 0) {
                    result[k] ^= field_.exp(field_.log(v) + basis);
                }
            }
        }

        return result;
    }

    std::vector<ShareFragment> Shamir::split(uint8_t threshold, uint8_t count, const SecureBytes& secret) const {
        if (threshold < 1)
            throw InvalidParameters("The requested threshold must be a positive integer.");
        if (threshold > count)
            throw InvalidParameters("The requested threshold (" + std::to_string(threshold) +
                                    ") must not exceed the number of shares (" + std::to_string(count) + ").");
        if (count > MAX_SHARE_COUNT)
            throw InvalidParameters("The requested number of shares (" + std::to_string(count) +
                                    ") must not exceed " + std::to_string(MAX_SHARE_COUNT) + ".");

        std::vector<ShareFragment> fragments;
        fragments.reserve(count);

        if (threshold == 1) {
            for (uint8_t i = 0; i < count; ++i) {
                fragments.push_back(ShareFragment{i, secret});
            }
            return fragments;
        }

        if (secret.size() < DIGEST_LENGTH_BYTES)
            throw InvalidSecretLength("The secret is too short to carry a digest.");

        const uint8_t randomCount = static_cast<uint8_t>(threshold - 2);
        for (uint8_t i = 0; i < randomCount; ++i) {
            fragments.push_back(ShareFragment{i, randomBytes(secret.size())});
        }

        const SecureBytes salt = randomBytes(secret.size() - DIGEST_LENGTH_BYTES);
        const Digest d = digest(secret, salt.data(), salt.size());

        ShareFragment digestFragment{DIGEST_INDEX, SecureBytes(d.begin(), d.end())};
        digestFragment.y.insert(digestFragment.y.end(), salt.begin(), salt.end());

        std::vector<ShareFragment> basis = fragments;
        basis.push_back(std::move(digestFragment));
        basis.push_back(ShareFragment{SECRET_INDEX, secret});

        for (uint8_t i = randomCount; i < count; ++i) {
            fragments.push_back(ShareFragment{i, interpolate(basis, i)});
        }

        return fragments;
    }

    SecureBytes Shamir::recombine(uint8_t threshold, const std::vector<ShareFragment>& fragments) const {
        if (threshold < 1)
            throw InvalidParameters("The threshold must be a positive integer.");

        std::set<uint8_t> xs;
        for (const auto& f : fragments) xs.insert(f.x);

        if (fragments.empty() || xs.size() < threshold)
            throw NotEnoughFragments("Insufficient fragments: " + std::to_string(xs.size()) +
                                     " distinct, " + std::to_string(threshold) + " required.");
        if (fragments.size() > threshold)
            throw InvalidParameters("Too many fragments: exactly " + std::to_string(threshold) + " required.");

        if (threshold == 1)
            return fragments.front().y;

        SecureBytes secret = interpolate(fragments, SECRET_INDEX);
        SecureBytes digestFragment = interpolate(fragments, DIGEST_INDEX);
        if (digestFragment.size() < DIGEST_LENGTH_BYTES)
            throw InvalidSecretLength("The shared value is too short to carry a digest.");

        const Digest expected = digest(secret, digestFragment.data() + DIGEST_LENGTH_BYTES,
                                       digestFragment.size() - DIGEST_LENGTH_BYTES);

        if (!constant_time_equal(expected.data(), digestFragment.data(), DIGEST_LENGTH_BYTES))
            throw DigestMismatch("Invalid digest of the shared secret.");

        return secret;
    }

} // namespace Arkenstone

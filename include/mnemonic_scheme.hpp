#ifndef MNEMONIC_SCHEME_HPP
#define MNEMONIC_SCHEME_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "exceptions.hpp"
#include "gf256.hpp"
#include "secure_string.hpp"
#include "shamir.hpp"
#include "share.hpp"
#include "word_codec.hpp"

/**
 * @file mnemonic_scheme.hpp
 * @brief Two-level (group, member) splitting of a master secret into mnemonic shares.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @brief Shape of one group: memberThreshold of memberCount shares recombine it.
     */
    struct GroupSpec {
        uint8_t memberThreshold = 1;
        uint8_t memberCount = 1;
    };

    /**
     * @class MnemonicScheme
     * @brief Generates mnemonic shares from a master secret and combines them back.
     *
     * The master secret is first encrypted with the passphrase cipher. The
     * encrypted secret is split into one fragment per group with the group
     * threshold, then each group fragment is split again among the members
     * of that group.
     */
    class MnemonicScheme {
    public:
        using Mnemonics = std::vector<std::vector<std::string>>;

        /**
         * @brief Result of generateRandom: the fresh secret and its shares.
         */
        struct RandomSplit {
            SecureBytes masterSecret;
            Mnemonics mnemonics;
        };

        /**
         * @param field GF(256) tables, must outlive the scheme.
         * @param wordlist Vocabulary, must outlive the scheme.
         */
        MnemonicScheme(const GF256& field, const Wordlist& wordlist)
            : wordlist_(wordlist), shamir_(field) {}

        /**
         * @brief Split a master secret into mnemonic shares.
         *
         * @param groupThreshold Number of groups needed to recover (1..groups.size()).
         * @param groups Shape of each group, at most MAX_SHARE_COUNT groups.
         * @param masterSecret At least 16 bytes, even length.
         * @param passphrase Printable ASCII, empty for none.
         * @param iterationExponent Key stretching cost of the cipher.
         * @return One list of mnemonics per group, in the order of groups.
         *
         * @throw InvalidParameters If the group layout is invalid (including 1-of-N groups with N > 1).
         * @throw InvalidSecretLength If the master secret is too short or of odd length.
         * @throw InvalidPassphraseEncoding If the passphrase is not printable ASCII.
         */
        Mnemonics generate(uint8_t groupThreshold,
                           const std::vector<GroupSpec>& groups,
                           const SecureBytes& masterSecret,
                           const secure_string& passphrase = "",
                           unsigned iterationExponent = 0) const;

        /**
         * @brief Same as generate with a fresh random master secret of strengthBits bits.
         * @throw InvalidSecretLength If strengthBits is below 128 or not a multiple of 16.
         */
        RandomSplit generateRandom(uint8_t groupThreshold,
                                   const std::vector<GroupSpec>& groups,
                                   std::size_t strengthBits = MIN_STRENGTH_BITS,
                                   const secure_string& passphrase = "",
                                   unsigned iterationExponent = 0) const;

        /**
         * @brief Split into Share values with a caller-chosen identifier.
         */
        std::vector<std::vector<Share>> generateShares(uint16_t identifier,
                                                       uint8_t groupThreshold,
                                                       const std::vector<GroupSpec>& groups,
                                                       const SecureBytes& masterSecret,
                                                       const secure_string& passphrase = "",
                                                       unsigned iterationExponent = 0) const;

        /**
         * @brief Recover the master secret from mnemonics.
         *
         * Uses the first memberThreshold distinct shares of each complete
         * group and the first groupThreshold complete groups. A wrong
         * passphrase returns a wrong secret and is not detected.
         *
         * @throw DecodeError If a mnemonic cannot be parsed.
         * @throw MnemonicSetMismatch If the shares differ in common parameters or value length.
         * @throw DuplicateMemberIndex If two different shares have the same group and member index.
         * @throw NotEnoughGroups If fewer than groupThreshold groups are complete.
         * @throw DigestMismatch If shares from different splits were mixed.
         */
        SecureBytes combine(const std::vector<std::string>& mnemonics,
                            const secure_string& passphrase = "") const;

        /**
         * @brief Same as combine, for already decoded shares.
         */
        SecureBytes combineShares(const std::vector<Share>& shares,
                                  const secure_string& passphrase = "") const;

        /**
         * @brief Check a group layout before any cryptography runs.
         * @throw InvalidParameters
         */
        static void validateGroups(uint8_t groupThreshold, const std::vector<GroupSpec>& groups);

        const Wordlist& wordlist() const { return wordlist_; }

    private:
        const Wordlist& wordlist_;
        Shamir shamir_;
    };

} // namespace Arkenstone

#endif // MNEMONIC_SCHEME_HPP

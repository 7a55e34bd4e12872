#include "../include/mnemonic_scheme.hpp"
#include "../include/cipher.hpp"
#include "../include/logger.hpp"
#include "../include/random.hpp"

#include <map>
#include <string>

/**
 * @file mnemonic_scheme.cpp
 * @brief Generation and combination of grouped mnemonic shares.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        void checkMasterSecret(const SecureBytes& masterSecret) {
            if (masterSecret.size() * 8 < MIN_STRENGTH_BITS)
                throw InvalidSecretLength("The length of the master secret (" + std::to_string(masterSecret.size()) +
                                          " bytes) must be at least " + std::to_string(MIN_STRENGTH_BITS / 8) + " bytes.");
            if (masterSecret.size() % 2 != 0)
                throw InvalidSecretLength("The length of the master secret in bytes must be an even number.");
        }

        /**
         * @brief Shares of one group in arrival order, without repeats.
         */
        struct GroupShares {
            uint8_t memberThreshold = 0;
            std::vector<const Share*> members;
        };
    }

    void MnemonicScheme::validateGroups(uint8_t groupThreshold, const std::vector<GroupSpec>& groups) {
        if (groups.empty())
            throw InvalidParameters("At least one group must be defined.");
        if (groups.size() > MAX_SHARE_COUNT)
            throw InvalidParameters("The number of groups (" + std::to_string(groups.size()) +
                                    ") must not exceed " + std::to_string(MAX_SHARE_COUNT) + ".");
        if (groupThreshold < 1)
            throw InvalidParameters("The group threshold must be a positive integer.");
        if (groupThreshold > groups.size())
            throw InvalidParameters("The requested group threshold (" + std::to_string(groupThreshold) +
                                    ") must not exceed the number of groups (" + std::to_string(groups.size()) + ").");

        for (const auto& g : groups) {
            if (g.memberThreshold < 1)
                throw InvalidParameters("The member threshold must be a positive integer.");
            if (g.memberCount > MAX_SHARE_COUNT)
                throw InvalidParameters("The number of shares in a group (" + std::to_string(g.memberCount) +
                                        ") must not exceed " + std::to_string(MAX_SHARE_COUNT) + ".");
            if (g.memberThreshold > g.memberCount)
                throw InvalidParameters("The member threshold (" + std::to_string(g.memberThreshold) +
                                        ") must not exceed the number of shares (" + std::to_string(g.memberCount) + ").");
            if (g.memberThreshold == 1 && g.memberCount > 1)
                throw InvalidParameters("Creating multiple member shares with member threshold 1 is not allowed. "
                                        "Use 1-of-1 member sharing instead.");
        }
    }

    std::vector<std::vector<Share>> MnemonicScheme::generateShares(uint16_t identifier,
                                                                   uint8_t groupThreshold,
                                                                   const std::vector<GroupSpec>& groups,
                                                                   const SecureBytes& masterSecret,
                                                                   const secure_string& passphrase,
                                                                   unsigned iterationExponent) const {
        validateGroups(groupThreshold, groups);
        checkMasterSecret(masterSecret);
        Cipher::validatePassphrase(passphrase);
        if (iterationExponent > MAX_ITERATION_EXPONENT)
            throw InvalidParameters("The iteration exponent must be between 0 and " +
                                    std::to_string(MAX_ITERATION_EXPONENT) + ".");

        const SecureBytes encrypted = Cipher::encrypt(masterSecret, passphrase, iterationExponent, identifier);

        const auto groupCount = static_cast<uint8_t>(groups.size());
        const std::vector<ShareFragment> groupFragments = shamir_.split(groupThreshold, groupCount, encrypted);

        std::vector<std::vector<Share>> result;
        result.reserve(groups.size());

        for (std::size_t g = 0; g < groups.size(); ++g) {
            const GroupSpec& groupSpec = groups[g];
            const ShareFragment& groupFragment = groupFragments[g];

            std::vector<Share> members;
            members.reserve(groupSpec.memberCount);

            for (auto& memberFragment : shamir_.split(groupSpec.memberThreshold, groupSpec.memberCount, groupFragment.y)) {
                Share share;
                share.identifier = identifier;
                share.iterationExponent = static_cast<uint8_t>(iterationExponent);
                share.groupIndex = groupFragment.x;
                share.groupThreshold = groupThreshold;
                share.groupCount = groupCount;
                share.memberIndex = memberFragment.x;
                share.memberThreshold = groupSpec.memberThreshold;
                share.value = std::move(memberFragment.y);
                members.push_back(std::move(share));
            }
            result.push_back(std::move(members));
        }

        Logger::instance().log(Logger::Level::Info, "split_generated",
                               {{"group_threshold", std::to_string(groupThreshold)},
                                {"group_count", std::to_string(groupCount)},
                                {"iteration_exponent", std::to_string(iterationExponent)}});
        return result;
    }

    MnemonicScheme::Mnemonics MnemonicScheme::generate(uint8_t groupThreshold,
                                                       const std::vector<GroupSpec>& groups,
                                                       const SecureBytes& masterSecret,
                                                       const secure_string& passphrase,
                                                       unsigned iterationExponent) const {
        const auto identifier = static_cast<uint16_t>(randomBits(ID_LENGTH_BITS));

        Mnemonics mnemonics;
        for (const auto& group : generateShares(identifier, groupThreshold, groups, masterSecret,
                                                passphrase, iterationExponent)) {
            std::vector<std::string> words;
            words.reserve(group.size());
            for (const auto& share : group) {
                words.push_back(share.mnemonic(wordlist_));
            }
            mnemonics.push_back(std::move(words));
        }
        return mnemonics;
    }

    MnemonicScheme::RandomSplit MnemonicScheme::generateRandom(uint8_t groupThreshold,
                                                               const std::vector<GroupSpec>& groups,
                                                               std::size_t strengthBits,
                                                               const secure_string& passphrase,
                                                               unsigned iterationExponent) const {
        if (strengthBits < MIN_STRENGTH_BITS)
            throw InvalidSecretLength("The requested strength of the master secret (" + std::to_string(strengthBits) +
                                      " bits) must be at least " + std::to_string(MIN_STRENGTH_BITS) + " bits.");
        if (strengthBits % 16 != 0)
            throw InvalidSecretLength("The requested strength of the master secret (" + std::to_string(strengthBits) +
                                      " bits) must be a multiple of 16 bits.");

        validateGroups(groupThreshold, groups);

        RandomSplit split;
        split.masterSecret = randomBytes(strengthBits / 8);
        split.mnemonics = generate(groupThreshold, groups, split.masterSecret, passphrase, iterationExponent);
        return split;
    }

    SecureBytes MnemonicScheme::combine(const std::vector<std::string>& mnemonics,
                                        const secure_string& passphrase) const {
        std::vector<Share> shares;
        shares.reserve(mnemonics.size());
        for (const auto& m : mnemonics) {
            shares.push_back(Share::fromMnemonic(wordlist_, m));
        }
        return combineShares(shares, passphrase);
    }

    SecureBytes MnemonicScheme::combineShares(const std::vector<Share>& shares,
                                              const secure_string& passphrase) const {
        if (shares.empty())
            throw NotEnoughGroups("The list of mnemonics is empty.");

        const CommonParameters common = shares.front().commonParameters();

        std::map<uint8_t, GroupShares> groups;
        for (const auto& share : shares) {
            if (share.commonParameters() != common)
                throw MnemonicSetMismatch("Invalid set of mnemonics. All mnemonics must begin with the same " +
                                          std::to_string(ID_EXP_LENGTH_WORDS) + " words, must have the same "
                                          "group threshold and the same group count.");
            if (share.value.size() != shares.front().value.size())
                throw MnemonicSetMismatch("Invalid set of mnemonics. All mnemonics must have the same length.");

            GroupShares& group = groups[share.groupIndex];
            if (group.members.empty()) {
                group.memberThreshold = share.memberThreshold;
            } else if (group.memberThreshold != share.memberThreshold) {
                throw MnemonicSetMismatch("Invalid set of mnemonics. All mnemonics in a group must have the same member threshold.");
            }

            bool duplicate = false;
            for (const Share* other : group.members) {
                if (other->memberIndex != share.memberIndex) continue;
                if (*other != share)
                    throw DuplicateMemberIndex("Invalid set of mnemonics. Two different shares have member index " +
                                               std::to_string(share.memberIndex) + " in group " +
                                               std::to_string(share.groupIndex) + ".");
                duplicate = true;
            }
            if (!duplicate) {
                group.members.push_back(&share);
            }
        }

        std::vector<ShareFragment> groupFragments;
        for (const auto& entry : groups) {
            const GroupShares& group = entry.second;
            if (group.members.size() < group.memberThreshold) continue;
            if (groupFragments.size() == common.groupThreshold) break;

            std::vector<ShareFragment> memberFragments;
            for (std::size_t i = 0; i < group.memberThreshold; ++i) {
                memberFragments.push_back(ShareFragment{group.members[i]->memberIndex, group.members[i]->value});
            }
            groupFragments.push_back(ShareFragment{entry.first, shamir_.recombine(group.memberThreshold, memberFragments)});
        }

        if (groupFragments.size() < common.groupThreshold)
            throw NotEnoughGroups("Insufficient number of mnemonic groups. " + std::to_string(groupFragments.size()) +
                                  " complete, " + std::to_string(common.groupThreshold) + " required.");

        const SecureBytes encrypted = shamir_.recombine(common.groupThreshold, groupFragments);
        SecureBytes secret = Cipher::decrypt(encrypted, passphrase, common.iterationExponent, common.identifier);

        Logger::instance().log(Logger::Level::Info, "secret_combined",
                               {{"shares", std::to_string(shares.size())},
                                {"groups_used", std::to_string(groupFragments.size())}});
        return secret;
    }

} // namespace Arkenstone

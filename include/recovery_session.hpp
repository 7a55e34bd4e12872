#ifndef RECOVERY_SESSION_HPP
#define RECOVERY_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "exceptions.hpp"
#include "mnemonic_scheme.hpp"
#include "secure_string.hpp"
#include "share.hpp"

/**
 * @file recovery_session.hpp
 * @brief Incremental collection of shares until a secret can be recovered.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    enum class SessionState {
        Empty,
        Collecting,
        Complete,
        Cancelled
    };

    /**
     * @brief Outcome of RecoverySession::accept.
     */
    struct AcceptResult {
        enum class Status {
            Accepted,
            Duplicate,      ///< identical share already collected, nothing changed
            DecodeFailed,   ///< not a valid mnemonic, error holds the reason
            Rejected,       ///< valid share that does not fit the set, error holds the reason
            Closed          ///< session is complete or cancelled
        };

        Status status = Status::Accepted;
        std::optional<ErrorKind> error;
        std::string message;

        bool accepted() const { return status == Status::Accepted; }
    };

    /**
     * @brief Progress of one group, as shown to the user.
     */
    struct GroupStatus {
        enum class State { Empty, InProgress, Finished };

        uint8_t groupIndex = 0;
        std::string prefix;
        std::size_t collected = 0;
        uint8_t memberThreshold = 0;   ///< 0 while no share of the group is known
        State state = State::Empty;
    };

    struct SessionStatus {
        SessionState state = SessionState::Empty;
        std::size_t completedGroups = 0;
        uint8_t groupThreshold = 0;
        uint8_t groupCount = 0;
        std::vector<GroupStatus> groups;
    };

    /**
     * @class RecoverySession
     * @brief Collects shares one mnemonic at a time and decides when recovery can run.
     *
     * The first accepted share fixes the common parameters of the session.
     * Decode and consistency failures never throw out of accept(); they are
     * returned so the caller can ask for another mnemonic. No I/O happens
     * here: prompting and printing belong to the caller.
     */
    class RecoverySession {
    public:
        explicit RecoverySession(const MnemonicScheme& scheme) : scheme_(scheme) {}
        ~RecoverySession();

        RecoverySession(const RecoverySession&) = delete;
        RecoverySession& operator=(const RecoverySession&) = delete;

        /**
         * @brief Decode a mnemonic and add it to its group.
         *
         * A share whose member index is already taken in its group by a
         * different share is rejected with DuplicateMemberIndex; one whose
         * value length differs from the set with MnemonicSetMismatch.
         */
        AcceptResult accept(const std::string& mnemonic);

        /**
         * @brief True if the group holds at least its member threshold of shares.
         */
        bool groupIsComplete(uint8_t groupIndex) const;

        /**
         * @brief True once at least groupThreshold groups are complete.
         */
        bool isComplete() const;

        std::size_t completedGroupCount() const;

        SessionState state() const;

        SessionStatus status() const;

        /**
         * @brief Fingerprint words of a group of the current set.
         * @throw InvalidParameters If no share has been accepted yet.
         */
        std::string groupPrefix(uint8_t groupIndex) const;

        /**
         * @brief Mnemonics accepted so far, in order.
         */
        const std::vector<std::string>& mnemonics() const { return mnemonics_; }

        /**
         * @brief Combine the accepted mnemonics.
         * @throw NotEnoughGroups If the session is not complete.
         * @throw ReconstructionFailure, CipherError As MnemonicScheme::combine.
         */
        SecureBytes recover(const secure_string& passphrase = "") const;

        /**
         * @brief Abort the session and wipe every collected mnemonic.
         */
        void cancel();

    private:
        void wipe();

        const MnemonicScheme& scheme_;
        std::optional<Share> lastShare_;
        std::map<uint8_t, std::vector<Share>> groups_;
        std::vector<std::string> mnemonics_;
        bool cancelled_ = false;
    };

} // namespace Arkenstone

#endif // RECOVERY_SESSION_HPP

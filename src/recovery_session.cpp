#include "../include/recovery_session.hpp"
#include "../include/logger.hpp"

#include <string>

/**
 * @file recovery_session.cpp
 * @brief Share accumulation and completion checks for interactive recovery.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        AcceptResult reject(AcceptResult::Status status, const CryptoException& e) {
            Logger::instance().log(Logger::Level::Warning, "share_rejected",
                                   {{"reason", toString(e.kind())}});
            AcceptResult result;
            result.status = status;
            result.error = e.kind();
            result.message = e.what();
            return result;
        }
    }

    RecoverySession::~RecoverySession() {
        wipe();
    }

    void RecoverySession::wipe() {
        for (auto& m : mnemonics_) {
            secure_memzero(&m[0], m.size());
        }
        mnemonics_.clear();
        groups_.clear();
        lastShare_.reset();
    }

    AcceptResult RecoverySession::accept(const std::string& mnemonic) {
        if (cancelled_ || isComplete()) {
            AcceptResult closed;
            closed.status = AcceptResult::Status::Closed;
            closed.message = cancelled_ ? "The recovery session was cancelled." : "The recovery session is already complete.";
            return closed;
        }

        Share share;
        try {
            share = Share::fromMnemonic(scheme_.wordlist(), mnemonic);
        } catch (const DecodeError& e) {
            return reject(AcceptResult::Status::DecodeFailed, e);
        }

        try {
            if (lastShare_ && lastShare_->commonParameters() != share.commonParameters())
                throw MnemonicSetMismatch("This mnemonic is not part of the current set.");
            if (lastShare_ && lastShare_->value.size() != share.value.size())
                throw MnemonicSetMismatch("This mnemonic encodes a secret of a different length than the current set.");

            auto it = groups_.find(share.groupIndex);
            if (it != groups_.end()) {
                for (const auto& other : it->second) {
                    if (other == share) {
                        AcceptResult duplicate;
                        duplicate.status = AcceptResult::Status::Duplicate;
                        duplicate.message = "This mnemonic has already been entered.";
                        return duplicate;
                    }
                    if (other.memberThreshold != share.memberThreshold)
                        throw MnemonicSetMismatch("This mnemonic has a different member threshold than the rest of its group.");
                    if (other.memberIndex == share.memberIndex)
                        throw DuplicateMemberIndex("A different mnemonic with the same member index was already entered for this group.");
                }
            }
        } catch (const SetConsistency& e) {
            return reject(AcceptResult::Status::Rejected, e);
        }

        Logger::instance().log(Logger::Level::Info, "share_accepted",
                               {{"group_index", std::to_string(share.groupIndex)},
                                {"member_index", std::to_string(share.memberIndex)}});

        groups_[share.groupIndex].push_back(share);
        lastShare_ = std::move(share);
        mnemonics_.push_back(mnemonic);

        return AcceptResult{};
    }

    bool RecoverySession::groupIsComplete(uint8_t groupIndex) const {
        auto it = groups_.find(groupIndex);
        if (it == groups_.end() || it->second.empty())
            return false;
        return it->second.size() >= it->second.front().memberThreshold;
    }

    std::size_t RecoverySession::completedGroupCount() const {
        std::size_t n = 0;
        for (const auto& entry : groups_) {
            if (groupIsComplete(entry.first)) ++n;
        }
        return n;
    }

    bool RecoverySession::isComplete() const {
        if (!lastShare_)
            return false;
        return completedGroupCount() >= lastShare_->groupThreshold;
    }

    SessionState RecoverySession::state() const {
        if (cancelled_)
            return SessionState::Cancelled;
        if (!lastShare_)
            return SessionState::Empty;
        return isComplete() ? SessionState::Complete : SessionState::Collecting;
    }

    std::string RecoverySession::groupPrefix(uint8_t groupIndex) const {
        if (!lastShare_)
            throw InvalidParameters("No share has been accepted yet.");

        Share fake = *lastShare_;
        fake.groupIndex = groupIndex;
        return fake.groupPrefix(scheme_.wordlist());
    }

    SessionStatus RecoverySession::status() const {
        SessionStatus s;
        s.state = state();
        if (!lastShare_)
            return s;

        s.completedGroups = completedGroupCount();
        s.groupThreshold = lastShare_->groupThreshold;
        s.groupCount = lastShare_->groupCount;

        for (uint8_t i = 0; i < s.groupCount; ++i) {
            GroupStatus g;
            g.groupIndex = i;
            g.prefix = groupPrefix(i);

            auto it = groups_.find(i);
            if (it != groups_.end() && !it->second.empty()) {
                g.collected = it->second.size();
                g.memberThreshold = it->second.front().memberThreshold;
                g.state = groupIsComplete(i) ? GroupStatus::State::Finished : GroupStatus::State::InProgress;
            }
            s.groups.push_back(std::move(g));
        }
        return s;
    }

    SecureBytes RecoverySession::recover(const secure_string& passphrase) const {
        if (!isComplete())
            throw NotEnoughGroups("Not enough shares have been collected to recover the secret.");
        return scheme_.combine(mnemonics_, passphrase);
    }

    void RecoverySession::cancel() {
        cancelled_ = true;
        wipe();
    }

} // namespace Arkenstone

#include "../include/exceptions.hpp"

/**
 * @file exceptions.cpp
 * @brief Mapping of error kinds to categories and names.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    ErrorCategory categoryOf(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::Language:
                return ErrorCategory::Language;
            case ErrorKind::InvalidParameters:
                return ErrorCategory::InputValidation;
            case ErrorKind::UnknownWord:
            case ErrorKind::InvalidWordCount:
            case ErrorKind::InvalidChecksum:
            case ErrorKind::InvalidPadding:
            case ErrorKind::InvalidShareHeader:
                return ErrorCategory::Decode;
            case ErrorKind::MnemonicSetMismatch:
            case ErrorKind::DuplicateMemberIndex:
                return ErrorCategory::SetConsistency;
            case ErrorKind::NotEnoughFragments:
            case ErrorKind::NotEnoughGroups:
            case ErrorKind::DigestMismatch:
                return ErrorCategory::Reconstruction;
            case ErrorKind::InvalidSecretLength:
            case ErrorKind::InvalidPassphraseEncoding:
                return ErrorCategory::Cipher;
            case ErrorKind::DivisionByZero:
                return ErrorCategory::Field;
            case ErrorKind::Crypto:
                break;
        }
        return ErrorCategory::Crypto;
    }

    const char* toString(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::Crypto: return "Crypto";
            case ErrorKind::Language: return "Language";
            case ErrorKind::InvalidParameters: return "InvalidParameters";
            case ErrorKind::UnknownWord: return "UnknownWord";
            case ErrorKind::InvalidWordCount: return "InvalidWordCount";
            case ErrorKind::InvalidChecksum: return "InvalidChecksum";
            case ErrorKind::InvalidPadding: return "InvalidPadding";
            case ErrorKind::InvalidShareHeader: return "InvalidShareHeader";
            case ErrorKind::MnemonicSetMismatch: return "MnemonicSetMismatch";
            case ErrorKind::DuplicateMemberIndex: return "DuplicateMemberIndex";
            case ErrorKind::NotEnoughFragments: return "NotEnoughFragments";
            case ErrorKind::NotEnoughGroups: return "NotEnoughGroups";
            case ErrorKind::DigestMismatch: return "DigestMismatch";
            case ErrorKind::InvalidSecretLength: return "InvalidSecretLength";
            case ErrorKind::InvalidPassphraseEncoding: return "InvalidPassphraseEncoding";
            case ErrorKind::DivisionByZero: return "DivisionByZero";
        }
        return "Unknown";
    }

} // namespace Arkenstone

#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for share generation, decoding and recovery.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @brief Every failure the library can report, one enumerator per leaf exception.
     */
    enum class ErrorKind {
        Crypto,
        Language,
        InvalidParameters,
        UnknownWord,
        InvalidWordCount,
        InvalidChecksum,
        InvalidPadding,
        InvalidShareHeader,
        MnemonicSetMismatch,
        DuplicateMemberIndex,
        NotEnoughFragments,
        NotEnoughGroups,
        DigestMismatch,
        InvalidSecretLength,
        InvalidPassphraseEncoding,
        DivisionByZero
    };

    /**
     * @brief Coarse grouping of ErrorKind used to decide how a failure propagates.
     */
    enum class ErrorCategory {
        Crypto,
        Language,
        InputValidation,
        Decode,
        SetConsistency,
        Reconstruction,
        Cipher,
        Field
    };

    ErrorCategory categoryOf(ErrorKind kind) noexcept;

    const char* toString(ErrorKind kind) noexcept;

    /**
     * @class CryptoException
     * @brief Base class for all exceptions thrown by the library.
     *
     * Extends std::runtime_error and carries the ErrorKind of the failure,
     * so callers can branch on kind() without catching every leaf type.
     */
    class CryptoException : public std::runtime_error
    {
    public:
        /**
         * @brief Construct a generic crypto failure (OpenSSL call failed).
         * @param message Error message.
         */
        explicit CryptoException(const std::string& message)
            : std::runtime_error(message), kind_(ErrorKind::Crypto) {}

        CryptoException(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const noexcept { return kind_; }

        ErrorCategory category() const noexcept { return categoryOf(kind_); }

    private:
        ErrorKind kind_;
    };

    /**
     * @class LanguageException
     * @brief Thrown when a word list cannot be loaded or is malformed.
     */
    class LanguageException : public CryptoException
    {
    public:
        explicit LanguageException(const std::string& message)
            : CryptoException(ErrorKind::Language, message) {}
    };

    /// @name Category bases
    /// @{

    /**
     * @class InputValidation
     * @brief Bad scheme, threshold or group shape. Raised before any cryptography runs.
     */
    class InputValidation : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class DecodeError
     * @brief Malformed or mistyped mnemonic. The caller can ask for re-entry.
     */
    class DecodeError : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class SetConsistency
     * @brief A share does not fit with the other shares of the set.
     */
    class SetConsistency : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class ReconstructionFailure
     * @brief The shares are well formed but cannot reconstruct a secret.
     */
    class ReconstructionFailure : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class CipherError
     * @brief Secret or passphrase rejected by the passphrase cipher.
     */
    class CipherError : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /// @}

    class InvalidParameters : public InputValidation
    {
    public:
        explicit InvalidParameters(const std::string& message)
            : InputValidation(ErrorKind::InvalidParameters, message) {}
    };

    class UnknownWord : public DecodeError
    {
    public:
        explicit UnknownWord(const std::string& message)
            : DecodeError(ErrorKind::UnknownWord, message) {}
    };

    class InvalidWordCount : public DecodeError
    {
    public:
        explicit InvalidWordCount(const std::string& message)
            : DecodeError(ErrorKind::InvalidWordCount, message) {}
    };

    class InvalidChecksum : public DecodeError
    {
    public:
        explicit InvalidChecksum(const std::string& message)
            : DecodeError(ErrorKind::InvalidChecksum, message) {}
    };

    /**
     * @class InvalidPadding
     * @brief The value words carry non-zero padding bits, or too many of them.
     */
    class InvalidPadding : public DecodeError
    {
    public:
        explicit InvalidPadding(const std::string& message)
            : DecodeError(ErrorKind::InvalidPadding, message) {}
    };

    /**
     * @class InvalidShareHeader
     * @brief Header fields are individually valid but contradict each other.
     */
    class InvalidShareHeader : public DecodeError
    {
    public:
        explicit InvalidShareHeader(const std::string& message)
            : DecodeError(ErrorKind::InvalidShareHeader, message) {}
    };

    class MnemonicSetMismatch : public SetConsistency
    {
    public:
        explicit MnemonicSetMismatch(const std::string& message)
            : SetConsistency(ErrorKind::MnemonicSetMismatch, message) {}
    };

    /**
     * @class DuplicateMemberIndex
     * @brief Two different shares claim the same member index within one group.
     */
    class DuplicateMemberIndex : public SetConsistency
    {
    public:
        explicit DuplicateMemberIndex(const std::string& message)
            : SetConsistency(ErrorKind::DuplicateMemberIndex, message) {}
    };

    class NotEnoughFragments : public ReconstructionFailure
    {
    public:
        explicit NotEnoughFragments(const std::string& message)
            : ReconstructionFailure(ErrorKind::NotEnoughFragments, message) {}
    };

    class NotEnoughGroups : public ReconstructionFailure
    {
    public:
        explicit NotEnoughGroups(const std::string& message)
            : ReconstructionFailure(ErrorKind::NotEnoughGroups, message) {}
    };

    class DigestMismatch : public ReconstructionFailure
    {
    public:
        explicit DigestMismatch(const std::string& message)
            : ReconstructionFailure(ErrorKind::DigestMismatch, message) {}
    };

    class InvalidSecretLength : public CipherError
    {
    public:
        explicit InvalidSecretLength(const std::string& message)
            : CipherError(ErrorKind::InvalidSecretLength, message) {}
    };

    class InvalidPassphraseEncoding : public CipherError
    {
    public:
        explicit InvalidPassphraseEncoding(const std::string& message)
            : CipherError(ErrorKind::InvalidPassphraseEncoding, message) {}
    };

    /**
     * @class DivisionByZero
     * @brief Division by the zero element of GF(256).
     */
    class DivisionByZero : public CryptoException
    {
    public:
        explicit DivisionByZero(const std::string& message)
            : CryptoException(ErrorKind::DivisionByZero, message) {}
    };

} // namespace Arkenstone

#endif // EXCEPTIONS_HPP

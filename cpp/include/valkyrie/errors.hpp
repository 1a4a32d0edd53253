#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace valkyrie {

enum class ErrorKind {
    KeyDerivation,
    Encryption,
    Decryption,
    Compression,
    HeaderFieldTooLong,
    EncryptionMismatch,
    CompressionMismatch,
    ArchiveIo,
    DirectoryRead,
    Config
};

const char* ErrorKindName(ErrorKind kind);

// Base of every error raised by the library. The low-level message that
// triggered the failure (OpenSSL, codec library, stream state) is kept in
// cause() and appended to what().
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, const std::string& cause = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    ErrorKind kind_;
    std::string message_;
    std::string cause_;
};

class KeyDerivationError : public Error {
public:
    explicit KeyDerivationError(const std::string& message, const std::string& cause = {})
        : Error(ErrorKind::KeyDerivation, message, cause) {}
};

class EncryptionError : public Error {
public:
    explicit EncryptionError(const std::string& message, const std::string& cause = {})
        : Error(ErrorKind::Encryption, message, cause) {}
};

class DecryptionError : public Error {
public:
    explicit DecryptionError(const std::string& message, const std::string& cause = {})
        : Error(ErrorKind::Decryption, message, cause) {}
};

// Tag verification failed: the ciphertext, IV or tag was altered, or the key is wrong.
class AuthenticationFailed : public DecryptionError {
public:
    explicit AuthenticationFailed(const std::string& cause = {})
        : DecryptionError("Authentication tag mismatch", cause) {}
};

class CompressionError : public Error {
public:
    explicit CompressionError(const std::string& message, const std::string& cause = {})
        : Error(ErrorKind::Compression, message, cause) {}
};

class UnsupportedCodec : public CompressionError {
public:
    explicit UnsupportedCodec(const std::string& codec, const std::string& cause = {})
        : CompressionError("Unsupported codec: " + codec, cause) {}
};

class HeaderFieldTooLong : public Error {
public:
    HeaderFieldTooLong(const std::string& field, std::size_t width, std::size_t actual);

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class EncryptionMismatch : public Error {
public:
    EncryptionMismatch(const std::string& expected, const std::string& found)
        : Error(ErrorKind::EncryptionMismatch,
                "Archive encryption mode '" + found + "' does not match '" + expected + "'") {}
};

class CompressionMismatch : public Error {
public:
    CompressionMismatch(const std::string& expected, const std::string& found)
        : Error(ErrorKind::CompressionMismatch,
                "Archive compression '" + found + "' does not match '" + expected + "'") {}
};

class ArchiveIoError : public Error {
public:
    explicit ArchiveIoError(const std::string& message, const std::string& cause = {})
        : Error(ErrorKind::ArchiveIo, message, cause) {}
};

class DirectoryReadError : public Error {
public:
    explicit DirectoryReadError(const std::string& message, const std::string& cause = {})
        : Error(ErrorKind::DirectoryRead, message, cause) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message, const std::string& cause = {})
        : Error(ErrorKind::Config, message, cause) {}
};

}  // namespace valkyrie

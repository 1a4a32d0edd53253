#include "valkyrie/errors.hpp"

namespace valkyrie {

namespace {

std::string Compose(const std::string& message, const std::string& cause) {
    if (cause.empty()) {
        return message;
    }
    return message + ": " + cause;
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::KeyDerivation:
            return "KeyDerivationError";
        case ErrorKind::Encryption:
            return "EncryptionError";
        case ErrorKind::Decryption:
            return "DecryptionError";
        case ErrorKind::Compression:
            return "CompressionError";
        case ErrorKind::HeaderFieldTooLong:
            return "HeaderFieldTooLong";
        case ErrorKind::EncryptionMismatch:
            return "EncryptionMismatch";
        case ErrorKind::CompressionMismatch:
            return "CompressionMismatch";
        case ErrorKind::ArchiveIo:
            return "ArchiveIoError";
        case ErrorKind::DirectoryRead:
            return "DirectoryReadError";
        case ErrorKind::Config:
            return "ConfigError";
    }
    return "Error";
}

Error::Error(ErrorKind kind, const std::string& message, const std::string& cause)
    : std::runtime_error(Compose(message, cause)), kind_(kind), message_(message), cause_(cause) {}

HeaderFieldTooLong::HeaderFieldTooLong(const std::string& field, std::size_t width, std::size_t actual)
    : Error(ErrorKind::HeaderFieldTooLong,
            "Header field '" + field + "' is " + std::to_string(actual)
                + " bytes, maximum is " + std::to_string(width)),
      field_(field) {}

}  // namespace valkyrie

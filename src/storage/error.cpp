#include "storage/error.hpp"

#include <utility>

namespace zephyrite {

namespace {

std::string compose(StorageErrorKind kind, const std::string& detail) {
    std::string out{to_string(kind)};
    out += ": ";
    out += detail;
    return out;
}

} // anonymous namespace

std::string_view to_string(StorageErrorKind kind) noexcept {
    switch (kind) {
        case StorageErrorKind::KeyNotFound:          return "Key not found";
        case StorageErrorKind::KeyAlreadyExists:     return "Key already exists";
        case StorageErrorKind::InvalidKey:           return "Invalid key";
        case StorageErrorKind::InvalidValue:         return "Invalid value";
        case StorageErrorKind::Internal:             return "Internal storage error";
        case StorageErrorKind::UnsupportedOperation: return "Unsupported operation";
    }
    return "Unknown storage error";
}

int status_code(StorageErrorKind kind) noexcept {
    switch (kind) {
        case StorageErrorKind::KeyNotFound:
            return 404;
        case StorageErrorKind::InvalidKey:
        case StorageErrorKind::InvalidValue:
            return 400;
        default:
            return 500;
    }
}

StorageError::StorageError(StorageErrorKind kind, std::string detail)
    : std::runtime_error(compose(kind, detail))
    , kind_(kind)
    , detail_(std::move(detail))
{
}

int StorageError::status_code() const noexcept {
    return zephyrite::status_code(kind_);
}

StorageError StorageError::key_not_found(std::string_view key) {
    return {StorageErrorKind::KeyNotFound, std::string(key)};
}

StorageError StorageError::key_already_exists(std::string_view key) {
    return {StorageErrorKind::KeyAlreadyExists, std::string(key)};
}

StorageError StorageError::invalid_key(std::string detail) {
    return {StorageErrorKind::InvalidKey, std::move(detail)};
}

StorageError StorageError::invalid_value(std::string detail) {
    return {StorageErrorKind::InvalidValue, std::move(detail)};
}

StorageError StorageError::internal(std::string detail) {
    return {StorageErrorKind::Internal, std::move(detail)};
}

StorageError StorageError::unsupported(std::string detail) {
    return {StorageErrorKind::UnsupportedOperation, std::move(detail)};
}

} // namespace zephyrite

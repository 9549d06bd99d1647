#include "Errors.hpp"

MissingFallbackError::MissingFallbackError(const std::string& key)
    : std::runtime_error("You must offer a fallback if the key is not in cache: " + key),
      key_(key) {}

DuplicateKeyError::DuplicateKeyError(const std::string& key)
    : std::runtime_error("Stream key is already registered: " + key),
      key_(key) {}

FetchError::FetchError(const std::string& key, std::exception_ptr cause)
    : std::runtime_error("Fetch failed for key " + key + ": " + describeException(cause)),
      key_(key),
      cause_(std::move(cause)) {}

std::exception_ptr FetchError::wrap(const std::string& key, std::exception_ptr error) {
    if (!error) {
        return std::make_exception_ptr(FetchError(key, error));
    }
    try {
        std::rethrow_exception(error);
    } catch (const FetchError&) {
        return error;
    } catch (...) {
        return std::make_exception_ptr(FetchError(key, error));
    }
}

std::string describeException(std::exception_ptr error) {
    if (!error) {
        return "unknown error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

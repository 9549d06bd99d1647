#pragma once

#include <exception>
#include <stdexcept>
#include <string>

class MissingFallbackError : public std::runtime_error {
public:
    explicit MissingFallbackError(const std::string& key);

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class DuplicateKeyError : public std::runtime_error {
public:
    explicit DuplicateKeyError(const std::string& key);

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class FetchError : public std::runtime_error {
public:
    FetchError(const std::string& key, std::exception_ptr cause);

    const std::string& key() const { return key_; }
    std::exception_ptr cause() const { return cause_; }

    // Returns `error` unchanged when it already holds a FetchError.
    static std::exception_ptr wrap(const std::string& key, std::exception_ptr error);

private:
    std::string key_;
    std::exception_ptr cause_;
};

std::string describeException(std::exception_ptr error);

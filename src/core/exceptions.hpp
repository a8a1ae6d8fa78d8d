#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace arbguard {

class ArbGuardException : public std::runtime_error {
public:
    explicit ArbGuardException(const std::string& message) : std::runtime_error(message) {}
    explicit ArbGuardException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public ArbGuardException {
public:
    explicit ConfigurationError(const std::string& message)
        : ArbGuardException("Configuration Error: " + message) {}
};

// Source index outside the observation's source set
class InvalidIndexError : public ArbGuardException {
public:
    explicit InvalidIndexError(std::size_t index)
        : ArbGuardException("Invalid Index: source " + std::to_string(index) + " does not exist"),
          index_(index) {}

    std::size_t index() const { return index_; }

private:
    std::size_t index_;
};

// Opportunity id outside the ledger range
class InvalidIdError : public ArbGuardException {
public:
    InvalidIdError(std::uint64_t id, std::size_t count)
        : ArbGuardException("Invalid Id: opportunity " + std::to_string(id) +
                            " out of range (count " + std::to_string(count) + ")"),
          id_(id) {}

    std::uint64_t id() const { return id_; }

private:
    std::uint64_t id_;
};

// Second acceptance within one logical height
class DuplicateHeightError : public ArbGuardException {
public:
    explicit DuplicateHeightError(std::uint64_t height)
        : ArbGuardException("Duplicate Height: an opportunity is already recorded at height " +
                            std::to_string(height)),
          height_(height) {}

    std::uint64_t height() const { return height_; }

private:
    std::uint64_t height_;
};

} // namespace arbguard

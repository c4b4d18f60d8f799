#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

class PkgslimException : public std::runtime_error {
public:
    explicit PkgslimException(const std::string& message)
        : std::runtime_error(message) {}
};

// An installed-package database that could not be opened or understood
class DatabaseError : public PkgslimException {
public:
    DatabaseError(std::filesystem::path database, const std::string& message)
        : PkgslimException(message), database_(std::move(database)) {}

    const std::filesystem::path& database() const { return database_; }

private:
    std::filesystem::path database_;
};

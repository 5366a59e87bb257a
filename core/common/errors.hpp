#pragma once

#include <stdexcept>
#include <string>

namespace arena {

/// Raised when an isolated workspace cannot be created.
/// Carries the failing command's stderr (worktree) or the filesystem
/// error text (copy).
class SandboxCreationError : public std::runtime_error {
public:
    explicit SandboxCreationError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Raised for malformed benchmark definitions, before any pair runs.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace arena

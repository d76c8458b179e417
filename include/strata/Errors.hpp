/**
 * @file Errors.hpp
 * @brief Exception types for strata
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - InvalidConfiguration: Rejected merge options or settings
 * - MergeDepthExceeded: Input nested deeper than MergeOptions::max_depth
 * - FileNotFoundError: Layer file not found
 * - ConfigParseError: JSON/TOML syntax errors
 * - UnsupportedFormatError: Layer file extension not understood
 */

#ifndef STRATA_ERRORS_HPP
#define STRATA_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace strata {

/**
 * @brief Base class for all strata exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Merge options (or the settings feeding them) are inconsistent
 *
 * Raised before any traversal begins, so no partial result exists.
 */
class InvalidConfiguration : public ConfigError {
public:
    explicit InvalidConfiguration(const std::string& reason)
        : ConfigError("Invalid merge configuration: " + reason)
        , reason_(reason)
    {}

    /**
     * @brief Get the reason without the common message prefix
     */
    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string reason_;
};

/**
 * @brief Recursion passed the configured depth limit
 */
class MergeDepthExceeded : public ConfigError {
public:
    explicit MergeDepthExceeded(std::size_t limit)
        : ConfigError("Merge depth limit of " + std::to_string(limit) + " exceeded")
        , limit_(limit)
    {}

    std::size_t limit() const noexcept {
        return limit_;
    }

private:
    std::size_t limit_;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 *
 * Line and column are 1-based; 0 means the parser did not report one.
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line Line of the error, or 0
     * @param column Column of the error, or 0
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief File extension is neither .json nor .toml
 */
class UnsupportedFormatError : public ConfigError {
public:
    UnsupportedFormatError(std::string path, std::string extension)
        : ConfigError("Unsupported config file type '" + extension + "' for '" + path +
                      "' (expected .json or .toml)")
        , path_(std::move(path))
        , extension_(std::move(extension))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string path_;
    std::string extension_;
};

} // namespace strata

#endif // STRATA_ERRORS_HPP

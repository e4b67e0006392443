/**
 * @file Errors.hpp
 * @brief Exception types for recon
 *
 * Error taxonomy:
 * - ReconError: Base class
 * - MalformedLiteral: Literal text fails to parse
 * - UnsupportedArgumentShape: Argument is not a literal shape
 * - InvalidInputShape: Comparator input is not property-bag-like
 * - MissingPropertyList: Restricted comparison lacks a property list
 * - FileNotFoundError: Input or settings file not found
 * - ConfigParseError: JSON/TOML syntax errors
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 * - SettingsError: Setting has an invalid type or value
 */

#ifndef RECON_ERRORS_HPP
#define RECON_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace recon {

/**
 * @brief Base class for all recon exceptions
 */
class ReconError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Literal text could not be parsed
 *
 * Carries the byte offset at which parsing stopped.
 */
class MalformedLiteral : public ReconError {
public:
    MalformedLiteral(std::size_t offset, std::string reason)
        : ReconError("Malformed literal at offset " + std::to_string(offset) +
                     ": " + reason)
        , offset_(offset)
        , reason_(std::move(reason))
    {}

    std::size_t offset() const noexcept {
        return offset_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::size_t offset_;
    std::string reason_;
};

/**
 * @brief Argument is well-formed but not a literal value shape
 *
 * Raised for variable references, sub-expressions, expandable strings and
 * calls, since reconstructing them would require evaluation.
 */
class UnsupportedArgumentShape : public ReconError {
public:
    /**
     * @param shape Name of the rejected shape (e.g., "variable")
     * @param offset Byte offset of the offending argument
     */
    UnsupportedArgumentShape(std::string shape, std::size_t offset)
        : ReconError("Unsupported argument shape '" + shape + "' at offset " +
                     std::to_string(offset))
        , shape_(std::move(shape))
        , offset_(offset)
    {}

    const std::string& shape() const noexcept {
        return shape_;
    }

    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    std::string shape_;
    std::size_t offset_;
};

/**
 * @brief Comparator input is not a property bag
 */
class InvalidInputShape : public ReconError {
public:
    /**
     * @param role Which input was rejected ("current" or "desired")
     * @param actual Type name of the rejected value
     */
    InvalidInputShape(std::string role, std::string actual)
        : ReconError("Invalid " + role + " state: expected a property bag, got " + actual)
        , role_(std::move(role))
        , actual_(std::move(actual))
    {}

    const std::string& role() const noexcept {
        return role_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string role_;
    std::string actual_;
};

/**
 * @brief Restricted comparison requested without a property list
 *
 * Structured objects cannot be safely fully enumerated, so comparing
 * against one requires an explicit list of properties.
 */
class MissingPropertyList : public ReconError {
public:
    explicit MissingPropertyList(std::string cls)
        : ReconError("A property list is required when the desired state is a '" +
                     cls + "' object")
        , class_name_(std::move(cls))
    {}

    const std::string& class_name() const noexcept {
        return class_name_;
    }

private:
    std::string class_name_;
};

/**
 * @brief File not found
 */
class FileNotFoundError : public ReconError {
public:
    explicit FileNotFoundError(std::string path)
        : ReconError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief File parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ReconError {
public:
    /**
     * @param file Path to the file with parse error
     * @param line 1-based line, 0 when unknown
     * @param column 1-based column, 0 when unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ReconError(format_message(file, line, column, details))
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
            msg += " at " + std::to_string(line) + ":" + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public ReconError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "render.max_depth")
     * @param segment The specific segment that doesn't exist
     */
    KeyError(std::string path, std::string segment)
        : ReconError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 */
class TypeError : public ReconError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : ReconError("Cannot traverse into " + actual +
                     " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A setting has the wrong type or an out-of-range value
 */
class SettingsError : public ReconError {
public:
    SettingsError(std::string key, std::string details)
        : ReconError("Invalid setting '" + key + "': " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

} // namespace recon

#endif // RECON_ERRORS_HPP

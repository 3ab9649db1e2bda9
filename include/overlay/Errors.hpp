/**
 * @file Errors.hpp
 * @brief Exception types for overlay errors
 *
 * Error taxonomy:
 * - OverlayError: Base class
 * - InputTypeError: Merge input is not text
 * - ParseError: Document could not be interpreted by the grammar
 * - SerializationError: Value could not be converted back to text
 * - ValidationError: Structural check failed (root is not a mapping)
 * - FileNotFoundError: Document file not found
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 *
 * The merge engine converts the first four into data on MergeResult;
 * none of them escapes merge_documents().
 */

#ifndef OVERLAY_ERRORS_HPP
#define OVERLAY_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace overlay {

/**
 * @brief Base class for all overlay exceptions
 */
class OverlayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief An argument to the merge entry point is not text
 */
class InputTypeError : public OverlayError {
public:
    /**
     * @param argument Which argument was rejected ("existing" or "update")
     * @param reason Why it is not text
     */
    InputTypeError(std::string argument, std::string reason)
        : OverlayError(argument + " document is not text: " + reason)
        , argument_(std::move(argument))
    {}

    const std::string& argument() const noexcept {
        return argument_;
    }

private:
    std::string argument_;
};

/**
 * @brief Document could not be interpreted by the grammar
 */
class ParseError : public OverlayError {
public:
    /**
     * @brief Construct with line number and error details
     * @param line 1-based line number (0 when not tied to a line)
     * @param details Description of the problem
     */
    ParseError(std::size_t line, std::string details)
        : OverlayError(format_message("", line, details))
        , line_(line)
        , details_(std::move(details))
    {}

    /**
     * @brief Construct with the source file name as well
     */
    ParseError(std::string source, std::size_t line, std::string details)
        : OverlayError(format_message(source, line, details))
        , source_(std::move(source))
        , line_(line)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    std::size_t line() const noexcept {
        return line_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::size_t line_ = 0;
    std::string details_;

    static std::string format_message(const std::string& source, std::size_t line,
                                      const std::string& details) {
        std::string msg;
        if (!source.empty()) msg += "'" + source + "' ";
        if (line > 0) msg += "line " + std::to_string(line) + ": ";
        return msg + details;
    }
};

/**
 * @brief Value could not be converted back to text
 */
class SerializationError : public OverlayError {
public:
    using OverlayError::OverlayError;
};

/**
 * @brief Post-merge structural check failed
 */
class ValidationError : public OverlayError {
public:
    using OverlayError::OverlayError;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public OverlayError {
public:
    explicit FileNotFoundError(std::string path)
        : OverlayError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public OverlayError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "agent.name")
     * @param segment The specific segment that doesn't exist (e.g., "name")
     */
    KeyError(std::string path, std::string segment)
        : OverlayError("Key not found: '" + segment + "' in path '" + path + "'")
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
 *
 * Raised when attempting to traverse into a scalar
 * (e.g., "agent.name.first" where name is a string).
 */
class TypeError : public OverlayError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : OverlayError("Cannot traverse into " + actual +
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

} // namespace overlay

#endif // OVERLAY_ERRORS_HPP

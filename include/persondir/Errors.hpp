/**
 * @file Errors.hpp
 * @brief Exception types for persondir
 *
 * Error taxonomy:
 * - PersonDirError: Base class
 * - InvalidArgument: A required input is absent
 * - IncorrectResultSize: A lookup returned more records than expected
 * - DataFormatError: A person document has the wrong shape
 * - ConfigError: Base class for configuration errors
 * - MissingMandatoryConfig: Mandatory keys absent
 * - FileNotFoundError: Config or person file not found
 * - ConfigParseError: JSON/TOML syntax errors
 */

#ifndef PERSONDIR_ERRORS_HPP
#define PERSONDIR_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace persondir {

/**
 * @brief Base class for all persondir exceptions
 */
class PersonDirError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A required argument was absent
 *
 * Raised before any mutation takes place. Indicates a programming error
 * in the caller.
 */
class InvalidArgument : public PersonDirError {
public:
    using PersonDirError::PersonDirError;
};

/**
 * @brief A lookup returned a different number of records than expected
 */
class IncorrectResultSize : public PersonDirError {
public:
    /**
     * @brief Construct with expected and actual result counts
     * @param expected Number of records the caller expected at most
     * @param actual Number of records actually returned
     */
    IncorrectResultSize(std::size_t expected, std::size_t actual)
        : PersonDirError("Incorrect result size: expected " + std::to_string(expected) +
                         ", actual " + std::to_string(actual))
        , expected_(expected)
        , actual_(actual)
    {}

    std::size_t expected() const noexcept {
        return expected_;
    }

    std::size_t actual() const noexcept {
        return actual_;
    }

private:
    std::size_t expected_;
    std::size_t actual_;
};

/**
 * @brief A person document does not have the expected shape
 */
class DataFormatError : public PersonDirError {
public:
    /**
     * @brief Construct with location and error details
     * @param where Origin of the document plus position (e.g., "people.json[2].name")
     * @param details What was wrong
     */
    DataFormatError(std::string where, std::string details)
        : PersonDirError("Invalid person data at '" + where + "': " + details)
        , where_(std::move(where))
        , details_(std::move(details))
    {}

    const std::string& where() const noexcept {
        return where_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string where_;
    std::string details_;
};

/**
 * @brief Base class for configuration errors
 */
class ConfigError : public PersonDirError {
public:
    using PersonDirError::PersonDirError;
};

/**
 * @brief Mandatory configuration keys are missing after merge
 *
 * Contains the list of all missing mandatory keys.
 */
class MissingMandatoryConfig : public ConfigError {
public:
    /**
     * @brief Construct with list of missing keys
     * @param keys Dot-paths of missing mandatory keys
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ConfigError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    /**
     * @brief Get the list of missing keys
     * @return Vector of dot-path strings
     */
    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief File not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief File parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line Line of the error (0 if unknown)
     * @param column Column of the error (0 if unknown)
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
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

} // namespace persondir

#endif // PERSONDIR_ERRORS_HPP

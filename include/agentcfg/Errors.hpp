/**
 * @file Errors.hpp
 * @brief Exception types for agent configuration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - FlagError: Unknown flag, missing argument or malformed flag value
 * - ConfigParseError: JSON/TOML syntax or type-mismatch errors
 * - FileNotFoundError: Config file or directory not found
 * - DurationError: Unparsable duration literal
 * - ValidationError: Merged configuration is semantically inconsistent
 */

#ifndef AGENTCFG_ERRORS_HPP
#define AGENTCFG_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace agentcfg {

/**
 * @brief Base class for all agentcfg exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Command line flag could not be parsed
 */
class FlagError : public ConfigError {
public:
    /**
     * @brief Construct with flag name and error details
     * @param flag Flag name without leading dashes (may be empty for
     *             errors not tied to a flag, e.g. a stray argument)
     * @param details Human-readable description of the problem
     */
    FlagError(std::string flag, std::string details)
        : ConfigError(format_message(flag, details))
        , flag_(std::move(flag))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the offending flag name
     */
    const std::string& flag() const noexcept {
        return flag_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string flag_;
    std::string details_;

    static std::string format_message(const std::string& flag, const std::string& details) {
        if (flag.empty()) return "flag error: " + details;
        return "flag -" + flag + ": " + details;
    }
};

/**
 * @brief Configuration document parse error (JSON/TOML syntax or types)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with source name and error details
     * @param source File path or descriptive name of the document
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string source, std::string details)
        : ConfigError("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the document source with the parse error
     */
    const std::string& source() const noexcept {
        return source_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

/**
 * @brief Configuration file or directory not found
 */
class FileNotFoundError : public ConfigError {
public:
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
 * @brief Duration literal could not be parsed
 */
class DurationError : public ConfigError {
public:
    explicit DurationError(std::string input)
        : ConfigError("invalid duration \"" + input + "\"")
        , input_(std::move(input))
    {}

    const std::string& input() const noexcept {
        return input_;
    }

private:
    std::string input_;
};

/**
 * @brief Merged configuration failed semantic validation
 *
 * Raised by the resolver. No runtime configuration is produced.
 */
class ValidationError : public ConfigError {
public:
    /**
     * @brief Construct with the field at fault and error details
     * @param field Field name in the merged fragment (e.g. "bind_addr")
     * @param details Description of the violation
     */
    ValidationError(std::string field, std::string details)
        : ConfigError("invalid configuration: " + field + ": " + details)
        , field_(std::move(field))
        , details_(std::move(details))
    {}

    const std::string& field() const noexcept {
        return field_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string field_;
    std::string details_;
};

} // namespace agentcfg

#endif // AGENTCFG_ERRORS_HPP

#pragma once

#include <stdexcept>
#include <string>

namespace docbridge {

/**
 * @brief Backend failure that is neither success nor a plain "not found"
 *
 * Raised for error payloads returned by the store (network, malformed response,
 * timeout). Never to be interpreted as absence of a document.
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message)
    {}

    StoreError(const std::string& error, const std::string& reason)
        : std::runtime_error(error + " :: " + reason)
        , error_(error)
        , reason_(reason)
    {}

    const std::string& error() const { return error_; }
    const std::string& reason() const { return reason_; }

private:
    std::string error_;
    std::string reason_;
};

/**
 * @brief Schema authoring bug (e.g. incomplete unique-constraint key)
 *
 * Fatal, not retried.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message)
    {}

    ConfigurationError(const std::string& schema, const std::string& message)
        : std::runtime_error(schema + ": " + message)
        , schema_(schema)
    {}

    const std::string& schema() const { return schema_; }

private:
    std::string schema_;
};

} // namespace docbridge

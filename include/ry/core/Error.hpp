#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ry::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

/**
 * @brief Malformed document input.
 *
 * The scanner and parser degrade gracefully instead of raising this; it is
 * kept for stricter validation layered on top of the token stream.
 */
class SyntaxError : public Error {
public:
    SyntaxError(std::string details, std::size_t line, std::size_t column);

    std::string_view details() const noexcept { return m_details; }
    std::size_t line() const noexcept { return m_line; }
    std::size_t column() const noexcept { return m_column; }

private:
    static std::string BuildMessage(const std::string& details,
                                    std::size_t line,
                                    std::size_t column);

    std::string m_details;
    std::size_t m_line = 0;
    std::size_t m_column = 0;
};

inline std::string SyntaxError::BuildMessage(const std::string& details,
                                             std::size_t line,
                                             std::size_t column) {
    std::string message;
    message.reserve(details.size() + 48);
    message.append(details);
    message.append(" at line ");
    message.append(std::to_string(line));
    message.append(", column ");
    message.append(std::to_string(column));
    return message;
}

inline SyntaxError::SyntaxError(std::string details, std::size_t line, std::size_t column)
    : Error(BuildMessage(details, line, column)),
      m_details(std::move(details)),
      m_line(line),
      m_column(column) {}

class IoError : public Error {
public:
    IoError(std::string_view operation, std::filesystem::path path, std::error_code code);

    std::string_view operation() const noexcept { return m_operation; }
    const std::filesystem::path& path() const noexcept { return m_path; }
    std::error_code code() const noexcept { return m_code; }

private:
    static std::string BuildMessage(std::string_view operation,
                                    const std::filesystem::path& path,
                                    const std::error_code& code);

    std::string m_operation;
    std::filesystem::path m_path;
    std::error_code m_code;
};

inline std::string IoError::BuildMessage(std::string_view operation,
                                         const std::filesystem::path& path,
                                         const std::error_code& code) {
    const std::string pathText = path.string();
    std::string message;
    message.reserve(operation.size() + pathText.size() + 32);
    message.append("I/O error during ");
    message.append(operation);
    message.append(" '");
    message.append(pathText);
    message.append("'");
    if (code) {
        message.append(": ");
        message.append(code.message());
    }
    return message;
}

inline IoError::IoError(std::string_view operation, std::filesystem::path path, std::error_code code)
    : Error(BuildMessage(operation, path, code)),
      m_operation(operation),
      m_path(std::move(path)),
      m_code(code) {}

class ValueTypeError : public Error {
public:
    ValueTypeError(std::string_view expected, std::string_view actual);

    std::string_view expected() const noexcept { return m_expected; }
    std::string_view actual() const noexcept { return m_actual; }

private:
    std::string m_expected;
    std::string m_actual;
};

inline ValueTypeError::ValueTypeError(std::string_view expected, std::string_view actual)
    : Error("Value type error: expected " + std::string(expected) + " but found " + std::string(actual)),
      m_expected(expected),
      m_actual(actual) {}

class KeyNotFoundError : public Error {
public:
    explicit KeyNotFoundError(std::string key);

    std::string_view key() const noexcept { return m_key; }

private:
    std::string m_key;
};

inline KeyNotFoundError::KeyNotFoundError(std::string key)
    : Error("Mapping has no key '" + key + "'"),
      m_key(std::move(key)) {}

} // namespace ry::core

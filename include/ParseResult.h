#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// Reason a parser gave up on a file. Never leaves the parser layer:
// FormatParser::parse() turns it into the format's default record.
struct ParseError {
    std::string message;
    size_t offset = 0;  // byte position where parsing stopped, 0 if unknown

    std::string to_string() const {
        if (offset == 0) return message;
        return message + " (at offset " + std::to_string(offset) + ")";
    }
};

// Either a parsed record or the error that prevented it.
template <typename T>
class ParseResult {
public:
    static ParseResult<T> success(T value) {
        ParseResult<T> r;
        r.m_value = std::move(value);
        return r;
    }

    static ParseResult<T> failure(std::string message, size_t offset = 0) {
        ParseResult<T> r;
        r.m_error = ParseError{std::move(message), offset};
        return r;
    }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!m_value) throw std::logic_error("ParseResult has no value: " + m_error.to_string());
        return *m_value;
    }

    T value_or(T fallback) const { return m_value.value_or(std::move(fallback)); }

    const ParseError& error() const { return m_error; }

private:
    ParseResult() = default;

    std::optional<T> m_value;
    ParseError m_error;
};

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace retina::engine {

    enum class ErrorCode {
        DimensionMismatch,
        CapacityExceeded,
        IndexEmpty,
        NotFound,
        CorruptState,
        NotReady,
        EncodingFailed,
        GenerationFailed,
        NoContent,
        NoEmbeddings,
        InvalidArgument,
        IoError
    };

    inline const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::DimensionMismatch: return "DimensionMismatch";
            case ErrorCode::CapacityExceeded:  return "CapacityExceeded";
            case ErrorCode::IndexEmpty:        return "IndexEmpty";
            case ErrorCode::NotFound:          return "NotFound";
            case ErrorCode::CorruptState:      return "CorruptState";
            case ErrorCode::NotReady:          return "NotReady";
            case ErrorCode::EncodingFailed:    return "EncodingFailed";
            case ErrorCode::GenerationFailed:  return "GenerationFailed";
            case ErrorCode::NoContent:         return "NoContent";
            case ErrorCode::NoEmbeddings:      return "NoEmbeddings";
            case ErrorCode::InvalidArgument:   return "InvalidArgument";
            case ErrorCode::IoError:           return "IoError";
        }
        return "Unknown";
    }

    struct Error {
        ErrorCode code;
        std::string message;

        std::string describe() const {
            return std::string(to_string(code)) + ": " + message;
        }
    };

    inline Error make_error(ErrorCode code, std::string message) {
        return Error{code, std::move(message)};
    }

    /**
     * @brief Either a value or the Error that prevented producing it.
     */
    template <typename T>
    class Result {
    public:
        Result(T value) : m_data(std::move(value)) {}
        Result(Error error) : m_data(std::move(error)) {}

        bool ok() const { return std::holds_alternative<T>(m_data); }
        explicit operator bool() const { return ok(); }

        T& value() { return std::get<T>(m_data); }
        const T& value() const { return std::get<T>(m_data); }

        T* operator->() { return &value(); }
        const T* operator->() const { return &value(); }

        const Error& error() const { return std::get<Error>(m_data); }
        ErrorCode code() const { return error().code; }

    private:
        std::variant<T, Error> m_data;
    };

    template <>
    class Result<void> {
    public:
        Result() = default;
        Result(Error error) : m_error(std::move(error)) {}

        bool ok() const { return !m_error.has_value(); }
        explicit operator bool() const { return ok(); }

        const Error& error() const { return *m_error; }
        ErrorCode code() const { return m_error->code; }

    private:
        std::optional<Error> m_error;
    };

}

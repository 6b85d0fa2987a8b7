#pragma once
#include <variant>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <ostream>

namespace scoreflow {
namespace utils {

/**
 * @brief Failure categories reported by the engine and its collaborators.
 */
enum class ErrorCode {
    UnknownItem,            ///< Coverage or scope references a nonexistent content item
    UnknownRule,            ///< Rule name not present in the rule registry
    UnknownMetric,          ///< Referenced metric definition does not exist
    CyclicMetricReference,  ///< Submetric chain returns to itself
    InvalidConfiguration,   ///< Definition fails a structural check (levels, weights, params, ...)
    DependencyTimeout,      ///< A submetric recomputation did not finish in time
    StoreUnavailable        ///< Transient failure talking to an external store
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnknownItem: return "UnknownItem";
        case ErrorCode::UnknownRule: return "UnknownRule";
        case ErrorCode::UnknownMetric: return "UnknownMetric";
        case ErrorCode::CyclicMetricReference: return "CyclicMetricReference";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::DependencyTimeout: return "DependencyTimeout";
        case ErrorCode::StoreUnavailable: return "StoreUnavailable";
    }
    return "Unknown";
}

// Configuration errors quarantine a metric until its definition is edited.
inline bool isConfigurationError(ErrorCode code) {
    return code == ErrorCode::UnknownItem || code == ErrorCode::UnknownRule ||
           code == ErrorCode::UnknownMetric || code == ErrorCode::CyclicMetricReference ||
           code == ErrorCode::InvalidConfiguration;
}

inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    return os << toString(code);
}

struct Error {
    ErrorCode code;
    std::string message;

    std::string describe() const {
        return std::string(toString(code)) + ": " + message;
    }
};

// Generic Result<T> template
// Holds either a value of type T or an Error

template <typename T>
class Result {
public:
    // Success constructor
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    // Error constructor
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message) : data_(Error{code, std::move(message)}) {}

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void

template <>
class Result<void> {
public:
    // Success constructor
    Result() : success_(true) {}
    // Error constructor
    Result(const Error& error) : success_(false), error_(error) {}
    Result(Error&& error) : success_(false), error_(std::move(error)) {}
    Result(ErrorCode code, std::string message)
        : success_(false), error_(Error{code, std::move(message)}) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    const Error& error() const { return error_; }

private:
    bool success_ = false;
    Error error_{ErrorCode::InvalidConfiguration, {}};
};

} // namespace utils
} // namespace scoreflow

// For convenience, provide a top-level alias in the project namespace
namespace scoreflow {
using utils::Result;
using utils::Error;
using utils::ErrorCode;
}

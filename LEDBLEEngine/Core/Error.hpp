// Error.hpp - Engine error model built on std::expected
//
// Every fallible engine operation returns Result<T>. The error carries a
// domain-scoped code (parse, template, transport, capability), the capture
// site and a severity. Parse and template errors reject a single input and
// never stop the engine; transport errors are handed to the caller verbatim.
//
// Usage:
//   Result<DeviceState> Parse(std::span<const uint8_t> bytes) {
//       if (bytes.size() < kMinLength) {
//           return LEDBLE_ERROR_FATAL(ParseError::TooShort, "State response too short");
//       }
//       ...
//   }
//
//   auto state = Parse(bytes);
//   if (!state) {
//       state.error().Log();
//   }

#pragma once

#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>

#include "../Logging/Logging.hpp"

namespace LEDBLE {

// ============================================================================
// Source Location
// ============================================================================

/// Compile-time source location tracking via compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    /// Extract filename from full path (strips directory)
    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

// ============================================================================
// Error Severity
// ============================================================================

enum class ErrorSeverity : uint8_t {
    /// Recoverable error - caller may retry or fall back
    Recoverable,

    /// Fatal for the operation at hand (the input is rejected)
    Fatal,

    /// Warning - non-blocking issue, logged but operation continues
    Warning
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
        case ErrorSeverity::Warning:     return "WARNING";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorDomain : uint8_t {
    Parse,
    Template,
    Transport,
    Capability,
};

/// Malformed advertisement or response bytes
enum class ParseError : uint8_t {
    InvalidLength = 1,
    InvalidCompanyId,
    UnrecognizedLayout,
    ChecksumMismatch,
    TooShort,
    UnexpectedMarker,
};

/// Command rendering failures
enum class TemplateError : uint8_t {
    UnknownFunction = 1,
    MissingParameter,
    ParameterOutOfRange,
    MalformedTemplate,
};

/// Link-level failures, surfaced verbatim to the caller
enum class TransportError : uint8_t {
    Timeout = 1,
    Disconnected,
    WriteFailed,
    FragmentationOverflow,
    NotConnected,
    QueueFull,
};

enum class CapabilityError : uint8_t {
    UnknownProduct = 1,
};

/// Domain-qualified error code. Implicitly built from any of the domain enums
/// so call sites can compare `error.code == ParseError::TooShort`.
struct ErrorCode {
    ErrorDomain domain{ErrorDomain::Parse};
    uint8_t value{0};

    constexpr ErrorCode() noexcept = default;
    constexpr ErrorCode(ParseError e) noexcept
        : domain(ErrorDomain::Parse), value(std::to_underlying(e)) {}
    constexpr ErrorCode(TemplateError e) noexcept
        : domain(ErrorDomain::Template), value(std::to_underlying(e)) {}
    constexpr ErrorCode(TransportError e) noexcept
        : domain(ErrorDomain::Transport), value(std::to_underlying(e)) {}
    constexpr ErrorCode(CapabilityError e) noexcept
        : domain(ErrorDomain::Capability), value(std::to_underlying(e)) {}

    constexpr bool operator==(const ErrorCode&) const noexcept = default;
};

[[nodiscard]] constexpr const char* ToString(ErrorCode code) noexcept {
    switch (code.domain) {
        case ErrorDomain::Parse:
            switch (static_cast<ParseError>(code.value)) {
                case ParseError::InvalidLength:      return "ParseError::InvalidLength";
                case ParseError::InvalidCompanyId:   return "ParseError::InvalidCompanyId";
                case ParseError::UnrecognizedLayout: return "ParseError::UnrecognizedLayout";
                case ParseError::ChecksumMismatch:   return "ParseError::ChecksumMismatch";
                case ParseError::TooShort:           return "ParseError::TooShort";
                case ParseError::UnexpectedMarker:   return "ParseError::UnexpectedMarker";
            }
            break;
        case ErrorDomain::Template:
            switch (static_cast<TemplateError>(code.value)) {
                case TemplateError::UnknownFunction:     return "TemplateError::UnknownFunction";
                case TemplateError::MissingParameter:    return "TemplateError::MissingParameter";
                case TemplateError::ParameterOutOfRange: return "TemplateError::ParameterOutOfRange";
                case TemplateError::MalformedTemplate:   return "TemplateError::MalformedTemplate";
            }
            break;
        case ErrorDomain::Transport:
            switch (static_cast<TransportError>(code.value)) {
                case TransportError::Timeout:               return "TransportError::Timeout";
                case TransportError::Disconnected:          return "TransportError::Disconnected";
                case TransportError::WriteFailed:           return "TransportError::WriteFailed";
                case TransportError::FragmentationOverflow: return "TransportError::FragmentationOverflow";
                case TransportError::NotConnected:          return "TransportError::NotConnected";
                case TransportError::QueueFull:             return "TransportError::QueueFull";
            }
            break;
        case ErrorDomain::Capability:
            switch (static_cast<CapabilityError>(code.value)) {
                case CapabilityError::UnknownProduct: return "CapabilityError::UnknownProduct";
            }
            break;
    }
    return "UnknownError";
}

// ============================================================================
// Error Type
// ============================================================================

struct Error {
    ErrorCode code;            ///< Domain-qualified code
    SourceLocation location;   ///< Capture site (file, line, function)
    ErrorSeverity severity;    ///< Error severity level
    const char* message;       ///< Human-readable description

    /// Use the LEDBLE_ERROR_* macros instead of calling this directly
    [[nodiscard]] static constexpr Error Make(
        ErrorCode code,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{code, loc, sev, msg};
    }

    [[nodiscard]] constexpr bool IsRecoverable() const noexcept {
        return severity == ErrorSeverity::Recoverable;
    }

    [[nodiscard]] constexpr bool IsFatal() const noexcept {
        return severity == ErrorSeverity::Fatal;
    }

    [[nodiscard]] constexpr bool IsWarning() const noexcept {
        return severity == ErrorSeverity::Warning;
    }

    [[nodiscard]] constexpr bool Is(ErrorCode other) const noexcept {
        return code == other;
    }

    /// Log error with full context (file, line, function, message)
    void Log() const noexcept {
        const auto file = location.FileName();
        LEDBLE_LOG_ERROR(Engine,
                         "[%s] %.*s:%d in %s() - %s (%s)",
                         ToString(severity),
                         static_cast<int>(file.size()), file.data(),
                         location.line,
                         location.function,
                         ToString(code),
                         message);
    }

    /// Log error as warning (for non-fatal errors)
    void LogAsWarning() const noexcept {
        const auto file = location.FileName();
        LEDBLE_LOG(Engine,
                   "[%s] %.*s:%d in %s() - %s (%s)",
                   ToString(severity),
                   static_cast<int>(file.size()), file.data(),
                   location.line,
                   location.function,
                   ToString(code),
                   message);
    }
};

static_assert(sizeof(Error) <= 64, "Error must stay cache-line friendly");

// ============================================================================
// Result Type
// ============================================================================

template<typename T>
using Result = std::expected<T, Error>;

// ============================================================================
// Error Creation Macros (with automatic source location)
// ============================================================================

#define LEDBLE_ERROR_RECOVERABLE(code, msg) \
    std::unexpected(::LEDBLE::Error::Make((code), ::LEDBLE::ErrorSeverity::Recoverable, (msg)))

#define LEDBLE_ERROR_FATAL(code, msg) \
    std::unexpected(::LEDBLE::Error::Make((code), ::LEDBLE::ErrorSeverity::Fatal, (msg)))

#define LEDBLE_ERROR_WARNING(code, msg) \
    std::unexpected(::LEDBLE::Error::Make((code), ::LEDBLE::ErrorSeverity::Warning, (msg)))

#define LEDBLE_ERROR_TIMEOUT(msg) \
    LEDBLE_ERROR_RECOVERABLE(::LEDBLE::TransportError::Timeout, (msg))

#define LEDBLE_ERROR_DISCONNECTED(msg) \
    LEDBLE_ERROR_RECOVERABLE(::LEDBLE::TransportError::Disconnected, (msg))

// ============================================================================
// Error Propagation Helpers
// ============================================================================

/// Propagate error or extract value
///
///   Result<Frames> Encode() {
///       auto bytes = LEDBLE_TRY(Build());
///       ...
///   }
#define LEDBLE_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Propagate with logging
#define LEDBLE_TRY_LOG(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            _result.error().Log(); \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

} // namespace LEDBLE

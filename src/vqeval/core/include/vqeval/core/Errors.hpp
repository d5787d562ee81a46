#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vqeval {

/* Fatal conditions of an evaluation call.
   A partial sample set (decode failure after some pairs) is not an error:
   it shows up as EvaluationResult::count < planned. */
enum class ErrorKind : std::uint8_t {
    SourceUnavailable = 0, // a source could not be opened at all
    EmptySource,           // frame count of either source is zero
    NoComparablePairs,     // plan was not empty but no pair decoded on both sides
    Cancelled              // external cancellation between samples
};

inline const char* toString(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::EmptySource:       return "EmptySource";
        case ErrorKind::NoComparablePairs: return "NoComparablePairs";
        case ErrorKind::Cancelled:         return "Cancelled";
        default:                           return "Unknown";
    }
}

class EvalError : public std::runtime_error {
public:
    EvalError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_{kind} {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace vqeval

#pragma once

#include <stdexcept>
#include <string>

namespace loopguard {

enum class GuardrailErrorCode {
    EmptyInputList,          // Supported rate/volume list has nothing usable
    NoMatchingDiscreteValue, // Snap target lies below every supported value
    InvariantViolation       // Range or guardrail bounds out of order
};

[[nodiscard]] constexpr const char* toString(GuardrailErrorCode code) noexcept {
    switch (code) {
        case GuardrailErrorCode::EmptyInputList:          return "empty_input_list";
        case GuardrailErrorCode::NoMatchingDiscreteValue: return "no_matching_discrete_value";
        case GuardrailErrorCode::InvariantViolation:      return "invariant_violation";
    }
    return "unknown";
}

/**
 * Raised when a guardrail cannot be derived from its inputs.
 * These are precondition failures; callers are not expected to recover.
 */
class GuardrailError : public std::runtime_error {
public:
    GuardrailError(GuardrailErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {
    }

    GuardrailErrorCode code() const noexcept { return code_; }

private:
    GuardrailErrorCode code_;
};

} // namespace loopguard

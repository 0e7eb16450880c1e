#ifndef STEP_RESULT_H
#define STEP_RESULT_H

#include <optional>
#include <string>
#include <utility>

enum class ErrorKind {
    Propagation,
    Classification,
    Metadata,
    Capture,
    Telemetry,
    Storage
};

// How the acquisition loop reacts to a failed step
enum class FailurePolicy {
    ContinueIteration,  // log and carry on with the remaining steps
    BackOff             // log, sleep the back-off interval instead of the cadence
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Propagation:    return "PropagationError";
        case ErrorKind::Classification: return "ClassificationError";
        case ErrorKind::Metadata:       return "MetadataError";
        case ErrorKind::Capture:        return "CaptureError";
        case ErrorKind::Telemetry:      return "TelemetryError";
        case ErrorKind::Storage:        return "StorageError";
    }
    return "UnknownError";
}

inline FailurePolicy failurePolicyFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Metadata:
        case ErrorKind::Telemetry:
            return FailurePolicy::ContinueIteration;
        case ErrorKind::Propagation:
        case ErrorKind::Classification:
        case ErrorKind::Capture:
        case ErrorKind::Storage:
            return FailurePolicy::BackOff;
    }
    return FailurePolicy::BackOff;
}

struct StepError {
    ErrorKind kind;
    std::string message;
};

/**
 * Outcome of one acquisition step: either a value or a classified error.
 */
template <typename T>
class StepResult {
private:
    std::optional<T> result;
    std::optional<StepError> failure;

    StepResult() = default;

public:
    static StepResult ok(T value) {
        StepResult step;
        step.result = std::move(value);
        return step;
    }

    static StepResult failed(ErrorKind kind, std::string message) {
        StepResult step;
        step.failure = StepError{kind, std::move(message)};
        return step;
    }

    bool isOk() const { return result.has_value(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const { return *result; }
    const StepError& error() const { return *failure; }
};

#endif // STEP_RESULT_H

// core/types/errors.h
#ifndef STAGECRAFT_CORE_TYPES_ERRORS_H
#define STAGECRAFT_CORE_TYPES_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace stagecraft {

// Base for every error this library throws.
class StagecraftError : public std::runtime_error {
public:
    explicit StagecraftError(const std::string& message) : std::runtime_error(message) {}
};

// --- Slicing ---

enum class SliceErrorCode : uint8_t {
    UNKNOWN_STEP,
    CROSS_HOST_DEPENDENCY,
    DUPLICATE_STEP
};

// Thrown by slice_plan(). No partial result ever accompanies it.
class SliceError : public StagecraftError {
public:
    SliceError(SliceErrorCode code,
               std::string step_id,
               std::string host_id,
               std::string dependency_id,
               std::string dependency_host_id,
               const std::string& message)
        : StagecraftError(message),
          code_(code),
          step_id_(std::move(step_id)),
          host_id_(std::move(host_id)),
          dependency_id_(std::move(dependency_id)),
          dependency_host_id_(std::move(dependency_host_id)) {}

    SliceErrorCode code() const noexcept { return code_; }
    const std::string& step_id() const noexcept { return step_id_; }
    const std::string& host_id() const noexcept { return host_id_; }
    const std::string& dependency_id() const noexcept { return dependency_id_; }
    const std::string& dependency_host_id() const noexcept { return dependency_host_id_; }

private:
    SliceErrorCode code_;
    std::string step_id_;
    std::string host_id_;
    std::string dependency_id_;
    std::string dependency_host_id_;
};

// --- Wire decoding ---

enum class DecodeErrorCode : uint8_t {
    SYNTAX,
    UNKNOWN_FIELD,
    TRAILING_CONTENT,
    TYPE_MISMATCH,
    VERSION_MISMATCH
};

class DecodeError : public StagecraftError {
public:
    DecodeError(DecodeErrorCode code, std::string path, const std::string& message)
        : StagecraftError(message), code_(code), path_(std::move(path)) {}

    DecodeErrorCode code() const noexcept { return code_; }
    // JSON path of the offending value, e.g. "$.steps[2].host"
    const std::string& path() const noexcept { return path_; }

private:
    DecodeErrorCode code_;
    std::string path_;
};

// Typed step inputs failed to decode, normalize or validate.
class InputsError : public StagecraftError {
public:
    using StagecraftError::StagecraftError;
};

class ExecutorError : public StagecraftError {
public:
    using StagecraftError::StagecraftError;
};

class EngineError : public StagecraftError {
public:
    using StagecraftError::StagecraftError;
};

class ConfigError : public StagecraftError {
public:
    using StagecraftError::StagecraftError;
};

} // namespace stagecraft

#endif // STAGECRAFT_CORE_TYPES_ERRORS_H

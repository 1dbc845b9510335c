// SPECTRE - Prover Error Types
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Exceptions raised by the proving pipeline. Each one names the stage that
// failed so callers can report it and retry from there.

#ifndef SPECTRE_PROVER_ERRORS_H
#define SPECTRE_PROVER_ERRORS_H

#include <stdexcept>
#include <string>

namespace spectre {

// ============================================================================
// Pipeline Stages
// ============================================================================

/// Stage of a shield/unshield flow, in execution order
enum class ErrorStage {
    Validation,
    Artifacts,
    HashInit,
    Derivation,
    CircuitInput,
    Proving,
    Formatting,
    Submission
};

/// Lower-case stage name ("validation", "artifacts", ...)
const char* ErrorStageToString(ErrorStage stage);

// ============================================================================
// Exceptions
// ============================================================================

/// Base class for every pipeline failure
class ProverError : public std::runtime_error {
public:
    ProverError(ErrorStage stage, const std::string& msg)
        : std::runtime_error(msg), stage_(stage) {}

    ErrorStage GetStage() const { return stage_; }

private:
    ErrorStage stage_;
};

/// Missing or malformed request fields; raised before any hashing
class ValidationError : public ProverError {
public:
    explicit ValidationError(const std::string& msg)
        : ProverError(ErrorStage::Validation, msg) {}
};

/// Circuit artifacts missing, unreachable or failing the format check
class ArtifactError : public ProverError {
public:
    explicit ArtifactError(const std::string& msg)
        : ProverError(ErrorStage::Artifacts, msg) {}
};

/// Hasher failed to initialize
class HashInitError : public ProverError {
public:
    explicit HashInitError(const std::string& msg)
        : ProverError(ErrorStage::HashInit, msg) {}
};

/// Groth16 computation failed
class ProvingError : public ProverError {
public:
    explicit ProvingError(const std::string& msg)
        : ProverError(ErrorStage::Proving, msg) {}
};

/// Proof or public signals have the wrong shape
class FormattingError : public ProverError {
public:
    explicit FormattingError(const std::string& msg)
        : ProverError(ErrorStage::Formatting, msg) {}
};

/// On-chain submission or completion failed
class SubmissionError : public ProverError {
public:
    explicit SubmissionError(const std::string& msg)
        : ProverError(ErrorStage::Submission, msg) {}
};

} // namespace spectre

#endif // SPECTRE_PROVER_ERRORS_H

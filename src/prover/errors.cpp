// SPECTRE - Prover Error Types
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/prover/errors.h"

namespace spectre {

const char* ErrorStageToString(ErrorStage stage) {
    switch (stage) {
        case ErrorStage::Validation:   return "validation";
        case ErrorStage::Artifacts:    return "artifacts";
        case ErrorStage::HashInit:     return "hash-init";
        case ErrorStage::Derivation:   return "derivation";
        case ErrorStage::CircuitInput: return "circuit-input";
        case ErrorStage::Proving:      return "proving";
        case ErrorStage::Formatting:   return "formatting";
        case ErrorStage::Submission:   return "submission";
    }
    return "unknown";
}

} // namespace spectre

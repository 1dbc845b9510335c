// SPECTRE - Proof Service Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/prover/service.h"
#include "spectre/shield/circuit_input.h"
#include "spectre/util/logging.h"

namespace spectre {

namespace {

/// Run one stage, attributing any stray exception to it
template<typename F>
auto RunStage(ErrorStage stage, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const ProverError&) {
        throw;
    } catch (const std::exception& e) {
        throw ProverError(stage, e.what());
    }
}

} // namespace

// ============================================================================
// ProveResult
// ============================================================================

ProveResult ProveResult::Success(ProveResponse response) {
    ProveResult result;
    result.response_ = std::move(response);
    return result;
}

ProveResult ProveResult::Fail(ErrorStage stage, std::string error, std::string message) {
    ProveResult result;
    result.failure_.stage = stage;
    result.failure_.error = std::move(error);
    result.failure_.message = std::move(message);
    return result;
}

ProveResult ProveResult::FromError(const ProverError& error) {
    if (error.GetStage() == ErrorStage::Validation) {
        std::string message = error.what();
        if (message == MISSING_FIELDS_ERROR) {
            return Fail(ErrorStage::Validation, MISSING_FIELDS_ERROR, "");
        }
        return Fail(ErrorStage::Validation, "Invalid request", message);
    }
    return Fail(error.GetStage(), "Proof generation failed", error.what());
}

int ProveResult::HttpStatus() const {
    if (IsSuccess()) return 200;
    return failure_.stage == ErrorStage::Validation ? 400 : 500;
}

JSONValue ProveResult::ToJSON() const {
    if (IsSuccess()) {
        return response_->ToJSON();
    }

    JSONValue::Object obj;
    obj["error"] = failure_.error;
    if (!failure_.message.empty()) {
        obj["message"] = failure_.message;
    }
    if (failure_.stage != ErrorStage::Validation) {
        obj["stage"] = ErrorStageToString(failure_.stage);
    }
    return JSONValue(std::move(obj));
}

// ============================================================================
// ProveService
// ============================================================================

ProveService::ProveService(std::shared_ptr<ProverContext> context)
    : context_(std::move(context)) {}

ProveResult ProveService::Prove(const JSONValue& body, const ProgressCallback& onProgress,
                                const CancellationToken* cancel) {
    try {
        ProveRequest request = RunStage(ErrorStage::Validation, [&] {
            return ParseProveRequest(body, context_->GetOptions().treeDepth);
        });
        return ProveResult::Success(Run(request, onProgress, cancel));
    } catch (const ProverError& e) {
        LOG_ERROR(util::LogCategory::PROVER) << "Proof request failed at "
                                             << ErrorStageToString(e.GetStage()) << ": " << e.what();
        return ProveResult::FromError(e);
    }
}

ProveResult ProveService::Prove(const ProveRequest& request, const ProgressCallback& onProgress,
                                const CancellationToken* cancel) {
    try {
        return ProveResult::Success(Run(request, onProgress, cancel));
    } catch (const ProverError& e) {
        LOG_ERROR(util::LogCategory::PROVER) << "Proof request failed at "
                                             << ErrorStageToString(e.GetStage()) << ": " << e.what();
        return ProveResult::FromError(e);
    }
}

ProveResponse ProveService::Run(const ProveRequest& request, const ProgressCallback& onProgress,
                                const CancellationToken* cancel) {
    SPECTRE_LOG_TIMER(util::LogCategory::PROVER, "proof request");
    LOG_INFO(util::LogCategory::PROVER) << "Starting proof generation for "
                                        << OperationToString(request.operation);

    ArtifactsPtr artifacts = RunStage(ErrorStage::Artifacts, [&] {
        return context_->GetLoader().Load(onProgress, cancel);
    });

    HasherPtr hasher = RunStage(ErrorStage::HashInit, [&] {
        return context_->GetHasher().Get();
    });

    CircuitInputParams params = RunStage(ErrorStage::Derivation, [&] {
        return ToCircuitInputParams(request, hasher);
    });

    CircuitInput input = RunStage(ErrorStage::CircuitInput, [&] {
        CircuitInputBuilder builder(hasher, context_->GetOptions().treeDepth);
        return builder.Build(params);
    });

    ProofOutput output = RunStage(ErrorStage::Proving, [&] {
        auto generator = context_->AcquireGenerator();
        return generator->Prove(input, artifacts).get();
    });

    return RunStage(ErrorStage::Formatting, [&] {
        return ProveResponse::FromProof(output.proof, std::move(output.publicSignals));
    });
}

} // namespace spectre

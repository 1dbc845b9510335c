// SPECTRE - Proof Service
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// One shield/unshield proof, end to end:
//   validate -> load circuits -> init hasher -> derive notes
//   -> build circuit input -> prove -> format
// Stages run strictly in this order. Any failure stops the pipeline and
// is reported with the stage it happened in.

#ifndef SPECTRE_PROVER_SERVICE_H
#define SPECTRE_PROVER_SERVICE_H

#include "spectre/core/json.h"
#include "spectre/prover/context.h"
#include "spectre/prover/errors.h"
#include "spectre/shield/request.h"

#include <memory>
#include <optional>
#include <string>

namespace spectre {

/// Tagged outcome of a proof request
class ProveResult {
public:
    struct Failure {
        ErrorStage stage{ErrorStage::Validation};
        /// Short category ("Missing required fields", "Invalid request", ...)
        std::string error;
        /// Diagnostic text; empty when the category says it all
        std::string message;
    };

    static ProveResult Success(ProveResponse response);
    static ProveResult Fail(ErrorStage stage, std::string error, std::string message);

    /// Map a pipeline exception to the failure reported to callers
    static ProveResult FromError(const ProverError& error);

    bool IsSuccess() const { return response_.has_value(); }

    /// Only valid on success
    const ProveResponse& GetResponse() const { return *response_; }
    /// Only valid on failure
    const Failure& GetFailure() const { return failure_; }

    /// 200, 400 for validation failures, 500 otherwise
    int HttpStatus() const;

    /// Response body for the caller
    JSONValue ToJSON() const;

private:
    std::optional<ProveResponse> response_;
    Failure failure_;
};

class ProveService {
public:
    explicit ProveService(std::shared_ptr<ProverContext> context);

    /// Run the pipeline for a raw request body
    ProveResult Prove(const JSONValue& body, const ProgressCallback& onProgress = {},
                      const CancellationToken* cancel = nullptr);

    /// Run the pipeline for an already decoded request
    ProveResult Prove(const ProveRequest& request, const ProgressCallback& onProgress = {},
                      const CancellationToken* cancel = nullptr);

    ProverContext& GetContext() { return *context_; }

private:
    std::shared_ptr<ProverContext> context_;

    ProveResponse Run(const ProveRequest& request, const ProgressCallback& onProgress,
                      const CancellationToken* cancel);
};

} // namespace spectre

#endif // SPECTRE_PROVER_SERVICE_H

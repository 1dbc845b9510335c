// SPECTRE - Prove HTTP Server
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Minimal HTTP/1.1 front end for the proof service:
//   POST    /api/privacy/prove   run the pipeline
//   OPTIONS *                    CORS preflight
//   GET     /health              hasher and circuit status
//
// One thread accepts connections and hands each to the "http" pool.
// Proofs themselves run on the prover pool owned by the ProverContext.

#ifndef SPECTRE_RPC_PROVE_SERVER_H
#define SPECTRE_RPC_PROVE_SERVER_H

#include "spectre/prover/service.h"
#include "spectre/util/config.h"
#include "spectre/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace spectre {

// ============================================================================
// HTTP Messages
// ============================================================================

constexpr const char* PROVE_PATH = "/api/privacy/prove";
constexpr const char* HEALTH_PATH = "/health";

struct HTTPRequest {
    std::string method;
    /// Request target without the query string
    std::string path;
    std::string version;
    /// Header names lower-cased
    std::map<std::string, std::string> headers;
    std::string body;

    std::optional<std::string> GetHeader(const std::string& name) const;
};

struct HTTPResponse {
    int status{200};
    std::string contentType{"application/json"};
    std::map<std::string, std::string> headers;
    std::string body;

    static HTTPResponse Json(int status, const JSONValue& body);
};

/// Parse request line, headers and whatever body follows the blank line
std::optional<HTTPRequest> ParseHTTPRequest(const std::string& raw);

/// Serialize with Content-Length and "Connection: close"
std::string BuildHTTPResponse(const HTTPResponse& response);

const char* HTTPStatusText(int status);

// ============================================================================
// Server
// ============================================================================

struct ProveServerConfig {
    std::string bindAddress{"127.0.0.1"};
    uint16_t port{8787};
    /// Connection worker threads
    size_t threads{4};
    /// Connections allowed to wait for a worker
    size_t maxPendingConnections{64};
    /// Max request size including headers
    size_t maxRequestSize{4 * 1024 * 1024};
    /// Socket receive timeout
    int requestTimeoutSeconds{30};

    /// http.bind, http.port and http.threads
    static ProveServerConfig FromConfig(const util::ConfigManager& config);
};

class ProveServer {
public:
    ProveServer(const ProveServerConfig& config, std::shared_ptr<ProveService> service);
    ~ProveServer();

    ProveServer(const ProveServer&) = delete;
    ProveServer& operator=(const ProveServer&) = delete;

    /// Bind, listen and start accepting; false if the socket cannot be set up
    bool Start();

    /// Stop accepting, finish in-flight connections
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// Port actually bound (differs from the config when it asked for 0)
    uint16_t GetPort() const { return boundPort_; }

    /// Route one request (also used directly by tests)
    HTTPResponse Handle(const HTTPRequest& request);

    uint64_t GetTotalRequests() const { return totalRequests_.load(); }
    uint64_t GetTotalErrors() const { return totalErrors_.load(); }
    int64_t GetUptime() const;

private:
    ProveServerConfig config_;
    std::shared_ptr<ProveService> service_;

    std::atomic<bool> running_{false};
    int serverSocket_{-1};
    uint16_t boundPort_{0};
    std::thread acceptThread_;
    std::unique_ptr<util::ThreadPool> pool_;

    std::atomic<uint64_t> totalRequests_{0};
    std::atomic<uint64_t> totalErrors_{0};
    std::chrono::steady_clock::time_point startTime_;

    void AcceptLoop();
    void HandleConnection(int clientSocket);

    /// Read headers and a Content-Length body; nullopt on timeout or close.
    /// Sets tooLarge when the request exceeds maxRequestSize.
    std::optional<std::string> ReadRequest(int clientSocket, bool& tooLarge);

    HTTPResponse HandleProve(const HTTPRequest& request);
    HTTPResponse HandleHealth();
};

} // namespace spectre

#endif // SPECTRE_RPC_PROVE_SERVER_H

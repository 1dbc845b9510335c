// SPECTRE - Prove HTTP Server Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/rpc/prove_server.h"
#include "spectre/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace spectre {

// ============================================================================
// HTTP Messages
// ============================================================================

std::optional<std::string> HTTPRequest::GetHeader(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

HTTPResponse HTTPResponse::Json(int status, const JSONValue& body) {
    HTTPResponse response;
    response.status = status;
    response.body = body.ToJSON();
    return response;
}

std::optional<HTTPRequest> ParseHTTPRequest(const std::string& raw) {
    HTTPRequest request;

    // Find header/body separator
    size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        headerEnd = raw.find("\n\n");
        if (headerEnd == std::string::npos) return std::nullopt;
        request.body = raw.substr(headerEnd + 2);
    } else {
        request.body = raw.substr(headerEnd + 4);
    }

    std::istringstream stream(raw.substr(0, headerEnd));
    std::string line;

    // Request line: METHOD SP target SP version
    if (!std::getline(stream, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::istringstream requestLine(line);
    std::string target;
    if (!(requestLine >> request.method >> target >> request.version)) {
        return std::nullopt;
    }
    if (request.version.compare(0, 5, "HTTP/") != 0) {
        return std::nullopt;
    }
    request.path = target.substr(0, target.find('?'));

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) continue;
        std::string key = line.substr(0, colonPos);
        std::string value = line.substr(colonPos + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.erase(0, 1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        request.headers[key] = value;
    }

    return request;
}

const char* HTTPStatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string BuildHTTPResponse(const HTTPResponse& response) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << response.status << " " << HTTPStatusText(response.status) << "\r\n";
    if (!response.body.empty() || response.status != 200) {
        ss << "Content-Type: " << response.contentType << "\r\n";
    }
    for (const auto& header : response.headers) {
        ss << header.first << ": " << header.second << "\r\n";
    }
    ss << "Content-Length: " << response.body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << response.body;
    return ss.str();
}

// ============================================================================
// Configuration
// ============================================================================

ProveServerConfig ProveServerConfig::FromConfig(const util::ConfigManager& config) {
    namespace Keys = util::ConfigKeys;
    ProveServerConfig result;
    result.bindAddress = config.GetString(Keys::HTTP_BIND, result.bindAddress);

    if (config.HasKey(Keys::HTTP_PORT)) {
        auto port = config.TryGetUInt(Keys::HTTP_PORT);
        if (!port || *port > 65535) {
            throw util::ConfigError("Invalid value for http.port");
        }
        result.port = static_cast<uint16_t>(*port);
    }
    if (config.HasKey(Keys::HTTP_THREADS)) {
        auto threads = config.TryGetUInt(Keys::HTTP_THREADS);
        if (!threads || *threads == 0 || *threads > 256) {
            throw util::ConfigError("http.threads must be between 1 and 256");
        }
        result.threads = static_cast<size_t>(*threads);
    }
    return result;
}

// ============================================================================
// Server
// ============================================================================

namespace {

void SendAll(int socket, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG(util::LogCategory::HTTP) << "send failed: " << std::strerror(errno);
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

void AddCorsHeaders(HTTPResponse& response) {
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

HTTPResponse ErrorResponse(int status, const std::string& error,
                           const std::string& message = "") {
    JSONValue::Object obj;
    obj["error"] = error;
    if (!message.empty()) {
        obj["message"] = message;
    }
    return HTTPResponse::Json(status, JSONValue(std::move(obj)));
}

} // namespace

ProveServer::ProveServer(const ProveServerConfig& config, std::shared_ptr<ProveService> service)
    : config_(config), service_(std::move(service)) {
    startTime_ = std::chrono::steady_clock::now();
}

ProveServer::~ProveServer() {
    Stop();
}

bool ProveServer::Start() {
    if (running_.load()) return true;

    serverSocket_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (serverSocket_ < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to create socket";
        return false;
    }

    int opt = 1;
    setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);

    if (config_.bindAddress == "0.0.0.0" || config_.bindAddress.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, config_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR(util::LogCategory::HTTP) << "Invalid bind address " << config_.bindAddress;
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    if (bind(serverSocket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to bind to "
            << config_.bindAddress << ":" << config_.port << ": " << std::strerror(errno);
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    if (listen(serverSocket_, static_cast<int>(config_.maxPendingConnections)) < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to listen on socket";
        close(serverSocket_);
        serverSocket_ = -1;
        return false;
    }

    socklen_t addrLen = sizeof(addr);
    if (getsockname(serverSocket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) == 0) {
        boundPort_ = ntohs(addr.sin_port);
    } else {
        boundPort_ = config_.port;
    }

    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = config_.threads;
    poolConfig.maxQueueSize = config_.maxPendingConnections;
    poolConfig.name = "http";
    pool_ = std::make_unique<util::ThreadPool>(poolConfig);

    running_.store(true);
    startTime_ = std::chrono::steady_clock::now();
    acceptThread_ = std::thread(&ProveServer::AcceptLoop, this);

    LOG_INFO(util::LogCategory::HTTP) << "Prove server listening on "
        << config_.bindAddress << ":" << boundPort_
        << " with " << config_.threads << " connection threads";
    return true;
}

void ProveServer::Stop() {
    if (!running_.exchange(false)) return;

    // shutdown() wakes a thread blocked in accept()
    if (serverSocket_ >= 0) {
        shutdown(serverSocket_, SHUT_RDWR);
        close(serverSocket_);
        serverSocket_ = -1;
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (pool_) {
        pool_->Shutdown();
    }
    LOG_INFO(util::LogCategory::HTTP) << "Prove server stopped";
}

int64_t ProveServer::GetUptime() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
}

void ProveServer::AcceptLoop() {
    while (running_.load()) {
        struct sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = accept4(serverSocket_,
                                   reinterpret_cast<struct sockaddr*>(&clientAddr), &clientLen,
                                   SOCK_CLOEXEC);
        if (clientSocket < 0) {
            if (running_.load() && errno != EINTR) {
                LOG_WARN(util::LogCategory::HTTP) << "Accept failed: " << std::strerror(errno);
            }
            continue;
        }

        struct timeval tv;
        tv.tv_sec = config_.requestTimeoutSeconds;
        tv.tv_usec = 0;
        setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        if (!pool_->TryExecute([this, clientSocket]() { HandleConnection(clientSocket); })) {
            LOG_WARN(util::LogCategory::HTTP) << "Connection queue full, rejecting connection";
            HTTPResponse busy = ErrorResponse(503, "Server busy");
            AddCorsHeaders(busy);
            SendAll(clientSocket, BuildHTTPResponse(busy));
            close(clientSocket);
        }
    }
}

std::optional<std::string> ProveServer::ReadRequest(int clientSocket, bool& tooLarge) {
    tooLarge = false;
    std::string raw;
    char chunk[8192];
    size_t expected = std::string::npos;

    while (true) {
        if (expected == std::string::npos) {
            size_t headerEnd = raw.find("\r\n\r\n");
            size_t sepLen = 4;
            if (headerEnd == std::string::npos) {
                headerEnd = raw.find("\n\n");
                sepLen = 2;
            }
            if (headerEnd != std::string::npos) {
                size_t contentLength = 0;
                auto parsed = ParseHTTPRequest(raw.substr(0, headerEnd + sepLen));
                if (parsed) {
                    if (auto cl = parsed->GetHeader("content-length")) {
                        auto res = std::from_chars(cl->data(), cl->data() + cl->size(),
                                                   contentLength);
                        if (res.ec != std::errc()) {
                            contentLength = 0;
                        }
                    }
                }
                expected = headerEnd + sepLen + contentLength;
                if (expected > config_.maxRequestSize) {
                    tooLarge = true;
                    return std::nullopt;
                }
            }
        }

        if (expected != std::string::npos && raw.size() >= expected) {
            raw.resize(expected);
            return raw;
        }
        if (raw.size() > config_.maxRequestSize) {
            tooLarge = true;
            return std::nullopt;
        }

        ssize_t n = recv(clientSocket, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            // Peer closed or timed out; a complete header block is still usable
            if (expected != std::string::npos || raw.empty()) {
                return std::nullopt;
            }
            return raw;
        }
        raw.append(chunk, static_cast<size_t>(n));
    }
}

void ProveServer::HandleConnection(int clientSocket) {
    bool tooLarge = false;
    auto raw = ReadRequest(clientSocket, tooLarge);

    HTTPResponse response;
    if (!raw) {
        if (!tooLarge) {
            close(clientSocket);
            return;
        }
        response = ErrorResponse(413, "Request too large");
        AddCorsHeaders(response);
    } else if (auto request = ParseHTTPRequest(*raw)) {
        response = Handle(*request);
    } else {
        response = ErrorResponse(400, "Bad Request");
        AddCorsHeaders(response);
    }

    if (response.status >= 400) {
        ++totalErrors_;
    }
    SendAll(clientSocket, BuildHTTPResponse(response));
    close(clientSocket);
}

HTTPResponse ProveServer::Handle(const HTTPRequest& request) {
    ++totalRequests_;
    LOG_DEBUG(util::LogCategory::HTTP) << request.method << " " << request.path;

    HTTPResponse response;
    if (request.method == "OPTIONS") {
        response.status = 200;
        response.contentType.clear();
    } else if (request.path == HEALTH_PATH) {
        response = request.method == "GET" ? HandleHealth()
                                           : ErrorResponse(405, "Method not allowed");
    } else if (request.path == PROVE_PATH) {
        response = request.method == "POST" ? HandleProve(request)
                                            : ErrorResponse(405, "Method not allowed");
    } else {
        response = ErrorResponse(404, "Not found");
    }

    AddCorsHeaders(response);
    return response;
}

HTTPResponse ProveServer::HandleProve(const HTTPRequest& request) {
    auto body = JSONValue::TryParse(request.body);
    if (!body) {
        return ErrorResponse(400, "Invalid request", "Request body is not valid JSON");
    }

    ProveResult result = service_->Prove(*body);
    if (result.IsSuccess()) {
        LOG_INFO(util::LogCategory::HTTP) << "Proof served ("
                                          << result.GetResponse().publicSignals.size()
                                          << " public signals)";
    }
    return HTTPResponse::Json(result.HttpStatus(), result.ToJSON());
}

HTTPResponse ProveServer::HandleHealth() {
    ProverContext& context = service_->GetContext();

    JSONValue::Object obj;
    obj["status"] = "ok";
    obj["hasherReady"] = context.GetHasher().IsReady();
    obj["circuitsLoaded"] = context.GetLoader().IsLoaded();
    obj["treeDepth"] = static_cast<uint64_t>(context.GetOptions().treeDepth);
    obj["uptime"] = GetUptime();
    obj["requests"] = totalRequests_.load();
    return HTTPResponse::Json(200, JSONValue(std::move(obj)));
}

} // namespace spectre

/*
 * docker_client_curl.cpp
 *
 * Notes
 * - Speaks the Docker Engine API with the libcurl easy API, either over the
 *   daemon's unix socket (CURLOPT_UNIX_SOCKET_PATH) or a plain TCP endpoint.
 * - Request/response calls honor DockerClientConfig::requestTimeout; streaming
 *   calls (stats, followed logs, pull) have no total timeout.
 * - Streams run one curl transfer on a worker thread and feed a ChannelStream.
 *   Cancelling the stream aborts the transfer from the progress callback.
 */

#include <flocker/docker/docker_client.h>
#include <flocker/docker/engine_api.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

namespace flocker::docker {

namespace {

using engine::Operation;

constexpr std::size_t kStderrExcerpt = 512;

struct Endpoint {
    std::string baseUrl;    // "http://localhost" for unix sockets
    std::string socketPath; // empty for TCP
    std::string apiVersion;
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds connectTimeout{5000};
};

Result<Endpoint> resolveEndpoint(const DockerClientConfig& config) {
    Endpoint ep;
    ep.apiVersion = config.apiVersion;
    ep.requestTimeout = config.requestTimeout;
    ep.connectTimeout = config.connectTimeout;

    std::string_view host = config.host;
    if (host.empty()) {
        host = "unix:///var/run/docker.sock";
    }
    if (host.rfind("unix://", 0) == 0) {
        ep.socketPath = std::string(host.substr(7));
        ep.baseUrl = "http://localhost";
        if (ep.socketPath.empty())
            return Error{ErrorCode::InvalidArgument, "Docker host has an empty socket path"};
    } else if (host.rfind("tcp://", 0) == 0) {
        ep.baseUrl = "http://" + std::string(host.substr(6));
    } else if (host.rfind("http://", 0) == 0 || host.rfind("https://", 0) == 0) {
        ep.baseUrl = std::string(host);
    } else {
        return Error{ErrorCode::InvalidArgument,
                     "Unsupported Docker host (expected unix:// or tcp://): " + config.host};
    }
    while (!ep.baseUrl.empty() && ep.baseUrl.back() == '/')
        ep.baseUrl.pop_back();
    return ep;
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::DaemonUnreachable;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

// Returns false to abort the transfer.
using ChunkSink = std::function<bool(std::string_view)>;
using ShouldCancel = std::function<bool()>;

struct Request {
    const char* method{"GET"};
    std::string path; // without the version prefix, e.g. "/containers/json"
    std::optional<std::string> body;
    bool streaming{false};
    std::chrono::milliseconds timeout{0};
    ChunkSink onChunk;          // only receives 2xx payloads
    ShouldCancel shouldCancel;
};

struct Response {
    long status{0};
    std::string body;
};

// Write sink context
struct WriteContext {
    CURL* curl{nullptr};
    const ChunkSink* onChunk{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::string* body{nullptr};
    bool cancelRequested{false};
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    std::string_view chunk(ptr, total);
    if (ctx->onChunk && *ctx->onChunk && status >= 200 && status < 300) {
        if (!(*ctx->onChunk)(chunk)) {
            ctx->cancelRequested = true;
            return 0;
        }
        return total;
    }
    ctx->body->append(chunk.data(), chunk.size());
    return total;
}

// Invoked by curl about once a second even while the connection is idle,
// which is what lets a quiet log stream notice cancellation.
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const Endpoint& ep, std::chrono::milliseconds timeout) {
    if (!ep.socketPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, ep.socketPath.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(ep.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "flocker");
}

Result<Response> perform(const Endpoint& ep, const Request& req) {
    CurlHandle curl{curl_easy_init()};
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    const std::string url = ep.baseUrl + "/" + ep.apiVersion + req.path;
    Response response;

    HeaderList headers;
    if (req.body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body->size()));
    } else if (std::string_view(req.method) == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, 0L);
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, req.method);

    WriteContext wctx;
    wctx.curl = curl.get();
    wctx.onChunk = &req.onChunk;
    wctx.shouldCancel = &req.shouldCancel;
    wctx.body = &response.body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
    if (req.shouldCancel) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    auto timeout = req.streaming ? std::chrono::milliseconds{0}
                                 : (req.timeout.count() > 0 ? req.timeout : ep.requestTimeout);
    configure_common(curl.get(), ep, timeout);

    CURLcode rc = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (wctx.cancelRequested) {
        spdlog::debug("Docker {} {} cancelled", req.method, req.path);
        return Error{ErrorCode::OperationCancelled, "Request cancelled: " + req.path};
    }
    if (rc != CURLE_OK) {
        spdlog::debug("Docker {} {} failed: {}", req.method, req.path, curl_easy_strerror(rc));
        auto err = makeCurlError(rc, std::string(req.method) + " " + req.path);
        if (err.code == ErrorCode::DaemonUnreachable) {
            err.message += ep.socketPath.empty() ? " (" + ep.baseUrl + ")"
                                                 : " (" + ep.socketPath + ")";
        }
        return err;
    }
    spdlog::debug("Docker {} {} -> {}", req.method, req.path, response.status);
    return response;
}

// Splits an incoming byte stream into complete lines.
class LineBuffer {
public:
    template <typename F> bool feed(std::string_view bytes, F&& onLine) {
        pending_.append(bytes.data(), bytes.size());
        size_t start = 0;
        size_t nl;
        while ((nl = pending_.find('\n', start)) != std::string::npos) {
            std::string line = pending_.substr(start, nl - start);
            start = nl + 1;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!onLine(std::move(line))) {
                pending_.erase(0, start);
                return false;
            }
        }
        pending_.erase(0, start);
        return true;
    }

    std::string takeRemainder() {
        std::string rest = std::move(pending_);
        pending_.clear();
        return rest;
    }

private:
    std::string pending_;
};

/**
 * Stream whose producer is a curl transfer on a dedicated thread. Destroying or
 * cancelling the stream aborts the transfer; the destructor joins the worker.
 */
template <typename T> class CurlStream final : public Stream<T> {
public:
    using Work = std::function<void(std::stop_token, ChannelStream<T>&)>;

    explicit CurlStream(Work work) : channel_(std::make_shared<ChannelStream<T>>()) {
        worker_ = std::jthread([channel = channel_, work = std::move(work)](std::stop_token st) {
            work(st, *channel);
        });
    }

    ~CurlStream() override {
        channel_->cancel();
        worker_.request_stop();
        if (worker_.joinable())
            worker_.join();
    }

    std::optional<T> next(std::chrono::milliseconds timeout) override {
        return channel_->next(timeout);
    }

    void cancel() override {
        channel_->cancel();
        worker_.request_stop();
    }

    bool closed() const override { return channel_->closed(); }
    bool cancelled() const override { return channel_->cancelled(); }
    std::optional<Error> failure() const override { return channel_->failure(); }

private:
    std::shared_ptr<ChannelStream<T>> channel_;
    std::jthread worker_;
};

std::string tailParam(std::size_t tailLines) {
    return tailLines == 0 ? std::string("all") : std::to_string(tailLines);
}

std::string excerpt(std::string_view text) {
    auto cut = text.substr(0, std::min(text.size(), kStderrExcerpt));
    std::string out(cut);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' || out.back() == ' '))
        out.pop_back();
    return out;
}

class CurlDockerClient final : public IDockerClient {
public:
    explicit CurlDockerClient(const DockerClientConfig& config) {
        auto ep = resolveEndpoint(config);
        if (ep) {
            endpoint_ = std::move(ep).value();
        } else {
            configError_ = ep.error();
            spdlog::warn("Docker client misconfigured: {}", configError_->message);
        }
    }

    Result<ContainerId> createContainer(const CreateContainerSpec& spec) override {
        std::string path = "/containers/create";
        if (!spec.name.empty())
            path += "?name=" + engine::urlEncode(spec.name);
        auto resp = call(Operation::Create, "POST", path, engine::buildCreateBody(spec).dump());
        if (!resp)
            return resp.error();
        return engine::parseCreateResponse(resp.value().body);
    }

    Result<void> startContainer(const ContainerId& id) override {
        auto resp = call(Operation::Start, "POST", "/containers/" + id + "/start");
        if (!resp)
            return resp.error();
        if (resp.value().status == 304)
            spdlog::debug("Container {} already running", id);
        return {};
    }

    Result<void> stopContainer(const ContainerId& id, std::chrono::seconds graceTimeout) override {
        auto timeout = endpoint_.requestTimeout +
                       std::chrono::duration_cast<std::chrono::milliseconds>(graceTimeout);
        auto resp = call(Operation::Stop, "POST",
                         "/containers/" + id + "/stop?t=" + std::to_string(graceTimeout.count()),
                         std::nullopt, timeout);
        if (!resp)
            return resp.error();
        if (resp.value().status == 304)
            spdlog::debug("Container {} already stopped", id);
        return {};
    }

    Result<void> removeContainer(const ContainerId& id, bool force) override {
        auto resp = call(Operation::Remove, "DELETE",
                         "/containers/" + id + (force ? "?force=1" : "?force=0"));
        if (!resp)
            return resp.error();
        if (resp.value().status == 404)
            spdlog::debug("Container {} already removed", id);
        return {};
    }

    Result<ContainerStatus> inspectContainer(const ContainerId& id) override {
        auto resp = call(Operation::Inspect, "GET", "/containers/" + id + "/json");
        if (!resp)
            return resp.error();
        return engine::parseInspect(resp.value().body);
    }

    Result<std::vector<ContainerStatus>> listContainers(bool runningOnly) override {
        auto resp =
            call(Operation::List, "GET", runningOnly ? "/containers/json" : "/containers/json?all=1");
        if (!resp)
            return resp.error();
        return engine::parseContainerList(resp.value().body);
    }

    Result<std::unique_ptr<Stream<StatsSample>>> streamStats(const ContainerId& id) override {
        auto status = inspectContainer(id);
        if (!status)
            return status.error();
        if (!status.value().running())
            return Error{ErrorCode::InvalidState, "Container " + id + " is not running"};

        auto stream = std::make_unique<CurlStream<StatsSample>>(
            [ep = endpoint_, id](std::stop_token st, ChannelStream<StatsSample>& channel) {
                LineBuffer lines;
                Request req;
                req.path = "/containers/" + id + "/stats?stream=1";
                req.streaming = true;
                req.shouldCancel = [&] { return st.stop_requested() || channel.cancelled(); };
                req.onChunk = [&](std::string_view chunk) {
                    return lines.feed(chunk, [&](std::string line) {
                        if (line.empty())
                            return true;
                        auto sample = engine::parseStatsSample(line);
                        if (!sample) {
                            spdlog::debug("Skipping stats sample: {}", sample.error().message);
                            return true;
                        }
                        return channel.push(std::move(sample).value());
                    });
                };
                finishStream(channel, Operation::Stats, perform(ep, req));
            });
        return std::unique_ptr<Stream<StatsSample>>(std::move(stream));
    }

    Result<std::vector<std::string>> fetchLogs(const ContainerId& id,
                                               std::size_t tailLines) override {
        auto resp = call(Operation::Logs, "GET",
                         "/containers/" + id + "/logs?stdout=1&stderr=1&tail=" +
                             tailParam(tailLines));
        if (!resp)
            return resp.error();
        engine::FrameDecoder decoder;
        std::string text;
        for (auto& frame : decoder.feed(resp.value().body))
            text += frame.second;
        return engine::splitLines(text);
    }

    Result<std::unique_ptr<Stream<std::string>>> followLogs(const ContainerId& id,
                                                            std::size_t tailLines) override {
        auto status = inspectContainer(id);
        if (!status)
            return status.error();

        auto stream = std::make_unique<CurlStream<std::string>>(
            [ep = endpoint_, id, tailLines](std::stop_token st, ChannelStream<std::string>& channel) {
                engine::FrameDecoder decoder;
                LineBuffer lines;
                Request req;
                req.path = "/containers/" + id + "/logs?follow=1&stdout=1&stderr=1&tail=" +
                           tailParam(tailLines);
                req.streaming = true;
                req.shouldCancel = [&] { return st.stop_requested() || channel.cancelled(); };
                req.onChunk = [&](std::string_view chunk) {
                    for (auto& frame : decoder.feed(chunk)) {
                        bool more = lines.feed(frame.second, [&](std::string line) {
                            return channel.push(std::move(line));
                        });
                        if (!more)
                            return false;
                    }
                    return true;
                };
                auto result = perform(ep, req);
                if (auto rest = lines.takeRemainder(); !rest.empty())
                    channel.push(std::move(rest));
                finishStream(channel, Operation::Logs, result);
            });
        return std::unique_ptr<Stream<std::string>>(std::move(stream));
    }

    Result<ExecResult> execInContainer(const ContainerId& id,
                                       const std::vector<std::string>& command) override {
        auto created = call(Operation::ExecCreate, "POST", "/containers/" + id + "/exec",
                            engine::buildExecCreateBody(command).dump());
        if (!created)
            return created.error();
        auto execId = engine::parseExecCreateResponse(created.value().body);
        if (!execId)
            return execId.error();

        engine::json startBody{{"Detach", false}, {"Tty", false}};
        auto started =
            call(Operation::ExecStart, "POST", "/exec/" + execId.value() + "/start", startBody.dump());
        if (!started)
            return started.error();

        auto inspected = call(Operation::ExecInspect, "GET", "/exec/" + execId.value() + "/json");
        if (!inspected)
            return inspected.error();
        auto exitCode = engine::parseExecExitCode(inspected.value().body);
        if (!exitCode)
            return exitCode.error();

        auto output = engine::demultiplex(started.value().body);
        ExecResult result;
        result.stdoutText = std::move(output.stdoutText);
        result.stderrText = std::move(output.stderrText);
        result.exitCode = exitCode.value();

        if (result.exitCode != 0) {
            spdlog::debug("exec {} in {} exited with {}", command.empty() ? "" : command.front(), id,
                          result.exitCode);
            return Error{ErrorCode::ExecFailed, "exit code " + std::to_string(result.exitCode) +
                                                    ": " + excerpt(result.stderrText)};
        }
        return result;
    }

    Result<std::vector<ImageInfo>> listLocalImages() override {
        auto resp = call(Operation::Images, "GET", "/images/json");
        if (!resp)
            return resp.error();
        return engine::parseImageList(resp.value().body);
    }

    Result<void> pullImage(const ImageReference& reference,
                           const PullProgressCallback& onProgress) override {
        if (configError_)
            return *configError_;

        std::string path = "/images/create?fromImage=" + engine::urlEncode(reference.repository);
        if (!reference.digest.empty())
            path = "/images/create?fromImage=" +
                   engine::urlEncode(reference.repository + "@" + reference.digest);
        else
            path += "&tag=" + engine::urlEncode(reference.tag.empty() ? "latest" : reference.tag);

        std::optional<Error> streamError;
        LineBuffer lines;
        Request req;
        req.method = "POST";
        req.path = path;
        req.streaming = true;
        req.onChunk = [&](std::string_view chunk) {
            return lines.feed(chunk, [&](std::string line) {
                if (line.empty())
                    return true;
                auto msg = engine::parsePullMessage(line);
                if (!msg) {
                    if (msg.error().code == ErrorCode::MalformedResponse)
                        return true;
                    streamError = msg.error();
                    return false;
                }
                if (onProgress)
                    onProgress(msg.value());
                return true;
            });
        };

        auto resp = perform(endpoint_, req);
        if (streamError) {
            spdlog::debug("Pull of {} failed: {}", reference.str(), streamError->message);
            return *streamError;
        }
        if (!resp)
            return resp.error();
        if (!engine::isSuccessStatus(Operation::Pull, resp.value().status))
            return engine::errorFromStatus(Operation::Pull, resp.value().status, resp.value().body);
        return {};
    }

private:
    Result<Response> call(Operation op, const char* method, std::string path,
                          std::optional<std::string> body = std::nullopt,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) {
        if (configError_)
            return *configError_;

        Request req;
        req.method = method;
        req.path = std::move(path);
        req.body = std::move(body);
        req.timeout = timeout;
        auto resp = perform(endpoint_, req);
        if (!resp)
            return resp.error();
        if (!engine::isSuccessStatus(op, resp.value().status))
            return engine::errorFromStatus(op, resp.value().status, resp.value().body);
        return resp;
    }

    template <typename T>
    static void finishStream(ChannelStream<T>& channel, Operation op, const Result<Response>& result) {
        if (!result) {
            if (result.error().code == ErrorCode::OperationCancelled)
                channel.finish();
            else
                channel.finish(result.error());
            return;
        }
        if (!engine::isSuccessStatus(op, result.value().status)) {
            channel.finish(engine::errorFromStatus(op, result.value().status, result.value().body));
            return;
        }
        channel.finish();
    }

    Endpoint endpoint_;
    std::optional<Error> configError_;
};

} // namespace

std::unique_ptr<IDockerClient> makeDockerClient(const DockerClientConfig& config) {
    static std::once_flag curlInit;
    std::call_once(curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return std::make_unique<CurlDockerClient>(config);
}

} // namespace flocker::docker

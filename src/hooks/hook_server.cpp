#include "hooks/hook_server.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <openssl/crypto.h>
#include <algorithm>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "providers/hook_config.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace clubhouse::hooks {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kTag = "hook-server";
constexpr const char* kRoutePrefix = "/hook/";
constexpr const char* kNonceHeader = "X-Clubhouse-Nonce";
constexpr std::chrono::seconds kReadTimeout{30};

bool LacksEventName(const nlohmann::json& raw) {
    const auto it = raw.find("hook_event_name");
    if (it == raw.end() || it->is_null()) {
        return true;
    }
    return it->is_string() && it->get<std::string>().empty();
}

// Constant time for equal-length values.
bool NonceMatches(const std::optional<std::string>& presented, const std::string& expected) {
    if (!presented || expected.empty() || presented->size() != expected.size()) {
        return false;
    }
    return CRYPTO_memcmp(presented->data(), expected.data(), expected.size()) == 0;
}

}  // namespace

HookRoute RouteHookRequest(const std::string& method, const std::string& target) {
    HookRoute route{};
    if (method != "POST" || !utils::StartsWith(target, kRoutePrefix)) {
        route.status = 404;
        return route;
    }
    const auto path = target.substr(std::string(kRoutePrefix).size());
    const auto slash = path.find('/');
    route.agent_id = slash == std::string::npos ? path : path.substr(0, slash);
    if (slash != std::string::npos) {
        route.event_hint = path.substr(slash + 1);
    }
    route.status = route.agent_id.empty() ? 400 : 200;
    return route;
}

struct HookServer::Processing {
    explicit Processing(std::size_t threads)
        : pool(threads) {}

    net::thread_pool pool;
};

// One connection. Requests on it are handled strictly in order: read,
// respond, process, then read the next. Processing runs on the server's
// processing pool so a slow surface never holds an I/O thread.
class HookServer::Session : public std::enable_shared_from_this<HookServer::Session> {
public:
    Session(tcp::socket&& socket, HookServer& server)
        : stream_(std::move(socket))
        , server_(server) {}

    void Run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::DoRead, shared_from_this()));
    }

private:
    void DoRead() {
        request_ = {};
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&Session::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            DoClose();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                utils::LogDebug(kTag, "read failed", {{"error", ec.message()}});
            }
            return;
        }

        route_ = RouteHookRequest(std::string(request_.method_string()), std::string(request_.target()));
        response_.result(static_cast<http::status>(route_.status));
        response_.version(request_.version());
        response_.keep_alive(request_.keep_alive());
        response_.prepare_payload();
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&Session::OnWrite, shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            utils::LogDebug(kTag, "write failed", {{"error", ec.message()}});
            return;
        }
        const bool close = response_.need_eof();
        response_ = {};

        if (route_.status != 200) {
            Resume(close);
            return;
        }
        std::optional<std::string> nonce;
        const auto header = request_.find(kNonceHeader);
        if (header != request_.end()) {
            nonce = std::string(header->value());
        }
        net::post(server_.processing_->pool,
                  [self = shared_from_this(), nonce = std::move(nonce), close] {
                      self->server_.HandleHook(self->route_.agent_id, self->route_.event_hint, nonce,
                                               self->request_.body());
                      net::post(self->stream_.get_executor(), [self, close] { self->Resume(close); });
                  });
    }

    void Resume(bool close) {
        if (close) {
            DoClose();
            return;
        }
        DoRead();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::empty_body> response_;
    HookRoute route_;
    HookServer& server_;
};

class HookServer::Listener : public std::enable_shared_from_this<HookServer::Listener> {
public:
    Listener(net::io_context& ioc, const tcp::endpoint& endpoint, HookServer& server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server) {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    }

    std::uint16_t Port() const {
        return acceptor_.local_endpoint().port();
    }

    void Run() {
        DoAccept();
    }

private:
    void DoAccept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::OnAccept, shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            utils::LogWarn(kTag, "accept failed", {{"error", ec.message()}});
        } else {
            std::make_shared<Session>(std::move(socket), server_)->Run();
        }
        DoAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    HookServer& server_;
};

HookServer::HookServer(config::HookServerConfig config,
                       const agents::AgentRegistry& registry,
                       const agents::ProviderResolver& resolver,
                       bus::EventBus* bus)
    : config_(std::move(config))
    , registry_(registry)
    , resolver_(resolver)
    , bus_(bus) {}

HookServer::~HookServer() {
    Stop();
}

std::shared_future<std::uint16_t> HookServer::Start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (ready_.valid()) {
        return ready_;
    }

    std::promise<std::uint16_t> promise;
    auto ready = promise.get_future().share();
    try {
        const int threads = std::max(1, config_.threads);
        auto ioc = std::make_unique<net::io_context>(threads);
        const auto address = net::ip::make_address(config_.host);
        const auto port = static_cast<unsigned short>(config_.port);
        auto listener = std::make_shared<Listener>(*ioc, tcp::endpoint{address, port}, *this);
        const auto bound_port = listener->Port();
        // Sessions reach processing_ from the workers, so it is set first.
        processing_ = std::make_unique<Processing>(
            static_cast<std::size_t>(std::max(1, config_.processing_threads)));
        listener->Run();

        for (int i = 0; i < threads; ++i) {
            workers_.emplace_back([context = ioc.get()] {
                for (;;) {
                    try {
                        context->run();
                        return;
                    } catch (const std::exception& ex) {
                        utils::LogError(kTag, "worker error", {{"error", ex.what()}});
                    }
                }
            });
        }
        io_context_ = std::move(ioc);
        listener_ = std::move(listener);
        port_ = bound_port;
        ready_ = ready;
        promise.set_value(bound_port);
        utils::LogInfo(kTag, "listening",
                       {{"host", config_.host}, {"port", std::to_string(bound_port)},
                        {"threads", std::to_string(threads)},
                        {"processing_threads", std::to_string(std::max(1, config_.processing_threads))}});
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "failed to start", {{"host", config_.host}, {"error", ex.what()}});
        promise.set_exception(std::current_exception());
    }
    return ready;
}

void HookServer::Stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!io_context_) {
        return;
    }
    io_context_->stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    // Queued work holds sessions, so the pool goes before the io_context.
    processing_->pool.stop();
    processing_->pool.join();
    processing_.reset();
    listener_.reset();
    io_context_.reset();
    port_ = 0;
    ready_ = {};
    utils::LogInfo(kTag, "stopped");
}

std::uint16_t HookServer::WaitReady() {
    std::shared_future<std::uint16_t> ready;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        ready = ready_;
    }
    if (!ready.valid()) {
        throw std::runtime_error("Hook server not started");
    }
    return ready.get();
}

std::string HookServer::HookBaseUrl() {
    return providers::BuildHookBaseUrl(WaitReady());
}

void HookServer::AddSurface(const std::shared_ptr<EventSurface>& surface) {
    std::lock_guard<std::mutex> lock(surfaces_mutex_);
    surfaces_.push_back(surface);
}

void HookServer::RemoveSurface(const std::shared_ptr<EventSurface>& surface) {
    std::lock_guard<std::mutex> lock(surfaces_mutex_);
    surfaces_.erase(std::remove_if(surfaces_.begin(), surfaces_.end(),
                                   [&surface](const std::weak_ptr<EventSurface>& entry) {
                                       auto locked = entry.lock();
                                       return !locked || locked == surface;
                                   }),
                    surfaces_.end());
}

void HookServer::HandleHook(const std::string& agent_id,
                            const std::string& event_hint,
                            const std::optional<std::string>& nonce,
                            const std::string& body) {
    auto raw = nlohmann::json::parse(body, nullptr, false);
    if (raw.is_discarded()) {
        utils::LogError(kTag, "failed to parse hook event", {{"agent", agent_id}});
        return;
    }
    // Copilot omits the event name from the payload and relies on the URL.
    if (!event_hint.empty() && raw.is_object() && LacksEventName(raw)) {
        raw["hook_event_name"] = event_hint;
    }

    const auto registration = registry_.Find(agent_id);
    if (!registration) {
        utils::LogDebug(kTag, "dropping event for unknown agent", {{"agent", agent_id}});
        return;
    }
    if (!NonceMatches(nonce, registration->nonce)) {
        utils::LogWarn(kTag, "rejected hook event with invalid nonce", {{"agent", agent_id}});
        return;
    }

    try {
        std::optional<std::string> provider_id;
        if (!registration->provider_id.empty()) {
            provider_id = registration->provider_id;
        }
        const auto& provider = resolver_.Resolve(registration->workspace_path, provider_id);
        auto event = provider.ParseHookEvent(raw);
        if (!event) {
            utils::LogDebug(kTag, "unrecognized hook event",
                            {{"agent", agent_id}, {"provider", provider.Id()}});
            return;
        }
        if (event->tool_name) {
            event->tool_verb = providers::ResolveToolVerb(provider, *event->tool_name);
        } else {
            event->tool_verb.reset();
        }
        event->timestamp = utils::NowMillis();
        FanOut(agent_id, *event);
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "failed to process hook event", {{"agent", agent_id}, {"error", ex.what()}});
    }
}

void HookServer::FanOut(const std::string& agent_id, const providers::NormalizedHookEvent& event) {
    std::vector<std::shared_ptr<EventSurface>> live;
    {
        std::lock_guard<std::mutex> lock(surfaces_mutex_);
        auto it = surfaces_.begin();
        while (it != surfaces_.end()) {
            if (auto surface = it->lock()) {
                live.push_back(std::move(surface));
                ++it;
            } else {
                it = surfaces_.erase(it);
            }
        }
    }
    for (const auto& surface : live) {
        if (!surface->IsAlive()) {
            continue;
        }
        try {
            surface->OnHookEvent(agent_id, event);
        } catch (const std::exception& ex) {
            utils::LogError(kTag, "surface rejected event", {{"agent", agent_id}, {"error", ex.what()}});
        }
    }
    if (bus_) {
        bus_->Publish(bus::MakeHookEvent(agent_id, event));
    }
}

}  // namespace clubhouse::hooks

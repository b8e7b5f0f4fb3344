// Example 01: Site Operations
//
// A server with two domain handlers: a quick synchronous one and a long
// running deployment tracked as an async operation. Try it with:
//
//   nc 127.0.0.1 7654
//   {"jsonrpc":"2.0","id":1,"method":"initialize","params":{"clientCapabilities":{}}}
//   {"jsonrpc":"2.0","id":2,"method":"site.deploy","params":{"siteId":"shop-1"}}
//   {"jsonrpc":"2.0","id":3,"method":"operation.status","params":{"operationId":"op_..."}}

#include <umcp/log/spdlog_logger.hpp>
#include <umcp/server/server.hpp>
#include <umcp/server/server_utils.hpp>

#include <asio/co_spawn.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <iostream>

using namespace umcp;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// site.list
// ═══════════════════════════════════════════════════════════════════════════

class SiteListHandler final : public IHandler {
public:
    asio::awaitable<Json> handle(const Json& params, ConnectionContext&, const JsonRpcRequest&) override {
        const auto provider = params.value("provider", std::string("hostinger"));
        if (provider != "hostinger") {
            throw RpcException::provider_error("Provider not configured: " + provider,
                                               Json{{"provider", provider}});
        }
        co_return Json{{"sites", Json::array({
            {{"id", "shop-1"}, {"name", sanitize_string("Main <Shop>")}},
            {{"id", "blog-1"}, {"name", "Company Blog"}}
        })}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// site.deploy
// ═══════════════════════════════════════════════════════════════════════════

class SiteDeployHandler final : public IHandler {
public:
    explicit SiteDeployHandler(AsyncOperationTracker& operations)
        : operations_(operations)
        , schema_(ParamSchema::from_json({
              {"required", Json::array({"siteId"})},
              {"properties", {
                  {"siteId", {{"type", "string"}}},
                  {"environment", {{"type", "string"}, {"enum", Json::array({"staging", "production"})}}}
              }}
          }))
    {}

    [[nodiscard]] const ParamSchema* param_schema() const noexcept override { return &schema_; }

    asio::awaitable<Json> handle(const Json& params, ConnectionContext& context, const JsonRpcRequest& request) override {
        const std::string operation_id = operations_.start(context.connection_id, request.method(), params);

        // The deployment continues after this response has been sent.
        asio::co_spawn(co_await asio::this_coro::executor,
                       deploy(operation_id, params.at("siteId").get<std::string>()),
                       log_coroutine_failure("Deployment " + operation_id));

        co_return Json{{"operationId", operation_id}, {"status", "running"}};
    }

private:
    asio::awaitable<void> deploy(std::string operation_id, std::string site_id) {
        asio::steady_timer step(co_await asio::this_coro::executor);
        for (int percent = 25; percent < 100; percent += 25) {
            step.expires_after(500ms);
            co_await step.async_wait(asio::use_awaitable);

            OperationUpdate delta;
            delta.progress = percent;
            if (operations_.update(operation_id, delta).has_value() == false) {
                co_return;  // Client went away or the operation timed out
            }
        }

        OperationUpdate done;
        done.status = OperationStatus::Completed;
        done.progress = 100;
        done.result = Json{{"siteId", site_id}, {"url", "https://" + site_id + ".example.net"}};
        auto finished = operations_.update(operation_id, done);
        if (finished.has_value() == false) {
            UMCP_LOG_DEBUG("Deployment {} not completed: {}", operation_id, finished.error().message);
        }
    }

    AsyncOperationTracker& operations_;
    ParamSchema schema_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    set_logger(make_console_logger(LogLevel::Debug));

    asio::io_context io;
    ServerConfig config;
    Server server(io, config);

    server.handlers().emplace<SiteListHandler>("site.list");
    server.handlers().emplace<SiteDeployHandler>("site.deploy", server.operations());

    const auto bound = server.start();
    if (bound.has_value() == false) {
        std::cerr << "Cannot start: " << bound.error().message << "\n";
        return 1;
    }
    std::cout << "Listening on " << bound->address().to_string() << ":" << bound->port() << "\n";

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code&, int) { server.stop(); });

    io.run();
    return 0;
}

#include "protocols/shell/commands.hpp"
#include "protocols/ProtocolService.hpp"
#include "protocols/TCPAcceptor.hpp"
#include "concurrency/Gate.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "config/Config.hpp"
#include "image/Dispatcher.hpp"
#include "image/Pipeline.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include <fmt/core.h>

using namespace rf;
using namespace rf::protocols::shell;

namespace {

std::atomic<int> pendingSignal{0};

void signalHandler(const int signum) { pendingSignal.store(signum); }

}

CommandResult rf::protocols::shell::serve(const config::Config& config) {
    const auto& server = config.server;

    try {
        concurrency::ThreadPoolManager::instance().init(server.workers);

        const auto gate = concurrency::Gate::create(server.concurrency_limit);
        const auto pipeline = std::make_shared<const image::Pipeline>(config.encoding);
        const auto dispatcher = std::make_shared<const image::Dispatcher>(
            gate, concurrency::ThreadPoolManager::instance().pipelinePool(), pipeline);

        ProtocolService service(dispatcher);
        service.start();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        log::Registry::reframe()->info("[Reframe] Ready on {}", endpointToString(service.endpoint()));

        while (service.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            const int sig = pendingSignal.exchange(0);
            if (sig == SIGHUP) {
                log::Registry::reframe()->info("[Reframe] SIGHUP received, reopening log file");
                log::Registry::reopenMainLog();
                continue;
            }
            if (sig != 0) {
                log::Registry::reframe()->info("[Reframe] Signal {} received. Shutting down gracefully...", sig);
                break;
            }
        }

        service.stop();
        concurrency::ThreadPoolManager::instance().shutdown();

        log::Registry::reframe()->info("[Reframe] Shut down cleanly.");
        return ok("");
    } catch (const std::exception& e) {
        log::Registry::reframe()->error("[Reframe] Failed to start: {}", e.what());
        concurrency::ThreadPoolManager::instance().shutdown();
        return failed(fmt::format("serve: {}", e.what()));
    }
}

// ═══════════════════════════════════════════════════════════════════
//  main.cpp — lanserve: share one file or directory over the LAN
// ═══════════════════════════════════════════════════════════════════

#include <lanserve/lanserve.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

using namespace lanserve;

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    config::Options options;
    try {
        options = config::parseArgs(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::usage(argv[0]);
        return 1;
    }

    if (options.showHelp) {
        std::cout << config::usage(argv[0]);
        return 0;
    }

    if (options.verbose) {
        console::setLevel(console::Level::Debug);
    }
    console::debug("Options:", nlohmann::json(options).dump());

    auto life = std::make_shared<lifecycle::Lifecycle>(static_cast<std::uint64_t>(options.count));
    std::unique_ptr<http::Server> server;
    std::string downloadName;

    try {
        auto spec = content::ContentSpec::fromPath(options.target, options.archiveKind);
        std::shared_ptr<const content::ContentProvider> provider = content::makeProvider(spec);
        downloadName = provider->filename();

        server = std::make_unique<http::Server>(DownloadHandler(provider, life));
        server->listen(options.listenAddress(), options.port);
    } catch (const std::exception& e) {
        console::error("Error:", e.what());
        return 1;
    }

    // Watch signals before announcing, so an early Ctrl+C is not lost
    lifecycle::InterruptWatcher interrupts(life->signal);

    server->start([life](const std::string& err) {
        life->signal.raise(lifecycle::Trigger::ServerError, err);
    });

    auto host = options.bindAddress.empty() ? network::localIp() : options.bindAddress;
    console::log("Serving", options.target);
    console::log("URL: http://" + host + ":" + std::to_string(server->port()) + "/" +
                 path::encodeURIComponent(downloadName));
    if (life->limit.unlimited()) {
        console::log("Downloads: unlimited");
    } else {
        console::log("Downloads:", options.count, "remaining");
    }
    console::log("Press Ctrl+C to stop");

    auto outcome = lifecycle::ShutdownCoordinator(life, options.drainTimeout).run(*server);
    console::debug("Shutdown finished:", lifecycle::describe(outcome.trigger),
                   outcome.drained ? "(drained)" : "(timed out)");

    // Abandoned transfers still run on detached threads; skip static
    // destructors they might be using.
    if (!outcome.drained) {
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(0);
    }
    return 0;
}

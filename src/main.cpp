// ═══════════════════════════════════════════════════════════════════
//  main.cpp — QuickShare server executable
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/config.h"
#include "quickshare/console.h"
#include "quickshare/errors.h"
#include "quickshare/lifecycle.h"
#include "quickshare/routes.h"
#include "quickshare/share_service.h"
#include "quickshare/sweeper.h"
#include "quickshare/tls.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace quickshare;

namespace {

// First IPv4 address of this host that other LAN machines can reach.
std::string lanAddress() {
    namespace net = boost::asio;
    try {
        net::io_context ioc;
        net::ip::tcp::resolver resolver(ioc);
        auto results = resolver.resolve(net::ip::tcp::v4(), net::ip::host_name(), "");
        for (const auto& result : results) {
            auto address = result.endpoint().address().to_string();
            if (address.rfind("127.", 0) != 0 && address.rfind("169.254.", 0) != 0) {
                return address;
            }
        }
    } catch (const boost::system::system_error& e) {
        console::debug("LAN address lookup failed:", e.what());
    }
    return "127.0.0.1";
}

void printBanner(const Config& config, const ShareService& service, bool https) {
    const std::string protocol = https ? "https" : "http";
    const std::string rule(60, '=');
    const auto port = std::to_string(config.port);

    std::cout << rule << "\n"
              << "QuickShare\n"
              << rule << "\n"
              << "Storage directory: " << service.options().storageDir.string() << "\n"
              << "Cleanup after:     " << config.cleanupHours << " hours\n"
              << "Max file size:     " << config.maxSizeMb << " MB\n"
              << "Protocol:          " << (https ? "HTTPS" : "HTTP") << "\n"
              << rule << "\n"
              << "Server running on:\n";
    if (config.host == "0.0.0.0") {
        std::cout << "  Local:   " << protocol << "://127.0.0.1:" << port << "\n"
                  << "  Network: " << protocol << "://" << lanAddress() << ":" << port << "\n";
    } else {
        std::cout << "  " << protocol << "://" << config.host << ":" << port << "\n";
    }
    std::cout << rule << "\n"
              << "Press Ctrl+C to stop the server\n"
              << rule << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = Config::defaults();

    try {
        config::applyEnvironment(config);
        if (config::applyArguments(config, argc, argv) == config::Action::ShowHelp) {
            std::cout << config::usage(argv[0]);
            return EXIT_SUCCESS;
        }
        config.validate();
    } catch (const errors::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.quiet) {
        console::setLevel(console::Level::Warn);
    }

    try {
        ShareService service({
            .storageDir        = config.storageDir,
            .maxSizeBytes      = config.maxSizeBytes(),
            .retention         = config.retention(),
            .maxFilesPerUpload = config.maxFilesPerUpload,
            .clock             = nullptr,
        });

        tls::Context tlsContext;
        if (config.tlsEnabled()) {
            tlsContext = tls::Context::load(config.tlsOptions());
        }

        ExpirySweeper sweeper(service, config.sweepInterval);
        sweeper.start();

        auto app = routes::createApp(service, {
            .threads = config.threads,
        });

        lifecycle::Shutdown shutdown;
        shutdown.onShutdown([&](int) {
            console::info("Stopping expiry sweeper...");
            sweeper.stop();
        });
        shutdown.attach(app);

        app.listen(config.host, config.port, &tlsContext, [&] {
            printBanner(config, service, tlsContext.enabled());
        });

        sweeper.stop();
        console::success("Server stopped.");
    } catch (const errors::ConfigError& e) {
        console::error("Configuration error:", e.what());
        return EXIT_FAILURE;
    } catch (const errors::StorageError& e) {
        console::error("Storage error:", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        console::error("Fatal:", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

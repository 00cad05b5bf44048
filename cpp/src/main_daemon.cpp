#include "fusionml/api.hpp"
#include "fusionml/config.hpp"
#include "fusionml/logging.hpp"

#include <pthread.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <path>] [--url <ws-url>]\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string url;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--url") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            (arg == "--config" ? config_path : url) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    // Blocked before any thread starts so that only sigwait() sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        std::cerr << "fusionmld error: cannot block signals\n";
        return 1;
    }

    try {
        auto settings = config_path.empty() ? fusionml::ServiceSettings{}
                                            : fusionml::ServiceSettings::from_toml(config_path);
        if (!url.empty()) {
            settings.stream.url = url;
        }
        settings.validate();

        auto runtime = fusionml::build_service(settings);
        auto logger = fusionml::get_logger("fusionmld");
        logger.info("daemon_started", {{"url", settings.stream.url},
                                       {"config", config_path.empty() ? "defaults" : config_path}});

        std::thread worker([&runtime]() { runtime.service->run(); });

        int received = 0;
        if (sigwait(&signals, &received) != 0) {
            received = SIGTERM;
        }
        logger.info("shutdown_requested", {{"signal", std::to_string(received)}});

        runtime.service->stop();
        worker.join();
        runtime.exporter->stop();

        const auto stats = runtime.engine->get_statistics();
        logger.info("daemon_stopped", {{"samples", std::to_string(runtime.service->sample_count())},
                                       {"predictions", std::to_string(stats.prediction_count)},
                                       {"anomalies", std::to_string(stats.anomaly_count)}});
    } catch (const std::exception& exc) {
        std::cerr << "fusionmld error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}

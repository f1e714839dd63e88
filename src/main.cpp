#include "docflow/config.hpp"
#include "docflow/context.hpp"
#include "docflow/import_server.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config FILE]\n"
              << "\n"
              << "Accepts file imports over WebSocket and runs them through the ingestion pipeline.\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE   YAML configuration (default: config.yaml)\n"
              << "  --help          Show this message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config.yaml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        auto config = docflow::load_config(config_file);
        docflow::initialize_logging(config.logging);
        DOCFLOW_LOG_INFO("Starting docflowd...");

        // Declared before the io_context so that pending handlers release
        // their sessions while the context is still alive
        docflow::Context context(config);

        boost::asio::io_context ioc;
        auto server = std::make_shared<docflow::ImportServer>(ioc, context, config.server);
        server->start();
        context.start_sweeper(ioc.get_executor());

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            DOCFLOW_LOG_INFO("Received signal " + std::to_string(signal_number) + ", shutting down");
            server->stop();
            context.stop();
            ioc.stop();
        });

        uint32_t thread_count = std::max<uint32_t>(1, config.server.threads);
        std::vector<std::thread> threads;
        threads.reserve(thread_count - 1);
        for (uint32_t i = 1; i < thread_count; ++i) {
            threads.emplace_back([&ioc]() { ioc.run(); });
        }
        ioc.run();
        for (auto& thread : threads) {
            thread.join();
        }

        context.stop();
        DOCFLOW_LOG_INFO("docflowd stopped, " + std::to_string(context.orchestrator().file_ids().size()) +
                         " files imported this run");
        DOCFLOW_LOG_DEBUG(docflow::Metrics::getInstance().export_prometheus());
        return 0;

    } catch (const std::exception& e) {
        DOCFLOW_LOG_CRITICAL("Fatal error in main: " + std::string(e.what()));
        return 1;
    }
}

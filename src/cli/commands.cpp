#include <atomic>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "api/http_gateway.hpp"
#include "config/config_loader.hpp"
#include "httplib.h"
#include "service/execution_service.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: pyexec serve | pyexec run <file|-> [--lib SPEC]... [--name NAME]" << std::endl;
}

pyexec::config::Config LoadRuntimeConfig() {
    auto config = pyexec::config::LoadConfig();
    pyexec::utils::SetLogConfig(config.logging);
    return config;
}

int RunServer() {
    const auto config = LoadRuntimeConfig();
    pyexec::service::ExecutionService service(config);
    pyexec::api::HttpGateway gateway(service);

    httplib::Server http_server;
    gateway.RegisterRoutes(http_server);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    const std::string host = config.server.host;
    const int port = config.server.port;
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.listen(host, port)) {
            pyexec::utils::Log(pyexec::utils::LogLevel::kError, "http", "failed to listen",
                               {{"host", host}, {"port", std::to_string(port)}});
            listen_failed.store(true);
        }
    });

    pyexec::utils::Log(pyexec::utils::LogLevel::kInfo, "http", "pyexec server started", {
        {"host", host},
        {"port", std::to_string(port)},
        {"environments", config.environments.root}});
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunOnce(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }
    pyexec::service::ExecutionRequest request{};
    const std::string source = argv[2];
    if (source == "-") {
        request.code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream input(source);
        if (!input.is_open()) {
            std::cerr << "Cannot read " << source << std::endl;
            return 1;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        request.code = buffer.str();
    }

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--lib" && i + 1 < argc) {
            request.dependencies.push_back(argv[++i]);
        } else if (arg == "--name" && i + 1 < argc) {
            request.name = std::string(argv[++i]);
        } else {
            PrintUsage();
            return 1;
        }
    }

    const auto config = LoadRuntimeConfig();
    pyexec::service::ExecutionService service(config);
    const auto result = service.Execute(request);
    std::cout << result.output << std::flush;
    if (!result.error.empty()) {
        std::cerr << result.error << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunServer();
    }

    if (argc >= 2 && std::string(argv[1]) == "run") {
        return RunOnce(argc, argv);
    }

    PrintUsage();
    return 1;
}

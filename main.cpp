#include <iostream>
#include <optional>
#include <string>

#include "app/RelayServerApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace voicescribe;

namespace {

void PrintUsage(const char* program) {
    std::cout << "usage: " << program << " [--config PATH] [--host HOST] [--port PORT]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> configPath;
    std::optional<std::string> host;
    std::optional<int> port;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                port.reset();
            }
            if (!port || *port < 1 || *port > 65535) {
                std::cerr << "error: invalid port " << argv[i] << std::endl;
                return 2;
            }
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "error: unknown argument " << arg << std::endl;
            PrintUsage(argv[0]);
            return 2;
        }
    }

    infrastructure::RelayConfig config = infrastructure::ConfigLoader::LoadRelayConfig(configPath);
    if (host) config.host = *host;
    if (port) config.port = *port;

    app::RelayServerApp server(config);
    return server.Run();
}

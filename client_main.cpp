#include <iostream>
#include <memory>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "app/ClientApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonTranscriptionRepository.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace voicescribe;

int main(int argc, char** argv) {
    std::optional<std::string> configPath;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    infrastructure::ClientConfig config = infrastructure::ConfigLoader::LoadClientConfig(configPath);
    std::filesystem::path historyPath = config.historyPath.empty()
        ? infrastructure::PathUtils::GetAppDataDir() / "transcriptions.json"
        : std::filesystem::path(config.historyPath);

    auto history = std::make_shared<infrastructure::JsonTranscriptionRepository>(historyPath);
    app::ClientApp client(config, history, std::cout, std::cerr);
    return client.Run(args);
}

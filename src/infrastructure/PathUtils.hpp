// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace voicescribe::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /** @brief $XDG_DATA_HOME/VoiceScribe, created on demand. */
    static std::filesystem::path GetAppDataDir();
    /** @brief $XDG_CONFIG_HOME/VoiceScribe/settings.json (not created). */
    static std::filesystem::path GetSettingsPath();
};

} // namespace voicescribe::infrastructure

// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace taskwalker::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    // <data home>/taskwalker, the default location of the fact store
    static std::filesystem::path GetStoreDir();
    // <config home>/taskwalker/settings.json
    static std::filesystem::path GetSettingsPath();
};

} // namespace taskwalker::infrastructure

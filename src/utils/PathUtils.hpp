#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace modelfetch::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* dataHome = std::getenv("XDG_DATA_HOME");
        if (dataHome && *dataHome) {
            return fs::path(dataHome);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getModelFetchPath() {
        return getAppDataPath() / "ModelFetch";
    }

    static fs::path getConfigPath() {
        return getModelFetchPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getModelFetchPath() / "logs";
    }
};

} // namespace modelfetch::utils

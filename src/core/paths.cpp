#include "core/paths.h"

#include <cstdlib>
#include <filesystem>

namespace drift
{
namespace fs = std::filesystem;

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetDriftConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/drift";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/drift";

    // Last resort: current directory
    return ".";
}

std::string GetDriftAssetsDir()
{
    const std::string env = EnvOrEmpty("DRIFT_ASSETS_DIR");
    if (!env.empty())
        return env;
#ifdef DRIFT_DEFAULT_ASSETS_DIR
    return DRIFT_DEFAULT_ASSETS_DIR;
#else
    return (fs::path(GetDriftConfigDir()) / "assets").string();
#endif
}

std::string DriftAssetPath(const std::string& relative)
{
    if (relative.empty())
        return GetDriftAssetsDir();
    return (fs::path(GetDriftAssetsDir()) / relative).string();
}

std::string GetSettingsPath()
{
    return (fs::path(GetDriftConfigDir()) / "settings.json").string();
}
} // namespace drift

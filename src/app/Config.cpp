#include "app/Config.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

namespace taggraph {

// ============================================================================
// Singleton accessor
// ============================================================================
Config& Config::instance() {
    static Config inst;
    return inst;
}

// ============================================================================
// getConfigPath - XDG config file location
// ============================================================================
std::string Config::getConfigPath() {
    // ~/.config/taggraph/config.json
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::string(xdgConfig) + "/taggraph/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/taggraph/config.json";
    }
    return "taggraph_config.json";
}

// ============================================================================
// Helper: create parent directories for a path
// ============================================================================
static void createParentDirs(const std::string& filePath) {
    auto lastSlash = filePath.find_last_of('/');
    if (lastSlash == std::string::npos) {
        return; // No directory component.
    }
    std::string dir = filePath.substr(0, lastSlash);

    std::string accumulated;
    for (size_t i = 0; i < dir.size(); ++i) {
        char c = dir[i];
        accumulated += c;
        if (c == '/' || i == dir.size() - 1) {
            mkdir(accumulated.c_str(), 0755);
        }
    }
}

void Config::reset() {
    defaultRootPath.clear();
    lastRootPath.clear();
    tagFileExtension = DEFAULT_TAG_FILE_EXTENSION;
    dirTagFileName = DEFAULT_DIR_TAG_FILE_NAME;
    verbose = false;
    inheritTags = true;
}

ScanOptions Config::scanOptions() const {
    ScanOptions options;
    options.tagFileExtension = tagFileExtension;
    options.dirTagFileName = dirTagFileName;
    options.verbose = verbose;
    return options;
}

// ============================================================================
// load - read JSON config from disk; use defaults if file is missing
// ============================================================================
void Config::load() {
    loadFrom(getConfigPath());
}

void Config::loadFrom(const std::string& path) {
    reset();

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        // File does not exist -- keep defaults.
        return;
    }

    try {
        nlohmann::json j;
        ifs >> j;
        fromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "taggraph: failed to parse config " << path << ": " << e.what() << std::endl;
        reset();
    }
}

// ============================================================================
// save - write JSON config to disk, creating directories if needed
// ============================================================================
bool Config::save() {
    return saveTo(getConfigPath());
}

bool Config::saveTo(const std::string& path) const {
    createParentDirs(path);

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        std::cerr << "taggraph: failed to write config to " << path << std::endl;
        return false;
    }

    ofs << toJson().dump(4) << std::endl;
    if (!ofs) {
        std::cerr << "taggraph: failed to write config to " << path << std::endl;
        return false;
    }
    return true;
}

// ============================================================================
// toJson - serialize all settings to a JSON object
// ============================================================================
nlohmann::json Config::toJson() const {
    nlohmann::json j;

    j["defaultRootPath"] = defaultRootPath;
    j["lastRootPath"] = lastRootPath;
    j["verbose"] = verbose;

    nlohmann::json& jt = j["tags"];
    jt["fileExtension"] = tagFileExtension;
    jt["dirFileName"] = dirTagFileName;
    jt["inherit"] = inheritTags;

    return j;
}

// ============================================================================
// fromJson - deserialize settings, keeping defaults for missing keys
// ============================================================================
void Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return;
    }

    if (j.contains("defaultRootPath") && j["defaultRootPath"].is_string()) {
        defaultRootPath = j["defaultRootPath"].get<std::string>();
    }
    if (j.contains("lastRootPath") && j["lastRootPath"].is_string()) {
        lastRootPath = j["lastRootPath"].get<std::string>();
    }
    if (j.contains("verbose") && j["verbose"].is_boolean()) {
        verbose = j["verbose"].get<bool>();
    }

    if (!j.contains("tags") || !j["tags"].is_object()) {
        return;
    }
    const auto& jt = j["tags"];

    // An empty extension would turn every file into a tag file.
    if (jt.contains("fileExtension") && jt["fileExtension"].is_string() &&
        !jt["fileExtension"].get<std::string>().empty()) {
        tagFileExtension = jt["fileExtension"].get<std::string>();
    }
    if (jt.contains("dirFileName") && jt["dirFileName"].is_string() &&
        !jt["dirFileName"].get<std::string>().empty()) {
        dirTagFileName = jt["dirFileName"].get<std::string>();
    }
    if (jt.contains("inherit") && jt["inherit"].is_boolean()) {
        inheritTags = jt["inherit"].get<bool>();
    }
}

} // namespace taggraph

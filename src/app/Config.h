#pragma once

#include "core/ScanOptions.h"
#include "core/Types.h"
#include <string>
#include <nlohmann/json.hpp>

namespace taggraph {

class Config {
public:
    static Config& instance();

    void load();
    bool save();

    // Explicit file locations (used by --config and by tests).
    void loadFrom(const std::string& path);
    bool saveTo(const std::string& path) const;

    // Restore every setting to its default.
    void reset();

    // App settings
    std::string defaultRootPath;    // Root used when --root is not given
    std::string lastRootPath;

    // Tag file conventions
    std::string tagFileExtension = DEFAULT_TAG_FILE_EXTENSION;
    std::string dirTagFileName = DEFAULT_DIR_TAG_FILE_NAME;

    bool verbose = false;

    // Default for "tags": include tags of enclosing directories
    bool inheritTags = true;

    ScanOptions scanOptions() const;

    // Get config file path
    static std::string getConfigPath();

private:
    Config() = default;

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);
};

} // namespace taggraph

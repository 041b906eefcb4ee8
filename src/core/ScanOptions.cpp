#include "ScanOptions.h"
#include "PlatformUtils.h"

namespace taggraph {

bool ScanOptions::isTagFileName(const std::string& name) const {
    return PlatformUtils::wildcardMatch(tagFilePattern(), name);
}

std::string ScanOptions::tagFileStem(const std::string& name) const {
    if (!isTagFileName(name)) {
        return name;
    }
    return name.substr(0, name.size() - tagFileExtension.size());
}

} // namespace taggraph

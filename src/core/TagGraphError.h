#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace taggraph {

// ============================================================================
// TagGraphError - the only error type thrown by the graph builder
// ============================================================================

class TagGraphError : public std::runtime_error {
public:
    enum Kind {
        ERR_IO = 0,     // canonicalization, directory listing or tag file read failure
        ERR_MESSAGE     // any other descriptive failure
    };

    TagGraphError(Kind kind, const std::string& message, std::error_code code = {})
        : std::runtime_error(message), kind_(kind), code_(code) {}

    Kind kind() const { return kind_; }
    const std::error_code& code() const { return code_; }

    static TagGraphError io(const std::string& what, const std::filesystem::path& path,
                            std::error_code code) {
        return TagGraphError(ERR_IO, what + " '" + path.string() + "': " + code.message(), code);
    }

private:
    Kind kind_;
    std::error_code code_;
};

} // namespace taggraph

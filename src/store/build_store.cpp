#include "postbuild/build_store.hpp"
#include "postbuild/platform.hpp"

#include <filesystem>

namespace postbuild {

namespace fs = std::filesystem;

bool is_valid_artifact_id(const std::string& artifact_id) {
    if (artifact_id.empty() || artifact_id[0] == '/') {
        return false;
    }
    size_t start = 0;
    while (start <= artifact_id.size()) {
        size_t slash = artifact_id.find('/', start);
        if (slash == std::string::npos) slash = artifact_id.size();
        std::string part = artifact_id.substr(start, slash - start);
        if (part.empty() || part == "." || part == "..") {
            return false;
        }
        start = slash + 1;
    }
    return true;
}

BuildStore::BuildStore(std::string artifact_root, std::string build_dir)
    : artifact_root_(std::move(artifact_root)), build_dir_(std::move(build_dir)) {}

std::optional<std::string> BuildStore::resolve(const std::string& artifact_id) const {
    if (!is_valid_artifact_id(artifact_id)) {
        return std::nullopt;
    }
    fs::path dir = fs::path(artifact_root_) / artifact_id;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }
    return absolute_normal(dir.string());
}

} // namespace postbuild

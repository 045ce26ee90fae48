#include "postbuild/whitelist.hpp"

namespace postbuild {

namespace {

std::string tree_glob(std::string dir) {
    while (dir.size() > 1 && dir.back() == '/') {
        dir.pop_back();
    }
    return dir + "/**";
}

} // namespace

Result<std::vector<std::string>> generate_whitelist(const std::string& build_dir,
                                                    const std::vector<std::string>& artifact_ids,
                                                    const ArtifactResolver& resolver) {
    std::vector<std::string> patterns = {tree_glob(build_dir), "/tmp/**", "/etc/**"};

    for (const auto& id : artifact_ids) {
        auto dir = resolver.resolve(id);
        if (!dir) {
            return Result<std::vector<std::string>>::err(Error(ErrorCode::ARTIFACT_NOT_FOUND,
                "artifact not found: " + id));
        }
        patterns.push_back(tree_glob(*dir));
    }

    return Result<std::vector<std::string>>::ok(std::move(patterns));
}

VoidResult write_whitelist(const std::string& build_dir,
                           const std::vector<std::string>& artifact_ids,
                           const ArtifactResolver& resolver,
                           std::ostream& out) {
    auto patterns = generate_whitelist(build_dir, artifact_ids, resolver);
    if (patterns.isErr()) {
        return VoidResult::err(patterns.error());
    }
    for (const auto& pattern : patterns.value()) {
        out << pattern << "\n";
    }
    return VoidResult::ok();
}

} // namespace postbuild

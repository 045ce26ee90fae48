#include "postbuild/platform.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

extern "C" char** environ;

namespace postbuild {

namespace fs = std::filesystem;

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Error errno_error(int err, const std::string& context) {
    std::string message = context + ": " + std::strerror(err);
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return Error(ErrorCode::FILE_NOT_FOUND, message);
        case EACCES:
        case EPERM:
        case EROFS:
            return Error(ErrorCode::PERMISSION_DENIED, message);
        case EEXIST:
            return Error(ErrorCode::TARGET_EXISTS, message);
        default:
            return Error(ErrorCode::IO_ERROR, message);
    }
}

bool is_plain_file(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode);
}

bool is_executable(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return (st.st_mode & 0111) != 0;
}

VoidResult write_protect(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return VoidResult::err(errno_error(errno, "cannot stat " + path));
    }
    // chmod would follow the link and touch its target
    if (S_ISLNK(st.st_mode)) {
        return VoidResult::ok();
    }
    mode_t mode = st.st_mode & 07777 & ~static_cast<mode_t>(0222);
    if (chmod(path.c_str(), mode) != 0) {
        return VoidResult::err(errno_error(errno, "cannot write-protect " + path));
    }
    return VoidResult::ok();
}

std::string absolute_normal(const std::string& path) {
    std::string result = fs::absolute(fs::path(path)).lexically_normal().string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::string relative_path(const std::string& target, const std::string& base_dir) {
    fs::path t(absolute_normal(target));
    fs::path b(absolute_normal(base_dir));
    std::string rel = t.lexically_relative(b).string();
    return rel.empty() ? "." : rel;
}

Result<std::set<std::string>> list_files_recursive(const std::string& dir) {
    std::set<std::string> files;
    fs::path root(absolute_normal(dir));

    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(root, ec))) {
        return Result<std::set<std::string>>::ok(std::move(files));
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            if (!fs::is_directory(entry.symlink_status())) {
                files.insert(entry.path().string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        return Result<std::set<std::string>>::err(
            Error(ErrorCode::IO_ERROR, std::string("cannot list ") + dir + ": " + e.what()));
    }

    return Result<std::set<std::string>>::ok(std::move(files));
}

bool is_under(const fs::path& path, const fs::path& root) {
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end() && path_it != path.end(); ++root_it, ++path_it) {
        if (*root_it != *path_it) {
            return false;
        }
    }
    return root_it == root.end();
}

VoidResult remove_empty_dirs_up_to(const std::string& dir, const std::string& root) {
    fs::path current(absolute_normal(dir));
    fs::path boundary(absolute_normal(root));

    if (!is_under(current, boundary)) {
        return VoidResult::err(Error(ErrorCode::PATH_TRAVERSAL,
                                     current.string() + " is not below " + boundary.string()));
    }

    while (current != boundary) {
        std::error_code ec;
        if (!fs::is_directory(fs::symlink_status(current, ec)) || !fs::is_empty(current, ec)) {
            break;
        }
        if (rmdir(current.c_str()) != 0) {
            return VoidResult::err(errno_error(errno, "cannot remove directory " + current.string()));
        }
        current = current.parent_path();
    }

    return VoidResult::ok();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

EnvMap get_all_env() {
    EnvMap env;
    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    return env;
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }
    auto home = get_env("HOME");
    if (!home) {
        return path;
    }
    return *home + path.substr(1);
}

} // namespace postbuild

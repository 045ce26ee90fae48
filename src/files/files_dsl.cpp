#include "postbuild/files_dsl.hpp"
#include "postbuild/template.hpp"

#include <cerrno>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

constexpr const char* LINE_SEPARATOR = "\n";

Result<FileSpec> parse_file_spec(const nlohmann::json& j, size_t index) {
    std::string where = "files[" + std::to_string(index) + "]";

    if (!j.is_object()) {
        return Result<FileSpec>::err(Error(ErrorCode::INVALID_SPEC, where + " must be an object"));
    }
    if (!j.contains("target") || !j["target"].is_string()) {
        return Result<FileSpec>::err(Error(ErrorCode::INVALID_SPEC,
            where + " must have a string \"target\""));
    }

    bool has_text = j.contains("text");
    bool has_object = j.contains("object");
    if (has_text == has_object) {
        return Result<FileSpec>::err(Error(ErrorCode::INVALID_SPEC,
            where + ": objects in files section must contain either \"text\" or \"object\""));
    }
    if (has_object && j.contains("expandvars")) {
        return Result<FileSpec>::err(Error(ErrorCode::UNSUPPORTED,
            where + ": \"expandvars\" only supported for \"text\""));
    }

    FileSpec spec;
    spec.target = j["target"].get<std::string>();

    if (j.contains("executable")) {
        if (!j["executable"].is_boolean()) {
            return Result<FileSpec>::err(Error(ErrorCode::INVALID_SPEC,
                where + ".executable must be a boolean"));
        }
        spec.executable = j["executable"].get<bool>();
    }

    if (has_text) {
        const auto& text = j["text"];
        if (!text.is_array()) {
            return Result<FileSpec>::err(Error(ErrorCode::INVALID_SPEC,
                where + ".text must be a list of strings"));
        }
        TextContent content;
        for (const auto& line : text) {
            if (!line.is_string()) {
                return Result<FileSpec>::err(Error(ErrorCode::INVALID_SPEC,
                    where + ".text must be a list of strings"));
            }
            content.lines.push_back(line.get<std::string>());
        }
        if (j.contains("expandvars")) {
            if (!j["expandvars"].is_boolean()) {
                return Result<FileSpec>::err(Error(ErrorCode::INVALID_SPEC,
                    where + ".expandvars must be a boolean"));
            }
            content.expandvars = j["expandvars"].get<bool>();
        }
        spec.content = std::move(content);
    } else {
        spec.content = ObjectContent{j["object"]};
    }

    return Result<FileSpec>::ok(std::move(spec));
}

VoidResult write_exclusive(const std::string& path, const std::string& data, unsigned mode) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, static_cast<mode_t>(mode));
    if (fd < 0) {
        return VoidResult::err(errno_error(errno, "cannot create " + path));
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            return VoidResult::err(errno_error(err, "cannot write " + path));
        }
        offset += static_cast<size_t>(written);
    }

    if (close(fd) != 0) {
        return VoidResult::err(errno_error(errno, "cannot close " + path));
    }
    return VoidResult::ok();
}

} // namespace

Result<std::vector<FileSpec>> parse_file_specs(const nlohmann::json& files) {
    std::vector<FileSpec> specs;
    if (!files.is_array()) {
        return Result<std::vector<FileSpec>>::err(Error(ErrorCode::INVALID_SPEC,
            "files section must be a list"));
    }

    for (size_t i = 0; i < files.size(); ++i) {
        auto spec = parse_file_spec(files[i], i);
        if (spec.isErr()) {
            return Result<std::vector<FileSpec>>::err(spec.error());
        }
        specs.push_back(std::move(spec.value()));
    }

    return Result<std::vector<FileSpec>>::ok(std::move(specs));
}

std::string canonical_json(const nlohmann::json& value) {
    // nlohmann::json objects are std::map backed, so keys come out sorted
    return value.dump(2);
}

Result<std::string> render_file_content(const FileSpec& spec, const EnvMap& env) {
    if (const auto* text = std::get_if<TextContent>(&spec.content)) {
        std::string joined;
        for (size_t i = 0; i < text->lines.size(); ++i) {
            if (i > 0) joined += LINE_SEPARATOR;
            joined += text->lines[i];
        }
        if (text->expandvars) {
            return substitute_template(joined, env);
        }
        return Result<std::string>::ok(std::move(joined));
    }

    const auto& object = std::get<ObjectContent>(spec.content);
    return Result<std::string>::ok(canonical_json(object.value));
}

VoidResult execute_files_dsl(const std::vector<FileSpec>& specs, const EnvMap& env) {
    for (const auto& spec : specs) {
        auto target = substitute_template(spec.target, env);
        if (target.isErr()) {
            return VoidResult::err(target.error().withContext("target \"" + spec.target + "\""));
        }

        fs::path target_path(target.value());
        fs::path parent = target_path.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return VoidResult::err(Error(ErrorCode::IO_ERROR,
                    "cannot create directory " + parent.string() + ": " + ec.message()));
            }
        }

        auto data = render_file_content(spec, env);
        if (data.isErr()) {
            return VoidResult::err(data.error().withContext(target.value()));
        }

        auto written = write_exclusive(target.value(), data.value(), spec.mode());
        if (written.isErr()) {
            return written;
        }
        spdlog::debug("wrote {} ({} bytes, mode {:o})", target.value(), data.value().size(),
                      spec.mode());
    }

    return VoidResult::ok();
}

} // namespace postbuild

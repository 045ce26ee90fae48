#include "postbuild/source_cache.hpp"
#include "postbuild/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

#include <unistd.h>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <zlib.h>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

// ============================================================================
// Tar Format
// ============================================================================

constexpr size_t TAR_BLOCK_SIZE = 512;
constexpr size_t TAR_NAME_SIZE = 100;
constexpr size_t TAR_MODE_SIZE = 8;
constexpr size_t TAR_SIZE_SIZE = 12;
constexpr size_t TAR_LINKNAME_SIZE = 100;
constexpr size_t TAR_PREFIX_SIZE = 155;

constexpr char TAR_REGTYPE = '0';
constexpr char TAR_AREGTYPE = '\0';
constexpr char TAR_LNKTYPE = '1';
constexpr char TAR_SYMTYPE = '2';
constexpr char TAR_DIRTYPE = '5';
constexpr char TAR_CONTTYPE = '7';
constexpr char TAR_GNU_LONGNAME = 'L';
constexpr char TAR_GNU_LONGLINK = 'K';
constexpr char TAR_PAX_HEADER = 'x';
constexpr char TAR_PAX_GLOBAL = 'g';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[8];                 // 148
    char typeflag;                  // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

bool is_zero_block(const uint8_t* block) {
    return std::all_of(block, block + TAR_BLOCK_SIZE, [](uint8_t b) { return b == 0; });
}

// Split an entry path into components, dropping "." and empty parts.
// PATH_TRAVERSAL for absolute paths and "..".
Result<std::vector<std::string>> entry_components(const std::string& entry_path) {
    if (!entry_path.empty() && entry_path[0] == '/') {
        return Result<std::vector<std::string>>::err(Error(ErrorCode::PATH_TRAVERSAL,
            "absolute path not allowed: " + entry_path));
    }
    std::vector<std::string> parts;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") {
            return Result<std::vector<std::string>>::err(Error(ErrorCode::PATH_TRAVERSAL,
                "path traversal not allowed: " + entry_path));
        }
        if (comp != "." && !comp.empty()) {
            parts.push_back(comp);
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(parts));
}

// Destination of an entry after stripping, or an empty optional when the
// entry is stripped away entirely
Result<std::optional<fs::path>> destination_for(const std::string& entry_path,
                                                const fs::path& root,
                                                int strip) {
    auto parts = entry_components(entry_path);
    if (parts.isErr()) {
        return Result<std::optional<fs::path>>::err(parts.error());
    }
    if (parts.value().size() <= static_cast<size_t>(strip)) {
        return Result<std::optional<fs::path>>::ok(std::nullopt);
    }

    fs::path dest = root;
    for (size_t i = static_cast<size_t>(strip); i < parts.value().size(); ++i) {
        dest /= parts.value()[i];
    }

    // Catch escapes through symlinks created by earlier entries
    std::error_code ec;
    fs::path resolved_parent = fs::weakly_canonical(dest.parent_path(), ec);
    if (ec || !is_under(resolved_parent, fs::weakly_canonical(root, ec))) {
        return Result<std::optional<fs::path>>::err(Error(ErrorCode::PATH_TRAVERSAL,
            "path escapes extraction root: " + entry_path));
    }
    return Result<std::optional<fs::path>>::ok(std::optional<fs::path>(dest));
}

bool entry_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

VoidResult make_parent_dirs(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "cannot create directory " + path.parent_path().string() + ": " + ec.message()));
    }
    return VoidResult::ok();
}

VoidResult write_regular_file(const fs::path& dest, const uint8_t* data, uint64_t size,
                              uint64_t mode) {
    std::ofstream file(dest, std::ios::binary);
    if (!file) {
        return VoidResult::err(errno_error(errno, "cannot create " + dest.string()));
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    file.close();
    if (!file) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR, "failed writing " + dest.string()));
    }

    std::error_code ec;
    fs::permissions(dest, static_cast<fs::perms>(mode & 07777), ec);
    if (ec) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "cannot set permissions on " + dest.string() + ": " + ec.message()));
    }
    return VoidResult::ok();
}

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool is_hex_digest(const std::string& s) {
    return s.size() == 64 && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'f');
    });
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

// ============================================================================
// Gzip
// ============================================================================

Result<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // 16 + MAX_WBITS: expect a gzip header and trailer
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        return Result<std::vector<uint8_t>>::err(Error(ErrorCode::IO_ERROR,
            "inflateInit2 failed"));
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> result;
    unsigned char buffer[16384];
    int ret = Z_OK;
    do {
        strm.next_out = buffer;
        strm.avail_out = sizeof(buffer);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            break;
        }
        result.insert(result.end(), buffer, buffer + (sizeof(buffer) - strm.avail_out));
    } while (ret != Z_STREAM_END && (strm.avail_in > 0 || strm.avail_out == 0));
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return Result<std::vector<uint8_t>>::err(Error(ErrorCode::IO_ERROR,
            "failed to decompress gzip data"));
    }
    return Result<std::vector<uint8_t>>::ok(std::move(result));
}

// ============================================================================
// Tar Extraction
// ============================================================================

VoidResult extract_tar(const std::vector<uint8_t>& tar_data,
                       const std::string& target_dir,
                       int strip) {
    fs::path root(absolute_normal(target_dir));
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "cannot create " + root.string() + ": " + ec.message()));
    }

    std::optional<std::string> long_name;
    std::optional<std::string> long_link;
    size_t offset = 0;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const uint8_t* block = tar_data.data() + offset;
        if (is_zero_block(block)) {
            break;
        }
        const auto* header = reinterpret_cast<const TarHeader*>(block);
        uint64_t size = parse_octal(header->size, TAR_SIZE_SIZE);
        uint64_t mode = parse_octal(header->mode, TAR_MODE_SIZE);
        size_t data_offset = offset + TAR_BLOCK_SIZE;
        size_t padded = static_cast<size_t>((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE) * TAR_BLOCK_SIZE;

        if (data_offset + size > tar_data.size()) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR, "truncated tar archive"));
        }
        offset = data_offset + padded;

        char typeflag = header->typeflag;
        if (typeflag == TAR_GNU_LONGNAME || typeflag == TAR_GNU_LONGLINK) {
            std::string value(reinterpret_cast<const char*>(tar_data.data() + data_offset),
                              static_cast<size_t>(size));
            value = value.substr(0, value.find('\0'));
            (typeflag == TAR_GNU_LONGNAME ? long_name : long_link) = value;
            continue;
        }
        if (typeflag == TAR_PAX_HEADER || typeflag == TAR_PAX_GLOBAL) {
            continue;
        }

        std::string path;
        if (long_name) {
            path = *long_name;
        } else {
            if (header->prefix[0] != '\0') {
                path = field_string(header->prefix, TAR_PREFIX_SIZE) + "/";
            }
            path += field_string(header->name, TAR_NAME_SIZE);
        }
        std::string linkname = long_link ? *long_link
                                         : field_string(header->linkname, TAR_LINKNAME_SIZE);
        long_name.reset();
        long_link.reset();

        auto dest = destination_for(path, root, strip);
        if (dest.isErr()) {
            return VoidResult::err(dest.error());
        }
        if (!dest.value()) {
            continue;
        }
        const fs::path& out = *dest.value();

        if (typeflag == TAR_DIRTYPE) {
            fs::create_directories(out, ec);
            if (ec) {
                return VoidResult::err(Error(ErrorCode::IO_ERROR,
                    "cannot create directory " + out.string() + ": " + ec.message()));
            }
            continue;
        }

        if (entry_exists(out)) {
            return VoidResult::err(Error(ErrorCode::TARGET_EXISTS,
                "refusing to overwrite " + out.string()));
        }
        auto parents = make_parent_dirs(out);
        if (parents.isErr()) {
            return parents;
        }

        if (typeflag == TAR_REGTYPE || typeflag == TAR_AREGTYPE || typeflag == TAR_CONTTYPE) {
            auto written = write_regular_file(out, tar_data.data() + data_offset, size, mode);
            if (written.isErr()) {
                return written;
            }
        } else if (typeflag == TAR_SYMTYPE) {
            if (symlink(linkname.c_str(), out.c_str()) != 0) {
                return VoidResult::err(errno_error(errno, "cannot create symlink " + out.string()));
            }
        } else if (typeflag == TAR_LNKTYPE) {
            auto source = destination_for(linkname, root, strip);
            if (source.isErr()) {
                return VoidResult::err(source.error());
            }
            if (!source.value()) {
                return VoidResult::err(Error(ErrorCode::INVALID_SPEC,
                    "hard link target stripped away: " + linkname));
            }
            if (link(source.value()->c_str(), out.c_str()) != 0) {
                return VoidResult::err(errno_error(errno, "cannot create hard link " + out.string()));
            }
        } else {
            return VoidResult::err(Error(ErrorCode::UNSUPPORTED,
                std::string("unsupported tar entry type '") + typeflag + "': " + path));
        }
    }

    return VoidResult::ok();
}

// ============================================================================
// Source Cache
// ============================================================================

Result<ArchiveKey> parse_archive_key(const std::string& key) {
    auto colon = key.find(':');
    if (colon == std::string::npos) {
        return Result<ArchiveKey>::err(Error(ErrorCode::INVALID_SPEC,
            "source key must be <type>:<digest>: " + key));
    }
    ArchiveKey parsed{key.substr(0, colon), key.substr(colon + 1)};
    if (parsed.type != "tar.gz" && parsed.type != "tar") {
        return Result<ArchiveKey>::err(Error(ErrorCode::UNSUPPORTED,
            "unsupported source type: " + parsed.type));
    }
    if (!is_hex_digest(parsed.digest)) {
        return Result<ArchiveKey>::err(Error(ErrorCode::INVALID_SPEC,
            "source digest must be 64 lowercase hex digits: " + key));
    }
    return Result<ArchiveKey>::ok(std::move(parsed));
}

std::string SourceCache::archive_path(const ArchiveKey& key) const {
    return (fs::path(root_) / "packs" / key.type / key.digest).string();
}

Result<std::string> SourceCache::put_archive(const std::vector<uint8_t>& data,
                                             const std::string& type) {
    auto hash = compute_sha256(data);
    if (!hash.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, hash.error));
    }
    auto key = parse_archive_key(type + ":" + hash.hex_digest);
    if (key.isErr()) {
        return Result<std::string>::err(key.error());
    }

    std::string path = archive_path(key.value());
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
            "cannot create " + fs::path(path).parent_path().string() + ": " + ec.message()));
    }
    auto written = atomic_write_file(path, std::string(data.begin(), data.end()));
    if (!written.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, written.error));
    }
    return Result<std::string>::ok(key.value().toString());
}

VoidResult SourceCache::unpack(const std::string& key,
                               const std::string& target_dir,
                               int strip) {
    auto parsed = parse_archive_key(key);
    if (parsed.isErr()) {
        return VoidResult::err(parsed.error());
    }

    std::string path = archive_path(parsed.value());
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return VoidResult::err(Error(ErrorCode::FILE_NOT_FOUND,
            "source archive not in cache: " + key));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());

    auto hash = compute_sha256(data);
    if (!hash.ok) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR, hash.error));
    }
    if (hash.hex_digest != parsed.value().digest) {
        return VoidResult::err(Error(ErrorCode::HASH_MISMATCH,
            "archive " + path + " hashes to " + hash.hex_digest));
    }

    if (parsed.value().type == "tar.gz") {
        auto tar = gzip_decompress(data);
        if (tar.isErr()) {
            return VoidResult::err(tar.error().withContext(key));
        }
        data = std::move(tar.value());
    }

    spdlog::debug("unpacking {} into {} (strip {})", key, target_dir, strip);
    return extract_tar(data, target_dir, strip);
}

VoidResult unpack_sources(const std::vector<SourceItem>& items,
                          const std::string& base_dir,
                          SourceUnpacker& unpacker) {
    for (const auto& item : items) {
        fs::path target(item.target);
        if (target.is_relative()) {
            target = fs::path(base_dir) / target;
        }
        auto result = unpacker.unpack(item.key, target.string(), item.strip);
        if (result.isErr()) {
            return result;
        }
    }
    return VoidResult::ok();
}

} // namespace postbuild

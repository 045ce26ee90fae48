#pragma once

#include "postbuild/build_spec.hpp"
#include "postbuild/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace postbuild {

// ============================================================================
// Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string hex_digest;
    std::string error;
};

// SHA-256 of a byte buffer, lowercase hex
HashResult compute_sha256(const std::vector<uint8_t>& data);

// ============================================================================
// Archive Handling
// ============================================================================

// Decompress a gzip stream. IO_ERROR on corrupt or truncated input.
Result<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& data);

/**
 * Extract a ustar/GNU tar stream into target_dir.
 *
 * The first `strip` path components of every entry are dropped; entries with
 * nothing left are skipped. Regular files, directories and symlinks (linkname
 * kept as-is) are created; hard links are created against earlier entries.
 *   PATH_TRAVERSAL - absolute or ".." paths, or paths resolving outside target_dir
 *   TARGET_EXISTS  - a file or link destination already exists
 */
VoidResult extract_tar(const std::vector<uint8_t>& tar_data,
                       const std::string& target_dir,
                       int strip);

// ============================================================================
// Source Cache
// ============================================================================

// "tar.gz:<hex>" -> {"tar.gz", "<hex>"}
struct ArchiveKey {
    std::string type;    // "tar.gz" or "tar"
    std::string digest;  // lowercase SHA-256 hex

    std::string toString() const { return type + ":" + digest; }
};

// INVALID_SPEC for a malformed key, UNSUPPORTED for an unknown archive type
Result<ArchiveKey> parse_archive_key(const std::string& key);

/**
 * @brief Unpacks sources named by content key
 */
class SourceUnpacker {
public:
    virtual ~SourceUnpacker() = default;

    virtual VoidResult unpack(const std::string& key,
                              const std::string& target_dir,
                              int strip) = 0;
};

/**
 * @brief Archives stored by digest at <root>/packs/<type>/<hex>
 */
class SourceCache : public SourceUnpacker {
public:
    explicit SourceCache(std::string root) : root_(std::move(root)) {}

    const std::string& root() const { return root_; }
    std::string archive_path(const ArchiveKey& key) const;

    // Store an archive of the given type, returning its key
    Result<std::string> put_archive(const std::vector<uint8_t>& data, const std::string& type);

    // Verify the archive digest and extract it (see extract_tar)
    //   FILE_NOT_FOUND - no archive stored under key
    //   HASH_MISMATCH  - stored bytes do not hash to the key's digest
    VoidResult unpack(const std::string& key,
                      const std::string& target_dir,
                      int strip) override;

private:
    std::string root_;
};

// Unpack each item in order, resolving relative targets against base_dir
VoidResult unpack_sources(const std::vector<SourceItem>& items,
                          const std::string& base_dir,
                          SourceUnpacker& unpacker);

} // namespace postbuild

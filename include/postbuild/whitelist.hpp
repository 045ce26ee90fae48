#pragma once

#include "postbuild/build_store.hpp"
#include "postbuild/result.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace postbuild {

// ============================================================================
// Sandbox Whitelist
// ============================================================================

// Glob patterns a sandboxed build may read, in order:
//   <build_dir>/**, /tmp/**, /etc/**, then <artifact dir>/** per id.
// ARTIFACT_NOT_FOUND if any id does not resolve.
Result<std::vector<std::string>> generate_whitelist(const std::string& build_dir,
                                                    const std::vector<std::string>& artifact_ids,
                                                    const ArtifactResolver& resolver);

// Generate the whitelist and write it one pattern per line. Nothing is
// written unless every id resolves.
VoidResult write_whitelist(const std::string& build_dir,
                           const std::vector<std::string>& artifact_ids,
                           const ArtifactResolver& resolver,
                           std::ostream& out);

} // namespace postbuild

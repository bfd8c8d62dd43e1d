#pragma once

#include <string>

namespace kiln {

// ============================================================================
// SHA-256 Content Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

// Compute SHA-256 hash of in-memory content
HashResult compute_sha256(const std::string& data);

// Compute SHA-256 hash of a file's content
HashResult compute_file_sha256(const std::string& file_path);

// Ledger checksum form: "sha256:<hex>"
std::string format_checksum(const std::string& hex_digest);

} // namespace kiln

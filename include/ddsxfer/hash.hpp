#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace ddsxfer {

// Hash value with the algorithm that produced it, as reported on the wire.
struct HashData {
    std::string algorithm;
    std::string value;  // lowercase hex

    bool operator==(const HashData&) const = default;
};

/// Incremental hex digest over OpenSSL EVP.
/// Supported algorithms: md5 (what uploads send), sha1, sha256.
class HashUtil {
public:
    explicit HashUtil(const std::string& algorithm = "md5");
    ~HashUtil();

    HashUtil(const HashUtil&) = delete;
    HashUtil& operator=(const HashUtil&) = delete;

    void add_chunk(std::span<const uint8_t> data);
    void add_file(const std::filesystem::path& path);

    /// Finish the digest. The object cannot be fed after this.
    HashData finish();

    static bool is_supported(const std::string& algorithm);

    static HashData hash_chunk(std::span<const uint8_t> data, const std::string& algorithm = "md5");
    static HashData hash_file(const std::filesystem::path& path, const std::string& algorithm = "md5");

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::string algorithm_;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool finished_ = false;
};

enum class HashStatus {
    OK,       // every supported hash matched
    WARNING,  // some matched, some did not
    FAILED,   // none matched
};

const char* hash_status_to_string(HashStatus status);

/// Result of checking a local file against every hash the server reported.
class FileHashStatus {
public:
    FileHashStatus(std::filesystem::path path, HashStatus status, std::string detail);

    /// Hash `path` with each supported algorithm in `expected_hashes` and compare.
    /// Throws HashValidationError when none of the algorithms is supported.
    static FileHashStatus determine_for_hashes(const std::vector<HashData>& expected_hashes,
                                               const std::filesystem::path& path);

    HashStatus status() const { return status_; }
    const std::filesystem::path& path() const { return path_; }
    const std::string& detail() const { return detail_; }

    /// OK and WARNING count as valid; a WARNING reflects servers that recorded
    /// conflicting hashes for the same content, not corruption.
    bool has_a_valid_hash() const { return status_ != HashStatus::FAILED; }

    /// Throws HashValidationError for FAILED.
    void raise_for_status() const;

    std::string status_line() const;

private:
    std::filesystem::path path_;
    HashStatus status_;
    std::string detail_;
};

}  // namespace ddsxfer

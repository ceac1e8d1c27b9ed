#include "ddsxfer/hash.hpp"
#include "ddsxfer/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>

namespace ddsxfer {

namespace {

constexpr size_t HASH_READ_BLOCK_SIZE = 1024 * 1024;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const EVP_MD* digest_for(const std::string& algorithm) {
    auto name = lowercase(algorithm);
    if (name == "md5") return EVP_md5();
    if (name == "sha1") return EVP_sha1();
    if (name == "sha256") return EVP_sha256();
    return nullptr;
}

std::string to_hex(const unsigned char* digest, unsigned int length) {
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

}  // namespace

// --- HashUtil ---

void HashUtil::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

HashUtil::HashUtil(const std::string& algorithm)
    : algorithm_(lowercase(algorithm))
    , ctx_(EVP_MD_CTX_new()) {
    const EVP_MD* md = digest_for(algorithm_);
    if (!md) {
        throw HashValidationError("Unsupported hash algorithm: " + algorithm);
    }
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize " + algorithm_ + " digest");
    }
}

HashUtil::~HashUtil() = default;

void HashUtil::add_chunk(std::span<const uint8_t> data) {
    if (finished_) throw std::logic_error("HashUtil::add_chunk after finish");
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update " + algorithm_ + " digest");
    }
}

void HashUtil::add_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Cannot open file for hashing: " + path.string());
    }
    std::vector<uint8_t> block(HASH_READ_BLOCK_SIZE);
    while (ifs) {
        ifs.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
        auto got = static_cast<size_t>(ifs.gcount());
        if (got == 0) break;
        add_chunk(std::span<const uint8_t>(block.data(), got));
    }
    if (ifs.bad()) {
        throw std::runtime_error("Failed reading file for hashing: " + path.string());
    }
}

HashData HashUtil::finish() {
    if (finished_) throw std::logic_error("HashUtil::finish called twice");
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw std::runtime_error("Failed to finish " + algorithm_ + " digest");
    }
    finished_ = true;
    return {algorithm_, to_hex(digest, length)};
}

bool HashUtil::is_supported(const std::string& algorithm) {
    return digest_for(algorithm) != nullptr;
}

HashData HashUtil::hash_chunk(std::span<const uint8_t> data, const std::string& algorithm) {
    HashUtil util(algorithm);
    util.add_chunk(data);
    return util.finish();
}

HashData HashUtil::hash_file(const std::filesystem::path& path, const std::string& algorithm) {
    HashUtil util(algorithm);
    util.add_file(path);
    return util.finish();
}

// --- FileHashStatus ---

const char* hash_status_to_string(HashStatus status) {
    switch (status) {
        case HashStatus::OK: return "OK";
        case HashStatus::WARNING: return "WARNING";
        case HashStatus::FAILED: return "FAILED";
    }
    return "FAILED";
}

FileHashStatus::FileHashStatus(std::filesystem::path path, HashStatus status, std::string detail)
    : path_(std::move(path)), status_(status), detail_(std::move(detail)) {}

FileHashStatus FileHashStatus::determine_for_hashes(const std::vector<HashData>& expected_hashes,
                                                    const std::filesystem::path& path) {
    std::vector<const HashData*> supported;
    std::string unsupported;
    for (const auto& hash : expected_hashes) {
        if (HashUtil::is_supported(hash.algorithm)) {
            supported.push_back(&hash);
        } else {
            if (!unsupported.empty()) unsupported += ", ";
            unsupported += hash.algorithm;
        }
    }
    if (supported.empty()) {
        throw HashValidationError("Unable to validate " + path.string() +
                                  ": no supported hash algorithm in [" + unsupported + "]");
    }

    // One pass over the file per algorithm, even when the server lists it twice.
    std::map<std::string, std::string> computed;
    size_t matches = 0;
    std::string matched;
    std::string mismatched;
    for (const HashData* expected : supported) {
        auto algorithm = lowercase(expected->algorithm);
        auto it = computed.find(algorithm);
        if (it == computed.end()) {
            it = computed.emplace(algorithm, HashUtil::hash_file(path, algorithm).value).first;
        }
        if (lowercase(expected->value) == it->second) {
            ++matches;
            if (!matched.empty()) matched += " ";
            matched += algorithm + ":" + it->second;
        } else {
            if (!mismatched.empty()) mismatched += " ";
            mismatched += algorithm + ":" + expected->value + " != " + it->second;
        }
    }

    if (matches == supported.size()) {
        return {path, HashStatus::OK, matched};
    }
    if (matches == 0) {
        return {path, HashStatus::FAILED, "expected " + mismatched};
    }
    return {path, HashStatus::WARNING, "matched " + matched + ", conflicting " + mismatched};
}

void FileHashStatus::raise_for_status() const {
    if (status_ == HashStatus::FAILED) {
        throw HashValidationError("Hash validation error: " + status_line());
    }
}

std::string FileHashStatus::status_line() const {
    return path_.string() + " " + hash_status_to_string(status_) + " (" + detail_ + ")";
}

}  // namespace ddsxfer

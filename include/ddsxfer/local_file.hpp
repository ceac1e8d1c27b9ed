#pragma once

#include "ddsxfer/data_service.hpp"
#include "ddsxfer/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ddsxfer {

/// File system facts about a file being uploaded.
class PathData {
public:
    explicit PathData(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }
    std::string name() const;
    std::string mime_type() const;
    uint64_t size() const;

    /// Whole-file hash with the upload algorithm.
    HashData get_hash() const;

    /// Read up to `size` bytes at `offset` (fewer at end of file).
    std::vector<uint8_t> read_chunk(uint64_t offset, uint64_t size) const;

private:
    std::filesystem::path path_;
};

/// A local file selected for upload, with where it goes remotely.
struct UploadItem {
    std::filesystem::path path;
    ParentRef parent;
    // Set when the file already exists remotely; the upload becomes a new version.
    std::optional<std::string> remote_file_id;
};

}  // namespace ddsxfer

#include "ddsxfer/local_file.hpp"
#include "ddsxfer/constants.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <stdexcept>

namespace ddsxfer {

namespace {

const std::map<std::string, std::string>& mime_types() {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".tsv", "text/tab-separated-values"},
        {".html", "text/html"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
    };
    return types;
}

}  // namespace

PathData::PathData(std::filesystem::path path)
    : path_(std::move(path)) {}

std::string PathData::name() const {
    return path_.filename().string();
}

std::string PathData::mime_type() const {
    auto ext = path_.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = mime_types().find(ext);
    return it != mime_types().end() ? it->second : "application/octet-stream";
}

uint64_t PathData::size() const {
    return std::filesystem::file_size(path_);
}

HashData PathData::get_hash() const {
    return HashUtil::hash_file(path_, constants::DEFAULT_HASH_ALGORITHM);
}

std::vector<uint8_t> PathData::read_chunk(uint64_t offset, uint64_t size) const {
    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Cannot open " + path_.string());
    }
    ifs.seekg(static_cast<std::streamoff>(offset));
    std::vector<uint8_t> data(size);
    ifs.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (ifs.bad()) {
        throw std::runtime_error("Failed reading " + path_.string());
    }
    data.resize(static_cast<size_t>(ifs.gcount()));
    return data;
}

}  // namespace ddsxfer

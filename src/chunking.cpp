#include "ddsxfer/chunking.hpp"

#include <algorithm>
#include <stdexcept>

namespace ddsxfer {

namespace {

uint64_t ceil_div(uint64_t numerator, uint64_t denominator) {
    return (numerator + denominator - 1) / denominator;
}

}  // namespace

uint64_t num_chunks(uint64_t chunk_size, uint64_t file_size) {
    if (chunk_size == 0) throw std::invalid_argument("chunk_size must be > 0");
    if (file_size == 0) return 1;
    return ceil_div(file_size, chunk_size);
}

std::vector<WorkParcel> work_parcels(size_t workers, uint64_t num_chunks) {
    std::vector<WorkParcel> parcels;
    if (num_chunks == 0) return parcels;
    if (workers == 0) workers = 1;

    uint64_t batch = ceil_div(num_chunks, workers);
    for (uint64_t start = 0; start < num_chunks; start += batch) {
        parcels.push_back({start, std::min(batch, num_chunks - start)});
    }
    return parcels;
}

std::vector<ByteRange> byte_ranges(uint64_t file_size, uint64_t bytes_per_chunk) {
    if (bytes_per_chunk == 0) throw std::invalid_argument("bytes_per_chunk must be > 0");

    std::vector<ByteRange> ranges;
    uint64_t start = 0;
    uint64_t remaining = file_size;
    while (remaining > 0) {
        uint64_t amount = std::min(bytes_per_chunk, remaining);
        ranges.push_back({start, start + amount - 1});
        start += amount;
        remaining -= amount;
    }
    return ranges;
}

uint64_t download_bytes_per_chunk(uint64_t file_size, size_t workers, uint64_t min_chunk_size) {
    if (workers == 0) workers = 1;
    uint64_t per_worker = ceil_div(file_size, workers);
    return std::max(per_worker, min_chunk_size);
}

ChunkDescriptor describe_chunk(uint64_t index, uint64_t chunk_size, uint64_t file_size) {
    ChunkDescriptor chunk;
    chunk.index = index;
    chunk.offset = index * chunk_size;
    if (chunk.offset < file_size) {
        chunk.size = std::min(chunk_size, file_size - chunk.offset);
    }
    return chunk;
}

}  // namespace ddsxfer

#pragma once

#include "ddsxfer/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ddsxfer {

// Inclusive byte range [start, end] within a file.
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t size() const { return end - start + 1; }
    bool operator==(const ByteRange&) const = default;
};

// Contiguous run of chunk indexes handed to one worker.
struct WorkParcel {
    uint64_t start_index = 0;
    uint64_t num_items = 0;

    bool operator==(const WorkParcel&) const = default;
};

// One upload chunk. `index` is 0-based; the wire protocol numbers chunks from 1.
struct ChunkDescriptor {
    uint64_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::string hash_value;
    std::string hash_algorithm;

    uint64_t wire_number() const { return index + 1; }
};

/// Number of chunks needed to send file_size bytes in chunk_size pieces.
/// A zero-byte file still needs one (empty) chunk.
uint64_t num_chunks(uint64_t chunk_size, uint64_t file_size);

/// Split [0, num_chunks) into contiguous batches of ceil(num_chunks / workers).
/// Rounding up keeps batches even, so small chunk counts can leave some
/// workers without a batch (e.g. 4 workers, 5 chunks -> 3 batches).
std::vector<WorkParcel> work_parcels(size_t workers, uint64_t num_chunks);

/// Walk a file from offset 0 emitting inclusive ranges of bytes_per_chunk
/// (the last one may be shorter). Empty for a zero-byte file.
std::vector<ByteRange> byte_ranges(uint64_t file_size, uint64_t bytes_per_chunk);

/// Range size for a download: the file divided across workers, but never
/// smaller than min_chunk_size so each worker gets a sizeable piece.
uint64_t download_bytes_per_chunk(uint64_t file_size, size_t workers,
                                  uint64_t min_chunk_size = constants::MIN_DOWNLOAD_CHUNK_SIZE);

/// Offset and size of chunk `index` of a file split in chunk_size pieces (hash left empty).
ChunkDescriptor describe_chunk(uint64_t index, uint64_t chunk_size, uint64_t file_size);

}  // namespace ddsxfer

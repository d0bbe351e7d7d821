#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "utils/file_io.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace zulu::chunking {

/**
 * Artifact categories. Each category has a fixed chunk size, so the
 * category recorded in a manifest fully determines the chunk layout.
 */
enum class ArtifactType {
    Model,   // 1 MiB chunks
    Memory,  // 64 KiB chunks
    Plugin,  // 256 KiB chunks
    Ui       // 512 KiB chunks
};

uint32_t chunk_size_for(ArtifactType type);

// Wire names: MODEL, MEMORY, PLUGIN, UI
const char* artifact_type_to_string(ArtifactType type);
std::optional<ArtifactType> artifact_type_from_string(const std::string& str);

/**
 * Number of chunks for an artifact: ceil(total_size / chunk_size)
 */
uint32_t chunk_count_for(uint64_t total_size, uint32_t chunk_size);

/**
 * One contiguous, non-overlapping slice of an artifact
 */
struct Chunk {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint32_t size = 0;
    Hash256 digest{};

    bool operator==(const Chunk& other) const {
        return index == other.index && offset == other.offset &&
               size == other.size && digest == other.digest;
    }
};

/**
 * A chunk produced by FileChunkStream. The data pointer refers to the
 * stream's internal buffer and is only valid until the next call to next().
 */
struct ChunkView {
    uint32_t index;
    uint64_t offset;
    const byte* data;
    uint32_t size;
    Hash256 digest;
};

/**
 * Constant-memory chunk iterator over a file. A single buffer of
 * chunk_size bytes is reused for every chunk.
 */
class FileChunkStream {
public:
    static Result<FileChunkStream> open(const std::filesystem::path& path, uint32_t chunk_size);

    FileChunkStream(FileChunkStream&&) noexcept = default;
    FileChunkStream& operator=(FileChunkStream&&) noexcept = default;

    /**
     * Read and hash the next chunk.
     * @return The chunk, or nullopt once the whole file has been consumed
     */
    Result<std::optional<ChunkView>> next();

    uint64_t total_size() const { return total_size_; }
    uint32_t chunk_count() const { return chunk_count_for(total_size_, chunk_size_); }

private:
    FileChunkStream(utils::File file, uint32_t chunk_size, uint64_t total_size);

    utils::File file_;
    uint32_t chunk_size_;
    uint64_t total_size_;
    uint32_t next_index_ = 0;
    bytes buffer_;
};

/**
 * Deterministic fixed-size chunking.
 * Identical bytes and chunk size always yield identical chunks and digests.
 */
class Chunker {
public:
    /**
     * Split an in-memory buffer. A zero-length buffer yields no chunks.
     * @throws std::invalid_argument if chunk_size is zero
     */
    static std::vector<Chunk> chunk_buffer(const bytes& data, uint32_t chunk_size);

    /**
     * Stream a file and return its chunk list (offsets, sizes, digests)
     */
    static Result<std::vector<Chunk>> chunk_file(const std::filesystem::path& path, uint32_t chunk_size);

    /**
     * Stream a file and return only its chunk digests, in order
     */
    static Result<std::vector<Hash256>> chunk_file_digests(const std::filesystem::path& path,
                                                           uint32_t chunk_size);

    /**
     * Random access to chunk `index` using a positional read. No other
     * chunk is read.
     */
    static Result<bytes> read_chunk(const std::filesystem::path& path, uint32_t index, uint32_t chunk_size);

    /**
     * Read chunk `index` of an open file into buffer (resized to the chunk's size)
     */
    static Result<void> read_chunk_into(const utils::File& file, uint32_t index, uint32_t chunk_size,
                                        uint64_t total_size, bytes& buffer);

    /**
     * Hash a chunk in place and compare against the expected digest
     */
    static bool verify_chunk(const byte* data, size_t len, const Hash256& expected);
    static bool verify_chunk(const bytes& data, const Hash256& expected) {
        return verify_chunk(data.data(), data.size(), expected);
    }

    /**
     * Check that chunks tile [0, total_size) exactly: consecutive indices,
     * increasing offsets, every chunk full-size except possibly the last.
     */
    static bool validate_chunk_alignment(const std::vector<Chunk>& chunks, uint32_t chunk_size,
                                         uint64_t total_size);

    static std::vector<Hash256> digests_of(const std::vector<Chunk>& chunks);
    static uint64_t total_size_of(const std::vector<Chunk>& chunks);
};

} // namespace zulu::chunking

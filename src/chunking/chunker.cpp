#include "chunker.hpp"
#include "crypto/blake3.hpp"
#include "utils/logger.hpp"
#include <stdexcept>

namespace zulu::chunking {

uint32_t chunk_size_for(ArtifactType type) {
    switch (type) {
        case ArtifactType::Model: return constants::MODEL_CHUNK_SIZE;
        case ArtifactType::Memory: return constants::MEMORY_CHUNK_SIZE;
        case ArtifactType::Plugin: return constants::PLUGIN_CHUNK_SIZE;
        case ArtifactType::Ui: return constants::UI_CHUNK_SIZE;
    }
    return constants::MODEL_CHUNK_SIZE;
}

const char* artifact_type_to_string(ArtifactType type) {
    switch (type) {
        case ArtifactType::Model: return "MODEL";
        case ArtifactType::Memory: return "MEMORY";
        case ArtifactType::Plugin: return "PLUGIN";
        case ArtifactType::Ui: return "UI";
    }
    return "MODEL";
}

std::optional<ArtifactType> artifact_type_from_string(const std::string& str) {
    if (str == "MODEL") return ArtifactType::Model;
    if (str == "MEMORY") return ArtifactType::Memory;
    if (str == "PLUGIN") return ArtifactType::Plugin;
    if (str == "UI") return ArtifactType::Ui;
    return std::nullopt;
}

uint32_t chunk_count_for(uint64_t total_size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

// FileChunkStream

FileChunkStream::FileChunkStream(utils::File file, uint32_t chunk_size, uint64_t total_size)
    : file_(std::move(file))
    , chunk_size_(chunk_size)
    , total_size_(total_size)
    , buffer_(chunk_size)
{}

Result<FileChunkStream> FileChunkStream::open(const std::filesystem::path& path, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return Result<FileChunkStream>::Err(ErrorCode::InvalidArgument, "Chunk size must be positive");
    }
    ZULU_TRY_UNWRAP(file, utils::File::open(path, utils::File::Mode::ReadOnly));
    ZULU_TRY_UNWRAP(size, file.size());
    return Result<FileChunkStream>::Ok(FileChunkStream(std::move(file), chunk_size, size));
}

Result<std::optional<ChunkView>> FileChunkStream::next() {
    using NextResult = Result<std::optional<ChunkView>>;

    uint64_t offset = static_cast<uint64_t>(next_index_) * chunk_size_;
    if (offset >= total_size_) {
        return NextResult::Ok(std::nullopt);
    }

    size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_size_, total_size_ - offset));
    ZULU_TRY_UNWRAP(got, file_.read_at(offset, buffer_.data(), want));
    if (got != want) {
        return NextResult::Err(ErrorCode::StorageReadFailed,
                               "File shrank while chunking: " + file_.path().string());
    }

    ChunkView view{
        next_index_,
        offset,
        buffer_.data(),
        static_cast<uint32_t>(got),
        crypto::Blake3::hash(buffer_.data(), got)
    };
    ++next_index_;
    return NextResult::Ok(view);
}

// Chunker

std::vector<Chunk> Chunker::chunk_buffer(const bytes& data, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    std::vector<Chunk> chunks;
    chunks.reserve(chunk_count_for(data.size(), chunk_size));

    uint64_t offset = 0;
    uint32_t index = 0;
    while (offset < data.size()) {
        uint32_t size = static_cast<uint32_t>(std::min<uint64_t>(chunk_size, data.size() - offset));
        Chunk chunk;
        chunk.index = index++;
        chunk.offset = offset;
        chunk.size = size;
        chunk.digest = crypto::Blake3::hash(data.data() + offset, size);
        chunks.push_back(chunk);
        offset += size;
    }

    ZULU_LOG_DEBUG("Chunked {} bytes into {} chunks of {} bytes", data.size(), chunks.size(), chunk_size);
    return chunks;
}

Result<std::vector<Chunk>> Chunker::chunk_file(const std::filesystem::path& path, uint32_t chunk_size) {
    ZULU_TRY_UNWRAP(stream, FileChunkStream::open(path, chunk_size));

    std::vector<Chunk> chunks;
    chunks.reserve(stream.chunk_count());
    while (true) {
        ZULU_TRY_UNWRAP(view, stream.next());
        if (!view) break;
        chunks.push_back(Chunk{view->index, view->offset, view->size, view->digest});
    }

    ZULU_LOG_DEBUG("Chunked file {} ({} bytes) into {} chunks",
                   path.string(), stream.total_size(), chunks.size());
    return Result<std::vector<Chunk>>::Ok(std::move(chunks));
}

Result<std::vector<Hash256>> Chunker::chunk_file_digests(const std::filesystem::path& path,
                                                         uint32_t chunk_size) {
    ZULU_TRY_UNWRAP(chunks, chunk_file(path, chunk_size));
    return Result<std::vector<Hash256>>::Ok(digests_of(chunks));
}

Result<bytes> Chunker::read_chunk(const std::filesystem::path& path, uint32_t index, uint32_t chunk_size) {
    ZULU_TRY_UNWRAP(file, utils::File::open(path, utils::File::Mode::ReadOnly));
    ZULU_TRY_UNWRAP(size, file.size());

    bytes buffer;
    ZULU_TRY(read_chunk_into(file, index, chunk_size, size, buffer));
    return Result<bytes>::Ok(std::move(buffer));
}

Result<void> Chunker::read_chunk_into(const utils::File& file, uint32_t index, uint32_t chunk_size,
                                      uint64_t total_size, bytes& buffer) {
    if (chunk_size == 0) {
        return Result<void>::Err(ErrorCode::InvalidArgument, "Chunk size must be positive");
    }
    if (index >= chunk_count_for(total_size, chunk_size)) {
        return Result<void>::Err(ErrorCode::OutOfRange,
                                 "Chunk index " + std::to_string(index) + " is past the end of the artifact");
    }

    uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_size, total_size - offset));
    buffer.resize(want);

    ZULU_TRY_UNWRAP(got, file.read_at(offset, buffer.data(), want));
    if (got != want) {
        return Result<void>::Err(ErrorCode::StorageReadFailed,
                                 "Short read on chunk " + std::to_string(index));
    }
    return Result<void>::Ok();
}

bool Chunker::verify_chunk(const byte* data, size_t len, const Hash256& expected) {
    return crypto::Blake3::hash(data, len) == expected;
}

bool Chunker::validate_chunk_alignment(const std::vector<Chunk>& chunks, uint32_t chunk_size,
                                       uint64_t total_size) {
    if (chunk_size == 0 || chunks.size() != chunk_count_for(total_size, chunk_size)) {
        return false;
    }

    uint64_t expected_offset = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.index != i || chunk.offset != expected_offset || chunk.size == 0) {
            return false;
        }
        bool last = (i + 1 == chunks.size());
        if (!last && chunk.size != chunk_size) {
            return false;
        }
        if (last && chunk.size > chunk_size) {
            return false;
        }
        expected_offset += chunk.size;
    }
    return expected_offset == total_size;
}

std::vector<Hash256> Chunker::digests_of(const std::vector<Chunk>& chunks) {
    std::vector<Hash256> digests;
    digests.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        digests.push_back(chunk.digest);
    }
    return digests;
}

uint64_t Chunker::total_size_of(const std::vector<Chunk>& chunks) {
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size;
    }
    return total;
}

} // namespace zulu::chunking

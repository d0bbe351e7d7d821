#pragma once

#include "zulu/common.hpp"
#include "zulu/error.hpp"
#include "artifacts/manifest.hpp"
#include "download/resume_state.hpp"
#include "utils/file_io.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace zulu::download {

/**
 * Fetch capability: chunk index -> chunk bytes. Transport agnostic.
 */
using FetchChunk = std::function<Result<bytes>(uint32_t index)>;

enum class DownloadState {
    Init,
    ResumeCheck,
    VerifyingChunk,
    FinalRootCheck,
    Finalized,
    Failed
};

const char* download_state_to_string(DownloadState state);

struct DownloadOptions {
    std::filesystem::path temp_dir = "./temp";
    bool resumable = true;
    std::function<void(uint64_t downloaded, uint64_t total)> on_progress;
    std::function<void(uint32_t verified, uint32_t total)> on_chunk_verified;
    const std::atomic<bool>* cancel = nullptr;   // polled before each chunk
};

struct DownloadResult {
    bool success = false;
    std::string artifact_id;
    Hash256 root{};
    uint32_t verified_chunks = 0;
    uint32_t total_chunks = 0;
    uint32_t resumed_from = 0;       // chunks accepted from a previous attempt
    std::optional<Error> error;
    std::string timestamp;
};

/**
 * StreamingDownloader - fetch, verify and assemble one artifact
 *
 * Every chunk is hashed and compared to the manifest digest before it is
 * written at its offset in "<temp_dir>/<id>_<version>.partial". The resume
 * file is persisted only after the chunk write is fsynced, so it never
 * records more than what is durable. A resumed download re-verifies the
 * last min(K, 5) chunks on disk first. The final root is recomputed from the
 * partial file before it is moved to the output path; no output file is
 * produced by a failed download.
 *
 * One downloader per artifact at a time.
 */
class StreamingDownloader {
public:
    StreamingDownloader(artifacts::Manifest manifest, DownloadOptions options = {});

    DownloadResult download(const FetchChunk& fetch, const std::filesystem::path& output_path);

    DownloadState state() const { return state_.load(); }

    // Index of the chunk being verified while in VerifyingChunk
    uint32_t current_chunk() const { return current_chunk_.load(); }

    std::filesystem::path temp_path() const;
    std::filesystem::path resume_path() const;

private:
    struct ResumePoint {
        std::vector<uint32_t> verified;
        uint64_t durable_bytes = 0;
    };

    Result<void> validate_manifest() const;
    Result<ResumePoint> check_resume_state();
    Result<void> reverify_tail(const ResumePoint& resume);
    Result<void> fetch_remaining(ResumePoint& resume, const FetchChunk& fetch);
    Result<void> check_final_root();
    Result<void> finalize(const std::filesystem::path& output_path);

    uint32_t expected_chunk_size(uint32_t index) const;
    uint64_t prefix_bytes(uint32_t chunk_count) const;
    void discard_state(const std::string& why);

    artifacts::Manifest manifest_;
    DownloadOptions options_;
    std::atomic<DownloadState> state_{DownloadState::Init};
    std::atomic<uint32_t> current_chunk_{0};
};

/**
 * Fetch capability over a local file, chunked with a fixed size
 */
class FileChunkSource {
public:
    static Result<FileChunkSource> open(const std::filesystem::path& path, uint32_t chunk_size);

    Result<bytes> fetch(uint32_t index) const;

    FetchChunk fetcher() const;

    uint64_t total_size() const { return total_size_; }

private:
    FileChunkSource(std::shared_ptr<utils::File> file, uint32_t chunk_size, uint64_t total_size);

    std::shared_ptr<utils::File> file_;
    uint32_t chunk_size_;
    uint64_t total_size_;
};

} // namespace zulu::download

#include "downloader.hpp"
#include "chunking/chunker.hpp"
#include "chunking/commitment.hpp"
#include "utils/logger.hpp"
#include "zulu/time_utils.hpp"
#include <algorithm>

namespace zulu::download {

namespace {

// Artifact ids become file names; keep them inside temp_dir
std::string file_safe(const std::string& name) {
    std::string out = name;
    std::replace_if(out.begin(), out.end(), [](char c) {
        return !((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                 c == '.' || c == '-' || c == '_');
    }, '_');
    return out;
}

void remove_if_exists(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        ZULU_LOG_WARN("Failed to remove {}: {}", path.string(), ec.message());
    }
}

} // anonymous namespace

const char* download_state_to_string(DownloadState state) {
    switch (state) {
        case DownloadState::Init: return "INIT";
        case DownloadState::ResumeCheck: return "RESUME_CHECK";
        case DownloadState::VerifyingChunk: return "VERIFYING_CHUNK";
        case DownloadState::FinalRootCheck: return "FINAL_ROOT_CHECK";
        case DownloadState::Finalized: return "FINALIZED";
        case DownloadState::Failed: return "FAILED";
    }
    return "FAILED";
}

StreamingDownloader::StreamingDownloader(artifacts::Manifest manifest, DownloadOptions options)
    : manifest_(std::move(manifest))
    , options_(std::move(options))
{}

std::filesystem::path StreamingDownloader::temp_path() const {
    return options_.temp_dir /
           (file_safe(manifest_.artifact_id) + "_" + file_safe(manifest_.artifact_version) + ".partial");
}

std::filesystem::path StreamingDownloader::resume_path() const {
    auto path = temp_path();
    path += ".resume.json";
    return path;
}

uint32_t StreamingDownloader::expected_chunk_size(uint32_t index) const {
    uint64_t offset = static_cast<uint64_t>(index) * manifest_.metadata.chunk_size;
    uint64_t remaining = manifest_.metadata.size - offset;
    return static_cast<uint32_t>(std::min<uint64_t>(remaining, manifest_.metadata.chunk_size));
}

uint64_t StreamingDownloader::prefix_bytes(uint32_t chunk_count) const {
    return std::min<uint64_t>(static_cast<uint64_t>(chunk_count) * manifest_.metadata.chunk_size,
                              manifest_.metadata.size);
}

void StreamingDownloader::discard_state(const std::string& why) {
    ZULU_LOG_WARN("Discarding partial download of {}: {}", manifest_.artifact_id, why);
    remove_if_exists(resume_path());
    remove_if_exists(temp_path());
}

Result<void> StreamingDownloader::validate_manifest() const {
    const auto& meta = manifest_.metadata;
    if (meta.chunk_count == 0 || meta.size == 0) {
        return Result<void>::Err(ErrorCode::EmptyArtifact, "Manifest describes an empty artifact");
    }
    if (meta.chunk_size == 0 ||
        manifest_.chunk_digests.size() != meta.chunk_count ||
        chunking::chunk_count_for(meta.size, meta.chunk_size) != meta.chunk_count) {
        return Result<void>::Err(ErrorCode::ManifestInvalid, "Manifest chunk layout is inconsistent");
    }
    return Result<void>::Ok();
}

Result<StreamingDownloader::ResumePoint> StreamingDownloader::check_resume_state() {
    using R = Result<ResumePoint>;
    state_ = DownloadState::ResumeCheck;

    ResumePoint fresh;
    if (!options_.resumable) {
        remove_if_exists(resume_path());
        remove_if_exists(temp_path());
        return R::Ok(fresh);
    }

    auto loaded = ResumeManifest::load(resume_path());
    if (loaded.is_err()) {
        discard_state(loaded.error().message());
        return R::Ok(fresh);
    }
    if (!loaded.value()) {
        // Partial bytes without a resume record cannot be trusted
        remove_if_exists(temp_path());
        return R::Ok(fresh);
    }

    const ResumeManifest& resume = *loaded.value();
    std::string problem;
    if (resume.artifact_id != manifest_.artifact_id) {
        problem = "artifact id mismatch";
    } else if (resume.expected_root != manifest_.root) {
        problem = "expected root mismatch";
    } else if (!resume.checksum_valid()) {
        problem = "checksum mismatch";
    } else if (resume.chunk_hashes != manifest_.chunk_digests) {
        problem = "chunk digest list mismatch";
    } else if (!resume.is_contiguous_prefix() || resume.verified_chunks.size() > manifest_.metadata.chunk_count) {
        problem = "verified chunks are not a contiguous prefix";
    }

    uint32_t verified = static_cast<uint32_t>(resume.verified_chunks.size());
    uint64_t durable = prefix_bytes(verified);
    if (problem.empty()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(temp_path(), ec);
        if (ec) {
            problem = "partial file missing";
        } else if (size < durable) {
            problem = "partial file shorter than verified chunks";
        }
    }

    if (!problem.empty()) {
        discard_state(problem);
        return R::Ok(fresh);
    }

    ResumePoint point;
    point.verified = resume.verified_chunks;
    point.durable_bytes = durable;
    return R::Ok(std::move(point));
}

Result<void> StreamingDownloader::reverify_tail(const ResumePoint& resume) {
    if (resume.verified.empty()) {
        return Result<void>::Ok();
    }

    size_t count = resume.verified.size();
    size_t from = count - std::min(count, constants::RESUME_REVERIFY_CHUNKS);
    ZULU_LOG_INFO("Resuming {} from chunk {}, re-verifying last {} chunks",
                  manifest_.artifact_id, count, count - from);

    auto fail = [&](const std::string& message) {
        ZULU_LOG_ERROR("Resume verification failed for {}: {}", manifest_.artifact_id, message);
        discard_state("resume verification failed");
        return Result<void>::Err(ErrorCode::ResumeStateCorrupt, message);
    };

    auto file = utils::File::open(temp_path(), utils::File::Mode::ReadOnly);
    if (file.is_err()) {
        return fail(file.error().message());
    }

    bytes buffer;
    for (size_t i = from; i < count; ++i) {
        uint32_t index = resume.verified[i];
        auto read = chunking::Chunker::read_chunk_into(file.value(), index, manifest_.metadata.chunk_size,
                                                       manifest_.metadata.size, buffer);
        if (read.is_err()) {
            return fail("Chunk " + std::to_string(index) + " unreadable: " + read.error().message());
        }
        if (!chunking::Chunker::verify_chunk(buffer, manifest_.chunk_digests[index])) {
            return fail("Resume verification failed at chunk " + std::to_string(index));
        }
    }
    return Result<void>::Ok();
}

Result<void> StreamingDownloader::fetch_remaining(ResumePoint& resume, const FetchChunk& fetch) {
    const uint32_t total = manifest_.metadata.chunk_count;
    const uint32_t start = static_cast<uint32_t>(resume.verified.size());

    auto mode = start > 0 ? utils::File::Mode::ReadWrite : utils::File::Mode::ReadWriteTruncate;
    ZULU_TRY_UNWRAP(file, utils::File::open(temp_path(), mode));
    if (start > 0) {
        // Drop anything past the verified prefix
        ZULU_TRY(file.truncate(resume.durable_bytes));
    }

    for (uint32_t i = start; i < total; ++i) {
        if (options_.cancel && options_.cancel->load()) {
            ZULU_LOG_INFO("Download of {} cancelled at chunk {}", manifest_.artifact_id, i);
            return Result<void>::Err(ErrorCode::Cancelled, "Download cancelled at chunk " + std::to_string(i));
        }

        state_ = DownloadState::VerifyingChunk;
        current_chunk_ = i;

        Result<bytes> fetched = Result<bytes>::Err(ErrorCode::NetworkError, "fetch not attempted");
        try {
            fetched = fetch(i);
        } catch (const std::exception& e) {
            fetched = Result<bytes>::Err(ErrorCode::NetworkError, e.what());
        }
        if (fetched.is_err()) {
            return Result<void>::Err(Error(ErrorCode::NetworkError,
                                           "Failed to fetch chunk " + std::to_string(i),
                                           fetched.error().message()));
        }
        const bytes& data = fetched.value();

        if (data.size() != expected_chunk_size(i) ||
            !chunking::Chunker::verify_chunk(data, manifest_.chunk_digests[i])) {
            ZULU_LOG_ERROR("Chunk {} of {} failed verification", i, manifest_.artifact_id);
            return Result<void>::Err(ErrorCode::ChunkHashMismatch, "Chunk " + std::to_string(i) + " hash mismatch");
        }

        uint64_t offset = static_cast<uint64_t>(i) * manifest_.metadata.chunk_size;
        ZULU_TRY(file.write_at(offset, data.data(), data.size()));
        ZULU_TRY(file.sync());

        resume.verified.push_back(i);
        resume.durable_bytes = offset + data.size();

        // Rewritten after every fsynced chunk, digest list included, so the cost
        // grows with chunk count squared.
        // TODO: persist only the verified index list and take digests from the signed manifest
        if (options_.resumable) {
            auto record = ResumeManifest::create(manifest_.artifact_id, manifest_.root,
                                                 resume.verified, manifest_.chunk_digests);
            ZULU_TRY(record.save(resume_path()));
        }

        if (options_.on_chunk_verified) {
            options_.on_chunk_verified(i + 1, total);
        }
        if (options_.on_progress) {
            options_.on_progress(resume.durable_bytes, manifest_.metadata.size);
        }
    }

    file.close();
    return Result<void>::Ok();
}

Result<void> StreamingDownloader::check_final_root() {
    state_ = DownloadState::FinalRootCheck;

    auto digests = chunking::Chunker::chunk_file_digests(temp_path(), manifest_.metadata.chunk_size);
    if (digests.is_err()) {
        discard_state("partial file unreadable");
        return Result<void>::Err(ErrorCode::RootMismatch, "Cannot recompute root: " + digests.error().message());
    }

    auto root = chunking::Commitment::compute(manifest_.strategy, digests.value());
    if (root.is_err() || root.value() != manifest_.root) {
        ZULU_LOG_ERROR("Final root mismatch for {}", manifest_.artifact_id);
        discard_state("final root mismatch");
        return Result<void>::Err(ErrorCode::RootMismatch, "Final root hash mismatch");
    }
    return Result<void>::Ok();
}

Result<void> StreamingDownloader::finalize(const std::filesystem::path& output_path) {
    if (output_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(ErrorCode::StorageWriteFailed,
                                     "Cannot create output directory: " + ec.message());
        }
    }
    ZULU_TRY(utils::move_file(temp_path(), output_path));
    remove_if_exists(resume_path());
    state_ = DownloadState::Finalized;
    return Result<void>::Ok();
}

DownloadResult StreamingDownloader::download(const FetchChunk& fetch, const std::filesystem::path& output_path) {
    time::Timer timer;
    state_ = DownloadState::Init;

    DownloadResult result;
    result.artifact_id = manifest_.artifact_id;
    result.root = manifest_.root;
    result.total_chunks = manifest_.metadata.chunk_count;

    ResumePoint resume;
    auto run = [&]() -> Result<void> {
        ZULU_TRY(validate_manifest());

        std::error_code ec;
        std::filesystem::create_directories(options_.temp_dir, ec);
        if (ec) {
            return Result<void>::Err(ErrorCode::StorageWriteFailed, "Cannot create temp directory: " + ec.message());
        }

        ZULU_TRY_UNWRAP(point, check_resume_state());
        resume = std::move(point);
        ZULU_TRY(reverify_tail(resume));
        result.resumed_from = static_cast<uint32_t>(resume.verified.size());

        ZULU_TRY(fetch_remaining(resume, fetch));
        ZULU_TRY(check_final_root());
        ZULU_TRY(finalize(output_path));
        return Result<void>::Ok();
    };

    auto outcome = run();
    result.verified_chunks = static_cast<uint32_t>(resume.verified.size());
    result.timestamp = time::now_string();

    if (outcome.is_err()) {
        state_ = DownloadState::Failed;
        result.error = outcome.error();
        if (!options_.resumable) {
            remove_if_exists(temp_path());
        }
        ZULU_LOG_ERROR("Download of {} failed: {} ({})", manifest_.artifact_id, outcome.error().to_string(),
                       disposition_to_string(outcome.error().disposition()));
        return result;
    }

    result.success = true;
    ZULU_LOG_INFO("Download of {} completed in {}ms ({:.2f} MB, {} chunks resumed)",
                  manifest_.artifact_id, timer.elapsed_milliseconds(),
                  static_cast<double>(manifest_.metadata.size) / (1024.0 * 1024.0), result.resumed_from);
    return result;
}

// FileChunkSource

FileChunkSource::FileChunkSource(std::shared_ptr<utils::File> file, uint32_t chunk_size, uint64_t total_size)
    : file_(std::move(file))
    , chunk_size_(chunk_size)
    , total_size_(total_size)
{}

Result<FileChunkSource> FileChunkSource::open(const std::filesystem::path& path, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return Result<FileChunkSource>::Err(ErrorCode::InvalidArgument, "Chunk size must be positive");
    }
    ZULU_TRY_UNWRAP(file, utils::File::open(path, utils::File::Mode::ReadOnly));
    ZULU_TRY_UNWRAP(size, file.size());
    return Result<FileChunkSource>::Ok(
        FileChunkSource(std::make_shared<utils::File>(std::move(file)), chunk_size, size));
}

Result<bytes> FileChunkSource::fetch(uint32_t index) const {
    bytes buffer;
    ZULU_TRY(chunking::Chunker::read_chunk_into(*file_, index, chunk_size_, total_size_, buffer));
    return Result<bytes>::Ok(std::move(buffer));
}

FetchChunk FileChunkSource::fetcher() const {
    FileChunkSource source = *this;
    return [source](uint32_t index) { return source.fetch(index); };
}

} // namespace zulu::download

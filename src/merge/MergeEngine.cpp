#include "merge/MergeEngine.hpp"
#include "common/log.hpp"
#include "storage/ChunkNaming.hpp"
#include "storage/UploadError.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>

namespace chunkd {

namespace {

enum class SlotState {
    Pending,
    Ready,
    Missing,
    Failed,
};

struct ChunkSlot {
    SlotState state = SlotState::Pending;
    long long chunkIndex = -1;
    std::vector<char> data;
    std::string error;
};

std::string describeRange(const ChunkRange& range) {
    if (range.first == range.last) {
        return "Chunk " + std::to_string(range.first);
    }
    return "Chunks " + std::to_string(range.first) + "-" + std::to_string(range.last);
}

} // namespace

void MergeReport::addMissing(long long chunkIndex) {
    if (!missingChunks.empty() && missingChunks.back().last + 1 == chunkIndex) {
        missingChunks.back().last = chunkIndex;
    } else {
        missingChunks.push_back(ChunkRange{chunkIndex, chunkIndex});
    }
}

long long MergeReport::missingCount() const {
    long long count = 0;
    for (const auto& range : missingChunks) {
        count += range.last - range.first + 1;
    }
    return count;
}

// Ring of `window` slots; slot i % window belongs to chunk i until the writer consumes it
struct MergeEngine::MergeState {
    std::string fileName;
    std::filesystem::path tempDir;
    std::mutex mutex;
    std::condition_variable ready;
    std::vector<ChunkSlot> slots;

    ChunkSlot& slotFor(long long chunkIndex) {
        return slots[static_cast<size_t>(chunkIndex) % slots.size()];
    }
};

MergeEngine::MergeEngine(const std::filesystem::path& tempDir,
                         const std::filesystem::path& finalDir,
                         UploadLocks& locks,
                         size_t workers,
                         size_t window)
    : tempDir_(tempDir),
      finalDir_(finalDir),
      locks_(locks),
      workers_(std::max<size_t>(workers, 1)),
      window_(window == 0 ? 2 * std::max<size_t>(workers, 1) : window),
      pool_(std::max<size_t>(workers, 1)) {}

MergeEngine::~MergeEngine() {
    pool_.join();
}

void MergeEngine::readChunk(MergeState& state, long long chunkIndex) {
    std::filesystem::path path = chunkPath(state.tempDir, state.fileName, chunkIndex);

    SlotState result = SlotState::Ready;
    std::vector<char> data;
    std::string error;

    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        result = SlotState::Missing;
    } else if (ec) {
        result = SlotState::Failed;
        error = "failed to open: " + ec.message();
    } else {
        std::ifstream chunkFile(path, std::ios::binary);
        if (!chunkFile) {
            result = SlotState::Failed;
            error = std::string("failed to open: ") + std::strerror(errno);
        } else {
            data.resize(static_cast<size_t>(size));
            chunkFile.read(data.data(), static_cast<std::streamsize>(data.size()));
            if (chunkFile.gcount() != static_cast<std::streamsize>(data.size())) {
                result = SlotState::Failed;
                error = "failed to read: got " + std::to_string(chunkFile.gcount()) +
                        " of " + std::to_string(size) + " bytes";
                data.clear();
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(state.mutex);
        ChunkSlot& slot = state.slotFor(chunkIndex);
        slot.data = std::move(data);
        slot.error = std::move(error);
        slot.state = result;
    }
    state.ready.notify_all();
}

void MergeEngine::scheduleRead(const std::shared_ptr<MergeState>& state, long long chunkIndex) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        ChunkSlot& slot = state->slotFor(chunkIndex);
        slot.state = SlotState::Pending;
        slot.chunkIndex = chunkIndex;
        slot.data.clear();
        slot.error.clear();
    }
    boost::asio::post(pool_, [state, chunkIndex]() {
        readChunk(*state, chunkIndex);
    });
}

MergeReport MergeEngine::mergeChunks(const std::string& fileName, long long totalChunks) {
    if (fileName.empty()) {
        throw UploadError(ErrorKind::InvalidRequest, "Invalid request data", "file_name must not be empty");
    }
    if (totalChunks < 1) {
        throw UploadError(ErrorKind::InvalidRequest, "Invalid request data",
                          "total_chunks must be at least 1, got " + std::to_string(totalChunks));
    }

    auto started = std::chrono::steady_clock::now();
    auto mergeGuard = locks_.lockForMerge(fileName);

    MergeReport report;
    report.fileName = fileName;
    report.totalChunks = totalChunks;

    // CREATING_OUTPUT
    std::filesystem::path outPath = outputPath(finalDir_, fileName);
    std::ofstream output(outPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw UploadError(ErrorKind::IoFailure,
                          "Failed to create output file",
                          outPath.string() + " (" + std::strerror(errno) + ")");
    }

    // MERGING
    auto state = std::make_shared<MergeState>();
    state->fileName = fileName;
    state->tempDir = tempDir_;
    long long window = static_cast<long long>(std::min<unsigned long long>(
        window_, static_cast<unsigned long long>(totalChunks)));
    state->slots.resize(static_cast<size_t>(window));

    for (long long i = 0; i < window; ++i) {
        scheduleRead(state, i);
    }

    std::uintmax_t goodBytes = 0;
    for (long long i = 0; i < totalChunks; ++i) {
        ChunkSlot consumed;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            ChunkSlot& slot = state->slotFor(i);
            state->ready.wait(lock, [&slot]() { return slot.state != SlotState::Pending; });
            consumed = std::move(slot);
            slot = ChunkSlot();
        }

        // Refill the freed slot before writing so reads overlap the write
        if (i + window < totalChunks) {
            scheduleRead(state, i + window);
        }

        std::filesystem::path path = chunkPath(tempDir_, fileName, i);
        if (consumed.state == SlotState::Missing) {
            report.addMissing(i);
            continue;
        }
        if (consumed.state == SlotState::Failed) {
            logLine(std::cerr, "Failed to read chunk " + std::to_string(i) + " of '" + fileName +
                               "': " + consumed.error);
            report.failedChunks.push_back(i);
            continue;
        }

        output.write(consumed.data.data(), static_cast<std::streamsize>(consumed.data.size()));
        output.flush();
        if (!output) {
            logLine(std::cerr, "Failed to write chunk " + std::to_string(i) + " to output file " +
                               outPath.string() + " (" + std::strerror(errno) + ")");
            report.failedChunks.push_back(i);
            // Rewind past the partial write so the next chunk lands at the right offset
            output.clear();
            output.seekp(static_cast<std::streamoff>(goodBytes));
            continue;
        }
        goodBytes += consumed.data.size();
        report.mergedChunks.push_back(i);

        std::error_code ec;
        if (!std::filesystem::remove(path, ec) && ec) {
            logLine(std::cerr, "Failed to remove merged chunk " + path.string() + ": " + ec.message());
        }
    }

    output.close();
    report.bytesWritten = goodBytes;

    for (const auto& range : report.missingChunks) {
        logLine(std::cerr, describeRange(range) + " of '" + fileName + "' not found in " + tempDir_.string());
    }

    std::error_code sizeEc;
    std::uintmax_t onDisk = std::filesystem::file_size(outPath, sizeEc);
    if (!sizeEc && onDisk > goodBytes) {
        std::filesystem::resize_file(outPath, goodBytes, sizeEc);
        if (sizeEc) {
            logLine(std::cerr, "Failed to truncate " + outPath.string() + ": " + sizeEc.message());
        }
    }

    // SWEEPING
    report.sweptArtifacts = sweepTempArtifacts();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    std::ostringstream summary;
    summary << "Merged '" << fileName << "': " << report.mergedChunks.size() << "/" << totalChunks
            << " chunks, " << report.missingCount() << " missing, "
            << report.failedChunks.size() << " failed, " << report.bytesWritten << " bytes, "
            << report.sweptArtifacts << " swept in " << elapsed << " ms";
    logLine(std::cout, summary.str());

    return report;
}

size_t MergeEngine::sweepTempArtifacts() {
    auto sweepGuard = locks_.lockForSweep();

    std::error_code ec;
    if (!std::filesystem::exists(tempDir_, ec)) {
        return 0;
    }

    std::vector<std::filesystem::path> artifacts;
    std::filesystem::directory_iterator it(tempDir_, ec);
    if (ec) {
        throw UploadError(ErrorKind::IoFailure,
                          "Failed to clean up temporary files",
                          "failed to list temp files: " + ec.message());
    }
    for (const auto& entry : it) {
        if (isChunkArtifact(entry.path().filename().string())) {
            artifacts.push_back(entry.path());
        }
    }

    for (const auto& artifact : artifacts) {
        std::filesystem::remove(artifact, ec);
        if (ec) {
            throw UploadError(ErrorKind::IoFailure,
                              "Failed to clean up temporary files",
                              "failed to remove temp file " + artifact.string() + ": " + ec.message());
        }
    }

    return artifacts.size();
}

} // namespace chunkd

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsgrab/media/segment_fetcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

namespace hlsgrab::media {

//=============================================================================
// FetchBatch
//=============================================================================

FetchBatch::FetchBatch(disk::ScratchDir directory, std::vector<FetchResult> results) noexcept
    : directory_(std::move(directory))
    , results_(std::move(results)) {}

std::uint32_t FetchBatch::succeeded() const noexcept {
    return static_cast<std::uint32_t>(std::count_if(results_.begin(), results_.end(),
        [](const FetchResult& r) { return r.success; }));
}

bool FetchBatch::cancelled() const noexcept {
    return std::any_of(results_.begin(), results_.end(), [](const FetchResult& r) {
        return r.error == MediaErrc::cancelled;
    });
}

//=============================================================================
// SegmentFetcher
//=============================================================================

SegmentFetcher::SegmentFetcher(core::Transport& transport, FetchConfig config)
    : transport_(transport)
    , config_(std::move(config)) {}

std::string SegmentFetcher::segment_file_name(std::uint32_t ordinal) {
    auto number = std::to_string(ordinal);
    if (number.size() < static_cast<std::size_t>(core::SEGMENT_NAME_WIDTH)) {
        number = std::string(core::SEGMENT_NAME_WIDTH - number.size(), '0') + number;
    }
    return std::string(core::SEGMENT_FILE_PREFIX) + number + std::string(core::SEGMENT_FILE_EXTENSION);
}

std::expected<FetchBatch, std::error_code>
SegmentFetcher::fetch(const ResolvedPlaylist& playlist,
                      std::stop_token stop,
                      const FetchCallback& callback) const noexcept {
    if (playlist.empty()) {
        return std::unexpected(make_error_code(MediaErrc::fetch_aborted));
    }

    auto directory = disk::ScratchDir::create(core::SCRATCH_DIR_PREFIX, config_.scratch_parent);
    if (!directory) {
        spdlog::error("Could not create temporary directory: {}", directory.error().message());
        return std::unexpected(directory.error());
    }
    spdlog::debug("Downloading segments to {}", directory->path().string());

    const auto& segments = playlist.segments();
    const auto total = static_cast<std::uint32_t>(segments.size());

    // One slot per ordinal; each worker only ever touches the slot it claimed
    std::vector<FetchResult> slots(segments.size());
    for (std::size_t i = 0; i < segments.size(); ++i) {
        slots[i].segment = segments[i];
        slots[i].local_path = directory->path() / segment_file_name(segments[i].ordinal);
        slots[i].error = make_error_code(MediaErrc::cancelled);
    }

    std::atomic<std::size_t> next{0};
    std::atomic<std::uint32_t> completed{0};

    auto worker = [&]() noexcept {
        while (!stop.stop_requested()) {
            auto index = next.fetch_add(1, std::memory_order_relaxed);
            if (index >= slots.size()) {
                return;
            }

            auto& slot = slots[index];
            fetch_one(slot, total);

            // Callback runs on this worker with no fetcher lock held
            const auto done = completed.fetch_add(1, std::memory_order_acq_rel) + 1;
            if (callback) {
                try {
                    callback(FetchProgress{done, total, slot.segment.ordinal, slot.success});
                } catch (const std::exception& e) {
                    spdlog::warn("Progress callback threw: {}", e.what());
                }
            }
        }
    };

    const auto worker_count = std::clamp<std::uint32_t>(
        std::min(config_.concurrency, total), 1, core::MAX_CONCURRENCY);

    if (worker_count == 1) {
        worker();
    } else {
        std::vector<std::jthread> pool;
        pool.reserve(worker_count);
        try {
            for (std::uint32_t i = 0; i < worker_count; ++i) {
                pool.emplace_back(worker);
            }
        } catch (const std::system_error& e) {
            spdlog::warn("Started {} of {} fetch workers: {}", pool.size(), worker_count, e.what());
            if (pool.empty()) {
                worker();
            }
        }
        // jthread joins on destruction
    }

    FetchBatch batch(std::move(*directory), std::move(slots));

    if (batch.cancelled()) {
        spdlog::warn("Fetch cancelled after {}/{} segment(s)", completed.load(), total);
    } else if (batch.failed() > 0) {
        spdlog::warn("{}/{} segment(s) failed to download", batch.failed(), total);
    } else {
        spdlog::info("Downloaded {} segment(s)", total);
    }

    return batch;
}

void SegmentFetcher::fetch_one(FetchResult& slot, std::uint32_t total) const noexcept {
    auto response = transport_.download(slot.segment.location, slot.local_path);
    if (!response) {
        slot.success = false;
        slot.error = response.error();

        // The slot stays reserved, but must not expose a truncated file
        std::error_code ec;
        std::filesystem::remove(slot.local_path, ec);

        spdlog::warn("Segment {}/{} failed: {} ({})",
                     slot.segment.ordinal, total, slot.error.message(), slot.segment.location);
        return;
    }

    slot.success = true;
    slot.error.clear();
    slot.bytes = response->content_length;
    spdlog::debug("Downloaded segment {}/{}: {}",
                  slot.segment.ordinal, total, slot.local_path.filename().string());
}

} // namespace hlsgrab::media

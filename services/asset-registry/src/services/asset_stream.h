#pragma once

/**
 * @file asset_stream.h
 * @brief Lazy, finite sequence of asset batches read from storage in windows
 *
 * Storage is read in windows of batchSize rows; each window is handed out
 * in items of at most itemLimit assets. Reading stops when a window comes
 * back empty or the storage offset reaches maxOffset. Not restartable.
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include "../domain/models/asset.h"

namespace services {

/**
 * @brief One stream item
 */
struct AssetBatch {
    int64_t offset = 0;   ///< Storage offset of the first asset in this item
    std::vector<domain::models::Asset> assets;

    int64_t total() const { return static_cast<int64_t>(assets.size()); }
};

class AssetStream {
public:
    /// Reads up to limit rows starting at offset; may throw
    using Fetcher = std::function<std::vector<domain::models::Asset>(int64_t offset, int64_t limit)>;

    /**
     * @throws std::invalid_argument if fetcher is empty or itemLimit/batchSize < 1
     */
    AssetStream(Fetcher fetcher, int64_t startOffset, int64_t itemLimit,
                int64_t batchSize, int64_t maxOffset);

    AssetStream(AssetStream&&) = default;
    AssetStream& operator=(AssetStream&&) = default;
    AssetStream(const AssetStream&) = delete;
    AssetStream& operator=(const AssetStream&) = delete;

    /**
     * @brief Produce the next item
     *
     * A failed storage read is rethrown once; the stream is finished
     * afterwards and every later call returns std::nullopt.
     *
     * @return The next item, or std::nullopt at the end of the stream
     */
    std::optional<AssetBatch> next();

    bool finished() const { return finished_; }

    /// Storage offset of the next asset to be handed out
    int64_t offset() const { return offset_; }

    int64_t batchSize() const { return batchSize_; }

private:
    Fetcher fetcher_;
    int64_t offset_;
    int64_t itemLimit_;
    int64_t batchSize_;
    int64_t maxOffset_;

    std::vector<domain::models::Asset> window_;
    size_t cursor_ = 0;
    bool finished_ = false;
};

} // namespace services

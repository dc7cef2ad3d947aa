#include "asset_stream.h"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace services {

AssetStream::AssetStream(Fetcher fetcher, int64_t startOffset, int64_t itemLimit,
                         int64_t batchSize, int64_t maxOffset)
    : fetcher_(std::move(fetcher))
    , offset_(startOffset)
    , itemLimit_(itemLimit)
    , batchSize_(batchSize)
    , maxOffset_(maxOffset)
{
    if (!fetcher_) {
        throw std::invalid_argument("AssetStream: fetcher cannot be empty");
    }
    if (itemLimit_ < 1 || batchSize_ < 1) {
        throw std::invalid_argument("AssetStream: item limit and batch size must be positive");
    }
}

std::optional<AssetBatch> AssetStream::next() {
    if (finished_) {
        return std::nullopt;
    }

    if (cursor_ >= window_.size()) {
        if (offset_ >= maxOffset_) {
            finished_ = true;
            return std::nullopt;
        }

        window_.clear();
        cursor_ = 0;
        try {
            window_ = fetcher_(offset_, batchSize_);
        } catch (const std::exception&) {
            finished_ = true;
            throw;
        }

        if (window_.empty()) {
            finished_ = true;
            return std::nullopt;
        }
    }

    size_t remaining = window_.size() - cursor_;
    size_t take = std::min(static_cast<size_t>(itemLimit_), remaining);

    AssetBatch batch;
    batch.offset = offset_;
    auto first = window_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    batch.assets.assign(std::make_move_iterator(first),
                        std::make_move_iterator(first + static_cast<std::ptrdiff_t>(take)));

    cursor_ += take;
    offset_ += static_cast<int64_t>(take);
    return batch;
}

} // namespace services

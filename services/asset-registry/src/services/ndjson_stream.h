#pragma once

/**
 * @file ndjson_stream.h
 * @brief Encodes an AssetStream as newline-delimited JSON
 *
 * Pull-driven: each call to nextLine() or read() advances the underlying
 * stream by at most one item, so only one storage window and one
 * encoded line are held at a time. A failed storage read or item
 * encoding becomes one final {"error": ...} line.
 */

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <json/json.h>
#include "asset_stream.h"

namespace services {

class NdjsonStream {
public:
    using ItemEncoder = std::function<Json::Value(const AssetBatch&)>;
    using ErrorEncoder = std::function<Json::Value(const std::exception&)>;

    /**
     * @throws std::invalid_argument if an encoder is empty
     */
    NdjsonStream(AssetStream stream, ItemEncoder encodeItem, ErrorEncoder encodeError);

    NdjsonStream(const NdjsonStream&) = delete;
    NdjsonStream& operator=(const NdjsonStream&) = delete;

    /**
     * @brief Next line including its trailing '\n'
     * @return std::nullopt once the stream has ended or the error line was produced
     */
    std::optional<std::string> nextLine();

    /**
     * @brief Copy up to size bytes of output into buffer
     *
     * Fetches the next line only when the previous one has been fully
     * copied. A null buffer abandons the stream.
     *
     * @return Bytes written; 0 at the end of the output
     */
    size_t read(char* buffer, size_t size);

    /// Item lines produced so far, not counting an error line
    size_t itemsWritten() const { return items_; }

    bool failed() const { return failed_; }
    bool done() const { return done_; }

private:
    AssetStream stream_;
    ItemEncoder encodeItem_;
    ErrorEncoder encodeError_;

    std::string pending_;
    size_t pendingPos_ = 0;
    size_t items_ = 0;
    bool failed_ = false;
    bool done_ = false;
};

} // namespace services

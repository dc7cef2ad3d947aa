#include "ndjson_stream.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace services {

namespace {

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

NdjsonStream::NdjsonStream(AssetStream stream, ItemEncoder encodeItem, ErrorEncoder encodeError)
    : stream_(std::move(stream)),
      encodeItem_(std::move(encodeItem)),
      encodeError_(std::move(encodeError))
{
    if (!encodeItem_ || !encodeError_) {
        throw std::invalid_argument("NdjsonStream: encoders cannot be empty");
    }
}

std::optional<std::string> NdjsonStream::nextLine() {
    if (done_) {
        return std::nullopt;
    }

    try {
        auto batch = stream_.next();
        if (!batch) {
            done_ = true;
            return std::nullopt;
        }
        std::string line = compactJson(encodeItem_(*batch)) + "\n";
        ++items_;
        return line;
    } catch (const std::exception& e) {
        done_ = true;
        failed_ = true;
        spdlog::warn("[NdjsonStream] Ending stream after {} item(s): {}", items_, e.what());

        Json::Value item;
        item["error"] = encodeError_(e);
        return compactJson(item) + "\n";
    }
}

size_t NdjsonStream::read(char* buffer, size_t size) {
    if (!buffer) {
        done_ = true;
        pending_.clear();
        pendingPos_ = 0;
        return 0;
    }
    if (size == 0) {
        return 0;
    }

    while (pendingPos_ >= pending_.size()) {
        auto line = nextLine();
        if (!line) {
            return 0;
        }
        pending_ = std::move(*line);
        pendingPos_ = 0;
    }

    size_t n = std::min(size, pending_.size() - pendingPos_);
    std::memcpy(buffer, pending_.data() + pendingPos_, n);
    pendingPos_ += n;
    return n;
}

} // namespace services

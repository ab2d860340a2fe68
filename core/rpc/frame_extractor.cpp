#include "frame_extractor.hpp"

#include "codec.hpp"
#include "logging/logger.hpp"

namespace tether {
namespace rpc {

namespace {

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return false;
        }
    }
    return true;
}

}  // namespace

FrameExtractor::FrameExtractor(size_t max_buffered_bytes) : max_buffered_bytes_(max_buffered_bytes) {}

std::vector<ExtractedItem> FrameExtractor::feed(std::string_view chunk) {
    std::vector<ExtractedItem> items;
    if (chunk.empty()) {
        return items;
    }

    if (buffer_.empty()) {
        if (try_whole_chunk(chunk, items)) {
            return items;
        }
        if (try_lines(chunk, items)) {
            LOG_DEBUG("[Frames] Received " << items.size() << " newline-delimited messages");
            return items;
        }
    }

    buffer_.append(chunk.data(), chunk.size());

    std::string object;
    while (next_object(object)) {
        Message message;
        std::string error;
        if (decode_message(object, message, error)) {
            items.emplace_back(std::move(message));
        } else {
            LOG_ERROR("[Frames] Failed to decode extracted JSON message (" << error << "): " << object);
            items.emplace_back(DecodeFailure{std::move(object), std::move(error)});
        }
        object.clear();
    }

    if (in_object_) {
        // Keep only the open object; scanner offsets shift with it
        buffer_.erase(0, object_start_);
        scan_pos_ -= object_start_;
        object_start_ = 0;
    } else {
        // Nothing object-like left: the remainder is noise
        buffer_.clear();
        reset_scanner();
    }

    if (buffer_.size() > max_buffered_bytes_) {
        LOG_ERROR("[Frames] Buffered " << buffer_.size() << " bytes without a complete object, discarding");
        items.emplace_back(DecodeFailure{std::string(), "Incomplete message exceeds " +
                                                            std::to_string(max_buffered_bytes_) + " bytes"});
        reset();
    }

    return items;
}

void FrameExtractor::reset() {
    buffer_.clear();
    reset_scanner();
}

bool FrameExtractor::try_whole_chunk(std::string_view chunk, std::vector<ExtractedItem> &out) const {
    Message message;
    std::string error;
    if (!decode_message(chunk, message, error)) {
        return false;
    }
    out.emplace_back(std::move(message));
    return true;
}

bool FrameExtractor::try_lines(std::string_view chunk, std::vector<ExtractedItem> &out) const {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= chunk.size()) {
        size_t end = chunk.find('\n', start);
        if (end == std::string_view::npos) {
            end = chunk.size();
        }
        std::string_view line = chunk.substr(start, end - start);
        if (!is_blank(line)) {
            lines.push_back(line);
        }
        start = end + 1;
    }

    // A single line was already covered by the whole-chunk attempt
    if (lines.size() < 2) {
        return false;
    }

    std::vector<ExtractedItem> decoded;
    decoded.reserve(lines.size());
    for (auto line : lines) {
        Message message;
        std::string error;
        if (!decode_message(line, message, error)) {
            return false;
        }
        decoded.emplace_back(std::move(message));
    }

    for (auto &item : decoded) {
        out.push_back(std::move(item));
    }
    return true;
}

bool FrameExtractor::next_object(std::string &object) {
    while (scan_pos_ < buffer_.size()) {
        const char c = buffer_[scan_pos_];

        if (!in_object_) {
            // Bytes before the opening brace are skipped
            if (c == '{') {
                object_start_ = scan_pos_;
                in_object_ = true;
                depth_ = 1;
            }
            ++scan_pos_;
            continue;
        }

        if (escaped_) {
            escaped_ = false;
        } else if (in_string_) {
            if (c == '\\') {
                escaped_ = true;
            } else if (c == '"') {
                in_string_ = false;
            }
        } else if (c == '"') {
            in_string_ = true;
        } else if (c == '{') {
            ++depth_;
        } else if (c == '}') {
            --depth_;
            if (depth_ == 0) {
                ++scan_pos_;
                object.assign(buffer_, object_start_, scan_pos_ - object_start_);
                in_object_ = false;
                object_start_ = 0;
                return true;
            }
        }
        ++scan_pos_;
    }
    return false;
}

void FrameExtractor::reset_scanner() {
    scan_pos_ = 0;
    object_start_ = 0;
    in_object_ = false;
    depth_ = 0;
    in_string_ = false;
    escaped_ = false;
}

}  // namespace rpc
}  // namespace tether

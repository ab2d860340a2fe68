#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "json_rpc.hpp"

namespace tether {
namespace rpc {

// Upper bound on bytes held while waiting for an object to close: 16 MiB
constexpr size_t kMaxBufferedBytes = 16u * 1024u * 1024u;

// A slice that looked like a JSON object but did not decode as JSON-RPC
struct DecodeFailure {
    std::string payload;
    std::string error;
};

using ExtractedItem = std::variant<Message, DecodeFailure>;

// FrameExtractor turns transport chunks into JSON-RPC messages.
//
// A peer may deliver one document per chunk, several newline-joined
// documents per chunk, or one document split over several chunks. Each
// chunk is tried against two fast paths while nothing is buffered (whole
// chunk as one document; every non-blank line as a document), then falls
// back to a string-aware brace scanner over an internal buffer. Bytes
// before the first '{' are dropped. Not thread-safe; owned by one reader.
class FrameExtractor {
public:
    explicit FrameExtractor(size_t max_buffered_bytes = kMaxBufferedBytes);

    // Returns everything that became complete with this chunk, in wire order
    std::vector<ExtractedItem> feed(std::string_view chunk);

    // Drops any partial document
    void reset();

    size_t buffered_size() const { return buffer_.size(); }
    bool has_partial() const { return !buffer_.empty(); }

private:
    bool try_whole_chunk(std::string_view chunk, std::vector<ExtractedItem> &out) const;
    bool try_lines(std::string_view chunk, std::vector<ExtractedItem> &out) const;

    // Advances the scanner over the buffer and copies the next complete
    // object into 'object'. The buffer is compacted once per feed().
    bool next_object(std::string &object);
    void reset_scanner();

    const size_t max_buffered_bytes_;
    std::string buffer_;

    // Scanner state, kept between chunks so each byte is visited once
    size_t scan_pos_ = 0;
    size_t object_start_ = 0;  // Valid while in_object_
    bool in_object_ = false;
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;
};

}  // namespace rpc
}  // namespace tether

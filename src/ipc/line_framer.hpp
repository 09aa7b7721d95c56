#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace plughost::ipc {

// Reassembles terminator-delimited messages from a byte stream. Blank lines
// are skipped.
class LineFramer {
public:
    explicit LineFramer(size_t max_buffered = 64 * 1024 * 1024, char terminator = '\n')
        : max_buffered_(max_buffered), terminator_(terminator) {}

    // Append received bytes; returns the complete messages in arrival order
    std::vector<std::string> feed(const char* data, size_t len);

    // Bytes of an incomplete message held back
    size_t buffered() const { return buffer_.size(); }

    // True once an incomplete message exceeds max_buffered
    bool overflowed() const { return buffer_.size() > max_buffered_; }

    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
    size_t max_buffered_;
    char terminator_;
};

} // namespace plughost::ipc

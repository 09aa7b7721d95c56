#include "ipc/line_framer.hpp"

namespace plughost::ipc {

namespace {

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::vector<std::string> LineFramer::feed(const char* data, size_t len) {
    std::vector<std::string> messages;
    buffer_.append(data, len);

    size_t start = 0;
    size_t pos;
    while ((pos = buffer_.find(terminator_, start)) != std::string::npos) {
        std::string line = buffer_.substr(start, pos - start);
        start = pos + 1;
        if (!is_blank(line)) {
            messages.push_back(std::move(line));
        }
    }

    buffer_.erase(0, start);
    return messages;
}

} // namespace plughost::ipc

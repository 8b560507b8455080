#include "fablecore/tag_filter.hpp"

namespace fablecore {

std::string TagFilter::feed(const std::string& chunk) {
    buffer_ += chunk;

    std::string out;
    std::size_t pos = 0;
    while (true) {
        std::size_t open = buffer_.find(kOpen, pos);
        if (open == std::string::npos) {
            std::size_t end = buffer_.size();
            if (end > pos && buffer_[end - 1] == '<') {
                --end;
            }
            out.append(buffer_, pos, end - pos);
            buffer_.erase(0, end);
            return out;
        }

        std::size_t close = buffer_.find(kClose, open + 2);
        out.append(buffer_, pos, open - pos);
        if (close == std::string::npos) {
            buffer_.erase(0, open);
            return out;
        }
        pos = close + 2;
    }
}

std::string TagFilter::finish() {
    std::string rest = strip_complete_tags(buffer_);
    buffer_.clear();
    return rest;
}

std::string TagFilter::strip_complete_tags(const std::string& text) {
    std::string out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t open = text.find(kOpen, pos);
        if (open == std::string::npos) break;
        std::size_t close = text.find(kClose, open + 2);
        if (close == std::string::npos) break;
        out.append(text, pos, open - pos);
        pos = close + 2;
    }
    if (pos < text.size()) {
        out.append(text, pos, std::string::npos);
    }
    return out;
}

} // namespace fablecore

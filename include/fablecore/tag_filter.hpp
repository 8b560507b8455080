#pragma once

#include <string>

namespace fablecore {

/**
 * Strips `<<...>>` control tags (speaker markers and the like) from a
 * streamed narration.
 *
 * Text is released as soon as it is known not to belong to a tag. An
 * unmatched "<<", or a single trailing "<", is held back until the next
 * chunk decides it, so a tag split across chunks never leaks.
 */
class TagFilter {
public:
    static constexpr const char* kOpen = "<<";
    static constexpr const char* kClose = ">>";

    /**
     * Add a chunk; returns the text that is now safe to emit (maybe empty).
     */
    std::string feed(const std::string& chunk);

    /**
     * End of stream: complete tags are stripped and whatever else is held
     * is released verbatim.
     */
    std::string finish();

    bool holding() const { return !buffer_.empty(); }

    static std::string strip_complete_tags(const std::string& text);

private:
    std::string buffer_;
};

} // namespace fablecore

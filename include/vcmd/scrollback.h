#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace vcmd {

// Every row of the screen taken just before new output is written:
// plain text for comparison, styled text for storage.
struct ScreenSnapshot {
    std::vector<std::string> plain;
    std::vector<std::string> styled;
};

// True if the line has nothing but whitespace
bool isBlankLine(const std::string& line);

//=============================================================================
// ScrollbackStore - bounded FIFO of rows that scrolled off the live screen
//=============================================================================

class ScrollbackStore {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10000;
    static constexpr size_t DEFAULT_DEDUP_WINDOW = 20;

    explicit ScrollbackStore(size_t capacity = DEFAULT_CAPACITY,
                             size_t dedupWindow = DEFAULT_DEDUP_WINDOW);

    // Append a styled line unless an identical one is among the last
    // dedupWindow entries. Trims from the front. Returns true if stored.
    bool append(const std::string& styledLine);

    // Compare the pre-write snapshot with the new top row and store whatever
    // scrolled off. Returns the number of lines actually stored.
    size_t capture(const ScreenSnapshot& before, const std::string& newTopPlain);

    size_t size() const { return _lines.size(); }
    bool empty() const { return _lines.empty(); }
    size_t capacity() const { return _capacity; }
    size_t dedupWindow() const { return _dedupWindow; }

    const std::string& line(size_t index) const { return _lines[index]; }
    const std::deque<std::string>& lines() const { return _lines; }

    void clear() { _lines.clear(); }

private:
    bool isRecentDuplicate(const std::string& line) const;
    void trim();

    std::deque<std::string> _lines;
    size_t _capacity;
    size_t _dedupWindow;
};

} // namespace vcmd

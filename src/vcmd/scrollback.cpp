#include <vcmd/scrollback.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>

namespace vcmd {

bool isBlankLine(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

ScrollbackStore::ScrollbackStore(size_t capacity, size_t dedupWindow)
    : _capacity(capacity > 0 ? capacity : 1)
    , _dedupWindow(dedupWindow) {}

bool ScrollbackStore::isRecentDuplicate(const std::string& line) const {
    size_t n = std::min(_dedupWindow, _lines.size());
    for (size_t i = 0; i < n; ++i) {
        if (_lines[_lines.size() - 1 - i] == line) {
            return true;
        }
    }
    return false;
}

void ScrollbackStore::trim() {
    while (_lines.size() > _capacity) {
        _lines.pop_front();
    }
}

bool ScrollbackStore::append(const std::string& styledLine) {
    if (isRecentDuplicate(styledLine)) {
        return false;
    }
    _lines.push_back(styledLine);
    trim();
    return true;
}

size_t ScrollbackStore::capture(const ScreenSnapshot& before, const std::string& newTopPlain) {
    const size_t rows = std::min(before.plain.size(), before.styled.size());
    if (rows == 0) return 0;

    // Row 0 matching means nothing moved; start at 1.
    size_t scrollAmount = 0;
    if (!isBlankLine(newTopPlain)) {
        for (size_t i = 1; i < rows; ++i) {
            if (!isBlankLine(before.plain[i]) && before.plain[i] == newTopPlain) {
                scrollAmount = i;
                break;
            }
        }
    }

    size_t added = 0;
    if (scrollAmount > 0) {
        for (size_t i = 0; i < scrollAmount; ++i) {
            if (!isBlankLine(before.plain[i]) && append(before.styled[i])) {
                ++added;
            }
        }
    } else if (before.plain[0] != newTopPlain && !isBlankLine(before.plain[0])) {
        // Scroll amount not detectable (large burst or full redraw):
        // keep every non-blank old row rather than lose history.
        for (size_t i = 0; i < rows; ++i) {
            if (!isBlankLine(before.plain[i]) && append(before.styled[i])) {
                ++added;
            }
        }
        ydebug("ScrollbackStore::capture: undetected scroll, captured {} rows", added);
    }
    return added;
}

} // namespace vcmd

#pragma once

#include <string>
#include <vector>

namespace vcmd {

struct TextPosition {
    int line = 0;
    int col = 0;

    bool operator==(const TextPosition& o) const { return line == o.line && col == o.col; }
    bool operator!=(const TextPosition& o) const { return !(*this == o); }
    bool operator<(const TextPosition& o) const {
        return line < o.line || (line == o.line && col < o.col);
    }
};

//=============================================================================
// SelectionModel - character range over the rendered text
//
// Positions are (line, screen column). A line given a column map translates
// screen columns to codepoints through it; other lines treat columns as
// codepoint indices. The end column is exclusive: start(0,7) to (0,12) over
// "Hello, World!" selects "World".
//=============================================================================

class SelectionModel {
public:
    void start(int line, int col);
    void update(int line, int col);
    void end();
    void clear();

    bool isActive() const { return _active; }
    bool isComplete() const { return _complete; }

    // A completed selection with start != end
    bool hasSelection() const;

    // Normalized (start <= end) range
    TextPosition rangeStart() const;
    TextPosition rangeEnd() const;

    // Range membership for rendering; true while dragging as well
    bool isSelected(int line, int col) const;

    // columnMaps[i][c]: codepoint index where screen column c of line i
    // starts, with one extra entry for the end of the row
    void setContent(std::vector<std::string> lines, std::vector<std::vector<int>> columnMaps = {}) {
        _content = std::move(lines);
        _columnMaps = std::move(columnMaps);
    }
    const std::vector<std::string>& content() const { return _content; }

    // Clamped extraction, never fails
    std::string selectedText() const;

private:
    int textColumn(int line, int col) const;

    bool _active = false;
    bool _complete = false;
    TextPosition _anchor;
    TextPosition _cursor;
    std::vector<std::string> _content;
    std::vector<std::vector<int>> _columnMaps;
};

} // namespace vcmd

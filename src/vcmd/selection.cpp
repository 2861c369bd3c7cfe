#include <vcmd/selection.h>
#include <algorithm>
#include <limits>

namespace vcmd {

void SelectionModel::start(int line, int col) {
    _active = true;
    _complete = false;
    _anchor = {line, col};
    _cursor = {line, col};
}

void SelectionModel::update(int line, int col) {
    if (!_active) return;
    _cursor = {line, col};
}

void SelectionModel::end() {
    if (!_active) return;
    _active = false;
    _complete = true;
}

void SelectionModel::clear() {
    _active = false;
    _complete = false;
    _anchor = {};
    _cursor = {};
}

bool SelectionModel::hasSelection() const {
    return _complete && _anchor != _cursor;
}

TextPosition SelectionModel::rangeStart() const {
    return _cursor < _anchor ? _cursor : _anchor;
}

TextPosition SelectionModel::rangeEnd() const {
    return _cursor < _anchor ? _anchor : _cursor;
}

bool SelectionModel::isSelected(int line, int col) const {
    if (!_active && !_complete) return false;
    if (_anchor == _cursor) return false;

    TextPosition s = rangeStart();
    TextPosition e = rangeEnd();
    if (line < s.line || line > e.line) return false;
    if (s.line == e.line) return col >= s.col && col < e.col;
    if (line == s.line) return col >= s.col;
    if (line == e.line) return col < e.col;
    return true;
}

namespace {

// Byte offset of the col-th codepoint, or line.size() past the end
size_t byteOffset(const std::string& line, int col) {
    size_t pos = 0;
    for (int i = 0; i < col && pos < line.size(); ++i) {
        ++pos;
        while (pos < line.size() && (static_cast<unsigned char>(line[pos]) & 0xC0) == 0x80) {
            ++pos;
        }
    }
    return pos;
}

// Columns are codepoint indices
std::string clampedSubstr(const std::string& line, int from, int to) {
    if (from < 0) from = 0;
    if (to <= from) return {};
    size_t b = byteOffset(line, from);
    size_t e = byteOffset(line, to);
    if (b >= e) return {};
    return line.substr(b, e - b);
}

} // namespace

int SelectionModel::textColumn(int line, int col) const {
    col = std::max(col, 0);
    if (line < 0 || line >= static_cast<int>(_columnMaps.size())) return col;
    const auto& map = _columnMaps[line];
    if (map.empty()) return col;
    if (col >= static_cast<int>(map.size())) return map.back();
    return map[col];
}

std::string SelectionModel::selectedText() const {
    if (!hasSelection() || _content.empty()) return {};

    TextPosition s = rangeStart();
    TextPosition e = rangeEnd();
    const int count = static_cast<int>(_content.size());

    if (s.line < 0) s = {0, 0};
    if (s.line >= count) return {};
    if (e.line >= count) {
        e.line = count - 1;
        e.col = std::numeric_limits<int>::max();
    }
    const int from = textColumn(s.line, s.col);
    const int to = textColumn(e.line, e.col);

    if (s.line == e.line) {
        return clampedSubstr(_content[s.line], from, to);
    }

    std::string out = _content[s.line].substr(byteOffset(_content[s.line], from));
    for (int i = s.line + 1; i < e.line; ++i) {
        out += '\n';
        out += _content[i];
    }
    out += '\n';
    out += clampedSubstr(_content[e.line], 0, to);
    return out;
}

} // namespace vcmd

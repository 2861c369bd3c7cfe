//=============================================================================
// Scrollback Tests
//
// Covers: bounded append, recent-duplicate suppression, scroll detection
//=============================================================================

#include <boost/ut.hpp>
#include <vcmd/scrollback.h>

using namespace boost::ut;
using namespace vcmd;

namespace {

ScreenSnapshot snapshotOf(const std::vector<std::string>& rows) {
    ScreenSnapshot snap;
    snap.plain = rows;
    snap.styled = rows;
    return snap;
}

} // namespace

suite scrollback_tests = [] {
    "store never exceeds its capacity"_test = [] {
        ScrollbackStore store(5, 0);
        for (int i = 0; i < 8; ++i) {
            store.append("l" + std::to_string(i));
        }
        expect(store.size() == 5_u);
        expect(store.line(0) == "l3") << "oldest lines are dropped first";
        expect(store.line(4) == "l7");
    };

    "identical line within the window is rejected"_test = [] {
        ScrollbackStore store(100, 3);
        expect(store.append("a"));
        expect(store.append("b"));
        expect(!store.append("a"));
        expect(store.size() == 2_u);
    };

    "identical line beyond the window is stored"_test = [] {
        ScrollbackStore store(100, 3);
        for (const char* s : {"a", "b", "c", "d"}) {
            store.append(s);
        }
        expect(store.append("a"));
        expect(store.size() == 5_u);
    };

    "no two equal lines inside any window span"_test = [] {
        ScrollbackStore store(1000, 4);
        for (int i = 0; i < 200; ++i) {
            store.append("x" + std::to_string(i % 6));
        }
        const auto& lines = store.lines();
        for (size_t i = 0; i < lines.size(); ++i) {
            for (size_t j = i + 1; j < lines.size() && j <= i + 4; ++j) {
                expect(lines[i] != lines[j]) << "duplicate at" << i << "and" << j;
            }
        }
    };

    "single line scroll captures the old top row"_test = [] {
        ScrollbackStore store;
        size_t added = store.capture(snapshotOf({"a", "b", "c"}), "b");
        expect(added == 1_u);
        expect(store.line(0) == "a");
    };

    "multi line scroll captures every scrolled row"_test = [] {
        ScrollbackStore store;
        size_t added = store.capture(snapshotOf({"a", "b", "c", "d"}), "c");
        expect(added == 2_u);
        expect(store.line(0) == "a");
        expect(store.line(1) == "b");
    };

    "unchanged top row captures nothing"_test = [] {
        ScrollbackStore store;
        expect(store.capture(snapshotOf({"a", "b", "c"}), "a") == 0_u);
        expect(store.empty());
    };

    "undetectable scroll keeps all non-blank old rows"_test = [] {
        ScrollbackStore store;
        size_t added = store.capture(snapshotOf({"a", "", "c"}), "zzz");
        expect(added == 2_u);
        expect(store.line(0) == "a");
        expect(store.line(1) == "c");
    };

    "blank rows are never stored"_test = [] {
        ScrollbackStore store;
        store.capture(snapshotOf({"", "  ", "x"}), "x");
        expect(store.empty());
    };

    "blank screen top is not treated as a scroll"_test = [] {
        ScrollbackStore store;
        expect(store.capture(snapshotOf({"", "", ""}), "hello") == 0_u);
    };

    "isBlankLine"_test = [] {
        expect(isBlankLine(""));
        expect(isBlankLine(" \t "));
        expect(!isBlankLine(" x "));
    };
};

#include "utils.hpp"
#include "notebook/selection.hpp"

namespace jotter::test {

using namespace jotter::notebook;

TEST_CASE("001: selection transitions compute the intended range", "[001][selection]") {
    SelectionRange r{3, 4};

    CHECK(select_first() == SelectionRange{0, 1});
    CHECK(select_last(10) == SelectionRange{10, 11});
    CHECK(select_all(10) == SelectionRange{0, 11});
    CHECK(move_up(r) == SelectionRange{2, 3});
    CHECK(move_down(r) == SelectionRange{4, 5});
    CHECK(move_up(r, PAGE_SIZE) == SelectionRange{-2, -1});
    CHECK(move_down(r, PAGE_SIZE) == SelectionRange{8, 9});
    CHECK(extend_up(r) == SelectionRange{2, 4});
    CHECK(extend_down(r) == SelectionRange{4, 2});
}

TEST_CASE("001: extend flips the anchor only at the boundary", "[001][selection]") {
    SECTION("extend-up from a backward range flips once") {
        CHECK(extend_up({4, 3}) == SelectionRange{3, 5});
        CHECK(extend_up({5, 3}) == SelectionRange{4, 3});
    }
    SECTION("extend-down from a single cell flips to a backward range") {
        CHECK(extend_down({2, 3}) == SelectionRange{3, 1});
        CHECK(extend_down({3, 1}) == SelectionRange{4, 1});
        CHECK(indices({4, 1}) == std::vector<int>{4, 3, 2});
    }
}

TEST_CASE("001: select-all then select-first always yields the first cell", "[001][selection]") {
    for (int n = 1; n <= 12; n++) {
        SelectionState state(n);
        state.set_range({n / 2, n / 2 + 1});
        state.apply(SelectionCommand::SELECT_ALL);
        state.apply(SelectionCommand::SELECT_FIRST);
        CHECK(state.range() == SelectionRange{0, 1});
    }
}

TEST_CASE("001: move-down then move-up returns to the start", "[001][selection]") {
    for (int start = 0; start < 8; start++) {
        SelectionRange r{start, start + 1};
        CHECK(move_up(move_down(r)) == r);
    }
}

TEST_CASE("001: repeated extend-up from a single cell grows the low edge", "[001][selection]") {
    SelectionRange r{6, 7};
    int previous = r.start;
    for (int i = 0; i < 5; i++) {
        r = extend_up(r);
        CHECK(r.start == previous - 1);
        CHECK(r.stop == 7);
        previous = r.start;
    }
}

TEST_CASE("001: select-last then extend-up on ten cells", "[001][selection]") {
    SelectionState state(10);
    state.apply(SelectionCommand::SELECT_LAST);
    CHECK(state.range() == SelectionRange{10, 11});

    // (N, N+1) is one past the last cell; resolution snaps it onto cell 9
    CHECK(state.selected() == std::vector<int>{9});

    state.apply(SelectionCommand::EXTEND_UP);
    CHECK(state.range() == SelectionRange{9, 11});
    CHECK(state.selected() == std::vector<int>{9});

    std::vector<SelectionRange> expected = {{8, 11}, {7, 11}, {6, 11}, {5, 11}};
    for (const auto& next : expected) {
        state.apply(SelectionCommand::EXTEND_UP);
        CHECK(state.range() == next);
    }
    CHECK(state.selected() == std::vector<int>{5, 6, 7, 8, 9});
}

TEST_CASE("001: normalize clamps onto real cells", "[001][selection][normalize]") {
    SECTION("empty notebook has no selection") {
        CHECK(indices(normalize({0, 1}, 0)).empty());
        CHECK(indices(normalize({-3, 7}, 0)).empty());
    }
    SECTION("forward ranges clamp to [0, N)") {
        CHECK(normalize({0, 11}, 10) == SelectionRange{0, 10});
        CHECK(normalize({-2, 3}, 10) == SelectionRange{0, 3});
    }
    SECTION("ranges past either end snap to the nearest cell") {
        CHECK(normalize({10, 11}, 10) == SelectionRange{9, 10});
        CHECK(normalize({-5, -4}, 10) == SelectionRange{0, 1});
        CHECK(normalize({0, 1}, 1) == SelectionRange{0, 1});
        CHECK(normalize({1, 2}, 1) == SelectionRange{0, 1});
    }
    SECTION("backward ranges keep their direction") {
        CHECK(normalize({4, 1}, 10) == SelectionRange{4, 1});
        CHECK(normalize({12, 7}, 10) == SelectionRange{9, 7});
        CHECK(indices(normalize({2, -4}, 10)) == std::vector<int>{2, 1, 0});
    }
    SECTION("normalization is idempotent") {
        const SelectionRange samples[] = {{10, 11}, {-5, -4}, {0, 11}, {12, 7}, {2, -4}, {3, 3}, {4, 1}};
        for (int n : {0, 1, 3, 10}) {
            for (const auto& r : samples) {
                auto once = normalize(r, n);
                CHECK(normalize(once, n) == once);
                for (int index : indices(once)) {
                    CHECK(index >= 0);
                    CHECK(index < n);
                }
            }
        }
    }
}

TEST_CASE("001: commands on an empty notebook are no-ops", "[001][selection]") {
    SelectionState state;
    auto before = state.range();
    for (auto command : {SelectionCommand::SELECT_FIRST, SelectionCommand::SELECT_LAST,
                         SelectionCommand::MOVE_UP, SelectionCommand::EXTEND_DOWN,
                         SelectionCommand::PAGE_DOWN}) {
        CHECK_FALSE(state.apply(command));
    }
    CHECK(state.range() == before);
    CHECK(state.selected().empty());
}

TEST_CASE("001: moving past the top keeps the overshoot", "[001][selection]") {
    SelectionState state(4);
    state.apply(SelectionCommand::MOVE_UP);
    state.apply(SelectionCommand::MOVE_UP);
    CHECK(state.range() == SelectionRange{-2, -1});
    CHECK(state.selected() == std::vector<int>{0});

    state.apply(SelectionCommand::MOVE_DOWN);
    CHECK(state.range() == SelectionRange{-1, 0});
    CHECK(state.selected() == std::vector<int>{0});
}

TEST_CASE("001: command names round trip", "[001][selection]") {
    CHECK(selection_command_from_string("extend-cell-selection-up") == SelectionCommand::EXTEND_UP);
    CHECK(selection_command_from_string("select-5th-next-cell") == SelectionCommand::PAGE_DOWN);
    CHECK_FALSE(selection_command_from_string("select-everything").has_value());
}

} // namespace jotter::test

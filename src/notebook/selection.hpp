#pragma once
#include <optional>
#include <string>
#include <vector>

namespace jotter::notebook {

// Cells moved by page-up / page-down
constexpr int PAGE_SIZE = 5;

// Half-open [start, stop) over the cells. stop < start is a backward
// range anchored at start, covering start down to stop + 1.
struct SelectionRange {
    int start = 0;
    int stop = 1;

    bool forward() const { return stop >= start; }
    bool operator==(const SelectionRange& other) const {
        return start == other.start && stop == other.stop;
    }
    bool operator!=(const SelectionRange& other) const { return !(*this == other); }
};

enum class SelectionCommand {
    SELECT_FIRST,
    SELECT_LAST,
    SELECT_ALL,
    MOVE_UP,
    MOVE_DOWN,
    PAGE_UP,
    PAGE_DOWN,
    EXTEND_UP,
    EXTEND_DOWN
};

const char* selection_command_to_string(SelectionCommand command);
std::optional<SelectionCommand> selection_command_from_string(const std::string& str);

// Transitions. These compute the intended range and never clamp.
SelectionRange select_first();
SelectionRange select_last(int cell_count);   // (N, N+1): one past the last cell
SelectionRange select_all(int cell_count);    // (0, N+1)
SelectionRange move_up(SelectionRange range, int step = 1);
SelectionRange move_down(SelectionRange range, int step = 1);
SelectionRange extend_up(SelectionRange range);
SelectionRange extend_down(SelectionRange range);

SelectionRange apply(SelectionCommand command, SelectionRange range, int cell_count);

// Clamp onto real cells. Empty result only when cell_count == 0; a range
// that falls entirely outside snaps to the nearest cell. Idempotent.
SelectionRange normalize(SelectionRange range, int cell_count);

// Cell indices covered by range, in selection order
std::vector<int> indices(SelectionRange range);

// Selection of one notebook: the intended range plus the cell count
class SelectionState {
public:
    explicit SelectionState(int cell_count = 0);

    // No-op (returns false) when there are no cells
    bool apply(SelectionCommand command);

    SelectionRange range() const { return range_; }
    void set_range(SelectionRange range) { range_ = range; }

    int cell_count() const { return cell_count_; }
    void set_cell_count(int cell_count);

    // Normalized range and the cells it covers
    SelectionRange resolved() const;
    std::vector<int> selected() const;

    bool empty() const { return cell_count_ == 0; }

private:
    SelectionRange range_;
    int cell_count_;
};

} // namespace jotter::notebook

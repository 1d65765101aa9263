#include "notebook/selection.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace jotter::notebook {

const char* selection_command_to_string(SelectionCommand command) {
    switch (command) {
        case SelectionCommand::SELECT_FIRST: return "select-first-cell";
        case SelectionCommand::SELECT_LAST: return "select-last-cell";
        case SelectionCommand::SELECT_ALL: return "select-all-cells";
        case SelectionCommand::MOVE_UP: return "select-previous-cell";
        case SelectionCommand::MOVE_DOWN: return "select-next-cell";
        case SelectionCommand::PAGE_UP: return "select-5th-previous-cell";
        case SelectionCommand::PAGE_DOWN: return "select-5th-next-cell";
        case SelectionCommand::EXTEND_UP: return "extend-cell-selection-up";
        case SelectionCommand::EXTEND_DOWN: return "extend-cell-selection-down";
        default: return "unknown";
    }
}

std::optional<SelectionCommand> selection_command_from_string(const std::string& str) {
    for (auto command : {SelectionCommand::SELECT_FIRST, SelectionCommand::SELECT_LAST,
                         SelectionCommand::SELECT_ALL, SelectionCommand::MOVE_UP,
                         SelectionCommand::MOVE_DOWN, SelectionCommand::PAGE_UP,
                         SelectionCommand::PAGE_DOWN, SelectionCommand::EXTEND_UP,
                         SelectionCommand::EXTEND_DOWN}) {
        if (str == selection_command_to_string(command)) {
            return command;
        }
    }
    return std::nullopt;
}

SelectionRange select_first() {
    return {0, 1};
}

SelectionRange select_last(int cell_count) {
    return {cell_count, cell_count + 1};
}

SelectionRange select_all(int cell_count) {
    return {0, cell_count + 1};
}

SelectionRange move_up(SelectionRange range, int step) {
    return {range.start - step, range.start - step + 1};
}

SelectionRange move_down(SelectionRange range, int step) {
    return {range.start + step, range.start + step + 1};
}

SelectionRange extend_up(SelectionRange range) {
    if (range.start - 1 == range.stop) {
        return {range.stop, range.start + 1};
    }
    return {range.start - 1, range.stop};
}

SelectionRange extend_down(SelectionRange range) {
    if (range.start + 1 == range.stop) {
        return {range.stop, range.start - 1};
    }
    return {range.start + 1, range.stop};
}

SelectionRange apply(SelectionCommand command, SelectionRange range, int cell_count) {
    switch (command) {
        case SelectionCommand::SELECT_FIRST: return select_first();
        case SelectionCommand::SELECT_LAST: return select_last(cell_count);
        case SelectionCommand::SELECT_ALL: return select_all(cell_count);
        case SelectionCommand::MOVE_UP: return move_up(range);
        case SelectionCommand::MOVE_DOWN: return move_down(range);
        case SelectionCommand::PAGE_UP: return move_up(range, PAGE_SIZE);
        case SelectionCommand::PAGE_DOWN: return move_down(range, PAGE_SIZE);
        case SelectionCommand::EXTEND_UP: return extend_up(range);
        case SelectionCommand::EXTEND_DOWN: return extend_down(range);
    }
    return range;
}

SelectionRange normalize(SelectionRange range, int cell_count) {
    if (cell_count <= 0) {
        return {0, 0};
    }

    int nearest = std::clamp(range.start, 0, cell_count - 1);

    if (range.forward()) {
        int lo = std::max(range.start, 0);
        int hi = std::min(range.stop, cell_count);
        if (lo >= hi) {
            return {nearest, nearest + 1};
        }
        return {lo, hi};
    }

    // Backward: start, start-1, ..., stop+1
    int first = std::min(range.start, cell_count - 1);
    int last = std::max(range.stop + 1, 0);
    if (first < last) {
        return {nearest, nearest + 1};
    }
    return {first, last - 1};
}

std::vector<int> indices(SelectionRange range) {
    std::vector<int> result;
    if (range.forward()) {
        for (int i = range.start; i < range.stop; i++) {
            result.push_back(i);
        }
    } else {
        for (int i = range.start; i > range.stop; i--) {
            result.push_back(i);
        }
    }
    return result;
}

SelectionState::SelectionState(int cell_count)
    : cell_count_(std::max(cell_count, 0)) {}

bool SelectionState::apply(SelectionCommand command) {
    if (cell_count_ == 0) {
        spdlog::debug("Ignoring {}: notebook has no cells", selection_command_to_string(command));
        return false;
    }
    range_ = notebook::apply(command, range_, cell_count_);
    return true;
}

void SelectionState::set_cell_count(int cell_count) {
    cell_count_ = std::max(cell_count, 0);
}

SelectionRange SelectionState::resolved() const {
    return normalize(range_, cell_count_);
}

std::vector<int> SelectionState::selected() const {
    return indices(resolved());
}

} // namespace jotter::notebook

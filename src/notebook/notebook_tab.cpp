#include "notebook/notebook_tab.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>
#include "ipc/protocol.hpp"

namespace jotter::notebook {

using json = nlohmann::json;

namespace {

void assign_id(Cell& cell) {
    if (cell.id.empty()) {
        cell.id = ipc::new_msg_id().substr(0, 8);
    }
}

} // namespace

NotebookTab::~NotebookTab() {
    // Route callbacks point into cells_, so drop the session first
    close();
}

void NotebookTab::add_cell(Cell cell) {
    assign_id(cell);
    cells_.push_back(std::move(cell));
    selection_.set_cell_count(static_cast<int>(cells_.size()));
}

void NotebookTab::set_cells(std::vector<Cell> cells) {
    cells_ = std::move(cells);
    for (auto& cell : cells_) {
        assign_id(cell);
    }
    selection_.set_cell_count(static_cast<int>(cells_.size()));
    selection_.set_range(select_first());
}

bool NotebookTab::run_cell(size_t index) {
    if (index >= cells_.size()) {
        spdlog::warn("No cell {} to run", index);
        return false;
    }
    Cell& target = cells_[index];
    if (target.cell_type != "code") {
        return false;
    }
    if (!session_) {
        spdlog::warn("Cannot run cell {}: no kernel", index);
        return false;
    }

    target.outputs = json::array();
    target.execution_count.reset();

    // Cells move when others are added or deleted, so look the cell up by id
    kernel::OutputCallbacks callbacks;
    callbacks.on_output = [this, id = target.id](const json& output) {
        size_t at = 0;
        Cell* cell = find_cell(id, &at);
        if (!cell) return;
        cell->outputs.push_back(output);
        if (output_listener_) output_listener_(at, output);
    };
    callbacks.on_clear_output = [this, id = target.id](bool) {
        if (Cell* cell = find_cell(id)) cell->outputs = json::array();
    };
    callbacks.on_execution_count = [this, id = target.id](int count) {
        if (Cell* cell = find_cell(id)) cell->execution_count = count;
    };
    callbacks.on_done = [this]() {
        if (running_ > 0) --running_;
    };

    auto msg_id = session_->execute(target.source, std::move(callbacks));
    if (msg_id.empty()) {
        return false;
    }
    ++running_;
    return true;
}

size_t NotebookTab::run_selected_cells(bool advance) {
    auto selected = selection_.selected();
    if (selected.empty()) {
        return 0;
    }

    size_t sent = 0;
    for (int index : selected) {
        if (run_cell(static_cast<size_t>(index))) {
            sent++;
        }
    }

    if (advance) {
        int last = *std::max_element(selected.begin(), selected.end());
        selection_.set_range(move_down(SelectionRange{last, last + 1}));
    }
    return sent;
}

size_t NotebookTab::run_all() {
    size_t sent = 0;
    for (size_t i = 0; i < cells_.size(); i++) {
        if (run_cell(i)) {
            sent++;
        }
    }
    return sent;
}

size_t NotebookTab::run_cell_and_insert_below() {
    size_t sent = run_selected_cells(false);
    add_cell_below();
    return sent;
}

void NotebookTab::add_cell_above() {
    auto selected = selected_ascending();
    size_t at = selected.empty() ? 0 : static_cast<size_t>(selected.front());
    insert_cells(at, {Cell{}});
}

void NotebookTab::add_cell_below() {
    auto selected = selected_ascending();
    size_t at = selected.empty() ? cells_.size() : static_cast<size_t>(selected.back()) + 1;
    insert_cells(at, {Cell{}});
}

size_t NotebookTab::delete_cells() {
    auto selected = selected_ascending();
    if (selected.empty()) {
        return 0;
    }
    for (auto it = selected.rbegin(); it != selected.rend(); ++it) {
        cells_.erase(cells_.begin() + *it);
    }
    if (cells_.empty()) {
        Cell blank;
        assign_id(blank);
        cells_.push_back(std::move(blank));
    }

    int next = std::min(selected.front(), static_cast<int>(cells_.size()) - 1);
    selection_.set_cell_count(static_cast<int>(cells_.size()));
    selection_.set_range(SelectionRange{next, next + 1});
    spdlog::debug("Deleted {} cell(s)", selected.size());
    return selected.size();
}

size_t NotebookTab::copy_cells() {
    auto selected = selected_ascending();
    if (selected.empty()) {
        return 0;
    }
    clipboard_.clear();
    for (int index : selected) {
        clipboard_.push_back(cells_[index]);
    }
    return clipboard_.size();
}

size_t NotebookTab::cut_cells() {
    if (copy_cells() == 0) {
        return 0;
    }
    return delete_cells();
}

size_t NotebookTab::paste_cells() {
    if (clipboard_.empty()) {
        return 0;
    }
    auto selected = selected_ascending();
    size_t at = selected.empty() ? 0 : static_cast<size_t>(selected.back()) + 1;

    std::vector<Cell> pasted = clipboard_;
    for (auto& cell : pasted) {
        cell.id.clear();
    }
    size_t count = pasted.size();
    insert_cells(at, std::move(pasted));
    return count;
}

bool NotebookTab::merge_cells() {
    auto selected = selected_ascending();
    if (selected.size() < 2) {
        return false;
    }

    Cell& first = cells_[selected.front()];
    for (size_t i = 1; i < selected.size(); i++) {
        first.source += "\n" + cells_[selected[i]].source;
    }
    first.outputs = json::array();
    first.execution_count.reset();

    for (size_t i = selected.size() - 1; i > 0; i--) {
        cells_.erase(cells_.begin() + selected[i]);
    }
    selection_.set_cell_count(static_cast<int>(cells_.size()));
    selection_.set_range(SelectionRange{selected.front(), selected.front() + 1});
    return true;
}

std::vector<int> NotebookTab::selected_ascending() const {
    auto selected = selection_.selected();
    std::sort(selected.begin(), selected.end());
    return selected;
}

void NotebookTab::insert_cells(size_t at, std::vector<Cell> cells) {
    at = std::min(at, cells_.size());
    int first = static_cast<int>(at);
    int count = static_cast<int>(cells.size());
    for (auto& cell : cells) {
        assign_id(cell);
    }
    cells_.insert(cells_.begin() + at, std::make_move_iterator(cells.begin()),
        std::make_move_iterator(cells.end()));
    selection_.set_cell_count(static_cast<int>(cells_.size()));
    selection_.set_range(SelectionRange{first, first + count});
}

Cell* NotebookTab::find_cell(const std::string& id, size_t* index) {
    for (size_t i = 0; i < cells_.size(); i++) {
        if (cells_[i].id == id) {
            if (index) *index = i;
            return &cells_[i];
        }
    }
    return nullptr;
}

void NotebookTab::on_unrouted_output(const json& output) {
    spdlog::info("Kernel output outside any cell ({})", output.value("output_type", "?"));
}

} // namespace jotter::notebook

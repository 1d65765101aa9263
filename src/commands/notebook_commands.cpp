#include "commands/notebook_commands.hpp"
#include "commands/command_registry.hpp"
#include "notebook/notebook_tab.hpp"
#include <spdlog/spdlog.h>

namespace jotter::commands {

using notebook::SelectionCommand;

void NotebookCommands::register_commands(CommandRegistry& registry) {
    Filter notebook_has_focus = [this]() { return has_notebook(); };

    struct SelectionBinding {
        SelectionCommand command;
        std::vector<std::string> keys;
        const char* description;
    };
    const SelectionBinding selection_bindings[] = {
        {SelectionCommand::SELECT_FIRST, {"home", "c-up"}, "Select the first cell in the notebook"},
        {SelectionCommand::SELECT_LAST, {"end", "c-down"}, "Select the last cell in the notebook"},
        {SelectionCommand::SELECT_ALL, {"c-a"}, "Select all cells in the notebook"},
        {SelectionCommand::MOVE_UP, {"up", "k"}, "Go up one cell"},
        {SelectionCommand::MOVE_DOWN, {"down", "j"}, "Select the next cell"},
        {SelectionCommand::PAGE_UP, {"pageup"}, "Go up 5 cells"},
        {SelectionCommand::PAGE_DOWN, {"pagedown"}, "Go down 5 cells"},
        {SelectionCommand::EXTEND_UP, {"s-up", "K"}, "Extend the cell selection up"},
        {SelectionCommand::EXTEND_DOWN, {"s-down", "J"}, "Extend the cell selection down"},
    };

    for (const auto& binding : selection_bindings) {
        SelectionCommand command = binding.command;
        registry.add({notebook::selection_command_to_string(command), binding.keys, notebook_has_focus,
            [this, command]() { select(command); }, "notebook", binding.description});
    }

    registry.add({"interrupt-kernel", {"I I"}, notebook_has_focus,
        [this]() { interrupt_kernel(); }, "notebook", "Interrupt the notebook's kernel"});
    registry.add({"restart-kernel", {"0 0"}, notebook_has_focus,
        [this]() { restart_kernel(); }, "notebook", "Restart the notebook's kernel"});
    registry.add({"change-kernel", {}, notebook_has_focus,
        [this]() { change_kernel(); }, "notebook", "Change the notebook's kernel"});
    registry.add({"run-selected-cells", {"c-enter", "c-e"}, notebook_has_focus,
        [this]() { run_selected_cells(false); }, "notebook", "Run the selected cells"});
    registry.add({"run-selected-cells-and-select-next-cell", {"s-enter", "c-r"}, notebook_has_focus,
        [this]() { run_selected_cells(true); }, "notebook", "Run the selected cells and select the next one"});
    registry.add({"run-all-cells", {}, notebook_has_focus,
        [this]() { run_all_cells(); }, "notebook", "Run every cell in the notebook"});
    registry.add({"run-cell-and-insert-below", {"a-enter"}, notebook_has_focus,
        [this]() { edit_counted(&notebook::NotebookTab::run_cell_and_insert_below, "Sent"); },
        "notebook", "Run the selected cells and add a new cell below"});

    using notebook::NotebookTab;
    registry.add({"add-cell-above", {"a"}, notebook_has_focus,
        [this]() { edit(&NotebookTab::add_cell_above); }, "notebook", "Add a new cell above the current"});
    registry.add({"add-cell-below", {"b"}, notebook_has_focus,
        [this]() { edit(&NotebookTab::add_cell_below); }, "notebook", "Add a new cell below the current"});
    registry.add({"delete-cells", {"d d"}, notebook_has_focus,
        [this]() { edit_counted(&NotebookTab::delete_cells, "Deleted"); }, "notebook", "Delete the selected cells"});
    registry.add({"cut-cells", {"x"}, notebook_has_focus,
        [this]() { edit_counted(&NotebookTab::cut_cells, "Cut"); }, "notebook", "Cut the selected cells"});
    registry.add({"copy-cells", {"c"}, notebook_has_focus,
        [this]() { edit_counted(&NotebookTab::copy_cells, "Copied"); }, "notebook", "Copy the selected cells"});
    registry.add({"paste-cells", {"v"}, notebook_has_focus,
        [this]() { edit_counted(&NotebookTab::paste_cells, "Pasted"); }, "notebook", "Paste the clipboard below the selection"});

    Filter multiple_cells_selected = [this]() {
        auto* nb = has_notebook() ? current_tab_() : nullptr;
        return nb && nb->multiple_cells_selected();
    };
    registry.add({"merge-cells", {"M"}, multiple_cells_selected,
        [this]() {
            if (auto* nb = current_tab_()) nb->merge_cells();
        },
        "notebook", "Merge the selected cells"});
}

bool NotebookCommands::has_notebook() const {
    return current_tab_ && current_tab_() != nullptr;
}

void NotebookCommands::select(SelectionCommand command) {
    if (auto* nb = current_tab_()) {
        nb->selection().apply(command);
    }
}

void NotebookCommands::interrupt_kernel() {
    if (auto* nb = current_tab_()) {
        nb->interrupt_kernel();
    }
}

void NotebookCommands::restart_kernel() {
    if (auto* nb = current_tab_()) {
        nb->restart_kernel();
    }
}

void NotebookCommands::change_kernel() {
    if (auto* nb = current_tab_()) {
        nb->change_kernel();
    }
}

void NotebookCommands::run_selected_cells(bool advance) {
    if (auto* nb = current_tab_()) {
        size_t sent = nb->run_selected_cells(advance);
        spdlog::debug("Sent {} cell(s) to the kernel", sent);
    }
}

void NotebookCommands::run_all_cells() {
    if (auto* nb = current_tab_()) {
        nb->run_all();
    }
}

void NotebookCommands::edit(void (notebook::NotebookTab::*operation)()) {
    if (auto* nb = current_tab_()) {
        (nb->*operation)();
    }
}

void NotebookCommands::edit_counted(size_t (notebook::NotebookTab::*operation)(), const char* verb) {
    if (auto* nb = current_tab_()) {
        size_t count = (nb->*operation)();
        spdlog::debug("{} {} cell(s)", verb, count);
    }
}

} // namespace jotter::commands

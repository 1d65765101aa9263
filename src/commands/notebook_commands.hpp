#pragma once
#include <functional>
#include "notebook/selection.hpp"

namespace jotter::notebook {
class NotebookTab;
} // namespace jotter::notebook

namespace jotter::commands {

class CommandRegistry;

// Notebook group: selection, cell editing, kernel control and running cells.
// Every command acts on the current notebook and does nothing without one.
class NotebookCommands final {
public:
    using TabProvider = std::function<notebook::NotebookTab*()>;

    explicit NotebookCommands(TabProvider current_tab) : current_tab_(std::move(current_tab)) {}

    void register_commands(CommandRegistry& registry);

private:
    TabProvider current_tab_;

    bool has_notebook() const;
    void select(notebook::SelectionCommand command);
    void interrupt_kernel();
    void restart_kernel();
    void change_kernel();
    void run_selected_cells(bool advance);
    void run_all_cells();
    void edit(void (notebook::NotebookTab::*operation)());
    void edit_counted(size_t (notebook::NotebookTab::*operation)(), const char* verb);
};

} // namespace jotter::commands

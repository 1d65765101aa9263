#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "notebook/selection.hpp"
#include "tab/kernel_tab.hpp"

namespace jotter::notebook {

struct Cell {
    std::string id; // assigned when the cell joins a notebook
    std::string cell_type = "code";
    std::string source;
    nlohmann::json outputs = nlohmann::json::array();
    std::optional<int> execution_count;
};

// Called for every output a cell receives, in arrival order
using OutputListener = std::function<void(size_t cell_index, const nlohmann::json& output)>;

// Kernel tab holding a list of cells and the cell selection
class NotebookTab final : public tab::KernelTab {
public:
    using tab::KernelTab::KernelTab;
    ~NotebookTab() override;

    void add_cell(Cell cell);
    void set_cells(std::vector<Cell> cells);
    const std::vector<Cell>& cells() const { return cells_; }
    const Cell& cell(size_t index) const { return cells_.at(index); }

    SelectionState& selection() { return selection_; }
    const SelectionState& selection() const { return selection_; }

    // Execute one code cell. Its outputs are cleared and refilled as they arrive.
    bool run_cell(size_t index);

    // Run the selected code cells; advance moves the selection past them.
    // Returns the number of cells sent to the kernel.
    size_t run_selected_cells(bool advance = false);

    size_t run_all();

    // Run the selected cells, then add an empty cell below them
    size_t run_cell_and_insert_below();

    // Cell editing. Each acts on the selection and leaves the edited cells selected.
    void add_cell_above();
    void add_cell_below();
    // The notebook always keeps one cell; deleting the last one leaves an empty cell.
    size_t delete_cells();
    size_t copy_cells();
    size_t cut_cells();
    // Inserts the clipboard below the selection. Pasted cells get new ids.
    size_t paste_cells();
    // Joins the selected sources into the first selected cell
    bool merge_cells();

    bool multiple_cells_selected() const { return selection_.selected().size() > 1; }
    const std::vector<Cell>& clipboard() const { return clipboard_; }

    // Cells sent whose kernel work has not finished
    size_t running() const { return running_; }

    void set_output_listener(OutputListener listener) { output_listener_ = std::move(listener); }

protected:
    void on_unrouted_output(const nlohmann::json& output) override;

private:
    std::vector<int> selected_ascending() const;
    void insert_cells(size_t at, std::vector<Cell> cells);
    Cell* find_cell(const std::string& id, size_t* index = nullptr);

    std::vector<Cell> cells_;
    std::vector<Cell> clipboard_;
    SelectionState selection_;
    size_t running_ = 0;
    OutputListener output_listener_;
};

} // namespace jotter::notebook

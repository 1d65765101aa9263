#include "utils.hpp"
#include "commands/command_registry.hpp"
#include "commands/notebook_commands.hpp"
#include "core/config.hpp"
#include "notebook/notebook_tab.hpp"

namespace jotter::test {

using commands::CommandRegistry;
using notebook::Cell;
using notebook::NotebookTab;
using notebook::SelectionRange;

namespace {

Cell code(const std::string& source) {
    Cell cell;
    cell.source = source;
    return cell;
}

std::vector<std::string> sources(const NotebookTab& nb) {
    std::vector<std::string> result;
    for (const auto& cell : nb.cells()) {
        result.push_back(cell.source);
    }
    return result;
}

Cell markdown(const std::string& source) {
    Cell cell;
    cell.cell_type = "markdown";
    cell.source = source;
    return cell;
}

struct NotebookHarness {
    kernel::EventLoop loop;
    core::Config config;
    kernel::StaticSpecSource specs;
    RecordingConfirm confirm;
    std::shared_ptr<FakeTransport::State> kernel = std::make_shared<FakeTransport::State>();
    std::unique_ptr<NotebookTab> nb;
    CommandRegistry registry;
    commands::NotebookCommands notebook_commands{[this]() { return nb.get(); }};

    NotebookHarness() {
        notebook_commands.register_commands(registry);
    }

    void open(std::vector<Cell> cells) {
        tab::TabServices services;
        services.confirm = &confirm;
        kernel::KernelSession::Dependencies deps;
        deps.transport = std::make_unique<FakeTransport>(kernel);
        nb = std::make_unique<NotebookTab>(loop, config, specs, services, std::move(deps));
        nb->set_cells(std::move(cells));

        nb->start_kernel();
        loop.run_pending();
        deliver(reply_to(kernel->last("kernel_info_request"), "kernel_info_reply", python_kernel_info()));
    }

    void deliver(ipc::Message msg) {
        kernel->deliver(std::move(msg));
        loop.run_pending();
    }

    // Play the kernel's side of one execution
    void finish(const ipc::Message& request, int count, const std::string& text) {
        deliver(status_msg("busy", request.msg_id));
        deliver(broadcast("execute_input", json{{"code", request.content["code"]}, {"execution_count", count}},
            request.msg_id));
        deliver(broadcast("stream", json{{"name", "stdout"}, {"text", text}}, request.msg_id));
        deliver(reply_to(request, "execute_reply", json{{"status", "ok"}, {"execution_count", count}}));
        deliver(status_msg("idle", request.msg_id));
    }
};

} // namespace

TEST_CASE("008: command registry basics", "[008][commands]") {
    CommandRegistry registry;
    int runs = 0;
    bool enabled = false;

    CHECK(registry.add({"do-thing", {"c-t"}, [&enabled]() { return enabled; }, [&runs]() { runs++; }, "misc", ""}));
    CHECK_FALSE(registry.add({"do-thing", {}, {}, [&runs]() { runs++; }, "misc", ""}));
    CHECK_FALSE(registry.add({"no-handler", {}, {}, {}, "misc", ""}));

    CHECK_FALSE(registry.run("do-thing"));
    CHECK_FALSE(registry.dispatch("c-t"));
    enabled = true;
    CHECK(registry.run("do-thing"));
    CHECK(registry.dispatch("c-t"));
    CHECK_FALSE(registry.dispatch("c-unbound"));
    CHECK_FALSE(registry.run("missing"));
    CHECK(runs == 2);

    REQUIRE(registry.find("do-thing") != nullptr);
    CHECK(registry.find("do-thing")->group == "misc");
}

TEST_CASE("008: a key bound twice runs the first available command", "[008][commands]") {
    CommandRegistry registry;
    std::string ran;
    registry.add({"edit-mode", {"enter"}, []() { return false; }, [&ran]() { ran = "edit"; }, "cell", ""});
    registry.add({"open-cell", {"enter"}, {}, [&ran]() { ran = "open"; }, "cell", ""});

    CHECK(registry.dispatch("enter"));
    CHECK(ran == "open");
}

TEST_CASE("008: notebook commands do nothing without a notebook", "[008][commands][notebook]") {
    NotebookHarness h;

    CHECK(h.registry.size() == 23);
    CHECK(h.registry.names("notebook").size() == 23);
    CHECK_FALSE(h.registry.run("select-first-cell"));
    CHECK_FALSE(h.registry.dispatch("j"));
    CHECK_FALSE(h.registry.run("restart-kernel"));
    CHECK_FALSE(h.registry.run("run-selected-cells"));
    CHECK_FALSE(h.registry.dispatch("d d"));
    CHECK_FALSE(h.registry.run("merge-cells"));
}

TEST_CASE("008: selection keys drive the notebook selection", "[008][commands][notebook]") {
    NotebookHarness h;
    h.open({code("a"), code("b"), code("c"), code("d")});

    CHECK(h.registry.dispatch("j"));
    CHECK(h.nb->selection().range() == SelectionRange{1, 2});
    CHECK(h.registry.dispatch("J"));
    CHECK(h.nb->selection().range() == SelectionRange{2, 0});
    CHECK(h.nb->selection().selected() == std::vector<int>{2, 1});

    CHECK(h.registry.dispatch("c-a"));
    CHECK(h.nb->selection().selected() == std::vector<int>{0, 1, 2, 3});
    CHECK(h.registry.dispatch("end"));
    CHECK(h.nb->selection().range() == SelectionRange{4, 5});
    CHECK(h.nb->selection().selected() == std::vector<int>{3});
    CHECK(h.registry.run("select-5th-previous-cell"));
    CHECK(h.nb->selection().selected() == std::vector<int>{0});
    CHECK(h.registry.dispatch("home"));
    CHECK(h.nb->selection().range() == SelectionRange{0, 1});
}

TEST_CASE("008: running cells collects their outputs", "[008][notebook][run]") {
    NotebookHarness h;
    h.open({code("print('hi')"), markdown("# notes"), code("print('bye')")});

    std::vector<size_t> listened;
    h.nb->set_output_listener([&listened](size_t index, const json&) { listened.push_back(index); });

    h.nb->selection().set_range({0, 2});
    CHECK(h.registry.run("run-selected-cells-and-select-next-cell"));
    CHECK(h.nb->running() == 1);
    CHECK(h.nb->selection().range() == SelectionRange{2, 3});

    auto requests = h.kernel->sent_of("execute_request");
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].content["code"] == "print('hi')");

    h.finish(requests[0], 1, "hi\n");
    CHECK(h.nb->running() == 0);
    const auto& first = h.nb->cell(0);
    REQUIRE(first.outputs.size() == 1);
    CHECK(first.outputs[0]["text"] == "hi\n");
    CHECK(first.execution_count == 1);
    CHECK(h.nb->cell(1).outputs.empty());
    CHECK(listened == std::vector<size_t>{0});
}

TEST_CASE("008: run all sends every code cell in order", "[008][notebook][run]") {
    NotebookHarness h;
    h.open({code("x = 1"), markdown("text"), code("x + 1")});

    CHECK(h.registry.run("run-all-cells"));
    auto requests = h.kernel->sent_of("execute_request");
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].content["code"] == "x = 1");
    CHECK(requests[1].content["code"] == "x + 1");

    h.finish(requests[1], 2, "2\n");
    h.finish(requests[0], 1, "");
    CHECK(h.nb->cell(2).execution_count == 2);
    CHECK(h.nb->cell(2).outputs[0]["text"] == "2\n");
    CHECK(h.nb->running() == 0);
}

TEST_CASE("008: re-running a cell clears its old outputs", "[008][notebook][run]") {
    NotebookHarness h;
    h.open({code("print(1)")});

    h.nb->run_cell(0);
    h.finish(h.kernel->last("execute_request"), 1, "1\n");
    REQUIRE(h.nb->cell(0).outputs.size() == 1);

    h.nb->run_cell(0);
    CHECK(h.nb->cell(0).outputs.empty());
    CHECK_FALSE(h.nb->cell(0).execution_count.has_value());
}

TEST_CASE("008: kernel commands reach the notebook's kernel", "[008][commands][notebook]") {
    NotebookHarness h;
    h.open({code("import time; time.sleep(100)")});

    CHECK(h.registry.dispatch("I I"));
    CHECK(h.kernel->sent_of("interrupt_request").size() == 1);

    CHECK(h.registry.dispatch("0 0"));
    CHECK(h.confirm.messages.size() == 1);
    CHECK(h.kernel->sent_of("shutdown_request").empty());
}

TEST_CASE("008: running without a kernel sends nothing", "[008][notebook][run]") {
    NotebookHarness h;
    h.open({code("1")});
    h.nb->close();

    CHECK(h.nb->run_selected_cells() == 0);
    CHECK(h.nb->running() == 0);
}

TEST_CASE("008: a kernel death finishes running cells and a restart recovers", "[008][notebook][run]") {
    NotebookHarness h;
    h.open({code("while True: pass"), code("2")});

    REQUIRE(h.nb->run_cell(0));
    CHECK(h.nb->running() == 1);
    h.kernel->disconnect("crashed");
    h.loop.run_pending();
    CHECK(h.nb->running() == 0);
    CHECK(h.nb->session()->status() == kernel::KernelStatus::DEAD);

    CHECK(h.registry.dispatch("0 0"));
    h.confirm.accept();
    h.loop.run_pending();
    h.deliver(reply_to(h.kernel->last("kernel_info_request"), "kernel_info_reply", python_kernel_info()));
    CHECK(h.nb->session()->status() == kernel::KernelStatus::IDLE);
    CHECK(h.nb->running() == 0);

    REQUIRE(h.nb->run_cell(1));
    h.finish(h.kernel->last("execute_request"), 1, "2\n");
    CHECK(h.nb->running() == 0);
    CHECK(h.nb->cell(1).outputs.size() == 1);
}

TEST_CASE("008: new cells go above or below the selection", "[008][notebook][edit]") {
    NotebookHarness h;
    h.open({code("a"), code("b"), code("c")});

    CHECK(h.registry.dispatch("b"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"a", "", "b", "c"});
    CHECK(h.nb->selection().selected() == std::vector<int>{1});

    CHECK(h.registry.dispatch("a"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"a", "", "", "b", "c"});
    CHECK(h.nb->selection().selected() == std::vector<int>{1});
    CHECK(h.nb->cell(1).id != h.nb->cell(2).id);

    CHECK(h.registry.dispatch("end"));
    CHECK(h.registry.dispatch("b"));
    CHECK(sources(*h.nb).back().empty());
    CHECK(h.nb->selection().selected() == std::vector<int>{5});
}

TEST_CASE("008: deleting cells at the notebook edges", "[008][notebook][edit]") {
    NotebookHarness h;
    h.open({code("a"), code("b"), code("c")});

    CHECK(h.registry.dispatch("d d"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"b", "c"});
    CHECK(h.nb->selection().selected() == std::vector<int>{0});

    CHECK(h.registry.dispatch("end"));
    CHECK(h.nb->delete_cells() == 1);
    CHECK(sources(*h.nb) == std::vector<std::string>{"b"});
    CHECK(h.nb->selection().selected() == std::vector<int>{0});

    // The last cell is replaced by an empty one
    std::string old_id = h.nb->cell(0).id;
    CHECK(h.nb->delete_cells() == 1);
    REQUIRE(h.nb->cells().size() == 1);
    CHECK(h.nb->cell(0).source.empty());
    CHECK(h.nb->cell(0).cell_type == "code");
    CHECK_FALSE(h.nb->cell(0).id.empty());
    CHECK(h.nb->cell(0).id != old_id);
    CHECK(h.nb->selection().selected() == std::vector<int>{0});
}

TEST_CASE("008: pasting at the notebook edges", "[008][notebook][edit]") {
    NotebookHarness h;
    h.open({code("a"), code("b"), code("c")});

    CHECK(h.registry.dispatch("v"));
    CHECK(h.nb->cells().size() == 3);

    CHECK(h.registry.dispatch("end"));
    CHECK(h.registry.dispatch("c"));
    CHECK(h.nb->clipboard().size() == 1);
    CHECK(h.registry.dispatch("v"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"a", "b", "c", "c"});
    CHECK(h.nb->selection().selected() == std::vector<int>{3});
    CHECK(h.nb->cell(3).id != h.nb->cell(2).id);

    CHECK(h.registry.dispatch("home"));
    CHECK(h.registry.dispatch("v"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"a", "c", "b", "c", "c"});
    CHECK(h.nb->selection().selected() == std::vector<int>{1});

    // An empty notebook takes the paste at the top
    h.nb->set_cells({});
    CHECK(h.nb->paste_cells() == 1);
    CHECK(sources(*h.nb) == std::vector<std::string>{"c"});
    CHECK(h.nb->selection().selected() == std::vector<int>{0});
}

TEST_CASE("008: cut then paste moves cells", "[008][notebook][edit]") {
    NotebookHarness h;
    h.open({code("a"), code("b"), code("c")});

    h.nb->selection().set_range(SelectionRange{0, 2});
    CHECK(h.registry.dispatch("x"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"c"});
    CHECK(h.nb->clipboard().size() == 2);

    CHECK(h.registry.dispatch("v"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"c", "a", "b"});
    CHECK(h.nb->selection().selected() == std::vector<int>{1, 2});
}

TEST_CASE("008: merging needs several selected cells", "[008][notebook][edit]") {
    NotebookHarness h;
    h.open({code("a"), code("b"), code("c")});

    CHECK_FALSE(h.registry.dispatch("M"));
    CHECK(h.nb->cells().size() == 3);

    REQUIRE(h.nb->run_cell(1));
    h.finish(h.kernel->last("execute_request"), 1, "b\n");
    REQUIRE(h.nb->cell(1).outputs.size() == 1);

    // Backward range, merged in notebook order
    h.nb->selection().set_range(SelectionRange{2, 0});
    CHECK(h.registry.dispatch("M"));
    CHECK(sources(*h.nb) == std::vector<std::string>{"a", "b\nc"});
    CHECK(h.nb->cell(1).outputs.empty());
    CHECK_FALSE(h.nb->cell(1).execution_count.has_value());
    CHECK(h.nb->selection().selected() == std::vector<int>{1});
}

TEST_CASE("008: outputs follow their cell when cells move", "[008][notebook][edit][run]") {
    NotebookHarness h;
    h.open({code("x = 1")});

    CHECK(h.registry.dispatch("a-enter"));
    REQUIRE(h.kernel->sent_of("execute_request").size() == 1);
    CHECK(sources(*h.nb) == std::vector<std::string>{"x = 1", ""});
    CHECK(h.nb->selection().selected() == std::vector<int>{1});

    CHECK(h.registry.dispatch("home"));
    CHECK(h.registry.dispatch("a"));
    h.finish(h.kernel->last("execute_request"), 1, "done\n");
    CHECK(h.nb->cell(0).outputs.empty());
    CHECK(h.nb->cell(1).outputs.size() == 1);
    CHECK(h.nb->cell(1).execution_count.value_or(0) == 1);

    // A deleted cell still finishes its run
    h.nb->selection().set_range(SelectionRange{1, 2});
    REQUIRE(h.nb->run_cell(1));
    CHECK(h.nb->delete_cells() == 1);
    h.finish(h.kernel->last("execute_request"), 2, "gone\n");
    CHECK(h.nb->running() == 0);
    CHECK(sources(*h.nb) == std::vector<std::string>{"", ""});
}

} // namespace jotter::test

#include <catch2/catch_test_macros.hpp>
#include "executor.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace gptshell;

static ErrorKind error_kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const AgentError& e) {
        return e.kind();
    }
    FAIL("expected AgentError");
    return ErrorKind::Internal;
}

// Accumulate interactive output until it contains needle.
static bool wait_for_output(ExecutionEngine& engine, const std::string& id,
                            const std::string& needle, std::string& seen) {
    return wait_until([&]() {
        seen += engine.interactive_output(id).output;
        return seen.find(needle) != std::string::npos;
    });
}

// ── interactive_start ────────────────────────────────────────────

TEST_CASE("Interactive: explicit command output arrives through the PTY", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start("echo from-pty");
    std::string seen;
    REQUIRE(wait_for_output(engine, id, "from-pty", seen));
}

TEST_CASE("Interactive: session id is distinct from detached ids", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto sid = engine.interactive_start("sleep 30");
    auto did = engine.start_detached("sleep 30");
    REQUIRE(sid != did);
    REQUIRE(table.find(sid)->mode() == ProcessMode::Interactive);
    engine.interactive_kill(sid);
    engine.kill(did);
}

TEST_CASE("Interactive: default shell accepts input and exits on request", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start();

    engine.interactive_input(id, "echo $((40 + 2))\n");
    std::string seen;
    REQUIRE(wait_for_output(engine, id, "42", seen));

    engine.interactive_input(id, "exit 0\n");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));
    auto d = engine.interactive_output(id);
    REQUIRE_FALSE(d.running);
    REQUIRE(d.exit_code == 0);
    REQUIRE(rec->status() == ProcessStatus::Exited);
}

TEST_CASE("Interactive: child sees the configured TERM", "[interactive]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.term = "dumb";
    ExecutionEngine engine(table, cfg);
    auto id = engine.interactive_start("echo term=$TERM");
    std::string seen;
    REQUIRE(wait_for_output(engine, id, "term=dumb", seen));
}

TEST_CASE("Interactive: child is attached to a terminal", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start("test -t 0 && echo is-a-tty");
    std::string seen;
    REQUIRE(wait_for_output(engine, id, "is-a-tty", seen));
}

TEST_CASE("Interactive: natural exit code is recorded", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start("exit 5");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));
    REQUIRE(engine.interactive_output(id).exit_code == 5);
}

TEST_CASE("Interactive: missing shell is ExecFailure", "[interactive]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.interactive_shell = "/nonexistent/shell";
    ExecutionEngine engine(table, cfg);
    REQUIRE(error_kind_of([&]() { engine.interactive_start(); }) == ErrorKind::ExecFailure);
    REQUIRE(table.size() == 0);
}

// ── Window size ──────────────────────────────────────────────────

TEST_CASE("Interactive: initial window size comes from config", "[interactive]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.pty_rows = 30;
    cfg.pty_cols = 91;
    ExecutionEngine engine(table, cfg);
    auto id = engine.interactive_start("stty size");
    std::string seen;
    REQUIRE(wait_for_output(engine, id, "30 91", seen));
}

TEST_CASE("Interactive: resize changes the window size", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start("read line; stty size");
    engine.interactive_resize(id, 40, 120);
    engine.interactive_input(id, "go\n");
    std::string seen;
    REQUIRE(wait_for_output(engine, id, "40 120", seen));
}

// ── Output offsets ───────────────────────────────────────────────

TEST_CASE("Interactive: explicit offset rereads without moving the cursor", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start("printf abc");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));

    auto from = engine.interactive_output_from(id, 1);
    REQUIRE(from.output == "bc");
    REQUIRE(from.next_offset == 3);

    auto d = engine.interactive_output(id);
    REQUIRE(d.output == "abc");
    REQUIRE(d.next_offset == 3);
    REQUIRE(engine.interactive_output(id).output.empty());
}

// ── kill and closed sessions ─────────────────────────────────────

TEST_CASE("Interactive: kill terminates a running shell", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start();
    auto res = engine.interactive_kill(id);
    REQUIRE(res.message == "Process " + id + " terminated.");
    REQUIRE(res.exit_code.has_value());
    auto d = engine.interactive_output(id);
    REQUIRE_FALSE(d.running);
    REQUIRE(table.find(id)->status() == ProcessStatus::Killed);
}

TEST_CASE("Interactive: input after kill is SessionClosed", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start("sleep 30");
    engine.interactive_kill(id);
    REQUIRE(error_kind_of([&]() { engine.interactive_input(id, "ls\n"); })
            == ErrorKind::SessionClosed);
    REQUIRE(error_kind_of([&]() { engine.interactive_resize(id, 10, 10); })
            == ErrorKind::SessionClosed);
}

TEST_CASE("Interactive: kill on an exited session reports already exited", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.interactive_start("true");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));
    auto res = engine.interactive_kill(id);
    REQUIRE(res.message == "Process " + id + " already exited.");
    REQUIRE(res.exit_code == 0);
}

// ── Mode scoping ─────────────────────────────────────────────────

TEST_CASE("Interactive: unknown session id is NotFound", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    REQUIRE(error_kind_of([&]() { engine.interactive_output("nope"); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&]() { engine.interactive_input("nope", "x"); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&]() { engine.interactive_resize("nope", 1, 1); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&]() { engine.interactive_kill("nope"); }) == ErrorKind::NotFound);
}

TEST_CASE("Interactive: ids of the other mode are not visible", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto did = engine.start_detached("sleep 30");
    auto sid = engine.interactive_start("sleep 30");

    REQUIRE(error_kind_of([&]() { engine.interactive_output(did); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&]() { engine.interactive_input(did, "x"); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&]() { engine.get_output(sid); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&]() { engine.kill(sid); }) == ErrorKind::NotFound);

    engine.kill(did);
    engine.interactive_kill(sid);
}

TEST_CASE("Interactive: pty master never leaks into concurrent spawns", "[interactive]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    std::atomic<bool> opened{false};
    std::mutex ids_mutex;
    std::vector<std::string> ids;

    std::thread opener([&]() {
        for (int i = 0; i < 20; ++i) {
            auto id = engine.interactive_start("sleep 30");
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.push_back(id);
        }
        opened.store(true);
    });

    bool leaked = false;
    while (!opened.load()) {
        auto r = engine.run_blocking("ls -l /proc/$$/fd");
        if (r.stdout_data.find("ptmx") != std::string::npos) leaked = true;
    }
    opener.join();

    for (const auto& id : ids) engine.interactive_kill(id);
    REQUIRE_FALSE(leaked);
}

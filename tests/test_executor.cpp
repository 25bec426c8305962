#include <catch2/catch_test_macros.hpp>
#include "executor.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <string>
#include <sys/types.h>
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

// True once pid no longer exists or is a zombie awaiting its reaper.
static bool process_gone(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) return true;
    std::string line;
    std::getline(stat, line);
    auto paren = line.rfind(')');
    return paren == std::string::npos || paren + 2 >= line.size() || line[paren + 2] == 'Z';
}

// Poll a detached job until it stops running, collecting every delta.
static OutputDelta collect_until_done(ExecutionEngine& engine, const std::string& id) {
    OutputDelta all;
    all.running = true;
    wait_until([&]() {
        auto d = engine.get_output(id);
        all.stdout_data += d.stdout_data;
        all.stderr_data += d.stderr_data;
        all.running = d.running;
        all.exit_code = d.exit_code;
        return !d.running;
    });
    return all;
}

// ── run_blocking ─────────────────────────────────────────────────

TEST_CASE("ExecutionEngine::run_blocking: captures stdout and exit code", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto r = engine.run_blocking("echo hello");
    REQUIRE(r.stdout_data == "hello\n");
    REQUIRE(r.stderr_data.empty());
    REQUIRE(r.exit_code == 0);
}

TEST_CASE("ExecutionEngine::run_blocking: separates stderr and keeps nonzero exit", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto r = engine.run_blocking("echo out; echo err >&2; exit 3");
    REQUIRE(r.stdout_data == "out\n");
    REQUIRE(r.stderr_data == "err\n");
    REQUIRE(r.exit_code == 3);
}

TEST_CASE("ExecutionEngine::run_blocking: feeds stdin and closes it", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto r = engine.run_blocking("cat", std::string("line one\nline two\n"));
    REQUIRE(r.stdout_data == "line one\nline two\n");
    REQUIRE(r.exit_code == 0);
}

TEST_CASE("ExecutionEngine::run_blocking: without stdin the child sees EOF", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto r = engine.run_blocking("cat; echo done");
    REQUIRE(r.stdout_data == "done\n");
}

TEST_CASE("ExecutionEngine::run_blocking: large stdin does not deadlock", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    std::string input(256 * 1024, 'z');
    auto r = engine.run_blocking("cat", input);
    REQUIRE(r.stdout_data.size() == input.size());
}

TEST_CASE("ExecutionEngine::run_blocking: death by signal is negative", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto r = engine.run_blocking("kill -9 $$");
    REQUIRE(r.exit_code == -9);
}

TEST_CASE("ExecutionEngine::run_blocking: trims the command", "[executor]") {
    SessionTable table;
    std::string seen;
    ExecutionEngine engine(table, make_test_exec_config(),
                           [&seen](const std::string& c) { seen = c; return true; });
    engine.run_blocking("   echo trimmed  \n");
    REQUIRE(seen == "echo trimmed");
}

TEST_CASE("ExecutionEngine::run_blocking: missing shell is ExecFailure", "[executor]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.shell = "/nonexistent/shell";
    ExecutionEngine engine(table, cfg);
    REQUIRE(error_kind_of([&]() { engine.run_blocking("echo hi"); }) == ErrorKind::ExecFailure);
}

TEST_CASE("ExecutionEngine::run_blocking: empty command is ExecFailure", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    REQUIRE(error_kind_of([&]() { engine.run_blocking("   "); }) == ErrorKind::ExecFailure);
}

TEST_CASE("ExecutionEngine::run_blocking: does not register a record", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    engine.run_blocking("true");
    REQUIRE(table.size() == 0);
}

// ── Approval ─────────────────────────────────────────────────────

TEST_CASE("ExecutionEngine: rejected command never runs", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config(),
                           [](const std::string&) { return false; });
    REQUIRE(error_kind_of([&]() { engine.run_blocking("echo x"); }) == ErrorKind::Rejected);
    REQUIRE(error_kind_of([&]() { engine.start_detached("echo x"); }) == ErrorKind::Rejected);
    REQUIRE(error_kind_of([&]() { engine.interactive_start("echo x"); }) == ErrorKind::Rejected);
    REQUIRE(table.size() == 0);
}

// ── start_detached / get_output ──────────────────────────────────

TEST_CASE("ExecutionEngine::start_detached: returns a fresh id per call", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto a = engine.start_detached("true");
    auto b = engine.start_detached("true");
    REQUIRE(a != b);
    REQUIRE(a.size() == 36);
    REQUIRE(table.find(a) != nullptr);
}

TEST_CASE("ExecutionEngine::get_output: deltas add up to the full output", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("for i in 1 2 3; do echo $i; sleep 0.05; done; echo bad >&2; exit 4");
    auto all = collect_until_done(engine, id);
    REQUIRE_FALSE(all.running);
    REQUIRE(all.stdout_data == "1\n2\n3\n");
    REQUIRE(all.stderr_data == "bad\n");
    REQUIRE(all.exit_code == 4);
}

TEST_CASE("ExecutionEngine::get_output: exit code is absent while running", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 5");
    auto d = engine.get_output(id);
    REQUIRE(d.running);
    REQUIRE_FALSE(d.exit_code.has_value());
    engine.kill(id);
}

TEST_CASE("ExecutionEngine::get_output: terminal status implies output is complete", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("printf 'tail-bytes'");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));
    auto d = engine.get_output(id);
    REQUIRE(d.stdout_data == "tail-bytes");
    REQUIRE(d.exit_code == 0);
    // Drained: later polls are empty but still report the exit code.
    auto again = engine.get_output(id);
    REQUIRE(again.stdout_data.empty());
    REQUIRE(again.exit_code == 0);
}

TEST_CASE("ExecutionEngine::start_detached: stdin is delivered then closed", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("cat", std::string("piped input"));
    auto all = collect_until_done(engine, id);
    REQUIRE(all.stdout_data == "piped input");
    REQUIRE(all.exit_code == 0);
}

TEST_CASE("ExecutionEngine::start_detached: echoed stdin larger than a pipe does not block", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    std::string input(300000, 'x');

    auto started = std::chrono::steady_clock::now();
    auto id = engine.start_detached("cat", input);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));

    auto all = collect_until_done(engine, id);
    REQUIRE_FALSE(all.running);
    REQUIRE(all.exit_code == 0);
    REQUIRE(all.stdout_data.size() == input.size());
    REQUIRE(all.stdout_data == input);
}

TEST_CASE("ExecutionEngine::start_detached: child that ignores stdin still gets an id", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 30", std::string(300000, 'x'));
    REQUIRE(table.find(id) != nullptr);
    REQUIRE(engine.get_output(id).running);
    REQUIRE(engine.kill(id).exit_code == -15);
}

TEST_CASE("ExecutionEngine::get_output: shell exit is reported while a background child writes", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("yes & exit 0");
    auto rec = table.find(id);

    REQUIRE(wait_until([&]() { return !rec->running(); }, std::chrono::milliseconds(3000)));
    auto d = engine.get_output(id);
    REQUIRE_FALSE(d.running);
    REQUIRE(d.exit_code == 0);
    REQUIRE(rec->status() == ProcessStatus::Exited);
}

TEST_CASE("ExecutionEngine::start_detached: missing shell is ExecFailure", "[executor]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.shell = "/nonexistent/shell";
    ExecutionEngine engine(table, cfg);
    REQUIRE(error_kind_of([&]() { engine.start_detached("echo hi"); }) == ErrorKind::ExecFailure);
    REQUIRE(table.size() == 0);
}

TEST_CASE("ExecutionEngine::get_output: unknown id is NotFound", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    REQUIRE(error_kind_of([&]() { engine.get_output("nope"); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&]() { engine.kill("nope"); }) == ErrorKind::NotFound);
}

TEST_CASE("ExecutionEngine::get_output_from: explicit offsets leave the cursor alone", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("printf abcdef; printf XY >&2");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));

    auto from = engine.get_output_from(id, 2, 1);
    REQUIRE(from.stdout_data == "cdef");
    REQUIRE(from.stderr_data == "Y");
    REQUIRE(from.stdout_next_offset == 6);
    REQUIRE(from.stderr_next_offset == 2);

    auto d = engine.get_output(id);
    REQUIRE(d.stdout_data == "abcdef");
    REQUIRE(d.stderr_data == "XY");
}

TEST_CASE("ExecutionEngine::get_output: overflow is reported with a marker", "[executor]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.max_buffer_bytes = 16;
    ExecutionEngine engine(table, cfg);
    auto id = engine.start_detached("printf '%0100d' 0");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));

    auto d = engine.get_output(id);
    REQUIRE(d.stdout_data == truncation_marker(84) + std::string(16, '0'));
}

TEST_CASE("ExecutionEngine: concurrent detached jobs stay isolated", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    std::vector<std::string> ids;
    for (int i = 0; i < 8; ++i) {
        ids.push_back(engine.start_detached("echo job" + std::to_string(i)));
    }
    for (int i = 0; i < 8; ++i) {
        auto all = collect_until_done(engine, ids[i]);
        REQUIRE(all.stdout_data == "job" + std::to_string(i) + "\n");
        REQUIRE(all.exit_code == 0);
    }
}

TEST_CASE("ExecutionEngine: run_blocking proceeds while a detached job runs", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 5");
    auto start = std::chrono::steady_clock::now();
    auto r = engine.run_blocking("echo quick");
    REQUIRE(r.stdout_data == "quick\n");
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
    engine.kill(id);
}

// ── kill ─────────────────────────────────────────────────────────

TEST_CASE("ExecutionEngine::kill: terminates a running job", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 30");
    auto res = engine.kill(id);
    REQUIRE(res.message == "Process " + id + " terminated.");
    REQUIRE(res.exit_code == -15);

    auto d = engine.get_output(id);
    REQUIRE_FALSE(d.running);
    REQUIRE(d.exit_code == -15);
    REQUIRE(table.find(id)->status() == ProcessStatus::Killed);
}

TEST_CASE("ExecutionEngine::kill: no output arrives after the killed status is visible", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("yes");
    REQUIRE(wait_until([&]() {
        return table.find(id)->stdout_buffer().total_appended() > 0;
    }));

    engine.kill(id);
    auto first = engine.get_output(id);
    REQUIRE_FALSE(first.running);
    auto second = engine.get_output(id);
    REQUIRE(second.stdout_data.empty());
    REQUIRE(second.stderr_data.empty());
}

TEST_CASE("ExecutionEngine::kill: escalates to SIGKILL when SIGTERM is ignored", "[executor]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.kill_grace_ms = 300;
    ExecutionEngine engine(table, cfg);
    auto id = engine.start_detached("trap '' TERM; echo ready; sleep 30");
    REQUIRE(wait_until([&]() {
        return table.find(id)->stdout_buffer().total_appended() > 0;
    }));
    auto res = engine.kill(id);
    REQUIRE(res.exit_code == -9);
    REQUIRE(table.find(id)->status() == ProcessStatus::Killed);
}

TEST_CASE("ExecutionEngine::kill: second kill reports already exited", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 30");
    auto first = engine.kill(id);
    auto second = engine.kill(id);
    REQUIRE(second.message == "Process " + id + " already exited.");
    REQUIRE(second.exit_code == first.exit_code);
}

TEST_CASE("ExecutionEngine::kill: finished job keeps its natural exit code", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("exit 2");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));
    auto res = engine.kill(id);
    REQUIRE(res.message == "Process " + id + " already exited.");
    REQUIRE(res.exit_code == 2);
    REQUIRE(rec->status() == ProcessStatus::Exited);
}

TEST_CASE("ExecutionEngine::kill: concurrent kills agree on the outcome", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 30");

    std::vector<KillResult> results(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&engine, &results, &id, i]() { results[i] = engine.kill(id); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        REQUIRE(r.exit_code == results[0].exit_code);
        REQUIRE(r.exit_code.has_value());
    }
    REQUIRE(table.find(id)->status() == ProcessStatus::Killed);
}

TEST_CASE("ExecutionEngine::kill: reaches the whole process group", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 30 & echo $!; wait");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() {
        return rec->stdout_buffer().read_from(0).data.find('\n') != std::string::npos;
    }));
    pid_t grandchild = static_cast<pid_t>(std::stol(rec->stdout_buffer().read_from(0).data));
    REQUIRE(grandchild > 0);

    engine.kill(id);
    REQUIRE(wait_until([&]() { return process_gone(grandchild); }));
}

// ── Table maintenance ────────────────────────────────────────────

TEST_CASE("ExecutionEngine::list_sessions: reports detached jobs", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto id = engine.start_detached("sleep 30");
    auto sessions = engine.list_sessions();
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions[0].id == id);
    REQUIRE(sessions[0].mode == ProcessMode::Detached);
    REQUIRE(sessions[0].status == ProcessStatus::Running);
    REQUIRE(sessions[0].command == "sleep 30");
    engine.kill(id);
}

TEST_CASE("ExecutionEngine::purge_finished: zero TTL keeps everything", "[executor]") {
    SessionTable table;
    auto cfg = make_test_exec_config();
    cfg.session_ttl = 0;
    ExecutionEngine engine(table, cfg);
    auto id = engine.start_detached("true");
    auto rec = table.find(id);
    REQUIRE(wait_until([&]() { return !rec->running(); }));
    REQUIRE(engine.purge_finished() == 0);
    REQUIRE(table.find(id) != nullptr);
}

TEST_CASE("ExecutionEngine::shutdown: kills every running session", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    auto a = engine.start_detached("sleep 30");
    auto b = engine.interactive_start("sleep 30");
    engine.shutdown();
    REQUIRE(table.find(a)->status() == ProcessStatus::Killed);
    REQUIRE(table.find(b)->status() == ProcessStatus::Killed);
}

TEST_CASE("ExecutionEngine::shutdown: terminates in-flight blocking runs", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    RunResult result;
    std::thread runner([&]() { result = engine.run_blocking("sleep 30"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto started = std::chrono::steady_clock::now();
    engine.shutdown();
    runner.join();
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
    REQUIRE(result.exit_code == -15);
}

TEST_CASE("ExecutionEngine::shutdown: later blocking runs are killed on spawn", "[executor]") {
    SessionTable table;
    ExecutionEngine engine(table, make_test_exec_config());
    engine.shutdown();
    auto started = std::chrono::steady_clock::now();
    auto result = engine.run_blocking("sleep 30");
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
    REQUIRE(result.exit_code == -9);
}

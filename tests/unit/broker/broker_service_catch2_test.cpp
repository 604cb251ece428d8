// BrokerService behaviour against a scripted CLI: admission order, capacity,
// cancellation, timeouts, streaming, environment and artifact hygiene.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <qbroker/broker/broker_service.h>

#include "../../common/mock_process.h"
#include "../../common/test_helpers.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

using namespace qbroker;
using namespace qbroker::broker;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using qbroker::test::eventually;
using qbroker::test::Gate;
using qbroker::test::MockProcessLauncher;
using qbroker::test::MockScript;

namespace {

const process::Environment kAmbient{{"ANTHROPIC_API_KEY", "sk-live-secret"},
                                    {"ANTHROPIC_API_KEY_ID", "key-id"},
                                    {"PATH", "/usr/bin:/bin"},
                                    {"HOME", "/home/tester"}};

ByteVector pngBytes() {
    const unsigned char raw[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0, 0};
    ByteVector out;
    for (unsigned char c : raw)
        out.push_back(static_cast<std::byte>(c));
    return out;
}

std::optional<std::string> argAfter(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || std::next(it) == args.end())
        return std::nullopt;
    return *std::next(it);
}

MockScript hanging(bool honourTerminate = true) {
    MockScript s;
    s.hang = true;
    s.honourTerminate = honourTerminate;
    return s;
}

MockScript gated(std::shared_ptr<Gate> gate) {
    auto s = MockScript::reply(R"({"type":"result","result":"done"})");
    s.gate = std::move(gate);
    return s;
}

struct BrokerFixture {
    qbroker::test::TempDirScope artifactDir{"qbroker-artifacts"};
    std::shared_ptr<MockProcessLauncher> launcher = std::make_shared<MockProcessLauncher>();
    std::unique_ptr<BrokerService> svc;

    BrokerService& make(std::size_t capacity = 3, bool start = true) {
        config::BrokerConfig cfg;
        cfg.capacity = capacity;
        cfg.terminationGrace = 100ms;
        cfg.statusTtl = 60s;
        cfg.artifactDir = artifactDir.path();
        svc = std::make_unique<BrokerService>(cfg, launcher, [] { return kAmbient; });
        if (start) {
            REQUIRE(svc->start());
        }
        return *svc;
    }

    RequestHandle submit(const std::string& prompt, QueryOptions options = {}) {
        RequestSpec spec;
        spec.prompt = prompt;
        spec.options = options;
        auto h = svc->submit(std::move(spec));
        REQUIRE(h);
        return h.value();
    }

    std::string stdinOf(std::size_t spawnIndex) const {
        return launcher->querySpawns().at(spawnIndex).stdinText->text();
    }
};

} // namespace

TEST_CASE_METHOD(BrokerFixture, "BrokerService: query passes the prompt on stdin",
                 "[broker][service][unit]") {
    auto& broker = make();
    launcher->setQueryScript(MockScript::reply(R"({"type":"result","result":"Hi there"})"));

    QueryOptions opts;
    opts.maxTokens = 256;
    opts.model = "claude-opus";
    auto r = broker.query("Say hi", opts);

    REQUIRE(r.success);
    CHECK(r.content == "Hi there");
    CHECK(r.state == RequestState::Completed);
    CHECK_FALSE(r.id.empty());
    CHECK(r.startedAt >= r.submittedAt);
    CHECK(r.completedAt >= r.startedAt);

    auto spawns = launcher->querySpawns();
    REQUIRE(spawns.size() == 1);
    const auto& args = spawns[0].spec.args;
    CHECK(args.front() == "-p");
    CHECK(argAfter(args, "--output-format") == std::optional<std::string>("json"));
    CHECK(argAfter(args, "--max-tokens") == std::optional<std::string>("256"));
    CHECK(argAfter(args, "--model") == std::optional<std::string>("claude-opus"));
    CHECK(spawns[0].spec.executable == std::filesystem::path("claude"));
    CHECK(spawns[0].stdinText->text() == "Say hi");
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: queued requests start in submission order",
                 "[broker][service][unit]") {
    auto& broker = make(3);
    std::vector<std::shared_ptr<Gate>> gates;
    for (int i = 0; i < 5; ++i)
        gates.push_back(std::make_shared<Gate>());
    launcher->setQueryScripter(
        [gates](std::size_t i) -> Result<MockScript> { return gated(gates.at(i)); });

    std::vector<RequestHandle> handles;
    for (int i = 0; i < 5; ++i)
        handles.push_back(submit("q" + std::to_string(i)));

    REQUIRE(eventually([&] { return launcher->querySpawns().size() == 3; }));
    std::this_thread::sleep_for(50ms);
    CHECK(launcher->querySpawns().size() == 3);
    CHECK(broker.status().queued == 2);
    CHECK(broker.requestState(handles[3].id) == RequestState::Queued);

    std::vector<std::string> firstWave;
    REQUIRE(eventually([&] {
        firstWave.clear();
        for (std::size_t i = 0; i < 3; ++i)
            firstWave.push_back(stdinOf(i));
        return std::none_of(firstWave.begin(), firstWave.end(),
                            [](const std::string& s) { return s.empty(); });
    }));
    std::sort(firstWave.begin(), firstWave.end());
    CHECK(firstWave == std::vector<std::string>{"q0", "q1", "q2"});

    gates[0]->open();
    REQUIRE(eventually([&] { return launcher->querySpawns().size() == 4; }));
    REQUIRE(eventually([&] { return stdinOf(3) == "q3"; }));

    gates[1]->open();
    REQUIRE(eventually([&] { return launcher->querySpawns().size() == 5; }));
    REQUIRE(eventually([&] { return stdinOf(4) == "q4"; }));

    for (auto& g : gates)
        g->open();
    for (auto& h : handles) {
        auto r = h.result.get();
        CHECK(r.success);
    }
    CHECK(broker.status().activeSlots == 0);
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: never exceeds its capacity",
                 "[broker][service][unit]") {
    constexpr std::size_t kCapacity = 2;
    auto& broker = make(kCapacity);

    std::mt19937 rng(1234);
    std::vector<int> delays;
    for (int i = 0; i < 16; ++i)
        delays.push_back(static_cast<int>(rng() % 15));
    launcher->setQueryScripter([delays](std::size_t i) -> Result<MockScript> {
        MockScript s;
        s.chunks = {R"({"result":)", R"("x"})"};
        s.chunkDelay = std::chrono::milliseconds{delays.at(i % delays.size())};
        return s;
    });

    std::vector<std::future<QueryResult>> results;
    for (int i = 0; i < 16; ++i) {
        results.push_back(std::async(std::launch::async, [&broker, i] {
            return broker.query("fuzz " + std::to_string(i));
        }));
    }
    for (auto& f : results) {
        auto r = f.get();
        CHECK(r.success);
        CHECK(r.content == "x");
    }

    CHECK(launcher->querySpawns().size() == 16);
    CHECK(launcher->peakRunning() <= static_cast<int>(kCapacity));
    CHECK(broker.status().activeSlots == 0);
}

TEST_CASE_METHOD(BrokerFixture,
                 "BrokerService: capacity holds across interleaved submissions and cancels",
                 "[broker][service][cancel][unit]") {
    constexpr std::size_t kCapacity = 3;
    constexpr int kRequests = 60;
    auto& broker = make(kCapacity);

    std::mt19937 rng(20241019);
    std::vector<int> kinds;
    for (int i = 0; i < kRequests; ++i)
        kinds.push_back(static_cast<int>(rng() % 3));
    launcher->setQueryScripter([kinds](std::size_t i) -> Result<MockScript> {
        switch (kinds.at(i % kinds.size())) {
            case 0: {
                auto s = MockScript::reply(R"({"result":"quick"})");
                s.chunkDelay = std::chrono::milliseconds{static_cast<int>(i % 7)};
                return s;
            }
            case 1:
                return hanging(true);
            default:
                return hanging(false);
        }
    });

    auto checkCapacity = [&] {
        auto st = broker.status();
        CHECK(st.activeSlots <= kCapacity);
        CHECK(launcher->running() <= static_cast<int>(kCapacity));
    };

    std::vector<RequestHandle> handles;
    for (int i = 0; i < kRequests; ++i) {
        handles.push_back(submit("fuzz " + std::to_string(i)));
        checkCapacity();
        if (rng() % 2 == 0) {
            const auto& victim = handles.at(rng() % handles.size());
            broker.cancel(victim.id);
            checkCapacity();
        }
    }

    // Whatever is still alive (hanging processes included) gets cancelled
    for (const auto& h : handles) {
        broker.cancel(h.id);
        checkCapacity();
    }

    for (auto& h : handles) {
        REQUIRE(h.result.wait_for(10s) == std::future_status::ready);
        auto r = h.result.get();
        CHECK(isTerminal(r.state));
        CHECK(r.state != RequestState::TimedOut);
        checkCapacity();
    }

    CHECK(launcher->peakRunning() <= static_cast<int>(kCapacity));
    CHECK(eventually([&] { return broker.status().activeSlots == 0; }));
    CHECK(broker.status().queued == 0);
    CHECK(eventually([&] { return launcher->running() == 0; }));
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: cancel while queued never spawns",
                 "[broker][service][cancel][unit]") {
    auto& broker = make(1);
    auto gate = std::make_shared<Gate>();
    launcher->setQueryScript(gated(gate));

    auto first = submit("first");
    auto second = submit("second");
    REQUIRE(broker.requestState(second.id) == RequestState::Queued);

    CHECK(broker.cancel(second.id));
    auto r = second.result.get();
    CHECK(r.state == RequestState::Cancelled);
    CHECK(r.errorKind == ErrorCode::OperationCancelled);
    CHECK(r.startedAt == TimePoint{});
    CHECK_FALSE(broker.cancel(second.id));

    gate->open();
    CHECK(first.result.get().success);
    CHECK(launcher->querySpawns().size() == 1);
    CHECK(broker.status().queued == 0);
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: cancel while running stops the process",
                 "[broker][service][cancel][unit]") {
    bool honour = true;
    SECTION("process honours SIGTERM") { honour = true; }
    SECTION("process ignores SIGTERM") { honour = false; }

    auto& broker = make(2);
    launcher->setQueryScript(hanging(honour));

    auto h = submit("long job");
    REQUIRE(eventually([&] { return launcher->running() == 1; }));

    auto before = std::chrono::steady_clock::now();
    CHECK(broker.cancel(h.id));
    REQUIRE(h.result.wait_for(2s) == std::future_status::ready);
    CHECK(std::chrono::steady_clock::now() - before < 2s);

    auto r = h.result.get();
    CHECK(r.state == RequestState::Cancelled);
    CHECK(r.errorKind == ErrorCode::OperationCancelled);
    CHECK_FALSE(r.success);
    CHECK(broker.status().activeSlots == 0);
    CHECK(eventually([&] { return launcher->running() == 0; }));
    CHECK_FALSE(broker.cancel(h.id));
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: children never see the API key variables",
                 "[broker][service][env][unit]") {
    auto& broker = make();
    REQUIRE(broker.query("hello").success);

    auto spawns = launcher->spawns();
    REQUIRE(spawns.size() >= 3); // two probes plus the query
    for (const auto& s : spawns) {
        CHECK(s.spec.env.count("ANTHROPIC_API_KEY") == 0);
        CHECK(s.spec.env.count("ANTHROPIC_API_KEY_ID") == 0);
        CHECK(s.spec.env.at("PATH") == "/usr/bin:/bin");
        CHECK(s.spec.env.at("HOME") == "/home/tester");
    }
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: image artifacts live only while the CLI runs",
                 "[broker][service][artifact][unit]") {
    auto& broker = make();

    SECTION("success") {
        auto gate = std::make_shared<Gate>();
        launcher->setQueryScript(gated(gate));

        auto fut = std::async(std::launch::async,
                              [&] { return broker.queryWithImage("What is this?", pngBytes()); });
        REQUIRE(eventually([&] { return launcher->querySpawns().size() == 1; }));

        auto image = argAfter(launcher->querySpawns()[0].spec.args, "--image");
        REQUIRE(image);
        std::filesystem::path imagePath{*image};
        CHECK(std::filesystem::exists(imagePath));
        CHECK(imagePath.extension() == ".png");
        CHECK(imagePath.parent_path() == artifactDir.path());
        CHECK(artifactDir.fileCount() == 1);

        gate->open();
        CHECK(fut.get().success);
        CHECK_FALSE(std::filesystem::exists(imagePath));
    }

    SECTION("failure") {
        auto failing = MockScript::reply("", 1);
        failing.stderrText = "bad image";
        launcher->setQueryScript(failing);
        auto r = broker.queryWithImage("What is this?", pngBytes());
        CHECK(r.state == RequestState::Failed);
    }

    SECTION("timeout") {
        launcher->setQueryScript(hanging());
        QueryOptions opts;
        opts.timeout = 150ms;
        auto r = broker.queryWithImage("What is this?", pngBytes(), opts);
        CHECK(r.state == RequestState::TimedOut);
    }

    SECTION("cancel") {
        launcher->setQueryScript(hanging());
        RequestSpec spec;
        spec.prompt = "What is this?";
        spec.image = pngBytes();
        auto h = broker.submit(std::move(spec));
        REQUIRE(h);
        REQUIRE(eventually([&] { return launcher->running() == 1; }));
        CHECK(broker.cancel(h.value().id));
        CHECK(h.value().result.get().state == RequestState::Cancelled);
    }

    CHECK(artifactDir.fileCount() == 0);
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: an empty image is rejected",
                 "[broker][service][artifact][unit]") {
    auto& broker = make();
    auto r = broker.queryWithImage("What is this?", ByteVector{});
    CHECK(r.errorKind == ErrorCode::InvalidArgument);
    CHECK(launcher->querySpawns().empty());
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: stream relays chunks in order",
                 "[broker][service][stream][unit]") {
    auto& broker = make();
    MockScript script;
    script.chunks = {"Hel", "lo ", "world"};
    script.chunkDelay = 10ms;
    launcher->setQueryScript(script);

    std::mutex mu;
    std::vector<std::string> chunks;
    int terminals = 0;
    QueryResult terminal;
    auto r = broker.stream(
        "Greet", {},
        [&](std::string_view c) {
            std::lock_guard<std::mutex> lock(mu);
            chunks.emplace_back(c);
        },
        [&](const QueryResult& res) {
            std::lock_guard<std::mutex> lock(mu);
            ++terminals;
            terminal = res;
        });

    REQUIRE(r.success);
    CHECK(r.content == "Hello world");
    CHECK(r.state == RequestState::Completed);

    std::lock_guard<std::mutex> lock(mu);
    CHECK(chunks == std::vector<std::string>{"Hel", "lo ", "world"});
    CHECK(terminals == 1);
    CHECK(terminal.id == r.id);
    CHECK(terminal.success);

    auto args = launcher->querySpawns().at(0).spec.args;
    CHECK(std::find(args.begin(), args.end(), "--output-format") == args.end());
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: a failed stream still ends with one terminal event",
                 "[broker][service][stream][unit]") {
    auto& broker = make();
    MockScript script;
    script.chunks = {"partial"};
    script.exitCode = 3;
    script.stderrText = "rate limited";
    launcher->setQueryScript(script);

    int terminals = 0;
    std::vector<std::string> chunks;
    auto r = broker.stream(
        "Greet", {}, [&](std::string_view c) { chunks.emplace_back(c); },
        [&](const QueryResult&) { ++terminals; });

    CHECK_FALSE(r.success);
    CHECK(r.errorKind == ErrorCode::RuntimeFailure);
    CHECK(chunks == std::vector<std::string>{"partial"});
    CHECK(terminals == 1);
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: first stream chunk moves Running to Streaming",
                 "[broker][service][stream][unit]") {
    auto& broker = make();
    auto gate = std::make_shared<Gate>();
    MockScript script;
    script.chunks = {"first"};
    script.gate = gate;
    launcher->setQueryScript(script);

    std::atomic<int> chunks{0};
    RequestSpec spec;
    spec.prompt = "Tell a story";
    spec.mode = RequestMode::Stream;
    auto submitted = broker.submit(std::move(spec), [&](std::string_view) { ++chunks; });
    REQUIRE(submitted);
    const auto id = submitted.value().id;

    REQUIRE(eventually([&] { return chunks.load() == 1; }));
    CHECK(broker.requestState(id) == RequestState::Streaming);

    gate->open();
    auto r = submitted.value().result.get();
    CHECK(r.success);
    CHECK(r.state == RequestState::Completed);
    CHECK(r.content == "first");
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: a query stays Running while output arrives",
                 "[broker][service][unit]") {
    auto& broker = make();
    auto gate = std::make_shared<Gate>();
    MockScript script;
    script.chunks = {R"({"result":)", R"("done"})"};
    script.gate = gate;
    launcher->setQueryScript(script);

    std::atomic<int> chunks{0};
    RequestSpec spec;
    spec.prompt = "Answer";
    auto submitted = broker.submit(std::move(spec), [&](std::string_view) { ++chunks; });
    REQUIRE(submitted);
    const auto id = submitted.value().id;

    REQUIRE(eventually([&] { return chunks.load() == 2; }));
    CHECK(broker.requestState(id) == RequestState::Running);

    gate->open();
    auto r = submitted.value().result.get();
    CHECK(r.success);
    CHECK(r.content == "done");
    CHECK(r.state == RequestState::Completed);
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: unavailable CLI never spawns a query",
                 "[broker][service][availability][unit]") {
    SECTION("not installed") {
        launcher->setInstalled(false);
        auto& broker = make();
        auto r = broker.query("hello");
        CHECK(r.errorKind == ErrorCode::NotInstalled);
        CHECK(r.state == RequestState::Failed);
        CHECK_FALSE(broker.status().installed);
    }
    SECTION("not authenticated") {
        launcher->setAuthenticated(false);
        auto& broker = make();
        auto r = broker.query("hello");
        CHECK(r.errorKind == ErrorCode::NotAuthenticated);
        CHECK(broker.status().installed);
        CHECK_FALSE(broker.status().authenticated);
    }
    CHECK(launcher->querySpawns().empty());
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: deadline yields TimedOut, not Cancelled",
                 "[broker][service][timeout][unit]") {
    auto& broker = make();
    bool honour = true;
    SECTION("honours SIGTERM") { honour = true; }
    SECTION("ignores SIGTERM") { honour = false; }
    launcher->setQueryScript(hanging(honour));

    QueryOptions opts;
    opts.timeout = 150ms;
    auto before = std::chrono::steady_clock::now();
    auto r = broker.query("slow", opts);

    CHECK(r.state == RequestState::TimedOut);
    CHECK(r.errorKind == ErrorCode::Timeout);
    CHECK_THAT(r.error, ContainsSubstring("150ms"));
    CHECK(std::chrono::steady_clock::now() - before < 3s);
    CHECK(broker.status().activeSlots == 0);
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: a non-positive timeout is rejected",
                 "[broker][service][timeout][unit]") {
    auto& broker = make();
    QueryOptions opts;
    opts.timeout = 0ms;
    auto r = broker.query("hello", opts);
    CHECK(r.errorKind == ErrorCode::InvalidArgument);
    CHECK(launcher->querySpawns().empty());
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: lifecycle gates submission",
                 "[broker][service][lifecycle][unit]") {
    auto& broker = make(1, /*start=*/false);
    CHECK_FALSE(broker.isRunning());
    CHECK(broker.query("early").errorKind == ErrorCode::NotInitialized);

    REQUIRE(broker.start());
    CHECK(broker.isRunning());
    CHECK(broker.start()); // idempotent while running

    broker.shutdown();
    CHECK_FALSE(broker.isRunning());
    CHECK(broker.query("late").errorKind == ErrorCode::SystemShutdown);
    auto restarted = broker.start();
    REQUIRE_FALSE(restarted);
    CHECK(restarted.error().code == ErrorCode::InvalidState);
    broker.shutdown();
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: shutdown ends queued and running requests",
                 "[broker][service][lifecycle][unit]") {
    auto& broker = make(1);
    launcher->setQueryScript(hanging(/*honourTerminate=*/false));

    auto running = submit("running");
    auto queued = submit("queued");
    REQUIRE(eventually([&] { return launcher->running() == 1; }));

    broker.shutdown();

    REQUIRE(running.result.wait_for(0ms) == std::future_status::ready);
    REQUIRE(queued.result.wait_for(0ms) == std::future_status::ready);
    auto r1 = running.result.get();
    auto r2 = queued.result.get();
    CHECK(r1.state == RequestState::Cancelled);
    CHECK(r1.errorKind == ErrorCode::SystemShutdown);
    CHECK(r2.state == RequestState::Cancelled);
    CHECK(r2.errorKind == ErrorCode::SystemShutdown);
    CHECK(launcher->querySpawns().size() == 1);
    CHECK(launcher->running() == 0);
    CHECK(artifactDir.fileCount() == 0);
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: CLI failures are reported with their cause",
                 "[broker][service][unit]") {
    auto& broker = make(1);

    SECTION("non-zero exit carries stderr") {
        auto s = MockScript::reply("", 2);
        s.stderrText = "  boom\n";
        launcher->setQueryScript(s);
        auto r = broker.query("hello");
        CHECK(r.state == RequestState::Failed);
        CHECK(r.errorKind == ErrorCode::RuntimeFailure);
        CHECK(r.error == "CLI exited with code 2: boom");
    }

    SECTION("non-zero exit without stderr") {
        launcher->setQueryScript(MockScript::reply("", 1));
        auto r = broker.query("hello");
        CHECK(r.error == "CLI exited with code 1: Unknown error");
    }

    SECTION("unparseable output") {
        launcher->setQueryScript(MockScript::reply(R"({"type":"result"})"));
        auto r = broker.query("hello");
        CHECK(r.errorKind == ErrorCode::MalformedOutput);
    }

    SECTION("spawn failure releases the slot") {
        launcher->setQueryScripter([](std::size_t i) -> Result<MockScript> {
            if (i == 0)
                return Error{ErrorCode::SpawnFailure, "fork failed"};
            return MockScript::reply(R"({"result":"recovered"})");
        });
        auto r = broker.query("hello");
        CHECK(r.errorKind == ErrorCode::SpawnFailure);
        CHECK(broker.status().activeSlots == 0);

        auto next = broker.query("again");
        CHECK(next.success);
        CHECK(next.content == "recovered");
    }
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: rejects an empty prompt",
                 "[broker][service][unit]") {
    auto& broker = make();
    CHECK(broker.query("").errorKind == ErrorCode::InvalidArgument);
    CHECK(broker.stream("", {}, [](std::string_view) {}).errorKind ==
          ErrorCode::InvalidArgument);
    CHECK(launcher->querySpawns().empty());
}

TEST_CASE_METHOD(BrokerFixture, "BrokerService: status reports availability and occupancy",
                 "[broker][service][unit]") {
    auto& broker = make(3);
    auto gate = std::make_shared<Gate>();
    launcher->setQueryScript(gated(gate));

    auto h = submit("hold a slot");
    REQUIRE(eventually([&] { return broker.status().activeSlots == 1; }));

    auto st = broker.status();
    CHECK(st.installed);
    CHECK(st.version == "2.0.14");
    CHECK(st.authenticated);
    CHECK(st.account == std::optional<std::string>("tester@example.com"));
    CHECK(st.capacity == 3);
    CHECK(st.queued == 0);
    CHECK_FALSE(st.lastError);
    CHECK(st.lastChecked != TimePoint{});

    gate->open();
    CHECK(h.result.get().success);
    CHECK(broker.status().activeSlots == 0);
}

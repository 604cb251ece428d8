#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <qbroker/broker/broker_service.h>
#include <qbroker/fallback/fallback_orchestrator.h>

#include "../../common/mock_process.h"
#include "../../common/test_helpers.h"

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace qbroker;
using namespace qbroker::fallback;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using qbroker::test::MockProcessLauncher;
using qbroker::test::MockScript;

namespace {

class FakeRemote final : public RemoteCompletionClient {
public:
    Result<std::string> complete(const RemoteRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (failWith_) {
            return *failWith_;
        }
        return reply_;
    }

    void setReply(std::string text) { reply_ = std::move(text); }
    void failWith(Error err) { failWith_ = std::move(err); }

    std::vector<RemoteRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::string reply_ = "remote answer";
    std::optional<Error> failWith_;
    std::vector<RemoteRequest> requests_;
};

struct FallbackFixture {
    qbroker::test::TempDirScope artifactDir{"qbroker-fallback"};
    std::shared_ptr<MockProcessLauncher> launcher = std::make_shared<MockProcessLauncher>();
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();
    std::unique_ptr<broker::BrokerService> svc;

    broker::BrokerService& startBroker() {
        config::BrokerConfig cfg;
        cfg.capacity = 2;
        cfg.terminationGrace = 100ms;
        cfg.statusTtl = 60s;
        cfg.artifactDir = artifactDir.path();
        svc = std::make_unique<broker::BrokerService>(
            cfg, launcher, [] { return process::Environment{{"PATH", "/bin"}}; });
        REQUIRE(svc->start());
        return *svc;
    }

    FallbackOrchestrator orchestrator(bool allowRemote = true) {
        FallbackOrchestrator::Options opts;
        opts.allowRemote = allowRemote;
        return FallbackOrchestrator(svc.get(), remote, opts);
    }
};

} // namespace

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: CLI answers first",
                 "[fallback][unit]") {
    startBroker();
    launcher->setQueryScript(MockScript::reply(R"({"result":"from cli"})"));
    auto orch = orchestrator();

    auto r = orch.query("hello");
    CHECK(r.success);
    CHECK(r.content == "from cli");
    CHECK(r.path == CompletionPath::Subscription);
    CHECK_FALSE(r.primaryError);
    CHECK(remote->requests().empty());
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: unavailable CLI goes remote",
                 "[fallback][unit]") {
    SECTION("not installed") {
        launcher->setInstalled(false);
        startBroker();
        auto orch = orchestrator();
        auto r = orch.query("hello");
        CHECK(r.success);
        CHECK(r.path == CompletionPath::RemoteApi);
        REQUIRE(r.primaryError);
        CHECK(r.primaryError->code == ErrorCode::NotInstalled);
    }
    SECTION("not authenticated") {
        launcher->setAuthenticated(false);
        startBroker();
        auto orch = orchestrator();
        auto r = orch.query("hello");
        CHECK(r.path == CompletionPath::RemoteApi);
        REQUIRE(r.primaryError);
        CHECK(r.primaryError->code == ErrorCode::NotAuthenticated);
    }
    SECTION("no broker at all") {
        FallbackOrchestrator orch(nullptr, remote, {});
        auto r = orch.query("hello");
        CHECK(r.path == CompletionPath::RemoteApi);
        REQUIRE(r.primaryError);
        CHECK(r.primaryError->code == ErrorCode::NotInitialized);
    }
    CHECK(launcher->querySpawns().empty());
    REQUIRE(remote->requests().size() == 1);
    CHECK(remote->requests()[0].prompt == "hello");
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: CLI failure falls back with options",
                 "[fallback][unit]") {
    startBroker();
    auto failing = MockScript::reply("", 1);
    failing.stderrText = "overloaded";
    launcher->setQueryScript(failing);
    auto orch = orchestrator();

    broker::QueryOptions opts;
    opts.maxTokens = 300;
    opts.model = "claude-haiku";
    auto r = orch.query("hello", opts);

    CHECK(r.success);
    CHECK(r.content == "remote answer");
    CHECK(r.path == CompletionPath::RemoteApi);
    REQUIRE(r.primaryError);
    CHECK(r.primaryError->code == ErrorCode::RuntimeFailure);

    auto reqs = remote->requests();
    REQUIRE(reqs.size() == 1);
    CHECK(reqs[0].maxTokens == std::optional<uint32_t>(300));
    CHECK(reqs[0].model == std::optional<std::string>("claude-haiku"));
    CHECK_FALSE(reqs[0].image);
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: both paths failing reports both",
                 "[fallback][unit]") {
    launcher->setInstalled(false);
    startBroker();
    remote->failWith(Error{ErrorCode::NetworkError, "connection refused"});
    auto orch = orchestrator();

    auto r = orch.query("hello");
    CHECK_FALSE(r.success);
    CHECK(r.path == CompletionPath::None);
    CHECK_THAT(r.error, ContainsSubstring("CLI: "));
    CHECK_THAT(r.error, ContainsSubstring("; API: connection refused"));
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: remote disabled keeps the CLI error",
                 "[fallback][unit]") {
    launcher->setAuthenticated(false);
    startBroker();
    auto orch = orchestrator(/*allowRemote=*/false);

    auto r = orch.query("hello");
    CHECK_FALSE(r.success);
    CHECK(r.path == CompletionPath::None);
    REQUIRE(r.primaryError);
    CHECK(r.error == r.primaryError->message);
    CHECK(remote->requests().empty());
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: broker shutdown mid-request goes remote",
                 "[fallback][unit]") {
    auto& broker = startBroker();
    MockScript hang;
    hang.hang = true;
    launcher->setQueryScript(hang);
    auto orch = orchestrator();

    auto fut = std::async(std::launch::async, [&] { return orch.query("slow"); });
    REQUIRE(qbroker::test::eventually([&] { return launcher->running() == 1; }));
    // The only live request is the one the orchestrator submitted
    broker.shutdown();

    auto r = fut.get();
    // Shutdown is not a user cancel, so the remote path still serves it
    CHECK(r.success);
    CHECK(r.path == CompletionPath::RemoteApi);
    REQUIRE(r.primaryError);
    CHECK(r.primaryError->code == ErrorCode::SystemShutdown);
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: image goes to the remote path encoded",
                 "[fallback][unit]") {
    launcher->setInstalled(false);
    startBroker();
    auto orch = orchestrator();

    ByteVector jpeg{std::byte{0xFF}, std::byte{0xD8}, std::byte{0xFF}, std::byte{0xE0}};
    auto r = orch.queryWithImage("describe", jpeg, "");
    CHECK(r.success);

    auto reqs = remote->requests();
    REQUIRE(reqs.size() == 1);
    REQUIRE(reqs[0].image);
    CHECK(reqs[0].image->mediaType == "image/jpeg");
    CHECK(reqs[0].image->data == jpeg);
    CHECK(artifactDir.fileCount() == 0);
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: mid-stream failure discards and restarts",
                 "[fallback][stream][unit]") {
    startBroker();
    MockScript partial;
    partial.chunks = {"The answer ", "is"};
    partial.exitCode = 1;
    partial.stderrText = "connection reset";
    launcher->setQueryScript(partial);
    remote->setReply("The answer is 42.");
    auto orch = orchestrator();

    std::vector<std::string> events;
    StreamSink sink;
    sink.onChunk = [&](std::string_view c) { events.emplace_back(c); };
    sink.onDiscard = [&] { events.emplace_back("<discard>"); };

    auto r = orch.stream("question", {}, sink);
    CHECK(r.success);
    CHECK(r.path == CompletionPath::RemoteApi);
    CHECK(events ==
          std::vector<std::string>{"The answer ", "is", "<discard>", "The answer is 42."});
}

TEST_CASE_METHOD(FallbackFixture, "FallbackOrchestrator: successful stream stays on the CLI",
                 "[fallback][stream][unit]") {
    startBroker();
    MockScript ok;
    ok.chunks = {"a", "b"};
    launcher->setQueryScript(ok);
    auto orch = orchestrator();

    std::string text;
    bool discarded = false;
    StreamSink sink;
    sink.onChunk = [&](std::string_view c) { text.append(c); };
    sink.onDiscard = [&] { discarded = true; };

    auto r = orch.stream("question", {}, sink);
    CHECK(r.success);
    CHECK(r.path == CompletionPath::Subscription);
    CHECK(r.content == "ab");
    CHECK(text == "ab");
    CHECK_FALSE(discarded);
    CHECK(remote->requests().empty());
}

TEST_CASE("buildMessagesBody: text and image blocks", "[fallback][remote][unit]") {
    config::RemoteApiConfig cfg;
    cfg.model = "default-model";
    cfg.maxTokens = 1000;

    RemoteRequest req;
    req.prompt = "What is this?";
    req.system = "Be brief.";
    req.image = RemoteImage{ByteVector{std::byte{'h'}, std::byte{'i'}}, "image/gif"};

    auto body = nlohmann::json::parse(buildMessagesBody(req, cfg));
    CHECK(body["model"] == "default-model");
    CHECK(body["max_tokens"] == 1000);
    CHECK(body["system"] == "Be brief.");
    REQUIRE(body["messages"].size() == 1);
    CHECK(body["messages"][0]["role"] == "user");
    auto content = body["messages"][0]["content"];
    REQUIRE(content.size() == 2);
    CHECK(content[0]["type"] == "image");
    CHECK(content[0]["source"]["media_type"] == "image/gif");
    CHECK(content[0]["source"]["data"] == "aGk=");
    CHECK(content[1]["text"] == "What is this?");

    req.model = "override";
    req.maxTokens = 10;
    req.system.reset();
    req.image.reset();
    body = nlohmann::json::parse(buildMessagesBody(req, cfg));
    CHECK(body["model"] == "override");
    CHECK(body["max_tokens"] == 10);
    CHECK_FALSE(body.contains("system"));
    CHECK(body["messages"][0]["content"].size() == 1);
}

TEST_CASE("parseMessagesReply: success and error shapes", "[fallback][remote][unit]") {
    auto ok = parseMessagesReply(
        200, R"({"content":[{"type":"text","text":"Hello "},{"type":"text","text":"there"}]})");
    REQUIRE(ok);
    CHECK(ok.value() == "Hello there");

    auto unauth = parseMessagesReply(
        401, R"({"type":"error","error":{"type":"authentication_error","message":"invalid x-api-key"}})");
    REQUIRE_FALSE(unauth);
    CHECK(unauth.error().code == ErrorCode::NotAuthenticated);
    CHECK_THAT(unauth.error().message, ContainsSubstring("invalid x-api-key"));

    auto overloaded = parseMessagesReply(529, "<html>busy</html>");
    REQUIRE_FALSE(overloaded);
    CHECK(overloaded.error().code == ErrorCode::RuntimeFailure);
    CHECK(overloaded.error().message == "Remote API error HTTP 529");

    auto empty = parseMessagesReply(200, R"({"content":[{"type":"tool_use"}]})");
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == ErrorCode::MalformedOutput);

    auto garbage = parseMessagesReply(200, "not json");
    REQUIRE_FALSE(garbage);
    CHECK(garbage.error().code == ErrorCode::MalformedOutput);
}

TEST_CASE("encodeBase64 and mediaTypeForExtension", "[fallback][remote][unit]") {
    auto enc = [](std::string_view s) {
        return encodeBase64({reinterpret_cast<const std::byte*>(s.data()), s.size()});
    };
    CHECK(enc("").empty());
    CHECK(enc("f") == "Zg==");
    CHECK(enc("fo") == "Zm8=");
    CHECK(enc("foo") == "Zm9v");
    CHECK(enc("foobar") == "Zm9vYmFy");

    CHECK(mediaTypeForExtension(".JPG") == "image/jpeg");
    CHECK(mediaTypeForExtension(".jpeg") == "image/jpeg");
    CHECK(mediaTypeForExtension(".gif") == "image/gif");
    CHECK(mediaTypeForExtension(".webp") == "image/webp");
    CHECK(mediaTypeForExtension(".bmp") == "image/png");
}

TEST_CASE("AnthropicHttpClient: refuses to send without a key", "[fallback][remote][unit]") {
    config::RemoteApiConfig cfg;
    cfg.apiKey.clear();
    AnthropicHttpClient client(cfg);
    auto r = client.complete(RemoteRequest{"hi", std::nullopt, std::nullopt, std::nullopt,
                                           std::nullopt});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NotAuthenticated);
}

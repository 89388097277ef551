#include "capture_tests.h"
#include "test_fixtures.h"

#include "hawk_capture_engine.h"

namespace {

struct EngineFixture {
    explicit EngineFixture(const HawkCaptureConfig& config = MemoryOnlyConfig())
        : engine(config, &timers) {
        page = std::make_shared<FakePage>("https://app.example.com/", "App");
        context = NewContext(page);
    }

    static std::shared_ptr<FakeBrowserContext> NewContext(const std::shared_ptr<FakePage>& page) {
        auto context = std::make_shared<FakeBrowserContext>();
        context->AddPage(page);
        auto connection = std::make_shared<FakeDebugConnection>();
        auto ok = [](const json&) { return CommandOk(); };
        connection->SetResponder("Target.setDiscoverTargets", ok);
        connection->SetResponder("Target.setAutoAttach", ok);
        connection->SetResponder("Target.sendMessageToTarget", ok);
        connection->SetResponder("Target.getTargets", [](const json&) {
            return CommandOk({{"targetInfos", json::array({
                {{"targetId", "sw"}, {"type", "service_worker"}, {"url", "chrome-extension://abc/sw.js"}}
            })}});
        });
        connection->SetResponder("Target.attachToTarget", [](const json& params) {
            return CommandOk({{"sessionId", "session-" + params.value("targetId", std::string())}});
        });
        context->connection = connection;
        return context;
    }

    void EmitApiRequest(const std::string& path) {
        auto request = std::make_shared<FakeRequest>("https://api.example.com" + path, "GET");
        page->EmitRequest(request);
        page->EmitResponse(std::make_shared<FakeResponse>(request, 200, "{}"));
    }

    ManualTaskRunner timers;
    HawkCaptureEngine engine;
    std::shared_ptr<FakePage> page;
    std::shared_ptr<FakeBrowserContext> context;
};

const char kApiHookFile[] =
    R"({"name": "api", "description": "API", "urlPatterns": ["https://api.example.com/*"], "captureRules": {}})";

}  // namespace

void RunEngineTests(TestRunner& runner) {
    const std::string CAT = "engine";

    // ========================================================================
    // Session lifecycle
    // ========================================================================

    runner.Test("no_hooks_leaves_session_untouched", CAT, [](TestContext& t) {
        EngineFixture f;
        StartResult result = f.engine.StartMonitoring("s1", f.context, SessionMetadata{"alice"});
        t.ExpectEq(std::string(StartResultToString(result)), std::string("no_hooks"), "start result");
        t.Expect(f.engine.GetSessionState("s1") == SessionState::UNINITIALIZED, "state changed");
        t.ExpectEq(f.page->SubscriptionCount(), size_t(0), "page subscribed");
        t.ExpectEq(f.engine.store()->GetProfileAlias("s1"), std::string("unknown"), "alias recorded");

        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        result = f.engine.StartMonitoring("s1", f.context, SessionMetadata{"alice"});
        t.Expect(result == StartResult::STARTED, "start after hooks loaded failed");
    });

    runner.Test("invalid_arguments_rejected", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        t.Expect(f.engine.StartMonitoring("", f.context, SessionMetadata()) ==
                 StartResult::INVALID_ARGUMENT, "empty id accepted");
        t.Expect(f.engine.StartMonitoring("s1", nullptr, SessionMetadata()) ==
                 StartResult::INVALID_ARGUMENT, "null context accepted");
        t.Expect(f.engine.GetSessionState("s1") == SessionState::UNINITIALIZED, "state changed");
    });

    runner.Test("states_only_move_forward", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));

        t.Expect(f.engine.StartMonitoring("s1", f.context, SessionMetadata()) == StartResult::STARTED,
                 "start failed");
        t.ExpectEq(std::string(SessionStateToString(f.engine.GetSessionState("s1"))),
                   std::string("monitoring"), "state after start");
        t.Expect(f.engine.StartMonitoring("s1", f.context, SessionMetadata()) ==
                 StartResult::SESSION_EXISTS, "double start accepted");

        t.Expect(f.engine.StopMonitoring("s1"), "stop failed");
        t.Expect(f.engine.GetSessionState("s1") == SessionState::STOPPED, "state after stop");
        t.Expect(!f.engine.StopMonitoring("s1"), "double stop succeeded");
        t.Expect(!f.engine.StopMonitoring("never"), "stop of unknown session succeeded");
        t.Expect(f.engine.StartMonitoring("s1", f.context, SessionMetadata()) ==
                 StartResult::SESSION_EXISTS, "restart accepted");
    });

    runner.Test("page_traffic_streamed_under_profile_alias", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureConfig config;
        config.output_directory = dir.str();
        EngineFixture f(config);
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        f.engine.StartMonitoring("s1", f.context, SessionMetadata{"Alice"});

        f.EmitApiRequest("/v1/me");
        t.ExpectEq(f.engine.Get("s1").size(), size_t(2), "buffered records");

        std::vector<CaptureRecord> lines;
        std::string error;
        std::string path = (dir.path() / "alice-api-s1.jsonl").string();
        t.Expect(HawkCaptureStore::ReadJsonl(path, &lines, &error), "jsonl missing: " + error);
        t.ExpectEq(lines.size(), size_t(2), "jsonl lines");
    });

    runner.Test("page_only_without_debug_connection", CAT, [](TestContext& t) {
        EngineFixture f;
        f.context->connection = nullptr;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        t.Expect(f.engine.StartMonitoring("s1", f.context, SessionMetadata()) == StartResult::STARTED,
                 "start failed");
        t.Expect(f.engine.GetMultiplexer("s1") == nullptr, "multiplexer kept");

        f.EmitApiRequest("/v1/me");
        t.ExpectEq(f.engine.Get("s1").size(), size_t(2), "page records");
    });

    runner.Test("worker_traffic_captured", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        f.engine.StartMonitoring("s1", f.context, SessionMetadata());

        auto mux = f.engine.GetMultiplexer("s1");
        t.Expect(mux != nullptr, "multiplexer missing");
        if (!mux) return;
        t.ExpectEq(mux->TargetSessionCount(), size_t(1), "target sessions");

        json request = {{"requestId", "7.1"},
                        {"request", {{"url", "https://api.example.com/v1/sync"}, {"method", "POST"}}},
                        {"initiator", {{"type", "other"}}}};
        f.context->connection->EmitFromTarget("session-sw",
            {{"method", "Network.requestWillBeSent"}, {"params", request}});

        auto records = f.engine.Get("s1");
        t.ExpectEq(records.size(), size_t(1), "records");
        if (!records.empty()) {
            t.Expect(records[0].source == CaptureSource::SERVICE_WORKER, "source");
        }
    });

    runner.Test("stop_releases_all_subscriptions", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        f.engine.StartMonitoring("s1", f.context, SessionMetadata());
        t.Expect(f.page->SubscriptionCount() > 0, "page not subscribed");
        t.Expect(f.context->connection->SubscriptionCount() > 0, "connection not subscribed");

        f.engine.StopMonitoring("s1");
        t.ExpectEq(f.page->SubscriptionCount(), size_t(0), "page subscriptions");
        t.ExpectEq(f.context->PageCreatedSubscriptions(), size_t(0), "page-created subscriptions");
        t.ExpectEq(f.context->connection->SubscriptionCount(), size_t(0), "connection subscriptions");
        t.ExpectEq(f.context->connection->detach_calls.load(), 1, "detach calls");
        t.Expect(f.engine.GetMultiplexer("s1") == nullptr, "multiplexer kept");

        f.EmitApiRequest("/v1/late");
        f.timers.AdvanceBy(kTargetRpcTimeoutMs);
        t.ExpectEq(f.engine.Get("s1").size(), size_t(0), "records after stop");
    });

    runner.Test("stopped_session_keeps_buffer", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        f.engine.StartMonitoring("s1", f.context, SessionMetadata());
        f.EmitApiRequest("/v1/me");
        f.engine.StopMonitoring("s1");
        t.ExpectEq(f.engine.Get("s1").size(), size_t(2), "buffer after stop");
    });

    runner.Test("cleanup_drops_session_data", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        f.engine.StartMonitoring("s1", f.context, SessionMetadata{"alice"});
        f.EmitApiRequest("/v1/me");

        t.ExpectEq(f.engine.TrackedSessionCount(), size_t(1), "tracked before cleanup");
        f.engine.Cleanup("s1");
        t.ExpectEq(f.engine.TrackedSessionCount(), size_t(0), "tracked after cleanup");
        t.Expect(f.engine.GetMultiplexer("s1") == nullptr, "multiplexer kept after cleanup");
        t.ExpectEq(f.engine.Get("s1").size(), size_t(0), "buffer after cleanup");
        t.ExpectEq(f.engine.store()->GetProfileAlias("s1"), std::string("unknown"), "alias after cleanup");
        t.Expect(f.engine.GetSessionState("s1") == SessionState::STOPPED, "state after cleanup");
        t.Expect(f.engine.StartMonitoring("s1", f.context, SessionMetadata()) ==
                 StartResult::SESSION_EXISTS, "id reused after cleanup");
        f.engine.Cleanup("never-started");
        t.Expect(f.engine.GetSessionState("never-started") == SessionState::UNINITIALIZED,
                 "cleanup retired an unknown id");
    });

    runner.Test("cleanup_all", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        auto second_page = std::make_shared<FakePage>("https://other.example.com/");
        auto second_context = EngineFixture::NewContext(second_page);
        f.engine.StartMonitoring("s1", f.context, SessionMetadata());
        f.engine.StartMonitoring("s2", second_context, SessionMetadata());
        f.engine.store()->Store("orphan", CaptureRecord());

        f.engine.CleanupAll();
        t.ExpectEq(f.engine.GetStatus().active_sessions, size_t(0), "active sessions");
        t.ExpectEq(f.engine.store()->TotalCaptured(), size_t(0), "captured");
        t.ExpectEq(second_page->SubscriptionCount(), size_t(0), "second page subscriptions");
        t.ExpectEq(f.engine.TrackedSessionCount(), size_t(0), "tracked sessions");
    });

    // ========================================================================
    // Hooks, status, export
    // ========================================================================

    runner.Test("status_json", CAT, [](TestContext& t) {
        EngineFixture f;
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*", "https://api2.example.com/"}));
        f.engine.StartMonitoring("s1", f.context, SessionMetadata());
        f.EmitApiRequest("/v1/me");

        json status = f.engine.GetStatus().ToJson();
        t.ExpectEq(status.value("totalHooks", 0), 1, "totalHooks");
        t.ExpectEq(status.value("totalPatterns", 0), 2, "totalPatterns");
        t.ExpectEq(status.value("activeSessions", 0), 1, "activeSessions");
        t.ExpectEq(status.value("totalCaptured", 0), 2, "totalCaptured");
        t.ExpectEq(status.value("outputFormat", ""), std::string("none"), "outputFormat");
        t.Expect(status.contains("outputDirectory"), "outputDirectory missing");
        t.Expect(status["hooks"].is_array() && status["hooks"].size() == 1, "hooks");
        t.Expect(status["hooks"][0]["patterns"].size() == 2, "hook patterns");
        t.Expect(status["sessionStats"].size() == 1 &&
                 status["sessionStats"][0].value("capturedCount", 0) == 2, "sessionStats");

        f.engine.StopMonitoring("s1");
        t.ExpectEq(f.engine.GetStatus().active_sessions, size_t(0), "active after stop");
    });

    runner.Test("reload_hooks_replaces_registry", CAT, [](TestContext& t) {
        TempDir first;
        first.Write("api.json", kApiHookFile);
        TempDir second;
        second.Write("auth.json",
            R"({"name": "auth", "urlPatterns": ["https://auth.example.com/"], "captureRules": {}})");

        EngineFixture f;
        t.ExpectEq(f.engine.LoadHooks(first.str()), size_t(1), "loaded");
        t.ExpectEq(f.engine.ReloadHooks(second.str()), size_t(1), "reloaded");
        CaptureStatus status = f.engine.GetStatus();
        t.ExpectEq(status.total_hooks, size_t(1), "hooks after reload");
        if (!status.hooks.empty()) t.ExpectEq(status.hooks[0].name, std::string("auth"), "hook name");
    });

    runner.Test("export_through_engine", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureConfig config = MemoryOnlyConfig();
        config.output_directory = dir.str();
        EngineFixture f(config);
        f.engine.RegisterHook(MakeHook("api", {"https://api.example.com/*"}));
        f.engine.StartMonitoring("s1", f.context, SessionMetadata{"Bob"});
        f.EmitApiRequest("/v1/me");

        ExportResult result = f.engine.Export("s1", "json");
        t.Expect(result.success, "export failed: " + result.error);
        t.ExpectEq(result.count, size_t(2), "count");
        t.Expect(std::filesystem::path(result.file_path).filename().string().rfind("bob-export-s1-", 0) == 0,
                 "file name: " + result.file_path);

        ExportResult missing = f.engine.Export("s2", "json");
        t.Expect(!missing.success, "export of unknown session succeeded");
    });
}

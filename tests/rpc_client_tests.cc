#include "capture_tests.h"
#include "test_fixtures.h"

#include "hawk_target_rpc_client.h"

namespace {

struct RpcFixture {
    RpcFixture() {
        connection = std::make_shared<FakeDebugConnection>();
        connection->SetResponder("Target.sendMessageToTarget",
                                 [](const json&) { return CommandOk(); });
        client.reset(new HawkTargetRpcClient(connection, &timers));
    }

    // Id of the last message forwarded into |sub_session_id|
    int64_t LastMessageId(const std::string& sub_session_id) {
        auto messages = connection->MessagesToTarget(sub_session_id);
        return messages.empty() ? -1 : messages.back().value("id", int64_t(-1));
    }

    ManualTaskRunner timers;
    std::shared_ptr<FakeDebugConnection> connection;
    std::unique_ptr<HawkTargetRpcClient> client;
};

}  // namespace

void RunRpcClientTests(TestRunner& runner) {
    const std::string CAT = "rpc_client";

    runner.Test("wraps_command_in_send_message", CAT, [](TestContext& t) {
        RpcFixture f;
        f.client->Send("sub-1", "Network.getResponseBody", {{"requestId", "42.7"}},
                       [](const HawkRpcResult&) {});

        auto sent = f.connection->Sent("Target.sendMessageToTarget");
        t.ExpectEq(sent.size(), size_t(1), "forwarded commands");
        if (sent.empty()) return;
        t.ExpectEq(sent[0].params.value("sessionId", ""), std::string("sub-1"), "sessionId");

        json message = json::parse(sent[0].params.value("message", ""), nullptr, false);
        t.Expect(!message.is_discarded(), "message is not JSON text");
        t.ExpectEq(message.value("method", ""), std::string("Network.getResponseBody"), "method");
        t.Expect(message["params"].value("requestId", "") == "42.7", "params");
        t.Expect(message.value("id", 0) > 0, "message id");
        t.ExpectEq(f.client->PendingCount(), size_t(1), "pending");
    });

    runner.Test("reply_resolves_once", CAT, [](TestContext& t) {
        RpcFixture f;
        int calls = 0;
        HawkRpcResult received;
        f.client->Send("sub-1", "Network.getResponseBody", {{"requestId", "1"}},
                       [&](const HawkRpcResult& result) {
                           calls++;
                           received = result;
                       });
        int64_t id = f.LastMessageId("sub-1");

        json reply = {{"id", id}, {"result", {{"body", "hello"}, {"base64Encoded", false}}}};
        t.Expect(!f.client->HandleReply("sub-2", reply), "reply from another session accepted");
        t.Expect(f.client->HandleReply("sub-1", reply), "reply rejected");
        t.Expect(!f.client->HandleReply("sub-1", reply), "duplicate reply accepted");

        t.ExpectEq(calls, 1, "callback calls");
        t.Expect(received.success, "not successful");
        t.ExpectEq(received.result.value("body", ""), std::string("hello"), "result body");
        t.ExpectEq(f.client->PendingCount(), size_t(0), "pending");

        f.timers.AdvanceBy(kTargetRpcTimeoutMs);
        t.ExpectEq(calls, 1, "callback after timeout");
    });

    runner.Test("error_reply_rejects", CAT, [](TestContext& t) {
        RpcFixture f;
        HawkRpcResult received;
        received.success = true;
        f.client->Send("sub-1", "Network.getResponseBody", {{"requestId", "1"}},
                       [&](const HawkRpcResult& result) { received = result; });

        json reply = {{"id", f.LastMessageId("sub-1")},
                      {"error", {{"code", -32000}, {"message", "No resource with given identifier found"}}}};
        f.client->HandleReply("sub-1", reply);
        t.Expect(!received.success, "error reply succeeded");
        t.Expect(!received.timed_out, "error reply timed out");
        t.ExpectEq(received.error, std::string("No resource with given identifier found"), "error");
    });

    runner.Test("times_out_after_eight_seconds", CAT, [](TestContext& t) {
        RpcFixture f;
        int calls = 0;
        HawkRpcResult received;
        f.client->Send("sub-1", "Network.getResponseBody", {{"requestId", "1"}},
                       [&](const HawkRpcResult& result) {
                           calls++;
                           received = result;
                       });

        f.timers.AdvanceBy(kTargetRpcTimeoutMs - 1);
        t.ExpectEq(calls, 0, "fired early");
        t.ExpectEq(f.client->PendingCount(), size_t(1), "pending before deadline");

        f.timers.AdvanceBy(1);
        t.ExpectEq(calls, 1, "timeout calls");
        t.Expect(received.timed_out, "timed_out not set");
        t.ExpectEq(received.error, std::string("RPC timeout: Network.getResponseBody"), "error");
        t.ExpectEq(f.client->PendingCount(), size_t(0), "pending after timeout");

        json late = {{"id", f.LastMessageId("sub-1")}, {"result", json::object()}};
        t.Expect(!f.client->HandleReply("sub-1", late), "late reply accepted");
        t.ExpectEq(calls, 1, "callback after late reply");
    });

    runner.Test("forward_failure_rejects_immediately", CAT, [](TestContext& t) {
        RpcFixture f;
        f.connection->SetResponder("Target.sendMessageToTarget", [](const json&) {
            return CommandError("No session with given id");
        });

        HawkRpcResult received;
        received.success = true;
        f.client->Send("gone", "Network.enable", json::object(),
                       [&](const HawkRpcResult& result) { received = result; });
        t.Expect(!received.success, "forward failure succeeded");
        t.ExpectEq(received.error, std::string("No session with given id"), "error");
        t.ExpectEq(f.client->PendingCount(), size_t(0), "pending");
    });

    runner.Test("purge_drops_without_callbacks", CAT, [](TestContext& t) {
        RpcFixture f;
        int calls = 0;
        auto count = [&calls](const HawkRpcResult&) { calls++; };
        f.client->Send("sub-1", "Network.enable", json::object(), count);
        f.client->Send("sub-1", "Network.getResponseBody", {{"requestId", "1"}}, count);
        f.client->Send("sub-2", "Network.enable", json::object(), count);

        t.ExpectEq(f.client->PurgeSession("sub-1"), size_t(2), "purged");
        t.ExpectEq(f.client->PendingCount(), size_t(1), "remaining");

        f.timers.AdvanceBy(kTargetRpcTimeoutMs);
        t.ExpectEq(calls, 1, "only the surviving entry timed out");
    });

    runner.Test("message_ids_increase", CAT, [](TestContext& t) {
        RpcFixture f;
        f.client->Send("sub-1", "Network.enable", json::object(), [](const HawkRpcResult&) {});
        f.client->Send("sub-2", "Network.enable", json::object(), [](const HawkRpcResult&) {});
        auto first = f.connection->MessagesToTarget("sub-1");
        auto second = f.connection->MessagesToTarget("sub-2");
        t.Expect(!first.empty() && !second.empty() &&
                 second[0].value("id", 0) > first[0].value("id", 0), "ids not increasing");
    });

    runner.Test("shutdown_clears_and_rejects", CAT, [](TestContext& t) {
        RpcFixture f;
        int calls = 0;
        f.client->Send("sub-1", "Network.enable", json::object(),
                       [&calls](const HawkRpcResult&) { calls++; });
        f.client->Shutdown();
        t.ExpectEq(f.client->PendingCount(), size_t(0), "pending after shutdown");

        HawkRpcResult rejected;
        rejected.success = true;
        f.client->Send("sub-1", "Network.enable", json::object(),
                       [&](const HawkRpcResult& result) { rejected = result; });
        t.Expect(!rejected.success, "send after shutdown succeeded");
        t.ExpectEq(rejected.error, std::string("RPC client is shut down"), "error");

        f.timers.AdvanceBy(kTargetRpcTimeoutMs);
        t.ExpectEq(calls, 0, "callback after shutdown");
    });

    // Timers may outlive the client
    runner.Test("timer_after_client_destroyed", CAT, [](TestContext& t) {
        RpcFixture f;
        int calls = 0;
        f.client->Send("sub-1", "Network.enable", json::object(),
                       [&calls](const HawkRpcResult&) { calls++; });
        f.client.reset();
        f.timers.AdvanceBy(kTargetRpcTimeoutMs);
        t.ExpectEq(calls, 0, "callback after destruction");
    });
}

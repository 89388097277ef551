#include "capture_tests.h"
#include "test_fixtures.h"

#include <sstream>

#include "hawk_capture_store.h"

namespace {

CaptureRecord MakeRecord(const std::string& hook, const std::string& url, int n) {
    CaptureRecord record;
    record.timestamp = "2024-05-01T10:00:00.000Z";
    record.type = CaptureType::REQUEST;
    record.hook_name = hook;
    record.session_id = "s1";
    record.url = url;
    record.method = "GET";
    record.request_id = "req_" + std::to_string(n) + "_1714557600000";
    return record;
}

HawkCaptureConfig StreamingConfig(const TempDir& dir, size_t max_capture_size = 1000) {
    HawkCaptureConfig config;
    config.output_directory = (dir.path() / "out").string();
    config.output_format = "jsonl";
    config.max_capture_size = max_capture_size;
    return config;
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

void RunStoreTests(TestRunner& runner) {
    const std::string CAT = "capture_store";

    // ========================================================================
    // Buffers
    // ========================================================================

    runner.Test("ring_buffer_evicts_oldest", CAT, [](TestContext& t) {
        HawkCaptureStore store(MemoryOnlyConfig(3));
        for (int i = 1; i <= 5; i++) {
            store.Store("s1", MakeRecord("api", "https://api.example.com/" + std::to_string(i), i));
        }
        auto records = store.Get("s1");
        t.ExpectEq(records.size(), size_t(3), "buffered");
        if (records.size() == 3) {
            t.ExpectEq(records[0].url, std::string("https://api.example.com/3"), "oldest kept");
            t.ExpectEq(records[2].url, std::string("https://api.example.com/5"), "newest");
        }
        t.ExpectEq(store.Count("s1"), size_t(3), "count");
    });

    runner.Test("sessions_are_independent", CAT, [](TestContext& t) {
        HawkCaptureStore store(MemoryOnlyConfig(2));
        store.Store("a", MakeRecord("api", "https://x/1", 1));
        store.Store("a", MakeRecord("api", "https://x/2", 2));
        store.Store("b", MakeRecord("api", "https://x/3", 3));
        store.Store("a", MakeRecord("api", "https://x/4", 4));

        t.ExpectEq(store.Count("a"), size_t(2), "session a");
        t.ExpectEq(store.Count("b"), size_t(1), "session b");
        t.ExpectEq(store.TotalCaptured(), size_t(3), "total");
        t.ExpectEq(store.SessionCounts().size(), size_t(2), "session counts");
        t.ExpectEq(store.Get("missing").size(), size_t(0), "unknown session");

        store.DropSession("a");
        t.ExpectEq(store.Count("a"), size_t(0), "dropped session");
        t.ExpectEq(store.TotalCaptured(), size_t(1), "total after drop");
    });

    runner.Test("get_returns_snapshot", CAT, [](TestContext& t) {
        HawkCaptureStore store(MemoryOnlyConfig());
        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        auto snapshot = store.Get("s1");
        store.Store("s1", MakeRecord("api", "https://x/2", 2));
        t.ExpectEq(snapshot.size(), size_t(1), "snapshot changed");
    });

    // ========================================================================
    // Profile aliases
    // ========================================================================

    runner.Test("profile_alias_sanitized", CAT, [](TestContext& t) {
        t.ExpectEq(HawkCaptureStore::SanitizeProfileAlias("Work Profile (2)"),
                   std::string("work-profile--2-"), "sanitized");
        t.ExpectEq(HawkCaptureStore::SanitizeProfileAlias(""), std::string("unknown"), "empty");

        HawkCaptureStore store(MemoryOnlyConfig());
        t.ExpectEq(store.GetProfileAlias("s1"), std::string("unknown"), "default alias");
        store.SetProfileAlias("s1", "Alice");
        t.ExpectEq(store.GetProfileAlias("s1"), std::string("alice"), "alias");
        store.DropProfileAlias("s1");
        t.ExpectEq(store.GetProfileAlias("s1"), std::string("unknown"), "dropped alias");
    });

    // ========================================================================
    // JSONL sink
    // ========================================================================

    runner.Test("jsonl_path_per_hook", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureStore store(StreamingConfig(dir));
        store.SetProfileAlias("s1", "Alice");
        std::string expected = (dir.path() / "out" / "alice-api-s1.jsonl").string();
        t.ExpectEq(store.JsonlPath("s1", "api"), expected, "hook file");
        t.ExpectEq(store.JsonlPath("s1", ""),
                   (dir.path() / "out" / "alice-general-s1.jsonl").string(), "general file");
    });

    runner.Test("streams_every_record", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureStore store(StreamingConfig(dir, 1));
        store.SetProfileAlias("s1", "alice");
        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        store.Store("s1", MakeRecord("api", "https://x/2", 2));
        store.Store("s1", MakeRecord("auth", "https://auth/1", 3));

        std::vector<CaptureRecord> api_lines;
        std::string error;
        t.Expect(HawkCaptureStore::ReadJsonl(store.JsonlPath("s1", "api"), &api_lines, &error),
                 "read failed: " + error);
        // The file is unbounded even though the buffer keeps one record
        t.ExpectEq(api_lines.size(), size_t(2), "api lines");
        if (api_lines.size() == 2) {
            t.ExpectEq(api_lines[1].url, std::string("https://x/2"), "append order");
        }

        std::vector<CaptureRecord> auth_lines;
        HawkCaptureStore::ReadJsonl(store.JsonlPath("s1", "auth"), &auth_lines, &error);
        t.ExpectEq(auth_lines.size(), size_t(1), "auth lines");
        t.ExpectEq(store.Count("s1"), size_t(1), "buffer bound");
    });

    runner.Test("no_files_when_streaming_off", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureConfig config = StreamingConfig(dir);
        config.output_format = "none";
        HawkCaptureStore store(config);
        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        t.Expect(!std::filesystem::exists(dir.path() / "out"), "output directory created");
        t.ExpectEq(store.Count("s1"), size_t(1), "buffered");
    });

    runner.Test("sink_failure_keeps_buffer", CAT, [](TestContext& t) {
        TempDir dir;
        std::string blocker = dir.Write("blocker", "not a directory");
        HawkCaptureConfig config;
        config.output_directory = blocker + "/nested";
        HawkCaptureStore store(config);
        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        t.ExpectEq(store.Count("s1"), size_t(1), "record lost");
    });

    // ========================================================================
    // Export
    // ========================================================================

    runner.Test("export_json", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureStore store(MemoryOnlyConfig());
        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        store.Store("s1", MakeRecord("api", "https://x/2", 2));

        std::string path = (dir.path() / "exports" / "s1.json").string();
        ExportResult result = store.Export("s1", "json", path);
        t.Expect(result.success, "export failed: " + result.error);
        t.ExpectEq(result.count, size_t(2), "count");
        t.ExpectEq(result.file_path, path, "path");

        std::string content = ReadFile(path);
        t.ExpectEq(result.size, uint64_t(content.size()), "size");
        json parsed = json::parse(content, nullptr, false);
        t.Expect(parsed.is_array() && parsed.size() == 2, "not a two-element array");
        t.ExpectEq(store.Count("s1"), size_t(2), "buffer changed by export");
    });

    runner.Test("export_json_matches_snapshot", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureStore store(MemoryOnlyConfig());
        store.Store("s1", MakeRecord("api", "https://api.example.com/v1/users", 1));

        CaptureRecord response = MakeRecord("api", "https://api.example.com/v1/users", 1);
        response.type = CaptureType::RESPONSE;
        response.source = CaptureSource::GLOBAL;
        response.method.reset();
        response.status = 200;
        response.status_text = "OK";
        response.headers = {{"content-type", "application/json"}, {"x-trace", "a,b"}};
        response.mime_type = "application/json";
        ApplyResponseBody(std::string(150000, 'x'), &response);
        response.custom = {{"endpoint", "v1/users"}, {"nested", {{"count", 2}}}};
        store.Store("s1", response);

        CaptureRecord failed = MakeRecord("api", "https://api.example.com/v1/stats", 2);
        failed.type = CaptureType::RESPONSE;
        failed.status = 404;
        failed.body_error = "Failed to read response body";
        store.Store("s1", failed);

        std::vector<CaptureRecord> snapshot = store.Get("s1");
        json expected = CaptureRecordsToJson(snapshot);

        std::string path = (dir.path() / "s1.json").string();
        ExportResult result = store.Export("s1", "json", path);
        t.Expect(result.success, "export failed: " + result.error);

        json exported = json::parse(ReadFile(path), nullptr, false);
        t.Expect(exported.is_array(), "export is not an array");
        if (!exported.is_array()) return;
        t.ExpectEq(exported.size(), snapshot.size(), "exported records");
        for (size_t i = 0; i < exported.size() && i < expected.size(); i++) {
            t.Expect(exported[i] == expected[i], "record " + std::to_string(i) + " differs");
        }

        if (exported.size() == 3) {
            const json& truncated = exported[1];
            t.Expect(truncated.value("bodyTruncated", false), "bodyTruncated");
            t.ExpectEq(truncated.value("bodySize", 0), 150000, "bodySize");
            t.ExpectEq(truncated.value("bodyPreview", std::string()).size(), size_t(1000),
                       "bodyPreview length");
            t.Expect(!truncated.contains("body"), "inline body kept");
            t.ExpectEq(truncated["headers"].value("x-trace", ""), std::string("a,b"), "headers");
            t.ExpectEq(truncated["custom"]["nested"].value("count", 0), 2, "custom");
            t.ExpectEq(exported[2].value("status", 0), 404, "status");
        }
    });

    runner.Test("export_jsonl", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureStore store(MemoryOnlyConfig());
        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        store.Store("s1", MakeRecord("api", "https://x/2", 2));

        std::string path = (dir.path() / "s1.jsonl").string();
        ExportResult result = store.Export("s1", "jsonl", path);
        t.Expect(result.success, "export failed: " + result.error);

        std::vector<CaptureRecord> lines;
        std::string error;
        HawkCaptureStore::ReadJsonl(path, &lines, &error);
        t.ExpectEq(lines.size(), size_t(2), "lines");
    });

    runner.Test("export_csv_quotes_fields", CAT, [](TestContext& t) {
        std::vector<CaptureRecord> records;
        CaptureRecord record = MakeRecord("api", "https://x/search?q=a,b", 1);
        record.headers = {{"accept", "text/plain"}};
        records.push_back(record);
        CaptureRecord response = MakeRecord("api", "https://x/1", 2);
        response.type = CaptureType::RESPONSE;
        response.method.reset();
        response.status = 404;
        records.push_back(response);

        std::string csv;
        t.Expect(HawkCaptureStore::FormatRecords(records, "csv", &csv), "csv rejected");

        std::vector<std::string> lines;
        std::stringstream stream(csv);
        std::string line;
        while (std::getline(stream, line)) lines.push_back(line);
        t.ExpectEq(lines.size(), size_t(3), "csv lines");
        if (lines.size() != 3) return;
        t.ExpectEq(lines[0], std::string("timestamp,type,hookName,url,method,status,headers"), "header");
        t.Expect(lines[1].find("\"https://x/search?q=a,b\"") != std::string::npos,
                 "url not quoted: " + lines[1]);
        t.Expect(lines[1].find("\"{\"\"accept\"\":\"\"text/plain\"\"}\"") != std::string::npos,
                 "headers not quoted: " + lines[1]);
        t.Expect(lines[2].find(",response,api,https://x/1,,404,") != std::string::npos,
                 "response row: " + lines[2]);
    });

    runner.Test("export_errors", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureStore store(MemoryOnlyConfig());

        ExportResult empty = store.Export("s1", "json", (dir.path() / "x.json").string());
        t.Expect(!empty.success, "empty export succeeded");
        t.ExpectEq(empty.error, std::string("No captures found for session s1"), "empty error");

        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        ExportResult xml = store.Export("s1", "xml", (dir.path() / "x.xml").string());
        t.Expect(!xml.success, "xml export succeeded");
        t.ExpectEq(xml.error, std::string("Unsupported format: xml"), "format error");
        t.Expect(!std::filesystem::exists(dir.path() / "x.xml"), "file written for bad format");

        ExportResult none = HawkCaptureStore::ExportRecords({}, "json", (dir.path() / "y.json").string());
        t.ExpectEq(none.error, std::string("No captures to export"), "no records error");
    });

    runner.Test("export_default_path", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureConfig config = MemoryOnlyConfig();
        config.output_directory = dir.str();
        HawkCaptureStore store(config);
        store.SetProfileAlias("s1", "Alice");
        store.Store("s1", MakeRecord("api", "https://x/1", 1));

        ExportResult result = store.Export("s1", "csv");
        t.Expect(result.success, "export failed: " + result.error);
        std::string name = std::filesystem::path(result.file_path).filename().string();
        t.Expect(name.rfind("alice-export-s1-", 0) == 0, "file name: " + name);
        t.Expect(name.size() > 4 && name.substr(name.size() - 4) == ".csv", "extension: " + name);
        t.Expect(std::filesystem::exists(result.file_path), "file missing");
    });

    runner.Test("read_jsonl_skips_bad_lines", CAT, [](TestContext& t) {
        TempDir dir;
        std::string path = dir.Write("mixed.jsonl",
            "{\"type\":\"request\",\"url\":\"https://x/1\",\"hookName\":\"api\"}\n"
            "\n"
            "not json\n"
            "{\"type\":\"request\"}\r\n"
            "{\"type\":\"page\",\"url\":\"https://x/2\",\"title\":\"Home\"}\r\n");

        std::vector<CaptureRecord> records;
        std::string error;
        t.Expect(HawkCaptureStore::ReadJsonl(path, &records, &error), "read failed: " + error);
        t.ExpectEq(records.size(), size_t(2), "records");
        if (records.size() == 2) {
            t.Expect(records[1].title && *records[1].title == "Home", "page title");
        }
        t.Expect(!HawkCaptureStore::ReadJsonl((dir.path() / "none.jsonl").string(), &records, &error),
                 "missing file read");
    });

    runner.Test("remove_capture_logs", CAT, [](TestContext& t) {
        TempDir dir;
        HawkCaptureConfig config = StreamingConfig(dir);
        HawkCaptureStore store(config);
        store.SetProfileAlias("s1", "Alice");
        store.SetProfileAlias("s2", "Bob");
        store.Store("s1", MakeRecord("api", "https://x/1", 1));
        store.Store("s1", MakeRecord("auth", "https://x/2", 2));
        store.Store("s2", MakeRecord("api", "https://x/3", 3));
        ExportResult exported = store.Export("s1", "jsonl");
        t.Expect(exported.success, "export failed: " + exported.error);

        std::ofstream((std::filesystem::path(config.output_directory) / "notes.txt").string()) << "keep";

        std::vector<std::string> removed;
        std::string error;
        t.Expect(HawkCaptureStore::RemoveCaptureLogs(config.output_directory, "s1", &removed, &error),
                 "session cleanup failed: " + error);
        t.ExpectEq(removed.size(), size_t(2), "s1 logs removed");
        t.Expect(!std::filesystem::exists(store.JsonlPath("s1", "api")), "s1 api log left");
        t.Expect(std::filesystem::exists(store.JsonlPath("s2", "api")), "s2 log removed");
        t.Expect(std::filesystem::exists(exported.file_path), "export removed");

        removed.clear();
        t.Expect(HawkCaptureStore::RemoveCaptureLogs(config.output_directory, "", &removed, &error),
                 "full cleanup failed: " + error);
        t.ExpectEq(removed.size(), size_t(1), "remaining logs removed");
        t.Expect(std::filesystem::exists(exported.file_path), "export removed by full cleanup");
        t.Expect(std::filesystem::exists(std::filesystem::path(config.output_directory) / "notes.txt"),
                 "unrelated file removed");
        t.ExpectEq(store.Count("s1"), size_t(2), "buffer touched");

        removed.clear();
        t.Expect(HawkCaptureStore::RemoveCaptureLogs((dir.path() / "absent").string(), "", &removed,
                                                     &error), "missing directory is an error");
        t.ExpectEq(removed.size(), size_t(0), "removed from missing directory");
    });
}

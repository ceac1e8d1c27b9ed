// Test suite for ddsxfer.
//
// Tests:
//   1. Chunk arithmetic (chunk counts, work parcels, byte ranges)
//   2. Hash verification
//   3. Task graph and scheduler, stopping siblings after a failure
//   4. Consistency waiter
//   5. Data service API: error mapping, service retries, signed-URL PUT retry
//   6. Upload engine: chunk URLs, forbidden URLs, zero-byte and multi-chunk files,
//      project uploads
//   7. Download engine: single range, partial/oversized retries, expired URLs,
//      already-complete files, project downloads
//   8. TransferConfig loading and validation
//   9. Metrics and progress reporting
//
// Network traffic goes to an in-process fake HttpTransport.

#include "ddsxfer/chunking.hpp"
#include "ddsxfer/consistency.hpp"
#include "ddsxfer/constants.hpp"
#include "ddsxfer/data_service.hpp"
#include "ddsxfer/errors.hpp"
#include "ddsxfer/file_downloader.hpp"
#include "ddsxfer/file_uploader.hpp"
#include "ddsxfer/hash.hpp"
#include "ddsxfer/http.hpp"
#include "ddsxfer/local_file.hpp"
#include "ddsxfer/metrics.hpp"
#include "ddsxfer/parallel.hpp"
#include "ddsxfer/project_downloader.hpp"
#include "ddsxfer/project_uploader.hpp"
#include "ddsxfer/transfer_config.hpp"
#include "ddsxfer/watcher.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace ddsxfer;
using nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

// Run `stmt` and fail unless it throws `ExType`.
#define ASSERT_THROWS(stmt, ExType, msg)                              \
    do {                                                              \
        bool threw_ = false;                                          \
        try { stmt; } catch (const ExType&) { threw_ = true; }        \
        if (!threw_) { FAIL(msg); return; }                           \
    } while (0)

static const std::string kApiUrl = "https://api.example/api/v1";
static const std::string kStoreHost = "https://store.example";

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static std::string md5_of(const std::string& s) {
    return HashUtil::hash_chunk(to_bytes(s), "md5").value;
}

/// 0..n-1 bytes of a repeating printable pattern.
static std::string pattern(size_t n, char first = 'a') {
    std::string s(n, ' ');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>(first + (i % 26));
    return s;
}

static HttpResponse status_response(int status) {
    HttpResponse response;
    response.status_code = status;
    return response;
}

static HttpResponse json_response(int status, const json& body) {
    HttpResponse response;
    response.status_code = status;
    auto text = body.dump();
    response.body.assign(text.begin(), text.end());
    return response;
}

static HttpResponse body_response(int status, const std::string& body) {
    HttpResponse response;
    response.status_code = status;
    response.body.assign(body.begin(), body.end());
    return response;
}

static HttpResponse network_error() {
    HttpResponse response;
    response.is_network_error = true;
    response.error = "Connection reset by peer";
    return response;
}

/// Records every request and answers through `handler`, one request at a time.
struct FakeServer {
    std::mutex mutex;
    std::function<HttpResponse(const HttpRequest&)> handler;
    std::vector<HttpRequest> requests;
    int sessions_created = 0;

    HttpResponse handle(const HttpRequest& request) {
        std::lock_guard lock(mutex);
        requests.push_back(request);
        return handler(request);
    }

    size_t count(HttpMethod method, const std::string& url_suffix) {
        std::lock_guard lock(mutex);
        return std::count_if(requests.begin(), requests.end(), [&](const HttpRequest& r) {
            return r.method == method && r.url.ends_with(url_suffix);
        });
    }

    size_t count_host(const std::string& host) {
        std::lock_guard lock(mutex);
        return std::count_if(requests.begin(), requests.end(), [&](const HttpRequest& r) {
            return r.url.starts_with(host);
        });
    }

    int sessions() {
        std::lock_guard lock(mutex);
        return sessions_created;
    }
};

class FakeTransport : public HttpTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}

    HttpResponse execute(const HttpRequest& request) override {
        return server_->handle(request);
    }

    HttpResponse stream(const HttpRequest& request, const HttpBodySink& sink) override {
        auto response = server_->handle(request);
        if (response.ok() && !response.body.empty()) {
            if (!sink(response.body.data(), response.body.size())) {
                response.aborted_by_sink = true;
            }
            response.body.clear();
        }
        return response;
    }

private:
    std::shared_ptr<FakeServer> server_;
};

static TransportFactory fake_factory(std::shared_ptr<FakeServer> server) {
    return [server]() -> std::unique_ptr<HttpTransport> {
        {
            std::lock_guard lock(server->mutex);
            ++server->sessions_created;
        }
        return std::make_unique<FakeTransport>(server);
    };
}

/// Control-plane and object store for uploads. Runs under FakeServer's lock.
struct UploadService {
    int uploads = 0;
    int files = 0;
    int store_puts = 0;
    int signatures = 0;
    int not_consistent_left = 0;
    std::vector<uint64_t> chunk_numbers;
    std::map<std::string, std::string> stored;  // "/<upload>/<number>" -> bytes
    // Replaces the response to the Nth (0-based) store PUT.
    std::function<std::optional<HttpResponse>(int)> store_override;

    HttpResponse operator()(const HttpRequest& req) {
        const std::string& url = req.url;
        if (url.starts_with(kStoreHost)) {
            int index = store_puts++;
            if (store_override) {
                if (auto response = store_override(index)) return *response;
            }
            auto path = url.substr(kStoreHost.size());
            path = path.substr(0, path.find('?'));
            stored[path] = std::string(req.body.begin(), req.body.end());
            return status_response(201);
        }
        if (req.method == HttpMethod::POST && url.find("/projects/") != std::string::npos &&
            url.ends_with("/uploads")) {
            return json_response(201, {{"id", "upload-" + std::to_string(++uploads)}});
        }
        if (req.method == HttpMethod::PUT && url.ends_with("/chunks")) {
            if (not_consistent_left > 0) {
                --not_consistent_left;
                return json_response(404, {{"code", "resource_not_consistent"}, {"reason", "not ready"}});
            }
            auto body = json::parse(req.body.begin(), req.body.end());
            auto number = body.at("number").get<uint64_t>();
            chunk_numbers.push_back(number);
            auto start = url.find("/uploads/") + std::strlen("/uploads/");
            auto upload_id = url.substr(start, url.size() - std::strlen("/chunks") - start);
            return json_response(200, {
                {"http_verb", "PUT"},
                {"host", kStoreHost},
                {"url", "/" + upload_id + "/" + std::to_string(number) + "?sig=" + std::to_string(++signatures)},
                {"http_headers", {{"Content-Type", "application/octet-stream"}}},
            });
        }
        if (req.method == HttpMethod::PUT && url.ends_with("/complete")) {
            return json_response(200, json::object());
        }
        if (req.method == HttpMethod::POST && url.ends_with("/files/")) {
            return json_response(201, {{"id", "file-" + std::to_string(++files)}});
        }
        if (req.method == HttpMethod::PUT && url.find("/files/") != std::string::npos) {
            return json_response(200, {{"id", url.substr(url.rfind('/') + 1)}});
        }
        return json_response(404, {{"reason", "no route for " + url}});
    }
};

static std::shared_ptr<FakeServer> upload_server(UploadService& service) {
    auto server = std::make_shared<FakeServer>();
    server->handler = [&service](const HttpRequest& req) { return service(req); };
    return server;
}

/// Serves ranged GETs for files keyed by URL path (query string ignored).
struct DownloadStore {
    std::map<std::string, std::string> contents;
    std::vector<std::pair<uint64_t, uint64_t>> ranges;
    int gets = 0;
    // Replaces the response to the Nth (0-based) GET.
    std::function<std::optional<HttpResponse>(int, const std::string& full_body)> override_get;

    HttpResponse operator()(const HttpRequest& req) {
        int index = gets++;
        auto path = req.url.substr(kStoreHost.size());
        path = path.substr(0, path.find('?'));
        auto it = contents.find(path);
        if (it == contents.end()) return status_response(404);
        uint64_t start = 0;
        uint64_t end = it->second.size() - 1;
        if (req.byte_range) {
            ranges.push_back(*req.byte_range);
            start = req.byte_range->first;
            end = req.byte_range->second;
        }
        auto body = it->second.substr(start, end - start + 1);
        if (override_get) {
            if (auto response = override_get(index, body)) return *response;
        }
        return body_response(206, body);
    }
};

static std::shared_ptr<FakeServer> download_server(DownloadStore& store) {
    auto server = std::make_shared<FakeServer>();
    server->handler = [&store](const HttpRequest& req) { return store(req); };
    return server;
}

class RecordingWatcher : public Watcher {
public:
    void transferring_item(const std::string& item, int increment_amt, int64_t transferred_bytes) override {
        items.push_back(item);
        units += increment_amt;
        bytes += transferred_bytes;
        if (transferred_bytes < 0) ++reverts;
    }
    void start_waiting() override { ++starts; }
    void done_waiting() override { ++dones; }

    std::vector<std::string> items;
    int units = 0;
    int64_t bytes = 0;
    int reverts = 0;
    int starts = 0;
    int dones = 0;
};

/// Config pointed at the fakes, with every backoff sleep disabled.
static TransferConfig test_config() {
    TransferConfig config;
    config.url = kApiUrl;
    config.auth_token = "secret-token";
    config.upload_workers = 3;
    config.download_workers = 3;
    config.retry.connection_retry_seconds = 0;
    config.retry.service_down_retry_seconds = 0;
    config.retry.resource_not_consistent_retry_seconds = 0;
    config.retry.send_external_retry_seconds = 0;
    config.retry.fetch_external_retry_seconds = 0;
    return config;
}

// ---------------------------------------------------------------------------
// 1. Chunk arithmetic
// ---------------------------------------------------------------------------

static void test_chunk_arithmetic() {
    std::cout << "\n=== Chunk arithmetic ===" << std::endl;

    {
        TEST(num_chunks_values);
        ASSERT_EQ(num_chunks(100, 300), 3ULL, "100/300");
        ASSERT_EQ(num_chunks(100, 0), 1ULL, "zero-byte file needs one chunk");
        ASSERT_EQ(num_chunks(122, 123), 2ULL, "122/123");
        ASSERT_EQ(num_chunks(125, 123), 1ULL, "125/123");
        PASS();
    }
    {
        TEST(work_parcels_four_workers_nineteen_chunks);
        std::vector<WorkParcel> expected = {{0, 5}, {5, 5}, {10, 5}, {15, 4}};
        ASSERT_TRUE(work_parcels(4, 19) == expected, "parcels for (4, 19)");
        PASS();
    }
    {
        TEST(work_parcels_can_leave_workers_idle);
        auto parcels = work_parcels(4, 5);
        ASSERT_EQ(parcels.size(), (size_t)3, "ceil(5/4)=2 per batch gives 3 batches");
        ASSERT_EQ(parcels.back().num_items, 1ULL, "last batch");
        PASS();
    }
    {
        TEST(work_parcels_cover_all_chunks);
        for (size_t workers = 1; workers <= 9; ++workers) {
            for (uint64_t chunks = 1; chunks <= 40; ++chunks) {
                auto parcels = work_parcels(workers, chunks);
                ASSERT_TRUE(parcels.size() <= workers, "no more parcels than workers");
                uint64_t next = 0;
                for (const auto& parcel : parcels) {
                    ASSERT_EQ(parcel.start_index, next, "parcels must be contiguous");
                    ASSERT_TRUE(parcel.num_items > 0, "parcels must not be empty");
                    next += parcel.num_items;
                }
                ASSERT_EQ(next, chunks, "parcels must cover every chunk");
            }
        }
        PASS();
    }
    {
        TEST(byte_ranges_cover_file);
        for (uint64_t size : {1ULL, 2ULL, 99ULL, 100ULL, 101ULL, 1000ULL, 4097ULL}) {
            for (uint64_t per_chunk : {1ULL, 7ULL, 100ULL, 5000ULL}) {
                auto ranges = byte_ranges(size, per_chunk);
                uint64_t next = 0;
                for (const auto& range : ranges) {
                    ASSERT_EQ(range.start, next, "ranges must be contiguous");
                    ASSERT_TRUE(range.end >= range.start, "inclusive range");
                    ASSERT_TRUE(range.size() <= per_chunk, "range no larger than requested");
                    next = range.end + 1;
                }
                ASSERT_EQ(next, size, "ranges must end at the last byte");
            }
        }
        ASSERT_TRUE(byte_ranges(0, 100).empty(), "zero-byte file has no ranges");
        PASS();
    }
    {
        TEST(download_chunk_size_has_floor);
        ASSERT_EQ(download_bytes_per_chunk(100, 8, 20), 20ULL, "floor applies");
        ASSERT_EQ(download_bytes_per_chunk(1000, 4, 20), 250ULL, "split across workers");
        ASSERT_EQ(download_bytes_per_chunk(1001, 4, 20), 251ULL, "rounded up");
        auto ranges = byte_ranges(100, download_bytes_per_chunk(100, 8));
        ASSERT_EQ(ranges.size(), (size_t)1, "small file is a single range");
        ASSERT_TRUE(ranges[0] == (ByteRange{0, 99}), "range (0, 99)");
        PASS();
    }
    {
        TEST(describe_chunk_offsets);
        auto last = describe_chunk(3, 3, 10);
        ASSERT_EQ(last.offset, 9ULL, "offset");
        ASSERT_EQ(last.size, 1ULL, "last chunk is short");
        ASSERT_EQ(last.wire_number(), 4ULL, "wire numbers start at 1");
        auto empty = describe_chunk(0, 100, 0);
        ASSERT_EQ(empty.size, 0ULL, "zero-byte chunk");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Hash verification
// ---------------------------------------------------------------------------

static void test_hash_verification() {
    std::cout << "\n=== Hash verification ===" << std::endl;

    auto tmpdir = make_temp_dir("ddsxfer-hash");
    auto path = tmpdir / "hello.txt";
    write_file(path, "hello");
    const std::string md5 = "5d41402abc4b2a76b9719d911017c592";
    const std::string sha1 = "aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d";

    {
        TEST(hash_util_algorithms);
        ASSERT_EQ(HashUtil::hash_file(path).value, md5, "md5");
        ASSERT_EQ(HashUtil::hash_file(path, "sha1").value, sha1, "sha1");
        ASSERT_EQ(HashUtil::hash_file(path, "SHA256").value,
                  "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824", "sha256");
        HashUtil incremental("md5");
        incremental.add_chunk(to_bytes("hel"));
        incremental.add_chunk(to_bytes("lo"));
        ASSERT_EQ(incremental.finish().value, md5, "incremental md5");
        PASS();
    }
    {
        TEST(all_matching_is_ok);
        auto status = FileHashStatus::determine_for_hashes({{"md5", md5}, {"sha1", sha1}}, path);
        ASSERT_TRUE(status.status() == HashStatus::OK, "status OK");
        ASSERT_TRUE(status.has_a_valid_hash(), "valid");
        status.raise_for_status();
        ASSERT_TRUE(status.status_line().find(" OK (") != std::string::npos, "status line");
        PASS();
    }
    {
        TEST(all_mismatching_fails_and_raises);
        auto status = FileHashStatus::determine_for_hashes({{"md5", "0000"}}, path);
        ASSERT_TRUE(status.status() == HashStatus::FAILED, "status FAILED");
        ASSERT_TRUE(!status.has_a_valid_hash(), "not valid");
        ASSERT_THROWS(status.raise_for_status(), HashValidationError, "FAILED must raise");
        PASS();
    }
    {
        TEST(mixed_is_warning_without_raise);
        auto status = FileHashStatus::determine_for_hashes({{"md5", md5}, {"sha1", "bad"}}, path);
        ASSERT_TRUE(status.status() == HashStatus::WARNING, "status WARNING");
        ASSERT_TRUE(status.has_a_valid_hash(), "WARNING counts as valid");
        status.raise_for_status();
        PASS();
    }
    {
        TEST(unsupported_algorithm_raises);
        ASSERT_THROWS(FileHashStatus::determine_for_hashes({{"crc32", "1234"}}, path),
                      HashValidationError, "cannot validate without a supported algorithm");
        PASS();
    }
    {
        TEST(unsupported_algorithm_is_skipped_beside_supported_one);
        auto status = FileHashStatus::determine_for_hashes({{"crc32", "1234"}, {"md5", md5}}, path);
        ASSERT_TRUE(status.status() == HashStatus::OK, "md5 decides");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. Task graph and scheduler
// ---------------------------------------------------------------------------

class RecordingCommand : public TaskCommand {
public:
    explicit RecordingCommand(std::string name, bool fail = false)
        : name_(std::move(name)), fail_(fail) {}

    void before_run(const json& parent_task_result) override {
        ++before_runs;
        parent_seen = parent_task_result;
    }

    json create_context() override {
        return {{"name", name_}, {"parent", parent_seen}, {"fail", fail_}};
    }

    TaskFunc func() const override {
        return [](const json& context, const MessageSender& sender) -> json {
            sender.send({{"kind", "note"}, {"task", sender.task_id()}});
            if (context.at("fail").get<bool>()) {
                throw std::runtime_error("boom in " + context.at("name").get<std::string>());
            }
            return {{"result", context.at("name").get<std::string>() + "-done"},
                    {"parent", context.at("parent")}};
        };
    }

    void after_run(const json& result) override { result_seen = result; }
    void on_message(const json& message) override {
        (void)message;
        ++messages;
    }

    int before_runs = 0;
    int messages = 0;
    json parent_seen;
    json result_seen;

private:
    std::string name_;
    bool fail_;
};

/// Runs until stop is requested or five seconds pass.
class LingeringCommand : public TaskCommand {
public:
    json create_context() override { return json::object(); }

    TaskFunc func() const override {
        auto saw_stop = saw_stop_;
        return [saw_stop](const json&, const MessageSender& sender) -> json {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (std::chrono::steady_clock::now() < deadline) {
                if (sender.stop_requested()) {
                    *saw_stop = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return {{"lingered", true}};
        };
    }

    bool saw_stop() const { return *saw_stop_; }

private:
    std::shared_ptr<std::atomic<bool>> saw_stop_ = std::make_shared<std::atomic<bool>>(false);
};

static double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

static void test_task_graph() {
    std::cout << "\n=== Task graph and scheduler ===" << std::endl;

    {
        TEST(waiting_task_list_chain);
        WaitingTaskList list;
        list.add(Task{1, std::nullopt, nullptr});
        list.add(Task{2, 1, nullptr});
        list.add(Task{3, 1, nullptr});
        auto roots = list.get_next_tasks(std::nullopt);
        ASSERT_EQ(roots.size(), (size_t)1, "one root");
        ASSERT_EQ(roots[0].id, 1, "root is A");
        auto children = list.get_next_tasks(1);
        ASSERT_EQ(children.size(), (size_t)2, "two children");
        ASSERT_EQ(children[0].id, 2, "B first");
        ASSERT_EQ(children[1].id, 3, "C second");
        ASSERT_TRUE(list.get_next_tasks(2).empty(), "nothing waits on B");
        ASSERT_EQ(list.get_next_tasks(1).size(), (size_t)2, "lookup does not remove");
        PASS();
    }
    {
        TEST(runner_assigns_sequential_ids);
        TaskExecutor executor(2);
        TaskRunner runner(executor);
        auto a = runner.add(std::nullopt, std::make_shared<RecordingCommand>("a"));
        auto b = runner.add(a, std::make_shared<RecordingCommand>("b"));
        ASSERT_EQ(a, 1, "first id");
        ASSERT_EQ(b, 2, "second id");
        ASSERT_EQ(runner.get_next_tasks(a).size(), (size_t)1, "b waits on a");
        PASS();
    }
    {
        TEST(roots_run_independently_and_child_sees_parent);
        auto a = std::make_shared<RecordingCommand>("a");
        auto b = std::make_shared<RecordingCommand>("b");
        auto c = std::make_shared<RecordingCommand>("c");
        TaskExecutor executor(2);
        TaskRunner runner(executor);
        auto a_id = runner.add(std::nullopt, a);
        runner.add(std::nullopt, b);
        runner.add(a_id, c);
        runner.run();

        ASSERT_EQ(a->result_seen.at("result").get<std::string>(), "a-done", "a result");
        ASSERT_EQ(b->result_seen.at("result").get<std::string>(), "b-done", "b result");
        ASSERT_TRUE(a->parent_seen.is_null(), "root sees no parent result");
        ASSERT_EQ(c->parent_seen.at("result").get<std::string>(), "a-done", "c sees a's result");
        ASSERT_EQ(c->result_seen.at("parent").at("result").get<std::string>(), "a-done",
                  "c's worker got a's result through its context");
        ASSERT_EQ(a->before_runs + b->before_runs + c->before_runs, 3, "before_run once per task");
        ASSERT_EQ(a->messages, 1, "a's message delivered");
        ASSERT_EQ(c->messages, 1, "c's message delivered");
        ASSERT_TRUE(executor.is_done(), "executor drained");
        PASS();
    }
    {
        TEST(more_tasks_than_workers);
        std::vector<std::shared_ptr<RecordingCommand>> commands;
        TaskExecutor executor(2);
        TaskRunner runner(executor);
        for (int i = 0; i < 10; ++i) {
            commands.push_back(std::make_shared<RecordingCommand>("t" + std::to_string(i)));
            runner.add(std::nullopt, commands.back());
        }
        runner.run();
        for (int i = 0; i < 10; ++i) {
            ASSERT_EQ(commands[i]->result_seen.at("result").get<std::string>(),
                      "t" + std::to_string(i) + "-done", "every task ran");
        }
        PASS();
    }
    {
        TEST(worker_error_aborts_run_with_text);
        auto a = std::make_shared<RecordingCommand>("a", true);
        auto child = std::make_shared<RecordingCommand>("child");
        TaskExecutor executor(2);
        TaskRunner runner(executor);
        auto a_id = runner.add(std::nullopt, a);
        runner.add(a_id, child);
        std::string what;
        try {
            runner.run();
        } catch (const TaskFailedError& e) {
            what = e.what();
        }
        ASSERT_EQ(what, "boom in a", "original error text");
        ASSERT_EQ(child->before_runs, 0, "child of failed task never starts");
        PASS();
    }
    {
        TEST(worker_error_stops_running_siblings);
        auto failing = std::make_shared<RecordingCommand>("range", true);
        auto lingering = std::make_shared<LingeringCommand>();
        TaskExecutor executor(2);
        TaskRunner runner(executor);
        runner.add(std::nullopt, lingering);
        runner.add(std::nullopt, failing);
        auto start = std::chrono::steady_clock::now();
        std::string what;
        try {
            runner.run();
        } catch (const TaskFailedError& e) {
            what = e.what();
        }
        double elapsed = seconds_since(start);
        ASSERT_EQ(what, "boom in range", "failing task's text");
        ASSERT_TRUE(lingering->saw_stop(), "sibling was told to stop");
        ASSERT_TRUE(elapsed < 2.0, "error surfaced after " + std::to_string(elapsed) + "s");
        PASS();
    }
    {
        TEST(executor_runs_again_after_a_failure);
        TaskExecutor executor(2);
        {
            TaskRunner runner(executor);
            runner.add(std::nullopt, std::make_shared<RecordingCommand>("first", true));
            ASSERT_THROWS(runner.run(), TaskFailedError, "first run fails");
        }
        auto quick = std::make_shared<RecordingCommand>("second");
        TaskRunner runner(executor);
        runner.add(std::nullopt, quick);
        runner.run();
        ASSERT_EQ(quick->result_seen.at("result").get<std::string>(), "second-done", "later run completes");
        PASS();
    }
    {
        TEST(stoppable_sleep_wakes_on_request);
        std::stop_source source;
        std::thread stopper([&source]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            source.request_stop();
        });
        auto start = std::chrono::steady_clock::now();
        bool cancelled = false;
        try {
            sleep_unless_stopped(std::chrono::seconds(5), source.get_token());
        } catch (const TaskCancelledError&) {
            cancelled = true;
        }
        stopper.join();
        ASSERT_TRUE(cancelled, "TaskCancelledError");
        ASSERT_TRUE(seconds_since(start) < 2.0, "woke early");
        sleep_unless_stopped(std::chrono::milliseconds(1), std::stop_token());
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Consistency waiter
// ---------------------------------------------------------------------------

static void test_consistency_waiter() {
    std::cout << "\n=== Consistency waiter ===" << std::endl;

    RetrySettings retry;
    retry.resource_not_consistent_retry_seconds = 0;

    {
        TEST(retries_until_consistent_and_notifies_once);
        RecordingWatcher watcher;
        int calls = 0;
        int result = retry_until_resource_is_consistent([&]() {
            if (++calls < 4) throw ResourceNotConsistentError(404, "/uploads/u1/chunks", "not ready");
            return 7;
        }, &watcher, retry);
        ASSERT_EQ(result, 7, "result returned");
        ASSERT_EQ(calls, 4, "called until consistent");
        ASSERT_EQ(watcher.starts, 1, "one start_waiting per run of retries");
        ASSERT_EQ(watcher.dones, 1, "one done_waiting per run of retries");
        PASS();
    }
    {
        TEST(no_notification_without_waiting);
        RecordingWatcher watcher;
        auto result = retry_until_resource_is_consistent([]() { return std::string("ok"); }, &watcher, retry);
        ASSERT_EQ(result, "ok", "result");
        ASSERT_EQ(watcher.starts, 0, "no start_waiting");
        PASS();
    }
    {
        TEST(other_errors_propagate_immediately);
        int calls = 0;
        ASSERT_THROWS(retry_until_resource_is_consistent([&]() -> int {
            ++calls;
            throw DataServiceError(400, "/files/", "bad request");
        }, nullptr, retry), DataServiceError, "DataServiceError propagates");
        ASSERT_EQ(calls, 1, "no retry for other errors");
        PASS();
    }
    {
        TEST(optional_ceiling_rethrows);
        RetrySettings capped = retry;
        capped.resource_not_consistent_max_retries = 2;
        RecordingWatcher watcher;
        int calls = 0;
        ASSERT_THROWS(retry_until_resource_is_consistent([&]() -> int {
            ++calls;
            throw ResourceNotConsistentError(404, "/uploads/u1", "not ready");
        }, &watcher, capped), ResourceNotConsistentError, "ceiling reached");
        ASSERT_EQ(calls, 3, "initial call plus two retries");
        ASSERT_EQ(watcher.starts, 1, "start_waiting");
        ASSERT_EQ(watcher.dones, 1, "done_waiting before rethrow");
        PASS();
    }
    {
        TEST(stop_request_ends_the_wait);
        RetrySettings slow = retry;
        slow.resource_not_consistent_retry_seconds = 5;
        std::stop_source source;
        RecordingWatcher watcher;
        int calls = 0;
        auto start = std::chrono::steady_clock::now();
        ASSERT_THROWS(retry_until_resource_is_consistent([&]() -> int {
            if (++calls == 2) source.request_stop();
            throw ResourceNotConsistentError(404, "/uploads/u1", "not ready");
        }, &watcher, slow, source.get_token()), TaskCancelledError, "wait cancelled");
        ASSERT_TRUE(seconds_since(start) < 2.0, "no full retry sleep");
        ASSERT_EQ(watcher.dones, 1, "done_waiting on cancel");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Data service API
// ---------------------------------------------------------------------------

static void test_data_service() {
    std::cout << "\n=== Data service API ===" << std::endl;

    auto connection = DataServiceConnection::from_config(test_config());
    const HashData hash{"md5", "abc"};

    {
        TEST(request_headers_and_body);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return json_response(201, {{"id", "upload-1"}}); };
        DataServiceApi api(connection, fake_factory(server));
        auto resp = api.create_upload("p1", "data.txt", "text/plain", 5, hash);
        ASSERT_EQ(resp.at("id").get<std::string>(), "upload-1", "id");
        const auto& req = server->requests.at(0);
        ASSERT_TRUE(req.method == HttpMethod::POST, "POST");
        ASSERT_EQ(req.url, kApiUrl + "/projects/p1/uploads", "url");
        ASSERT_EQ(req.headers.get("authorization").value_or(""), "secret-token", "auth header");
        ASSERT_TRUE(req.headers.has("User-Agent"), "user agent");
        auto body = json::parse(req.body.begin(), req.body.end());
        ASSERT_TRUE(body.at("chunked").get<bool>(), "chunked upload");
        ASSERT_EQ(body.at("hash").at("algorithm").get<std::string>(), "md5", "hash algorithm");
        PASS();
    }
    {
        TEST(chunk_number_must_be_positive);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return json_response(200, json::object()); };
        DataServiceApi api(connection, fake_factory(server));
        ASSERT_THROWS(api.create_upload_url("u1", 0, 10, hash), std::invalid_argument, "number 0 rejected");
        ASSERT_TRUE(server->requests.empty(), "nothing sent");
        PASS();
    }
    {
        TEST(error_response_carries_reason);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) {
            return json_response(400, {{"reason", "bad size"}, {"suggestion", "send a size"}});
        };
        DataServiceApi api(connection, fake_factory(server));
        int status = 0;
        std::string reason;
        try {
            api.create_file(ParentRef{"dds-project", "p1"}, "u1");
        } catch (const DataServiceError& e) {
            status = e.status_code();
            reason = e.reason();
        }
        ASSERT_EQ(status, 400, "status");
        ASSERT_EQ(reason, "bad size", "reason");
        PASS();
    }
    {
        TEST(not_consistent_maps_to_its_own_error);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) {
            return json_response(404, {{"code", "resource_not_consistent"}});
        };
        DataServiceApi api(connection, fake_factory(server));
        ASSERT_THROWS(api.complete_upload("u1", hash), ResourceNotConsistentError, "not consistent");
        PASS();
    }
    {
        TEST(service_down_is_waited_out);
        auto server = std::make_shared<FakeServer>();
        int unavailable = 3;
        server->handler = [&](const HttpRequest&) {
            if (unavailable-- > 0) return status_response(503);
            return json_response(200, {{"id", "f1"}});
        };
        DataServiceApi api(connection, fake_factory(server));
        auto resp = api.update_file("f1", "u1");
        ASSERT_EQ(resp.at("id").get<std::string>(), "f1", "eventually answered");
        ASSERT_EQ(server->requests.size(), (size_t)4, "three 503s then success");
        PASS();
    }
    {
        TEST(service_down_wait_stops_on_request);
        auto slow = connection;
        slow.retry.service_down_retry_seconds = 5;
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return status_response(503); };
        DataServiceApi api(slow, fake_factory(server));
        std::stop_source source;
        api.set_stop_token(source.get_token());
        std::thread stopper([&source]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            source.request_stop();
        });
        auto start = std::chrono::steady_clock::now();
        bool cancelled = false;
        try {
            api.get_file_url("f1");
        } catch (const TaskCancelledError&) {
            cancelled = true;
        }
        stopper.join();
        ASSERT_TRUE(cancelled, "TaskCancelledError");
        ASSERT_TRUE(seconds_since(start) < 2.0, "left the 503 loop early");
        ASSERT_EQ(server->requests.size(), (size_t)1, "no request after the stop");
        PASS();
    }
    {
        TEST(control_plane_connection_errors_are_bounded);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return network_error(); };
        DataServiceApi api(connection, fake_factory(server));
        ASSERT_THROWS(api.get_file_url("f1"), ConnectionError, "gives up");
        ASSERT_EQ(server->requests.size(), (size_t)(connection.retry.connection_retry_times + 1),
                  "initial try plus retries");
        PASS();
    }
    {
        TEST(put_retries_three_connection_errors_then_succeeds);
        auto server = std::make_shared<FakeServer>();
        int failures = 3;
        server->handler = [&](const HttpRequest&) {
            if (failures-- > 0) return network_error();
            return status_response(201);
        };
        DataServiceApi api(connection, fake_factory(server));
        int observed = 0;
        api.set_retry_observer([&](RetryKind kind) { if (kind == RetryKind::CONNECTION) ++observed; });
        ASSERT_EQ(server->sessions(), 1, "one session before sending");
        api.send_external("PUT", kStoreHost, "/u1/1", {}, to_bytes("data"));
        ASSERT_EQ(server->requests.size(), (size_t)4, "succeeds on attempt 4");
        ASSERT_EQ(server->sessions(), 4, "session recreated 3 times");
        ASSERT_EQ(observed, 3, "each retry observed");
        PASS();
    }
    {
        TEST(put_fourth_connection_error_propagates);
        auto server = std::make_shared<FakeServer>();
        int failures = 4;
        server->handler = [&](const HttpRequest&) {
            if (failures-- > 0) return network_error();
            return status_response(201);
        };
        DataServiceApi api(connection, fake_factory(server));
        ASSERT_THROWS(api.send_external("PUT", kStoreHost, "/u1/1", {}, to_bytes("data")),
                      ConnectionError, "cap of 4 reached");
        ASSERT_EQ(server->requests.size(), (size_t)4, "four attempts");
        PASS();
    }
    {
        TEST(post_is_never_retried);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return network_error(); };
        DataServiceApi api(connection, fake_factory(server));
        ASSERT_THROWS(api.send_external("POST", kStoreHost, "/u1/1", {}, to_bytes("data")),
                      ConnectionError, "POST error propagates");
        ASSERT_EQ(server->requests.size(), (size_t)1, "sent once");
        PASS();
    }
    {
        TEST(send_external_status_mapping);
        auto server = std::make_shared<FakeServer>();
        int status = 403;
        server->handler = [&](const HttpRequest&) { return status_response(status); };
        DataServiceApi api(connection, fake_factory(server));
        ASSERT_THROWS(api.send_external("PUT", kStoreHost, "/u1/1", {}, to_bytes("x")),
                      ForbiddenSendExternalError, "403 is forbidden");
        status = 500;
        ASSERT_THROWS(api.send_external("PUT", kStoreHost, "/u1/1", {}, to_bytes("x")),
                      ExternalStoreError, "500 from the store");
        ASSERT_THROWS(api.send_external("PATCH", kStoreHost, "/u1/1", {}, to_bytes("x")),
                      std::invalid_argument, "unsupported verb");
        PASS();
    }
    {
        TEST(headers_are_case_insensitive);
        HttpHeaders headers;
        headers.set("Content-Type", "application/json");
        ASSERT_EQ(headers.get("content-type").value_or(""), "application/json", "lookup");
        headers.remove("CONTENT-TYPE");
        ASSERT_TRUE(!headers.has("Content-Type"), "removed");
        PASS();
    }
    {
        TEST(curl_transport_reports_refused_connection);
        HttpClientConfig http_config;
        http_config.user_agent = constants::USER_AGENT;
        http_config.connect_timeout = std::chrono::milliseconds(2000);
        auto factory = curl_transport_factory(http_config);
        auto transport = factory();
        ASSERT_TRUE(transport != nullptr, "factory builds a session");
        auto response = transport->execute(HttpRequest::get("http://127.0.0.1:1/"));
        ASSERT_TRUE(response.is_network_error, "no server on port 1");
        ASSERT_TRUE(!response.error.empty(), "curl error text");
        ASSERT_TRUE(!response.ok(), "not ok");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Upload engine
// ---------------------------------------------------------------------------

static void test_upload() {
    std::cout << "\n=== Upload engine ===" << std::endl;

    auto tmpdir = make_temp_dir("ddsxfer-upload");
    auto config = test_config();

    {
        TEST(path_data_reads_chunks);
        auto path = tmpdir / "Table.CSV";
        write_file(path, "0123456789");
        PathData path_data(path);
        ASSERT_EQ(path_data.name(), "Table.CSV", "name");
        ASSERT_EQ(path_data.mime_type(), "text/csv", "mime type by extension");
        ASSERT_EQ(path_data.size(), 10ULL, "size");
        auto chunk = path_data.read_chunk(8, 5);
        ASSERT_EQ(std::string(chunk.begin(), chunk.end()), "89", "short read at end of file");
        ASSERT_EQ(path_data.get_hash().value, md5_of("0123456789"), "whole-file md5");
        ASSERT_EQ(PathData(tmpdir / "blob").mime_type(), "application/octet-stream", "fallback type");
        PASS();
    }
    {
        TEST(chunk_url_uses_one_based_numbers);
        UploadService service;
        auto server = upload_server(service);
        DataServiceApi api(DataServiceConnection::from_config(config), fake_factory(server));
        FileUploadOperations operations(api, nullptr);
        auto url = operations.create_file_chunk_url("upload-1", 0, to_bytes("abc"));
        ASSERT_EQ(url.host, kStoreHost, "host");
        ASSERT_EQ(service.chunk_numbers.size(), (size_t)1, "one chunk URL");
        ASSERT_EQ(service.chunk_numbers[0], 1ULL, "chunk 0 is number 1 on the wire");
        auto body = json::parse(server->requests.at(0).body.begin(), server->requests.at(0).body.end());
        ASSERT_EQ(body.at("hash").at("value").get<std::string>(), md5_of("abc"), "chunk hash");
        PASS();
    }
    {
        TEST(chunk_url_waits_for_consistency);
        UploadService service;
        service.not_consistent_left = 2;
        auto server = upload_server(service);
        DataServiceApi api(DataServiceConnection::from_config(config), fake_factory(server));
        RecordingWatcher watcher;
        FileUploadOperations operations(api, &watcher);
        operations.create_file_chunk_url("upload-1", 0, to_bytes("abc"));
        ASSERT_EQ(server->count(HttpMethod::PUT, "/chunks"), (size_t)3, "two waits then success");
        ASSERT_EQ(watcher.starts, 1, "start_waiting");
        ASSERT_EQ(watcher.dones, 1, "done_waiting");
        PASS();
    }
    {
        TEST(forbidden_chunk_url_is_reissued_once);
        UploadService service;
        service.store_override = [](int index) -> std::optional<HttpResponse> {
            if (index == 0) return status_response(403);
            return std::nullopt;
        };
        auto server = upload_server(service);
        DataServiceApi api(DataServiceConnection::from_config(config), fake_factory(server));
        int forbidden = 0;
        api.set_retry_observer([&](RetryKind kind) { if (kind == RetryKind::FORBIDDEN) ++forbidden; });
        FileUploadOperations operations(api, nullptr);
        operations.send_chunk("upload-1", 0, to_bytes("abc"));
        ASSERT_EQ(service.chunk_numbers.size(), (size_t)2, "fresh URL requested");
        ASSERT_EQ(service.store_puts, 2, "chunk resent");
        ASSERT_EQ(forbidden, 1, "retry reported");
        PASS();
    }
    {
        TEST(forbidden_twice_propagates);
        UploadService service;
        service.store_override = [](int) -> std::optional<HttpResponse> { return status_response(403); };
        auto server = upload_server(service);
        DataServiceApi api(DataServiceConnection::from_config(config), fake_factory(server));
        FileUploadOperations operations(api, nullptr);
        ASSERT_THROWS(operations.send_chunk("upload-1", 0, to_bytes("abc")),
                      ForbiddenSendExternalError, "two attempts then give up");
        ASSERT_EQ(service.store_puts, 2, "two sends");
        PASS();
    }
    {
        TEST(zero_byte_file_sends_one_chunk);
        auto path = tmpdir / "empty.dat";
        write_file(path, "");
        UploadService service;
        auto server = upload_server(service);
        RecordingWatcher watcher;
        FileUploader uploader(config, fake_factory(server), &watcher);
        auto file_id = uploader.upload("p1", UploadItem{path, ParentRef{"dds-project", "p1"}, std::nullopt});
        ASSERT_EQ(file_id, "file-1", "file created");
        ASSERT_EQ(server->count(HttpMethod::PUT, "/uploads/upload-1/chunks"), (size_t)1,
                  "exactly one chunk-create call");
        ASSERT_EQ(service.chunk_numbers.at(0), 1ULL, "chunk number 1");
        ASSERT_EQ(service.stored.at("/upload-1/1"), "", "empty chunk stored");
        ASSERT_EQ(server->count(HttpMethod::PUT, "/uploads/upload-1/complete"), (size_t)1, "completed");
        ASSERT_EQ(watcher.units, 1, "one chunk of progress");
        PASS();
    }
    {
        TEST(multi_chunk_file_is_split_across_workers);
        auto path = tmpdir / "digits.txt";
        write_file(path, "0123456789");
        auto chunked = config;
        chunked.upload_bytes_per_chunk = 3;
        UploadService service;
        auto server = upload_server(service);
        RecordingWatcher watcher;
        TransferMetrics metrics;
        FileUploader uploader(chunked, fake_factory(server), &watcher, &metrics);
        uploader.upload("p1", UploadItem{path, ParentRef{"dds-folder", "f9"}, std::nullopt});

        auto numbers = service.chunk_numbers;
        std::sort(numbers.begin(), numbers.end());
        ASSERT_TRUE(numbers == (std::vector<uint64_t>{1, 2, 3, 4}), "chunks 1..4");
        std::string reassembled;
        for (int n = 1; n <= 4; ++n) reassembled += service.stored.at("/upload-1/" + std::to_string(n));
        ASSERT_EQ(reassembled, "0123456789", "chunks hold the file");
        ASSERT_EQ(watcher.units, 4, "progress per chunk");
        ASSERT_EQ(watcher.bytes, (int64_t)10, "progress bytes");
        ASSERT_EQ(metrics.chunks_sent().Value(), 4.0, "chunks metric");
        ASSERT_EQ(metrics.upload_bytes_total().Value(), 10.0, "bytes metric");
        ASSERT_EQ(metrics.files_uploaded().Value(), 1.0, "file metric");

        auto complete = std::find_if(server->requests.begin(), server->requests.end(),
                                     [](const HttpRequest& r) { return r.url.ends_with("/complete"); });
        ASSERT_TRUE(complete != server->requests.end(), "complete sent");
        std::string form(complete->body.begin(), complete->body.end());
        ASSERT_TRUE(form.find(md5_of("0123456789")) != std::string::npos, "whole-file hash sent");
        PASS();
    }
    {
        TEST(project_upload_small_and_large_files);
        auto small_a = tmpdir / "project" / "a.txt";
        auto small_b = tmpdir / "project" / "b.txt";
        auto large = tmpdir / "project" / "large.bin";
        write_file(small_a, "abc");
        write_file(small_b, "");
        write_file(large, pattern(20));
        auto project_config = config;
        project_config.upload_bytes_per_chunk = 8;

        std::vector<UploadItem> items = {
            {small_a, ParentRef{"dds-project", "p1"}, std::nullopt},
            {small_b, ParentRef{"dds-project", "p1"}, std::nullopt},
            {large, ParentRef{"dds-project", "p1"}, std::string("existing-9")},
        };
        ASSERT_EQ(ProjectUploader::count_chunks(items, 8), 5ULL, "1 + 1 + 3 chunks");

        UploadService service;
        auto server = upload_server(service);
        RecordingWatcher watcher;
        TransferMetrics metrics;
        ProjectUploader uploader(project_config, fake_factory(server), &watcher, &metrics);
        auto file_ids = uploader.run("p1", items);

        ASSERT_EQ(file_ids.size(), (size_t)3, "three files");
        ASSERT_EQ(file_ids.at(large.string()), "existing-9", "large file versioned in place");
        ASSERT_TRUE(file_ids.at(small_a.string()).starts_with("file-"), "small file created");
        ASSERT_TRUE(file_ids.at(small_a.string()) != file_ids.at(small_b.string()), "distinct ids");
        ASSERT_EQ(server->count(HttpMethod::POST, "/files/"), (size_t)2, "two new files");
        ASSERT_EQ(server->count(HttpMethod::PUT, "/files/existing-9"), (size_t)1, "one new version");
        ASSERT_EQ(service.chunk_numbers.size(), (size_t)5, "five chunk URLs");
        ASSERT_EQ(server->count(HttpMethod::PUT, "/complete"), (size_t)3, "three completes");
        ASSERT_EQ(watcher.units, 5, "progress matches chunk count");
        ASSERT_EQ(metrics.files_uploaded().Value(), 3.0, "files metric");
        ASSERT_TRUE(std::find(watcher.items.begin(), watcher.items.end(), small_a.string()) != watcher.items.end(),
                    "watcher told about small file");
        PASS();
    }
    {
        TEST(project_upload_fails_fast);
        auto path = tmpdir / "fail" / "a.txt";
        write_file(path, "abc");
        UploadService service;
        auto server = std::make_shared<FakeServer>();
        server->handler = [&service](const HttpRequest& req) {
            if (req.url.ends_with("/complete")) return json_response(400, {{"reason", "hash mismatch"}});
            return service(req);
        };
        ProjectUploader uploader(config, fake_factory(server), nullptr);
        std::string what;
        try {
            uploader.run("p1", {{path, ParentRef{"dds-project", "p1"}, std::nullopt}});
        } catch (const TaskFailedError& e) {
            what = e.what();
        }
        ASSERT_TRUE(what.find("hash mismatch") != std::string::npos, "service reason reaches the caller");
        ASSERT_EQ(server->count(HttpMethod::POST, "/files/"), (size_t)0, "no file created");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 7. Download engine
// ---------------------------------------------------------------------------

static RemoteFile remote_file(const std::string& id, const std::string& path, const std::string& content) {
    RemoteFile file;
    file.id = id;
    file.path = path;
    file.size = content.size();
    file.hashes = {{"md5", md5_of(content)}};
    file.url = ExternalUrl{"GET", kStoreHost, "/" + id + "?sig=1", {}};
    return file;
}

static FileUrlSource counting_url_source(int& calls) {
    return [&calls](const std::string& file_id) {
        ++calls;
        return ExternalUrl{"GET", kStoreHost, "/" + file_id + "?sig=fresh" + std::to_string(calls), {}};
    };
}

static void test_download() {
    std::cout << "\n=== Download engine ===" << std::endl;

    auto tmpdir = make_temp_dir("ddsxfer-download");
    auto config = test_config();
    config.download_workers = 8;
    const std::string content = pattern(100);

    {
        TEST(small_file_is_one_range);
        DownloadStore store;
        store.contents["/file-1"] = content;
        auto server = download_server(store);
        RecordingWatcher watcher;
        int url_calls = 0;
        FileDownloader downloader(config, fake_factory(server), counting_url_source(url_calls), &watcher);
        auto local = tmpdir / "one-range.bin";
        auto outcome = downloader.download(remote_file("file-1", "one-range.bin", content), local);

        ASSERT_TRUE(outcome.state == DownloadState::GOOD, "state GOOD");
        ASSERT_TRUE(outcome.hash_status.status() == HashStatus::OK, "hash OK");
        ASSERT_EQ(store.gets, 1, "one GET");
        ASSERT_TRUE(store.ranges.at(0) == std::make_pair(uint64_t{0}, uint64_t{99}), "range (0, 99)");
        ASSERT_EQ(read_file(local), content, "content written");
        ASSERT_EQ(url_calls, 0, "listing URL used");
        ASSERT_EQ(watcher.units, 1, "one range of progress");
        ASSERT_EQ(watcher.bytes, (int64_t)100, "byte progress");
        PASS();
    }
    {
        TEST(ranges_are_written_in_place);
        auto big = pattern(1000, 'A');
        auto ranged = config;
        ranged.download_workers = 4;
        ranged.download_min_chunk_size = 100;
        DownloadStore store;
        store.contents["/file-2"] = big;
        auto server = download_server(store);
        int url_calls = 0;
        FileDownloader downloader(ranged, fake_factory(server), counting_url_source(url_calls), nullptr);
        ASSERT_EQ(downloader.ranges_for(1000).size(), (size_t)4, "four ranges");
        auto local = tmpdir / "ranges.bin";
        auto outcome = downloader.download(remote_file("file-2", "ranges.bin", big), local);
        ASSERT_TRUE(outcome.state == DownloadState::GOOD, "state GOOD");
        ASSERT_EQ(store.gets, 4, "one GET per range");
        ASSERT_EQ(read_file(local), big, "ranges assembled");
        PASS();
    }
    {
        TEST(partial_ranges_are_retried_with_progress_reverted);
        DownloadStore store;
        store.contents["/file-3"] = content;
        store.override_get = [](int index, const std::string& body) -> std::optional<HttpResponse> {
            if (index < 2) return body_response(206, body.substr(0, 40));
            return std::nullopt;
        };
        auto server = download_server(store);
        RecordingWatcher watcher;
        TransferMetrics metrics;
        int url_calls = 0;
        FileDownloader downloader(config, fake_factory(server), counting_url_source(url_calls), &watcher, &metrics);
        auto local = tmpdir / "partial.bin";
        auto outcome = downloader.download(remote_file("file-3", "partial.bin", content), local);

        ASSERT_TRUE(outcome.state == DownloadState::GOOD, "state GOOD");
        ASSERT_EQ(store.gets, 3, "three attempts");
        ASSERT_EQ(watcher.reverts, 2, "progress reverted per retry");
        ASSERT_EQ(watcher.bytes, (int64_t)100, "byte progress nets out");
        ASSERT_EQ(read_file(local), content, "content written");
        ASSERT_EQ(metrics.download_bytes_total().Value(), 100.0, "bytes metric");
        ASSERT_TRUE(metrics.serialize().find("kind=\"partial\"") != std::string::npos, "retry metric");
        PASS();
    }
    {
        TEST(partial_ranges_beyond_cap_raise_with_counts);
        auto capped = config;
        capped.retry.fetch_external_retry_times = 2;
        DownloadStore store;
        store.contents["/file-4"] = content;
        store.override_get = [](int, const std::string& body) -> std::optional<HttpResponse> {
            return body_response(206, body.substr(0, 40));
        };
        auto server = download_server(store);
        int url_calls = 0;
        FileDownloader downloader(capped, fake_factory(server), counting_url_source(url_calls), nullptr);
        std::string what;
        try {
            downloader.download(remote_file("file-4", "capped.bin", content), tmpdir / "capped.bin");
        } catch (const TaskFailedError& e) {
            what = e.what();
        }
        ASSERT_TRUE(what.find("Actual: 40") != std::string::npos, "actual bytes in message: " + what);
        ASSERT_TRUE(what.find("Expected: 100") != std::string::npos, "expected bytes in message: " + what);
        ASSERT_EQ(store.gets, 3, "initial attempt plus two retries");
        PASS();
    }
    {
        TEST(oversized_range_fails_fast_and_retries);
        DownloadStore store;
        store.contents["/file-5"] = content;
        store.override_get = [&content](int index, const std::string&) -> std::optional<HttpResponse> {
            if (index == 0) return body_response(200, content + content);
            return std::nullopt;
        };
        auto server = download_server(store);
        int url_calls = 0;
        FileDownloader downloader(config, fake_factory(server), counting_url_source(url_calls), nullptr);
        auto local = tmpdir / "large.bin";
        auto outcome = downloader.download(remote_file("file-5", "large.bin", content), local);
        ASSERT_TRUE(outcome.state == DownloadState::GOOD, "state GOOD");
        ASSERT_EQ(store.gets, 2, "retried once");
        ASSERT_EQ(read_file(local), content, "content written");
        PASS();
    }
    {
        TEST(expired_url_is_refetched);
        DownloadStore store;
        store.contents["/file-6"] = content;
        auto server = std::make_shared<FakeServer>();
        server->handler = [&store](const HttpRequest& req) {
            if (req.url.ends_with("sig=1")) return status_response(403);
            return store(req);
        };
        int url_calls = 0;
        FileDownloader downloader(config, fake_factory(server), counting_url_source(url_calls), nullptr);
        auto local = tmpdir / "expired.bin";
        auto outcome = downloader.download(remote_file("file-6", "expired.bin", content), local);
        ASSERT_TRUE(outcome.state == DownloadState::GOOD, "state GOOD");
        ASSERT_EQ(url_calls, 1, "one refresh");
        ASSERT_EQ(server->requests.size(), (size_t)2, "expired attempt plus fresh one");
        ASSERT_EQ(read_file(local), content, "content written");
        PASS();
    }
    {
        TEST(expired_url_refreshes_are_bounded);
        auto capped = config;
        capped.retry.expired_url_retry_times = 2;
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return status_response(401); };
        int url_calls = 0;
        FileDownloader downloader(capped, fake_factory(server), counting_url_source(url_calls), nullptr);
        ASSERT_THROWS(downloader.download(remote_file("file-7", "gone.bin", content), tmpdir / "gone.bin"),
                      ExternalStoreError, "gives up after refreshes");
        ASSERT_EQ(url_calls, 2, "two refreshes");
        PASS();
    }
    {
        TEST(unexpected_store_status_fails);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return status_response(500); };
        int url_calls = 0;
        FileDownloader downloader(config, fake_factory(server), counting_url_source(url_calls), nullptr);
        std::string what;
        try {
            downloader.download(remote_file("file-8", "err.bin", content), tmpdir / "err.bin");
        } catch (const TaskFailedError& e) {
            what = e.what();
        }
        ASSERT_TRUE(what.find("500") != std::string::npos, "status in message");
        PASS();
    }
    {
        TEST(already_complete_file_is_skipped);
        auto local = tmpdir / "complete.bin";
        write_file(local, content);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return status_response(500); };
        RecordingWatcher watcher;
        int url_calls = 0;
        FileDownloader downloader(config, fake_factory(server), counting_url_source(url_calls), &watcher);
        auto outcome = downloader.download(remote_file("file-9", "complete.bin", content), local);
        ASSERT_TRUE(outcome.state == DownloadState::ALREADY_COMPLETE, "ALREADY_COMPLETE");
        ASSERT_TRUE(server->requests.empty(), "no network I/O");
        ASSERT_EQ(watcher.units, 1, "progress still counted");
        PASS();
    }
    {
        TEST(zero_byte_file_needs_no_request);
        auto server = std::make_shared<FakeServer>();
        server->handler = [](const HttpRequest&) { return status_response(500); };
        int url_calls = 0;
        FileDownloader downloader(config, fake_factory(server), counting_url_source(url_calls), nullptr);
        auto local = tmpdir / "empty.bin";
        auto outcome = downloader.download(remote_file("file-10", "empty.bin", ""), local);
        ASSERT_TRUE(outcome.state == DownloadState::GOOD, "state GOOD");
        ASSERT_TRUE(fs::exists(local) && fs::file_size(local) == 0, "empty file created");
        ASSERT_TRUE(server->requests.empty(), "no requests");
        ASSERT_EQ(url_calls, 0, "no URL needed");
        PASS();
    }
    {
        TEST(project_download_reports_every_file);
        const std::string good = pattern(50, 'a');
        const std::string bad = pattern(60, 'k');
        DownloadStore store;
        store.contents["/good"] = good;
        store.contents["/bad"] = std::string(bad.size(), 'x');
        auto server = download_server(store);
        TransferMetrics metrics;
        RecordingWatcher watcher;
        int url_calls = 0;
        auto project_dir = tmpdir / "project";
        std::vector<RemoteFile> files = {
            remote_file("bad", "sub/bad.txt", bad),
            remote_file("good", "sub/deeper/good.txt", good),
        };
        ProjectDownloader downloader(config, fake_factory(server), &watcher, &metrics,
                                     counting_url_source(url_calls));
        ASSERT_EQ(downloader.count_ranges(files), 2ULL, "one range per small file");
        bool raised = false;
        try {
            downloader.run(project_dir, files);
        } catch (const HashValidationError&) {
            raised = true;
        }
        ASSERT_TRUE(raised, "aggregate error raised");
        ASSERT_EQ(store.gets, 2, "failed file does not stop its sibling");
        ASSERT_EQ(read_file(project_dir / "sub" / "deeper" / "good.txt"), good, "good file downloaded");
        ASSERT_EQ(metrics.download_bytes_total().Value(), 110.0, "bytes metric");
        PASS();
    }
    {
        TEST(project_download_all_valid);
        const std::string one = pattern(30, 'b');
        DownloadStore store;
        store.contents["/one"] = one;
        auto server = download_server(store);
        int url_calls = 0;
        ProjectDownloader downloader(config, fake_factory(server), nullptr, nullptr,
                                     counting_url_source(url_calls));
        auto statuses = downloader.run(tmpdir / "valid", {remote_file("one", "one.txt", one)});
        ASSERT_EQ(statuses.size(), (size_t)1, "one status");
        ASSERT_TRUE(statuses[0].status() == HashStatus::OK, "OK");
        PASS();
    }
    {
        TEST(ignored_range_header_fails_without_retry);
        auto big = pattern(1000, 'A');
        auto ranged = config;
        ranged.download_workers = 4;
        ranged.download_min_chunk_size = 100;
        DownloadStore store;
        store.contents["/file-11"] = big;
        store.override_get = [&big](int, const std::string&) -> std::optional<HttpResponse> {
            return body_response(200, big);
        };
        auto server = download_server(store);
        int url_calls = 0;
        FileDownloader downloader(ranged, fake_factory(server), counting_url_source(url_calls), nullptr);
        std::string what;
        try {
            downloader.download(remote_file("file-11", "whole.bin", big), tmpdir / "whole.bin");
        } catch (const TaskFailedError& e) {
            what = e.what();
        }
        ASSERT_TRUE(what.find("ignored the Range header") != std::string::npos, "range error: " + what);
        std::map<uint64_t, int> gets_per_start;
        for (const auto& range : store.ranges) ++gets_per_start[range.first];
        for (const auto& [range_start, gets] : gets_per_start) {
            if (range_start > 0) ASSERT_EQ(gets, 1, "ranged GET not retried");
        }
        PASS();
    }
    {
        TEST(remote_paths_must_stay_in_destination);
        const std::string one = pattern(30, 'c');
        DownloadStore store;
        store.contents["/one"] = one;
        store.contents["/escape"] = one;
        auto server = download_server(store);
        int url_calls = 0;
        ProjectDownloader downloader(config, fake_factory(server), nullptr, nullptr,
                                     counting_url_source(url_calls));
        auto dest = tmpdir / "contained";
        ASSERT_THROWS(downloader.run(dest, {remote_file("one", "one.txt", one),
                                            remote_file("escape", "../escape.txt", one)}),
                      std::invalid_argument, "parent directory rejected");
        ASSERT_EQ(store.gets, 0, "nothing downloaded");
        ASSERT_TRUE(!fs::exists(tmpdir / "escape.txt"), "no file outside destination");
        ASSERT_THROWS(downloader.run(dest, {remote_file("escape", "/tmp/escape.txt", one)}),
                      std::invalid_argument, "absolute path rejected");
        ASSERT_THROWS(ProjectDownloader::local_path_for(dest, "a/../../x.txt"), std::invalid_argument,
                      "climbs out after normalizing");
        ASSERT_EQ(ProjectDownloader::local_path_for(dest, "a/../b/x.txt"), dest / "b" / "x.txt",
                  "normalized inside destination");
        PASS();
    }
    {
        TEST(download_state_names);
        ASSERT_EQ(std::string(download_state_to_string(DownloadState::EXPIRED_URL)), "EXPIRED_URL", "name");
        ASSERT_TRUE(download_state_from_string("ALREADY_COMPLETE") == DownloadState::ALREADY_COMPLETE, "parse");
        ASSERT_THROWS(download_state_from_string("bogus"), std::invalid_argument, "unknown state");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 8. TransferConfig
// ---------------------------------------------------------------------------

static void test_transfer_config() {
    std::cout << "\n=== TransferConfig ===" << std::endl;

    auto tmpdir = make_temp_dir("ddsxfer-config");
    auto json_path = tmpdir / "config.json";

    {
        TEST(json_loading);
        write_file(json_path,
            R"({
                "url": "https://api.example/api/v1",
                "auth_token": "abc",
                "upload_bytes_per_chunk": "50MB",
                "download_min_chunk_size": 1048576,
                "upload_workers": 4,
                "download_workers": 2,
                "verbose": true,
                "metrics_file": "/tmp/ddsxfer.prom",
                "retry": {
                    "fetch_external_retry_times": 7,
                    "resource_not_consistent_max_retries": 30
                }
            })");
        TransferConfig cfg;
        ASSERT_TRUE(cfg.load_json(json_path), "load_json should succeed");
        ASSERT_EQ(cfg.url, "https://api.example/api/v1", "url");
        ASSERT_EQ(cfg.auth_token, "abc", "token");
        ASSERT_EQ(cfg.upload_bytes_per_chunk, 50ULL * 1024 * 1024, "chunk size from MB string");
        ASSERT_EQ(cfg.download_min_chunk_size, 1048576ULL, "min download chunk");
        ASSERT_EQ(cfg.upload_workers, (size_t)4, "upload workers");
        ASSERT_EQ(cfg.download_workers, (size_t)2, "download workers");
        ASSERT_TRUE(cfg.verbose, "verbose");
        ASSERT_EQ(cfg.metrics_file.string(), "/tmp/ddsxfer.prom", "metrics file");
        ASSERT_EQ(cfg.retry.fetch_external_retry_times, 7, "nested retry");
        ASSERT_EQ(cfg.retry.resource_not_consistent_max_retries, 30, "consistency ceiling");
        ASSERT_EQ(cfg.retry.send_external_put_retry_times, 4, "untouched default");
        PASS();
    }
    {
        TEST(nonexistent_json_fails);
        TransferConfig cfg;
        ASSERT_TRUE(!cfg.load_json("/nonexistent/config.json"), "should fail");
        ASSERT_THROWS(TransferConfig::load("/nonexistent/config.json"), ConfigError, "load throws");
        PASS();
    }
    {
        TEST(byte_size_parsing);
        ASSERT_EQ(parse_byte_size("12"), 12ULL, "plain bytes");
        ASSERT_EQ(parse_byte_size("3mb"), 3ULL * 1024 * 1024, "MB suffix");
        ASSERT_THROWS(parse_byte_size("lots"), ConfigError, "not a size");
        ASSERT_THROWS(parse_byte_size("MB"), ConfigError, "suffix alone");
        PASS();
    }
    {
        TEST(defaults_and_validation);
        TransferConfig cfg;
        cfg.apply_defaults();
        ASSERT_TRUE(cfg.upload_workers >= 1 && cfg.upload_workers <= 8, "upload default in 1..8");
        ASSERT_EQ(cfg.download_workers, (cfg.upload_workers + 1) / 2, "download default is half");
        ASSERT_TRUE(!cfg.validate().empty(), "url required");
        cfg.url = kApiUrl;
        ASSERT_TRUE(cfg.validate().empty(), "valid: " + cfg.validate());
        cfg.upload_bytes_per_chunk = 0;
        ASSERT_TRUE(!cfg.validate().empty(), "chunk size must be positive");
        PASS();
    }
    {
        TEST(environment_overrides);
        setenv("DDSXFER_URL", "https://env.example/api", 1);
        setenv("DDSXFER_UPLOAD_WORKERS", "6", 1);
        setenv("DDSXFER_UPLOAD_BYTES_PER_CHUNK", "2MB", 1);
        write_file(json_path, R"({"url": "https://file.example/api", "upload_workers": 2})");
        auto cfg = TransferConfig::load(json_path);
        unsetenv("DDSXFER_URL");
        unsetenv("DDSXFER_UPLOAD_WORKERS");
        unsetenv("DDSXFER_UPLOAD_BYTES_PER_CHUNK");
        ASSERT_EQ(cfg.url, "https://env.example/api", "env wins over file");
        ASSERT_EQ(cfg.upload_workers, (size_t)6, "workers from env");
        ASSERT_EQ(cfg.upload_bytes_per_chunk, 2ULL * 1024 * 1024, "chunk size from env");
        PASS();
    }
    {
        TEST(http_client_follows_config);
        TransferConfig cfg;
        cfg.verify_ssl = false;
        cfg.verbose = true;
        auto client = http_client_config(cfg);
        ASSERT_TRUE(!client.verify_ssl, "verify_ssl off");
        ASSERT_TRUE(client.verbose, "verbose on");
        ASSERT_EQ(client.user_agent, std::string(constants::USER_AGENT), "user agent");
        auto transport = curl_transport_factory(cfg)();
        auto* curl = dynamic_cast<CurlHttpClient*>(transport.get());
        ASSERT_TRUE(curl != nullptr, "libcurl session");
        ASSERT_TRUE(!curl->config().verify_ssl, "session skips TLS verification");
        PASS();
    }
    {
        TEST(metrics_follow_config);
        TransferConfig cfg;
        cfg.metrics_file = tmpdir / "from-config.prom";
        cfg.metrics_interval_secs = 60;
        auto metrics = make_transfer_metrics(cfg);
        metrics->start();
        metrics->files_uploaded().Increment();
        metrics->stop();
        auto content = read_file(cfg.metrics_file);
        ASSERT_TRUE(content.find("ddsxfer_files_uploaded_total") != std::string::npos, "written to metrics_file");

        TransferConfig in_memory;
        auto quiet = make_transfer_metrics(in_memory);
        quiet->stop();
        ASSERT_EQ(quiet->files_uploaded().Value(), 0.0, "in-memory registry");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 9. Metrics and progress
// ---------------------------------------------------------------------------

static void test_metrics_and_progress() {
    std::cout << "\n=== Metrics and progress ===" << std::endl;

    auto tmpdir = make_temp_dir("ddsxfer-metrics");
    auto prom_path = tmpdir / "transfer.prom";

    {
        TEST(stop_writes_prom_file);
        TransferMetrics metrics(prom_path, std::chrono::seconds(60), {{"run", "test"}});
        metrics.record_retry(RetryKind::EXPIRED_URL);
        metrics.record_file_status(HashStatus::WARNING);
        metrics.chunks_sent().Increment(3);
        metrics.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("ddsxfer_chunks_sent_total") != std::string::npos, "chunks counter");
        ASSERT_TRUE(content.find("kind=\"expired_url\"") != std::string::npos, "retry label");
        ASSERT_TRUE(content.find("status=\"warning\"") != std::string::npos, "file status label");
        ASSERT_TRUE(content.find("run=\"test\"") != std::string::npos, "constant label");
        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }
    {
        TEST(in_memory_metrics_write_nothing);
        TransferMetrics metrics;
        metrics.start();
        metrics.consistency_waits().Increment();
        metrics.stop();
        ASSERT_EQ(metrics.consistency_waits().Value(), 1.0, "counter kept");
        PASS();
    }
    {
        TEST(retry_kind_names_round_trip);
        for (auto kind : {RetryKind::CONNECTION, RetryKind::FORBIDDEN, RetryKind::EXPIRED_URL,
                          RetryKind::PARTIAL, RetryKind::TOO_LARGE}) {
            auto parsed = retry_kind_from_string(retry_kind_to_string(kind));
            ASSERT_TRUE(parsed && *parsed == kind, "round trip");
        }
        ASSERT_TRUE(!retry_kind_from_string("timeout"), "unknown kind");
        PASS();
    }
    {
        TEST(progress_printer_counts_units);
        ProgressPrinter printer(4, "uploading");
        printer.transferring_item("a.txt", 0, 0);
        printer.transferring_item("a.txt", 1, 100);
        printer.transferring_item("b.txt", 3, 300);
        printer.transferring_item("b.txt", 0, -50);
        printer.start_waiting();
        printer.done_waiting();
        printer.finished();
        ASSERT_EQ(printer.count(), 4ULL, "units");
        ASSERT_EQ(printer.transferred_bytes(), (int64_t)350, "bytes with revert");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "ddsxfer test suite" << std::endl;
    std::cout << "==================" << std::endl;

    test_chunk_arithmetic();
    test_hash_verification();
    test_task_graph();
    test_consistency_waiter();
    test_data_service();
    test_upload();
    test_download();
    test_transfer_config();
    test_metrics_and_progress();

    std::cout << "\n==================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}

#pragma once

#include <stdint.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "logging.h"
#include "output_pin.h"
#include "relay_driver.h"
#include "scheduling.h"
#include "square_client.h"

// Level of every fake relay line, shared by the pins of one test.
class FakeBoard {
public:
    enum Level { UNSET, HIGH, LOW };

    void set(int channel, Level level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_levels[channel] = level;
        m_writes.push_back(std::make_pair(channel, level));
    }

    Level level(int channel) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_levels.find(channel);
        return it == m_levels.end() ? UNSET : it->second;
    }

    std::vector<int> engaged() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<int> result;
        for (const auto& entry : m_levels) {
            if (entry.second == LOW) result.push_back(entry.first);
        }
        return result;
    }

    bool allIdle() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_levels) {
            if (entry.second != HIGH) return false;
        }
        return !m_levels.empty();
    }

    size_t writeCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_writes.size();
    }

    std::vector<std::pair<int, Level> > writes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_writes;
    }

private:
    mutable std::mutex m_mutex;
    std::map<int, Level> m_levels;
    std::vector<std::pair<int, Level> > m_writes;
};

class FakePin : public OutputPin {
public:
    FakePin(FakeBoard& board, int channel, bool claimable = true)
        : m_board(board), m_channel(channel), m_claimable(claimable) {}

    bool configureAsOutput() override { return m_claimable; }
    void setHigh() override { m_board.set(m_channel, FakeBoard::HIGH); }
    void setLow() override { m_board.set(m_channel, FakeBoard::LOW); }

private:
    FakeBoard& m_board;
    int        m_channel;
    bool       m_claimable;
};

// Attaches channels 1..count and configures the driver.
inline bool attachFakeRelays(RelayDriver& relays, FakeBoard& board, int count = 16) {
    for (int channel = 1; channel <= count; channel++) {
        relays.attach(channel, std::unique_ptr<OutputPin>(new FakePin(board, channel)));
    }
    return relays.configure();
}

// Runs every job on the caller's thread before spawn() returns.
class InlineTaskRunner : public TaskRunner {
public:
    bool spawn(const char* name, std::function<void()> job) override {
        names.push_back(name);
        if (refuse) return false;
        job();
        return true;
    }

    bool                     refuse = false;
    std::vector<std::string> names;
};

// Keeps jobs until the test runs them, so a test can look at the
// state between intake and processing.
class DeferredTaskRunner : public TaskRunner {
public:
    bool spawn(const char* name, std::function<void()> job) override {
        (void)name;
        m_jobs.push_back(job);
        return true;
    }

    size_t pending() const { return m_jobs.size(); }

    void runAll() {
        std::vector<std::function<void()> > jobs;
        jobs.swap(m_jobs);
        for (auto& job : jobs) job();
    }

private:
    std::vector<std::function<void()> > m_jobs;
};

// One real thread per job. join() waits for all of them.
class ThreadTaskRunner : public TaskRunner {
public:
    ~ThreadTaskRunner() override { join(); }

    bool spawn(const char* name, std::function<void()> job) override {
        (void)name;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_threads.push_back(std::thread(job));
        return true;
    }

    void join() {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            threads.swap(m_threads);
        }
        for (auto& thread : threads) thread.join();
    }

private:
    std::mutex               m_mutex;
    std::vector<std::thread> m_threads;
};

class FakeClock {
public:
    explicit FakeClock(uint32_t startMs = 1000) : m_now(startMs) {}

    uint32_t now() const { return m_now.load(); }
    void     advance(uint32_t ms) { m_now += ms; }
    void     set(uint32_t ms) { m_now = ms; }

    ClockFn fn() {
        return [this]() { return m_now.load(); };
    }

private:
    std::atomic<uint32_t> m_now;
};

// Records each hold. onSleep runs while the relays are still engaged.
class RecordingSleeper {
public:
    SleepFn fn() {
        return [this](uint32_t ms) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_holds.push_back(ms);
            }
            if (onSleep) onSleep(ms);
        };
    }

    std::vector<uint32_t> holds() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_holds;
    }

    std::function<void(uint32_t)> onSleep;

private:
    mutable std::mutex    m_mutex;
    std::vector<uint32_t> m_holds;
};

struct TransportCall {
    std::string method;
    std::string path;
    std::string body;
    uint32_t    timeoutMs;
};

// Scripted provider. GET replies are keyed by path, batch-retrieve replies
// by the first requested object id. Anything unscripted is a 404.
class FakeTransport : public HttpTransport {
public:
    struct Reply {
        bool        delivered = true;
        int         status    = 200;
        std::string body;
        uint32_t    delayMs   = 0;
    };

    explicit FakeTransport(FakeClock* clock = nullptr) : m_clock(clock) {}

    void replyToGet(const std::string& path, int status, const std::string& body) {
        Reply reply;
        reply.status = status;
        reply.body   = body;
        m_replies["GET " + path] = reply;
    }

    void replyToObject(const std::string& objectId, int status, const std::string& body) {
        Reply reply;
        reply.status = status;
        reply.body   = body;
        m_replies["OBJECT " + objectId] = reply;
    }

    void failGet(const std::string& path) {
        Reply reply;
        reply.delivered = false;
        m_replies["GET " + path] = reply;
    }

    void failObject(const std::string& objectId) {
        Reply reply;
        reply.delivered = false;
        m_replies["OBJECT " + objectId] = reply;
    }

    void delayGet(const std::string& path, uint32_t delayMs) {
        m_replies["GET " + path].delayMs = delayMs;
    }

    void delayObject(const std::string& objectId, uint32_t delayMs) {
        m_replies["OBJECT " + objectId].delayMs = delayMs;
    }

    bool request(const char* method, const std::string& path, const std::string& body,
                 uint32_t timeoutMs, HttpResponse& response) override {
        TransportCall call;
        call.method    = method;
        call.path      = path;
        call.body      = body;
        call.timeoutMs = timeoutMs;
        calls.push_back(call);

        std::string key = std::string(method) == "GET" ? "GET " + path
                                                       : "OBJECT " + firstObjectId(body);
        auto it = m_replies.find(key);
        if (it == m_replies.end()) {
            response.status = 404;
            response.body   = R"({"errors":[{"category":"INVALID_REQUEST_ERROR","code":"NOT_FOUND","detail":"missing"}]})";
            return true;
        }

        const Reply& reply = it->second;
        if (m_clock != nullptr && reply.delayMs > 0) m_clock->advance(reply.delayMs);
        if (!reply.delivered) return false;
        response.status = reply.status;
        response.body   = reply.body;
        return true;
    }

    size_t callCount(const std::string& method) const {
        size_t count = 0;
        for (const auto& call : calls) {
            if (call.method == method) count++;
        }
        return count;
    }

    std::vector<TransportCall> calls;

private:
    static std::string firstObjectId(const std::string& body) {
        const std::string marker = "\"object_ids\":[\"";
        size_t start = body.find(marker);
        if (start == std::string::npos) return "";
        start += marker.size();
        size_t end = body.find('"', start);
        return end == std::string::npos ? "" : body.substr(start, end - start);
    }

    FakeClock*                   m_clock;
    std::map<std::string, Reply> m_replies;
};

// Collects formatted log lines while in scope.
class LogCapture {
public:
    LogCapture() {
        lines().clear();
        setLogSink(&LogCapture::sink);
    }
    ~LogCapture() { setLogSink(nullptr); }

    bool contains(const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex());
        for (const auto& line : lines()) {
            if (line.find(text) != std::string::npos) return true;
        }
        return false;
    }

private:
    static void sink(LogLevel level, const char* line) {
        (void)level;
        std::lock_guard<std::mutex> lock(mutex());
        lines().push_back(line);
    }
    static std::vector<std::string>& lines() {
        static std::vector<std::string> captured;
        return captured;
    }
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }
};

// Provider payloads

struct FixtureLineItem {
    std::string uid;
    std::string catalogObjectId;
    std::string name;
};

inline std::string orderJson(const std::string& orderId, const std::vector<FixtureLineItem>& items) {
    std::string json = R"({"order":{"id":")" + orderId +
                       R"(","location_id":"LOC_1","state":"OPEN","line_items":[)";
    for (size_t i = 0; i < items.size(); i++) {
        if (i) json += ",";
        json += R"({"uid":")" + items[i].uid + R"(","quantity":"1")";
        if (!items[i].catalogObjectId.empty()) {
            json += R"(,"catalog_object_id":")" + items[i].catalogObjectId + "\"";
        }
        json += R"(,"name":")" + items[i].name +
                R"(","base_price_money":{"amount":250,"currency":"USD"}})";
    }
    json += R"(],"total_money":{"amount":250,"currency":"USD"}}})";
    return json;
}

struct FixtureAttribute {
    std::string key;
    std::string definitionId;
    std::string selectionUid;
};

inline std::string catalogObjectJson(const std::string& objectId, const std::string& type,
                                     const std::vector<FixtureAttribute>& attributes) {
    std::string json = R"({"objects":[{"type":")" + type + R"(","id":")" + objectId +
                       R"(","version":1700000000000,"is_deleted":false)";
    if (!attributes.empty()) {
        json += R"(,"custom_attribute_values":{)";
        for (size_t i = 0; i < attributes.size(); i++) {
            const FixtureAttribute& attribute = attributes[i];
            if (i) json += ",";
            json += "\"" + attribute.key + R"(":{"name":"Slot","type":"SELECTION","key":")" +
                    attribute.key + R"(","custom_attribute_definition_id":")" +
                    attribute.definitionId + R"(","selection_uid_values":[)";
            if (!attribute.selectionUid.empty()) json += "\"" + attribute.selectionUid + "\"";
            json += "]}";
        }
        json += "}";
    }
    json += R"(,"item_variation_data":{"item_id":"ITEM_1","name":"Regular"}}]})";
    return json;
}

inline std::string definitionJson(const std::string& definitionId,
                                  const std::vector<std::pair<std::string, std::string> >& selections) {
    std::string json = R"({"objects":[{"type":"CUSTOM_ATTRIBUTE_DEFINITION","id":")" +
                       definitionId +
                       R"(","custom_attribute_definition_data":{"type":"SELECTION","name":"Slot",)"
                       R"("selection_config":{"max_allowed_selections":1,"allowed_selections":[)";
    for (size_t i = 0; i < selections.size(); i++) {
        if (i) json += ",";
        json += R"({"uid":")" + selections[i].first + R"(","name":")" + selections[i].second +
                "\"}";
    }
    json += "]}}}]}";
    return json;
}

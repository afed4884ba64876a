#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "broker/broker.hpp"

namespace argwire::broker {

enum class BrokerMode {
    FAKE,     // Record jobs; run them on drain()
    INLINE    // Dispatch every submission immediately
};

BrokerMode broker_mode_from_string(const std::string& str);
const char* broker_mode_to_string(BrokerMode mode);

struct EnqueuedJob {
    std::string jid;
    std::string job;
    std::string payload;                 // JSON text, as it would sit in the queue
    std::optional<Timestamp> at;         // set for schedule_at / schedule_in
    uint64_t sequence = 0;

    WirePayload args() const;

    // Broker-style envelope: {"jid", "class", "args": [payload], "at"?}
    nlohmann::json to_json() const;
};

// Broker for tests and local runs. Payloads are stored as JSON text so every
// job crosses the same text boundary a networked queue would impose.
class InMemoryBroker : public Broker {
public:
    explicit InMemoryBroker(BrokerMode mode = BrokerMode::FAKE);

    // Required before drain() or any INLINE submission
    void attach(Dispatcher& dispatcher);

    BrokerMode mode() const { return mode_; }
    void set_mode(BrokerMode mode) { mode_ = mode; }

    std::string submit(const std::string& job, const WirePayload& payload) override;
    std::string schedule_at(const std::string& job, Timestamp at, const WirePayload& payload) override;
    std::string schedule_in(const std::string& job, Seconds delay, const WirePayload& payload) override;

    std::vector<EnqueuedJob> jobs() const;
    std::vector<EnqueuedJob> jobs_for(const std::string& job) const;
    size_t size() const;
    void clear();
    size_t clear_for(const std::string& job);

    // Dispatch every queued job in submission order; returns how many ran.
    // A failing job stops the drain and its error propagates; later jobs stay queued.
    size_t drain();
    size_t drain_for(const std::string& job);

private:
    std::string enqueue(const std::string& job, std::optional<Timestamp> at, const WirePayload& payload);
    nlohmann::json run(const EnqueuedJob& job);
    std::optional<EnqueuedJob> pop_next(const std::string* only_job);
    Dispatcher& dispatcher() const;

    std::atomic<BrokerMode> mode_;
    Dispatcher* dispatcher_ = nullptr;

    std::deque<EnqueuedJob> queue_;
    mutable std::mutex queue_mutex_;

    std::atomic<uint64_t> next_sequence_{1};
};

// 24 lowercase hex characters
std::string generate_jid();

} // namespace argwire::broker

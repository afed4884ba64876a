#include "broker/in_memory_broker.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <cstdio>
#include <random>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace argwire::broker {

BrokerMode broker_mode_from_string(const std::string& str) {
    if (str == "inline") return BrokerMode::INLINE;
    return BrokerMode::FAKE;
}

const char* broker_mode_to_string(BrokerMode mode) {
    switch (mode) {
        case BrokerMode::INLINE: return "inline";
        default: return "fake";
    }
}

std::string generate_jid() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[25];
    std::snprintf(buf, sizeof(buf), "%016llx%08llx", static_cast<unsigned long long>(a),
                  static_cast<unsigned long long>(b & 0xffffffffULL));
    return std::string(buf);
}

WirePayload EnqueuedJob::args() const {
    return json::parse(payload);
}

json EnqueuedJob::to_json() const {
    json out;
    out["jid"] = jid;
    out["class"] = job;
    out["args"] = json::array({args()});
    if (at) {
        auto since_epoch = std::chrono::duration<double>(at->time_since_epoch());
        out["at"] = since_epoch.count();
    }
    return out;
}

InMemoryBroker::InMemoryBroker(BrokerMode mode) : mode_(mode) {}

void InMemoryBroker::attach(Dispatcher& dispatcher) {
    dispatcher_ = &dispatcher;
}

Dispatcher& InMemoryBroker::dispatcher() const {
    if (!dispatcher_) {
        throw core::Error("InMemoryBroker has no dispatcher attached");
    }
    return *dispatcher_;
}

std::string InMemoryBroker::submit(const std::string& job, const WirePayload& payload) {
    return enqueue(job, std::nullopt, payload);
}

std::string InMemoryBroker::schedule_at(const std::string& job, Timestamp at, const WirePayload& payload) {
    return enqueue(job, at, payload);
}

std::string InMemoryBroker::schedule_in(const std::string& job, Seconds delay, const WirePayload& payload) {
    auto now = std::chrono::system_clock::now();
    // Offset from now that still fits a system_clock time point, less a second for rounding
    Seconds limit = Timestamp::max() - now - std::chrono::seconds(1);
    if (!std::isfinite(delay.count()) || delay >= limit || delay <= -limit) {
        throw core::Error("Cannot schedule " + job + " in " + std::to_string(delay.count()) +
                          "s: delay is out of range");
    }
    auto at = now + std::chrono::duration_cast<std::chrono::system_clock::duration>(delay);
    return enqueue(job, at, payload);
}

std::string InMemoryBroker::enqueue(const std::string& job, std::optional<Timestamp> at,
                                    const WirePayload& payload) {
    EnqueuedJob entry;
    entry.jid = generate_jid();
    entry.job = job;
    entry.payload = payload.dump();
    entry.at = at;
    entry.sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);

    if (mode_ == BrokerMode::INLINE) {
        spdlog::debug("Running {} job {} inline", job, entry.jid);
        run(entry);
        return entry.jid;
    }

    std::string jid = entry.jid;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(entry));
    }
    spdlog::debug("Queued {} job {}", job, jid);
    return jid;
}

json InMemoryBroker::run(const EnqueuedJob& job) {
    return dispatcher().dispatch(job.job, job.args());
}

std::vector<EnqueuedJob> InMemoryBroker::jobs() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return std::vector<EnqueuedJob>(queue_.begin(), queue_.end());
}

std::vector<EnqueuedJob> InMemoryBroker::jobs_for(const std::string& job) const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    std::vector<EnqueuedJob> out;
    for (const auto& entry : queue_) {
        if (entry.job == job) {
            out.push_back(entry);
        }
    }
    return out;
}

size_t InMemoryBroker::size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void InMemoryBroker::clear() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

size_t InMemoryBroker::clear_for(const std::string& job) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    size_t before = queue_.size();
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (it->job == job) {
            it = queue_.erase(it);
        } else {
            ++it;
        }
    }
    return before - queue_.size();
}

std::optional<EnqueuedJob> InMemoryBroker::pop_next(const std::string* only_job) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (!only_job || it->job == *only_job) {
            EnqueuedJob entry = std::move(*it);
            queue_.erase(it);
            return entry;
        }
    }
    return std::nullopt;
}

size_t InMemoryBroker::drain() {
    // Check up front so an unattached broker keeps its queue intact
    dispatcher();
    size_t ran = 0;
    while (auto entry = pop_next(nullptr)) {
        run(*entry);
        ++ran;
    }
    return ran;
}

size_t InMemoryBroker::drain_for(const std::string& job) {
    dispatcher();
    size_t ran = 0;
    while (auto entry = pop_next(&job)) {
        run(*entry);
        ++ran;
    }
    return ran;
}

} // namespace argwire::broker

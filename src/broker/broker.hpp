#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace argwire::broker {

// String-keyed JSON object carried by the broker as an opaque blob
using WirePayload = nlohmann::json;

using Timestamp = std::chrono::system_clock::time_point;

// Delay in seconds; integral and fractional durations both convert implicitly
using Seconds = std::chrono::duration<double>;

// Job queue the pipelines forward serialized arguments to.
// Retries, ordering, persistence and concurrency are the implementation's business.
class Broker {
public:
    virtual ~Broker() = default;

    virtual std::string submit(const std::string& job, const WirePayload& payload) = 0;
    virtual std::string schedule_at(const std::string& job, Timestamp at, const WirePayload& payload) = 0;
    virtual std::string schedule_in(const std::string& job, Seconds delay, const WirePayload& payload) = 0;
};

// Entry point a broker calls when it decides to execute a job,
// passing the payload exactly as it was submitted.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;
    virtual nlohmann::json dispatch(const std::string& job, const WirePayload& payload) = 0;
};

} // namespace argwire::broker

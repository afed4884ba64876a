#include "jobs/job_router.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace argwire::jobs {

JobRouter::JobRouter(broker::Broker& broker) : broker_(broker) {}

JobPipeline& JobRouter::register_job(JobDefinition definition) {
    if (definition.name.empty()) {
        throw core::Error("Job name must not be empty");
    }
    if (pipelines_.count(definition.name)) {
        throw core::Error("Job " + definition.name + " is already registered");
    }

    std::string name = definition.name;
    auto pipeline = std::make_unique<JobPipeline>(std::move(definition), schemas_, broker_);
    pipeline->set_log_payloads(log_payloads_);
    auto& ref = *pipeline;
    pipelines_[name] = std::move(pipeline);
    spdlog::debug("Registered job {}", name);
    return ref;
}

JobPipeline* JobRouter::find(const std::string& job) const {
    auto it = pipelines_.find(job);
    return it != pipelines_.end() ? it->second.get() : nullptr;
}

JobPipeline& JobRouter::pipeline(const std::string& job) const {
    auto* found = find(job);
    if (!found) {
        throw core::Error("Unknown job: " + job);
    }
    return *found;
}

std::vector<std::string> JobRouter::job_names() const {
    std::vector<std::string> names;
    names.reserve(pipelines_.size());
    for (const auto& [name, pipeline] : pipelines_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json JobRouter::dispatch(const std::string& job, const broker::WirePayload& payload) {
    auto* found = find(job);
    if (!found) {
        spdlog::warn("Dispatch for unknown job {}", job);
        throw core::Error("Unknown job: " + job);
    }
    return found->dispatch(payload);
}

void JobRouter::set_log_payloads(bool enabled) {
    log_payloads_ = enabled;
    for (auto& [name, pipeline] : pipelines_) {
        pipeline->set_log_payloads(enabled);
    }
}

} // namespace argwire::jobs

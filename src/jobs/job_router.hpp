#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "broker/broker.hpp"
#include "jobs/pipeline.hpp"
#include "jobs/schema_registry.hpp"

namespace argwire::jobs {

// Job table by name. Brokers dispatch through it.
// Register every job before the broker starts dispatching.
class JobRouter : public broker::Dispatcher {
public:
    explicit JobRouter(broker::Broker& broker);

    // Throws core::Error if a job with the same name is already registered
    JobPipeline& register_job(JobDefinition definition);

    template <typename JobT>
    JobPipeline& define(std::string name) {
        return register_job(define_job<JobT>(std::move(name)));
    }

    JobPipeline* find(const std::string& job) const;

    // Throws core::Error for an unknown job
    JobPipeline& pipeline(const std::string& job) const;

    std::vector<std::string> job_names() const;

    nlohmann::json dispatch(const std::string& job, const broker::WirePayload& payload) override;

    SchemaRegistry& schemas() { return schemas_; }

    void set_log_payloads(bool enabled);

private:
    broker::Broker& broker_;
    SchemaRegistry schemas_;
    std::unordered_map<std::string, std::unique_ptr<JobPipeline>> pipelines_;
    bool log_payloads_ = false;
};

} // namespace argwire::jobs

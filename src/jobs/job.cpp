#include "jobs/job.hpp"
#include "core/errors.hpp"

namespace argwire::jobs {

nlohmann::json Job::run() {
    std::string name = job_name().empty() ? std::string("Job") : job_name();
    throw core::NotImplementedError(name + " must implement #run");
}

} // namespace argwire::jobs

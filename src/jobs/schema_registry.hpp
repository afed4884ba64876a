#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include "jobs/definition.hpp"

namespace argwire::jobs {

// Resolves and caches each job's declared argument schema.
//
// Resolution runs outside the lock. Two threads resolving the same job for
// the first time may both build the schema; the first insert wins and the
// other copy is dropped. Schemas are immutable, so either copy is correct.
class SchemaRegistry {
public:
    // nullptr for jobs that declare no Args.
    // Throws core::SchemaNotDefinedError for an Args that is not a usable schema.
    schema::SchemaPtr resolve(const JobDefinition& definition);

    bool is_cached(const std::string& job) const;
    size_t size() const;

private:
    std::unordered_map<std::string, schema::SchemaPtr> cache_;
    mutable std::mutex mutex_;
};

} // namespace argwire::jobs

#include "jobs/schema_registry.hpp"
#include "core/errors.hpp"
#include "schema/hash_serializer.hpp"
#include <spdlog/spdlog.h>

namespace argwire::jobs {

namespace {

schema::SchemaPtr build_schema(const JobDefinition& definition) {
    if (!definition.args) {
        return nullptr;
    }

    const auto& decl = *definition.args;
    if (!decl.make) {
        throw core::SchemaNotDefinedError(definition.name + "::Args must derive from " +
                                          "argwire::schema::ArgumentSchema, got " + decl.type_name);
    }

    try {
        auto built = decl.make();
        if (!built) {
            throw core::SchemaNotDefinedError(definition.name + "::Args produced no schema (" +
                                              decl.type_name + ")");
        }
        auto defaults = schema::check_defaults(*built);
        if (!defaults.success) {
            throw core::SchemaNotDefinedError(definition.name + "::Args has an invalid default: " +
                                              defaults.error);
        }
        return built;
    } catch (const core::SchemaNotDefinedError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::SchemaNotDefinedError(definition.name + "::Args (" + decl.type_name +
                                          ") is not a valid schema: " + e.what());
    }
}

} // namespace

schema::SchemaPtr SchemaRegistry::resolve(const JobDefinition& definition) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(definition.name);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    auto built = build_schema(definition);

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = cache_.emplace(definition.name, std::move(built));
    if (inserted) {
        spdlog::debug("Resolved argument schema for {} ({} fields)", definition.name,
                      it->second ? it->second->fields().size() : 0);
    }
    return it->second;
}

bool SchemaRegistry::is_cached(const std::string& job) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.count(job) > 0;
}

size_t SchemaRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace argwire::jobs

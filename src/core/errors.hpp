#pragma once
#include <stdexcept>
#include <string>

namespace argwire::core {

// Base error for everything the pipelines raise
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Job declares an Args type that is not a usable schema
class SchemaNotDefinedError : public Error {
public:
    using Error::Error;
};

// Strict validation failed at submission time
class InvalidArgsError : public Error {
public:
    using Error::Error;
};

// Outbound serialization or inbound deserialization failed
class SerializationError : public Error {
public:
    using Error::Error;
};

// Job body was never overridden
class NotImplementedError : public Error {
public:
    using Error::Error;
};

} // namespace argwire::core

#pragma once

#include <stdexcept>
#include <string>

namespace ctxengine {

// Two vectors of different length were compared.
class DimensionMismatch : public std::invalid_argument {
public:
    DimensionMismatch(size_t a, size_t b)
        : std::invalid_argument("Vectors must have the same length (" +
                                std::to_string(a) + " vs " + std::to_string(b) + ")") {}
};

// A memory id was referenced that is not stored.
class NotFound : public std::out_of_range {
public:
    explicit NotFound(const std::string& id)
        : std::out_of_range("Memory not found: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// A request, option object or snapshot could not be decoded.
class InvalidRequest : public std::runtime_error {
public:
    explicit InvalidRequest(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ctxengine

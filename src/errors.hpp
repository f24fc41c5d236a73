#pragma once
#include <stdexcept>
#include <string>

namespace dosewatch {

// Rejected at the store boundary; nothing was written.
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& field, const std::string& message)
        : std::runtime_error(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class NotFoundError : public std::runtime_error {
public:
    NotFoundError(const std::string& entity, const std::string& id)
        : std::runtime_error(entity + " not found: " + id), entity_(entity), id_(id) {}

    const std::string& entity() const { return entity_; }
    const std::string& id() const { return id_; }

private:
    std::string entity_;
    std::string id_;
};

// Raised by reminder dispatchers. Never rolls back a data write.
class DispatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace dosewatch

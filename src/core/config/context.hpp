#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/task_errors.hpp"

namespace taskrun::core::config {

// Configuration carrier handed to contextualized tasks. Always wraps a JSON object.
class Context {
public:
    Context();
    explicit Context(nlohmann::json::object_t values);

    // Independent copy; mutating the clone never touches this instance.
    Context clone() const;

    // Overrides top-level keys in place. Returns the number of keys applied.
    errors::Result<std::size_t> update(const nlohmann::json& overrides);

    // Dotted-path lookup, e.g. "db.host".
    std::optional<nlohmann::json> find(const std::string& dotted_key) const;

    bool contains(const std::string& key) const;
    const nlohmann::json& data() const { return data_; }

    bool operator==(const Context& other) const { return data_ == other.data_; }
    bool operator!=(const Context& other) const { return !(*this == other); }

private:
    nlohmann::json data_;
};

// Recursively merges `overrides` into `base`. Nested objects merge key by key,
// anything else is replaced.
void deep_merge(nlohmann::json& base, const nlohmann::json& overrides);

}  // namespace taskrun::core::config

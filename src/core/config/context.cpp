#include "core/config/context.hpp"

#include <utility>

namespace taskrun::core::config {

using errors::ErrorCategory;
using errors::TaskError;
using nlohmann::json;

Context::Context() : data_(json::object()) {}

Context::Context(json::object_t values) : data_(std::move(values)) {}

Context Context::clone() const {
    Context copy;
    copy.data_ = data_;
    return copy;
}

errors::Result<std::size_t> Context::update(const json& overrides) {
    if (overrides.is_null()) {
        return std::size_t{0};
    }
    if (!overrides.is_object()) {
        return TaskError{ErrorCategory::Config,
                         "Context update expects an object, got " +
                             std::string(overrides.type_name()) + ".",
                         "invalid_config"};
    }

    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        data_[it.key()] = it.value();
    }
    return overrides.size();
}

std::optional<json> Context::find(const std::string& dotted_key) const {
    if (dotted_key.empty()) {
        return std::nullopt;
    }

    const json* node = &data_;
    std::size_t start = 0;
    while (start <= dotted_key.size()) {
        const auto dot = dotted_key.find('.', start);
        const std::string part = dotted_key.substr(
            start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) {
            return std::nullopt;
        }
        const auto it = node->find(part);
        if (it == node->end()) {
            return std::nullopt;
        }
        node = &(*it);
        if (dot == std::string::npos) {
            return *node;
        }
        start = dot + 1;
    }
    return std::nullopt;
}

bool Context::contains(const std::string& key) const {
    return data_.contains(key);
}

void deep_merge(json& base, const json& overrides) {
    if (!base.is_object() || !overrides.is_object()) {
        base = overrides;
        return;
    }
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        auto existing = base.find(it.key());
        if (existing != base.end() && existing->is_object() && it->is_object()) {
            deep_merge(*existing, it.value());
        } else {
            base[it.key()] = it.value();
        }
    }
}

}  // namespace taskrun::core::config

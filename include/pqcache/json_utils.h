#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/json_utils.h — JSON value wrapper used for parsed payloads
// ═══════════════════════════════════════════════════════════════════
//  Thin layer over nlohmann/json. `req.body` is a JsonValue so that
//  the normalizer and the pipeline can inspect and rewrite the parsed
//  GraphQL payload without caring which host adapter produced it.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace pqcache {

// ─────────────────────────────────────────────
//  class JsonValue
//  A default-constructed value is an empty object, which is what
//  a request without a parsed body carries.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nlohmann::json::object()) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    // ── Mutation ──
    //    Assigning a key on a non-object value turns it into an object.
    JsonValue& set(const std::string& key, nlohmann::json value) {
        if (!data_.is_object()) data_ = nlohmann::json::object();
        data_[key] = std::move(value);
        return *this;
    }

    // ── Inspection ──
    bool isObject() const { return data_.is_object(); }
    bool has(const std::string& key) const {
        return data_.is_object() && data_.contains(key);
    }

    // null, {}, [] and "" all count as empty
    bool empty() const {
        if (data_.is_null()) return true;
        if (data_.is_string()) return data_.get_ref<const std::string&>().empty();
        if (data_.is_object() || data_.is_array()) return data_.empty();
        return false;
    }

    // ── Access underlying nlohmann::json ──
    const nlohmann::json& raw() const { return data_; }

private:
    nlohmann::json data_;
};

} // namespace pqcache

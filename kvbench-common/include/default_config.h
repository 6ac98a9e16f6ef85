#pragma once

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace kvbench {

/**
 * @brief Flat key/value view over a YAML or JSON properties file.
 *
 * Nested maps are flattened into dotted keys, so
 * `workload: {thread_count: 4}` is looked up as "workload.thread_count".
 * Sequences are rejected. Load() and the getters throw std::runtime_error
 * (or the parser's own exception) on malformed input; callers translate that
 * into their error model.
 */
class DefaultConfig {
   public:
    // A scalar as produced by the parser of the loaded file.
    using Scalar = std::variant<YAML::Node, Json::Value>;

    void Load();

    bool HasKey(const std::string& key) const {
        return scalars_.count(key) != 0;
    }

    size_t Size() const { return scalars_.size(); }

    /**
     * @brief Reads an unsigned 32-bit value
     * @param key Dotted key to look up
     * @param val Receives the value
     * @param default_value Assigned to val when the key is absent
     */
    void GetUInt32(const std::string& key, uint32_t* val,
                   uint32_t default_value = 0) const {
        *val = lookup(key, default_value);
    }

    void GetUInt64(const std::string& key, uint64_t* val,
                   uint64_t default_value = 0) const {
        *val = lookup(key, default_value);
    }

    void GetDouble(const std::string& key, double* val,
                   double default_value = 0.0) const {
        *val = lookup(key, default_value);
    }

    void GetString(const std::string& key, std::string* val,
                   const std::string& default_value = "") const {
        *val = lookup(key, default_value);
    }

    void SetPath(const std::string& path) { path_ = path; }
    const std::string& GetPath() const { return path_; }

   private:
    template <typename T>
    T lookup(const std::string& key, const T& default_value) const;

    void flatten(const YAML::Node& node, const std::string& prefix);
    void flatten(const Json::Value& node, const std::string& prefix);

    void parseYaml();
    void parseJson();

    std::string path_;
    std::unordered_map<std::string, Scalar> scalars_;
};

}  // namespace kvbench

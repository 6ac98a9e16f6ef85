#include "default_config.h"

#include <glog/logging.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace kvbench {

namespace {

std::string JoinKey(const std::string& prefix, const std::string& name) {
    return prefix.empty() ? name : prefix + "." + name;
}

template <typename T>
T FromJson(const Json::Value& value);

template <>
uint32_t FromJson<uint32_t>(const Json::Value& value) {
    return value.asUInt();
}

template <>
uint64_t FromJson<uint64_t>(const Json::Value& value) {
    return value.asUInt64();
}

template <>
double FromJson<double>(const Json::Value& value) {
    return value.asDouble();
}

template <>
std::string FromJson<std::string>(const Json::Value& value) {
    return value.asString();
}

}  // namespace

void DefaultConfig::Load() {
    if (path_.empty()) {
        throw std::runtime_error("Properties path is not set");
    }
    std::string ext = std::filesystem::path(path_).extension().string();
    scalars_.clear();
    LOG(INFO) << "Loading properties from " << path_;
    if (ext == ".yaml" || ext == ".yml") {
        parseYaml();
    } else if (ext == ".json") {
        parseJson();
    } else {
        throw std::runtime_error("Unsupported properties file format: " +
                                 path_);
    }
    VLOG(1) << "Loaded " << scalars_.size() << " properties from " << path_;
}

void DefaultConfig::parseYaml() {
    YAML::Node root = YAML::LoadFile(path_);
    if (!root.IsNull()) {
        flatten(root, "");
    }
}

void DefaultConfig::parseJson() {
    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error("Cannot open properties file: " + path_);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::runtime_error("Malformed JSON in " + path_ + ": " + errors);
    }
    flatten(root, "");
}

void DefaultConfig::flatten(const YAML::Node& node, const std::string& prefix) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            scalars_.insert_or_assign(
                prefix, Scalar(std::in_place_type<YAML::Node>, node));
            return;
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                flatten(entry.second,
                        JoinKey(prefix, entry.first.as<std::string>()));
            }
            return;
        default:
            throw std::runtime_error("Unsupported YAML value at '" + prefix +
                                     "' in " + path_);
    }
}

void DefaultConfig::flatten(const Json::Value& node,
                            const std::string& prefix) {
    if (node.isObject()) {
        for (const auto& name : node.getMemberNames()) {
            flatten(node[name], JoinKey(prefix, name));
        }
    } else if (node.isArray()) {
        throw std::runtime_error("Unsupported JSON value at '" + prefix +
                                 "' in " + path_);
    } else {
        scalars_.insert_or_assign(
            prefix, Scalar(std::in_place_type<Json::Value>, node));
    }
}

template <typename T>
T DefaultConfig::lookup(const std::string& key, const T& default_value) const {
    auto it = scalars_.find(key);
    if (it == scalars_.end()) {
        return default_value;
    }
    if (const auto* yaml = std::get_if<YAML::Node>(&it->second)) {
        return yaml->as<T>();
    }
    return FromJson<T>(std::get<Json::Value>(it->second));
}

template uint32_t DefaultConfig::lookup<uint32_t>(const std::string&,
                                                  const uint32_t&) const;
template uint64_t DefaultConfig::lookup<uint64_t>(const std::string&,
                                                  const uint64_t&) const;
template double DefaultConfig::lookup<double>(const std::string&,
                                              const double&) const;
template std::string DefaultConfig::lookup<std::string>(
    const std::string&, const std::string&) const;

}  // namespace kvbench

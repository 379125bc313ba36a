#include <carlink/core/config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <type_traits>

namespace carlink::core {

namespace {

nlohmann::json toJson(const ConfigValue& value);

nlohmann::json nodeToJson(const ConfigNode& node) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [key, item] : node.values()) {
        json[key] = toJson(item);
    }
    return json;
}

nlohmann::json toJson(const ConfigValue& value) {
    if (auto* node = std::get_if<ConfigNodePtr>(&value)) {
        return nodeToJson(**node);
    }
    if (auto* array = std::get_if<ConfigArrayPtr>(&value)) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& item : (*array)->items) {
            json.push_back(toJson(item));
        }
        return json;
    }
    return std::visit([](const auto& scalar) -> nlohmann::json {
        using T = std::decay_t<decltype(scalar)>;
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                      std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
            return scalar;
        } else {
            return nullptr;
        }
    }, value);
}

ConfigValue fromJson(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
            return nullptr;
        case nlohmann::json::value_t::boolean:
            return json.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            return json.get<int64_t>();
        case nlohmann::json::value_t::number_float:
            return json.get<double>();
        case nlohmann::json::value_t::string:
            return json.get<std::string>();
        case nlohmann::json::value_t::array: {
            auto array = std::make_shared<ConfigArray>();
            for (const auto& item : json) {
                array->items.push_back(fromJson(item));
            }
            return array;
        }
        case nlohmann::json::value_t::object: {
            ConfigNode::Map values;
            for (auto it = json.begin(); it != json.end(); ++it) {
                values[it.key()] = fromJson(it.value());
            }
            return ConfigNode::create(std::move(values));
        }
        default:
            break;
    }
    throw_error(ErrorCode::InvalidData, "Unsupported JSON value in configuration");
}

Result<ConfigNodePtr> rootFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return {ErrorCode::InvalidData, "config root must be a JSON object"};
    }
    return std::get<ConfigNodePtr>(fromJson(json));
}

} // namespace

namespace {

template<typename T>
Result<void> readExact(const ConfigNode& node, const std::string& key, T& out) {
    if (!node.has(key)) return {};
    auto value = node.get<T>(key);
    if (value.is_error()) return value.error();
    out = value.value();
    return {};
}

} // namespace

Result<void> ConfigNode::read(const std::string& key, std::string& out) const {
    return readExact(*this, key, out);
}

Result<void> ConfigNode::read(const std::string& key, int64_t& out) const {
    return readExact(*this, key, out);
}

Result<void> ConfigNode::read(const std::string& key, bool& out) const {
    return readExact(*this, key, out);
}

Result<void> ConfigNode::read(const std::string& key, double& out) const {
    auto it = values_.find(key);
    if (it == values_.end()) return {};

    // "deadzone": 0 juga sah untuk field floating point
    if (auto* integer = std::get_if<int64_t>(&it->second)) {
        out = static_cast<double>(*integer);
        return {};
    }
    return readExact(*this, key, out);
}

ConfigNodePtr Config::section(const std::string& key) const {
    auto node = root_->get<ConfigNodePtr>(key);
    return node.is_ok() ? node.value() : ConfigNode::create();
}

Result<void> Config::loadFromFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file) {
            return {ErrorCode::FileNotFound, "config file not found: " + path.string()};
        }

        nlohmann::json json;
        file >> json;

        auto root = rootFromJson(json);
        if (root.is_error()) return root.error();
        root_ = root.value();
        return {};
    }
    catch (const std::exception& e) {
        return {ErrorCode::InvalidData, "config file is not valid JSON: " + std::string(e.what())};
    }
}

Result<void> Config::saveToFile(const std::filesystem::path& path) const {
    try {
        auto json = nodeToJson(*root_);

        std::ofstream file(path);
        if (!file) {
            return {ErrorCode::FileAccessDenied, "cannot write config file " + path.string()};
        }

        file << json.dump(2);
        return {};
    }
    catch (const std::exception& e) {
        return {ErrorCode::InvalidData, "cannot serialize config for file: " + std::string(e.what())};
    }
}

Result<void> Config::loadFromString(std::string_view data) {
    try {
        auto json = nlohmann::json::parse(data);

        auto root = rootFromJson(json);
        if (root.is_error()) return root.error();
        root_ = root.value();
        return {};
    }
    catch (const std::exception& e) {
        return {ErrorCode::InvalidData, "config text is not valid JSON: " + std::string(e.what())};
    }
}

Result<std::string> Config::saveToString() const {
    try {
        return nodeToJson(*root_).dump(2);
    }
    catch (const std::exception& e) {
        return {ErrorCode::InvalidData, "cannot serialize config: " + std::string(e.what())};
    }
}

} // namespace carlink::core

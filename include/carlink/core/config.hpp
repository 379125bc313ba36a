#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <carlink/core/error.hpp>

namespace carlink::core {

class ConfigNode;
struct ConfigArray;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;
using ConfigArrayPtr = std::shared_ptr<ConfigArray>;

// Nilai JSON: null, bool, integer, floating point, string, array, object
using ConfigValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    ConfigArrayPtr,
    ConfigNodePtr
>;

struct ConfigArray {
    std::vector<ConfigValue> items;
};

// Satu object JSON dalam tree konfigurasi
class ConfigNode {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    static ConfigNodePtr create(Map values = {}) {
        auto node = std::make_shared<ConfigNode>();
        node->values_ = std::move(values);
        return node;
    }

    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {ErrorCode::ResourceNotFound, "config key missing: " + key};
        }
        if (auto* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        return {ErrorCode::InvalidData, "config key has wrong type: " + key};
    }

    // Key yang tidak ada membiarkan `out` apa adanya (default milik pemanggil);
    // tipe yang salah menjadi InvalidData
    Result<void> read(const std::string& key, std::string& out) const;
    Result<void> read(const std::string& key, int64_t& out) const;
    Result<void> read(const std::string& key, double& out) const;
    Result<void> read(const std::string& key, bool& out) const;

    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::forward<T>(value);
    }

    bool has(const std::string& key) const {
        return values_.count(key) > 0;
    }

    const Map& values() const { return values_; }

private:
    Map values_;
};

// Konfigurasi proses: file JSON dengan section per komponen
// ("relay", "reconnect", "video", "control")
class Config {
public:
    Config() : root_(ConfigNode::create()) {}

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> saveToFile(const std::filesystem::path& path) const;
    Result<void> loadFromString(std::string_view data);
    Result<std::string> saveToString() const;

    // Section yang tidak ada (atau bukan object) menghasilkan node kosong
    ConfigNodePtr section(const std::string& key) const;

    template<typename T>
    Result<T> get(const std::string& key) const {
        return root_->get<T>(key);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_->set(key, std::forward<T>(value));
    }

private:
    ConfigNodePtr root_;
};

// Config global milik executable
inline Config& config() {
    static Config instance;
    return instance;
}

} // namespace carlink::core

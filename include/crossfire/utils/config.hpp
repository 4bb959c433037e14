// include/crossfire/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <istream>
#include <sstream>

namespace crossfire {
namespace utils {

// key=value settings. A "[section]" line prefixes the keys that follow it
// with "section.", so "[indicators] rsi_period = 14" is read back as
// get("indicators.rsi_period", ...).
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    void parse(std::istream& in);

public:
    Config() = default;

    // Shared process-wide instance
    static std::shared_ptr<Config> instance();

    bool load_from_file(const std::string& filename);
    void load_from_string(const std::string& text);

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const;
    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    // true/false, yes/no, on/off, 1/0
    bool get_bool(const std::string& key, bool default_value) const;

    bool has(const std::string& key) const;
    size_t size() const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }
};

} // namespace utils
} // namespace crossfire

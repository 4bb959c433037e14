// include/crossfire/strategy/strategy_base.hpp
#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include "crossfire/indicators/indicator_builder.hpp"
#include "crossfire/strategy/signal_frame.hpp"

namespace crossfire {
namespace strategy {

class StrategyBase {
protected:
    std::string name_;
    std::unordered_map<std::string, std::string> config_;

public:
    explicit StrategyBase(std::string name) : name_(std::move(name)) {}
    virtual ~StrategyBase() = default;

    // Attaches a Signal column to the indicator table; must not modify `data`
    virtual SignalFrame generate_signals(const indicators::IndicatorTable& data) const = 0;

    // Configuration
    virtual void configure(const std::unordered_map<std::string, std::string>& config) {
        config_ = config;
    }

    std::string get_config(const std::string& key, const std::string& default_value = "") const {
        auto it = config_.find(key);
        return it != config_.end() ? it->second : default_value;
    }

    const std::string& name() const { return name_; }
};

using StrategyPtr = std::shared_ptr<StrategyBase>;

} // namespace strategy
} // namespace crossfire

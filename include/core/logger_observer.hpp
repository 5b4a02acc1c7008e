#pragma once

#include "config_observer.hpp"

class PocoConfigManager;

/**
 * @brief Re-applies the log level when log_level changes in the watched config file
 */
class LoggerObserver : public ConfigObserver
{
public:
    explicit LoggerObserver(const PocoConfigManager &config) : config_(config) {}
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    bool hasLogLevelChange(const ConfigUpdateEvent &event) const;

    const PocoConfigManager &config_;
};

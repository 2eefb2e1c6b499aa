// File: config/configuration.cpp

#include "config/configuration.hpp"

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) { getInstance(filename); }

    Configuration &Configuration::getInstance(const std::string &filename) {
        std::call_once(init_flag_, [&filename] {
            instance_ = std::make_shared<Configuration>(filename.empty() ? std::string(default_filename_) : filename);
        });
        return *instance_;
    }

    Configuration::Configuration(const std::string &filename) {
        LOG_INFO("Loading configuration from file: {}", filename);

        try {
            const YAML::Node root = YAML::LoadFile(filename);
            LOG_INFO("Configuration file '{}' loaded successfully.", filename);
            load(root);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration '{}': {}", filename, e.what());
            throw std::runtime_error(fmt::format("Could not load configuration '{}': {}", filename, e.what()));
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                LOG_DEBUG("Loading nested map for key: '{}'", key);
                load(it.second, key);
            } else {
                config_map_[key] = it.second;
                LOG_DEBUG("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
            }
        }
    }

    void Configuration::show() const {
        std::shared_lock lock(mutex_);
        LOG_INFO("Configuration details:");
        for (const auto &[key, value]: config_map_) {
            LOG_INFO("{}: {}", key, value.IsScalar() ? value.as<std::string>() : "[non-scalar]");
        }
    }
} // namespace config

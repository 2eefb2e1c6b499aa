// File: main.cpp

#include <exception>
#include <string>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "executor.hpp"

int main(const int argc, char *argv[]) {
    try {
        const std::string config_file = argc > 1 ? argv[1] : "configuration.yaml";
        config::initialize(config_file);

        common::logging::Logger::initialize(config::get("logging.directory", "./logs"),
                                            config::get("logging.file", "classifier_eval.log"),
                                            config::get("logging.level", "info"),
                                            config::get("logging.pattern",
                                                        "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%# %!] %v"));
        config::show();

        const auto task = Executor::parseTask(argc > 2 ? argv[2] : config::get("task", "evaluate"));
        if (!Executor::allInputsSelected()) {
            LOG_CRITICAL("Model, dataset and output paths must be configured in {}", config_file);
            return 1;
        }

        Executor::execute(task);
    } catch (const std::exception &e) {
        LOG_CRITICAL("{}", e.what());
        return 1;
    }
    return 0;
}

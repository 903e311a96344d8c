#include <sidr/util/logger.hpp>

namespace sidr {

namespace {

std::unique_ptr<Logger>& logger_slot() {
    static std::unique_ptr<Logger> instance = std::make_unique<ConsoleLogger>();
    return instance;
}

}  // namespace

Logger& logger() {
    return *logger_slot();
}

void set_logger(std::unique_ptr<Logger> logger) {
    if (logger) {
        logger_slot() = std::move(logger);
    }
}

}  // namespace sidr

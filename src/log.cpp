#include "strophe/log.hpp"

#include <mutex>
#include <utility>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Strophe {

    namespace {
        constexpr const char* kLoggerName = "strophe";

        std::mutex& logger_mutex() {
            static std::mutex m;
            return m;
        }

        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> slot;
            return slot;
        }

        std::shared_ptr<spdlog::logger> make_default_logger() {
            auto l = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            l->set_level(spdlog::level::warn);
            l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            // Registration lets load_env_levels find the logger by name
            spdlog::drop(kLoggerName);
            spdlog::register_logger(l);
            spdlog::cfg::load_env_levels();
            return l;
        }
    } // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::scoped_lock lock{ logger_mutex() };
        auto& slot = logger_slot();
        if (!slot) slot = make_default_logger();
        return slot;
    }

    void set_logger(std::shared_ptr<spdlog::logger> l) {
        std::scoped_lock lock{ logger_mutex() };
        logger_slot() = std::move(l);
    }

    void set_log_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

} // namespace Strophe

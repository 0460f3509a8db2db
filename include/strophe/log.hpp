#pragma once


/*
    -------------------
    Strophe diagnostics
    -------------------
    Strophe reports through one spdlog logger named "strophe":

    - debug: every tag registered, every failed decode
    - warn:  an existing tag property disagreeing with the registry
    - error: a registry build that failed

    The default logger writes to stderr at `warn`. `SPDLOG_LEVEL`
    (e.g. `SPDLOG_LEVEL=strophe=debug`) is honoured when it is created.
    Applications that route logs elsewhere install their own logger with
    `set_logger`.
*/

#include <memory>

#include <spdlog/spdlog.h>

#include "strophe/config.hpp"

namespace Strophe {

    /// @brief Logger used by every Strophe component
    [[nodiscard]] STROPHE_API std::shared_ptr<spdlog::logger> logger();

    /// @brief Replaces the Strophe logger; null restores the default one
    STROPHE_API void set_logger(std::shared_ptr<spdlog::logger> l);

    STROPHE_API void set_log_level(spdlog::level::level_enum level);

} // namespace Strophe

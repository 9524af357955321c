#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>

namespace relay_cpp {

    /// @brief Name of the spdlog logger every relay_cpp component writes to.
    inline constexpr const char* kLoggerName = "relay_cpp";

    /// @brief The library logger.
    /// @note If the application registered a logger named kLoggerName it is
    /// used as is. Otherwise a colour stdout logger at info level is created
    /// on first use.
    std::shared_ptr<spdlog::logger> logger();

    /// @brief co_spawn completion handler for coroutines nobody awaits. An
    /// exception that escaped the coroutine is logged as an error.
    struct log_on_exception {
        const char* where;
        void operator()(std::exception_ptr ep) const;
    };

}  // namespace relay_cpp

#include "relay_cpp/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace relay_cpp {

    std::shared_ptr<spdlog::logger> logger() {
        static std::mutex mu;

        std::lock_guard<std::mutex> lk(mu);
        if (auto existing = spdlog::get(kLoggerName)) return existing;

        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_level(spdlog::level::info);
        return created;
    }

    void log_on_exception::operator()(std::exception_ptr ep) const {
        if (!ep) return;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            logger()->error("{}: {}", where, e.what());
        }
    }

}  // namespace relay_cpp

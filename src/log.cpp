#include "genai_pool/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace genai_pool {

    std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(logger_name)) return existing;
            try {
                return spdlog::stdout_color_mt(logger_name);
            } catch (const spdlog::spdlog_ex&) {
                // Registered concurrently by the host between get() and here.
                return spdlog::get(logger_name);
            }
        }();
        return instance;
    }

}  // namespace genai_pool

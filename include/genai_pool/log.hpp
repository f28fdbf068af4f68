#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace genai_pool {

    /// @brief Name of the spdlog logger the library writes to.
    inline constexpr const char* logger_name = "genai_pool";

    /// @brief The library logger.
    ///
    /// If the host application registered a logger named `genai_pool` before
    /// the first call, that one is used; otherwise a colored stdout logger is
    /// created.
    std::shared_ptr<spdlog::logger> logger();

}  // namespace genai_pool

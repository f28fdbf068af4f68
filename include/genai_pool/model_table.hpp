#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace genai_pool {

    /// @brief Purpose tags understood by the default model table.
    namespace purpose {
        inline constexpr std::string_view orchestrator = "orchestrator";
        inline constexpr std::string_view vision = "vision";
        inline constexpr std::string_view fallback = "fallback";
        inline constexpr std::string_view creative = "creative";
        inline constexpr std::string_view pro = "pro";
    }  // namespace purpose

    /**
     * @brief Fixed mapping from a caller purpose to a backend model name.
     *
     * Unknown purposes resolve to the model registered under the default
     * purpose. The table is immutable once built.
     */
    class ModelTable {
       public:
        using map_type = std::unordered_map<std::string, std::string>;

        ModelTable(map_type models, std::string default_purpose)
            : m_models(std::move(models)),
              m_default_purpose(std::move(default_purpose)) {}

        /// @brief The built-in table: flash for every purpose, pro for "pro".
        static ModelTable defaults() {
            const std::string flash = "gemini-3-flash-preview";
            map_type m{
                {std::string(purpose::orchestrator), flash},
                {std::string(purpose::vision), flash},
                {std::string(purpose::fallback), flash},
                {std::string(purpose::creative), flash},
                {std::string(purpose::pro), "gemini-3-pro-preview"},
            };
            return ModelTable(std::move(m), std::string(purpose::fallback));
        }

        /// @brief Model for purpose, or the default purpose's model.
        /// @note Returns an empty string only when the default purpose itself
        /// is missing from the table.
        [[nodiscard]] std::string resolve(std::string_view purpose_tag) const {
            if (auto it = m_models.find(std::string(purpose_tag));
                it != m_models.end()) {
                return it->second;
            }
            if (auto it = m_models.find(m_default_purpose);
                it != m_models.end()) {
                return it->second;
            }
            return {};
        }

        [[nodiscard]] const std::string& default_purpose() const noexcept {
            return m_default_purpose;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return m_models.size();
        }

       private:
        map_type m_models;
        std::string m_default_purpose;
    };

}  // namespace genai_pool

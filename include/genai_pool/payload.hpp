#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace genai_pool {

    /// @brief Binary media sent inline with a prompt (video, image, audio).
    struct InlineData {
        std::string mime_type;
        /// Raw bytes; the transport base64-encodes them.
        std::string bytes;
    };

    /// @brief One prompt part: text or inline media.
    using Part = std::variant<std::string, InlineData>;

    /**
     * @brief Generation options forwarded to the service untouched.
     */
    struct GenerationOptions {
        std::optional<std::string> system_instruction;
        std::optional<double> temperature;
        std::optional<double> top_p;
        std::optional<int> max_output_tokens;
        /** @brief e.g. "application/json" for structured output. */
        std::optional<std::string> response_mime_type;
        std::optional<nlohmann::json> response_schema;
    };

    /**
     * @brief What a collaborator wants sent. The scheduler and the executor
     * never look inside; only the transport serializes it.
     */
    struct Payload {
        std::vector<Part> parts;
        GenerationOptions options;

        /// @brief Single text prompt.
        static Payload text(std::string prompt) {
            Payload p;
            p.parts.emplace_back(std::move(prompt));
            return p;
        }

        /// @brief Media followed by a text prompt, the shape used for frame
        /// and clip analysis.
        static Payload media(std::string mime_type, std::string bytes,
                             std::string prompt) {
            Payload p;
            p.parts.emplace_back(
                InlineData{std::move(mime_type), std::move(bytes)});
            p.parts.emplace_back(std::move(prompt));
            return p;
        }
    };

}  // namespace genai_pool

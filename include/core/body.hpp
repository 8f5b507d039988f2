#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace rulegate {

/**
 * @brief Request or response payload: empty, parsed JSON, or opaque bytes
 *
 * Produced by a best-effort parse. Bytes that are not valid JSON are kept
 * as-is and serialize back unchanged.
 */
class Body {
public:
    Body() = default;
    explicit Body(nlohmann::json value) : data_(std::move(value)) {}

    [[nodiscard]] static Body parse(std::string_view bytes);
    [[nodiscard]] static Body raw(std::string bytes);

    [[nodiscard]] bool is_empty() const { return std::holds_alternative<std::monostate>(data_); }
    [[nodiscard]] bool is_json() const { return std::holds_alternative<nlohmann::json>(data_); }
    [[nodiscard]] bool is_raw() const { return std::holds_alternative<std::string>(data_); }

    nlohmann::json& json() { return std::get<nlohmann::json>(data_); }
    const nlohmann::json& json() const { return std::get<nlohmann::json>(data_); }
    const std::string& raw_bytes() const { return std::get<std::string>(data_); }

    /// Bytes to put on the wire (JSON is dumped compactly)
    [[nodiscard]] std::string serialize() const;

private:
    std::variant<std::monostate, nlohmann::json, std::string> data_;
};

} // namespace rulegate

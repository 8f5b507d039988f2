#include "core/body.hpp"

namespace rulegate {

Body Body::parse(std::string_view bytes) {
    if (bytes.empty()) return Body{};

    auto parsed = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return raw(std::string(bytes));
    }
    return Body(std::move(parsed));
}

Body Body::raw(std::string bytes) {
    Body b;
    b.data_ = std::move(bytes);
    return b;
}

std::string Body::serialize() const {
    if (is_json()) return json().dump();
    if (is_raw()) return raw_bytes();
    return {};
}

} // namespace rulegate

#include <graphrag/core/document.h>

#include <sstream>
#include <type_traits>

namespace graphrag {

std::string Document::renderContent() const {
    if (!graphContext.has_value() || graphContext->empty()) {
        return content;
    }
    return content + "\n\n" + graphContext.value();
}

std::optional<double> metadataAsNumber(const MetadataValue& value) {
    return std::visit(
        [](const auto& v) -> std::optional<double> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? 1.0 : 0.0;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return static_cast<double>(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return std::nullopt;
            } else {
                static_assert(std::is_same_v<T, std::vector<std::string>>,
                              "unhandled metadata kind");
                return std::nullopt;
            }
        },
        value);
}

std::string metadataToString(const MetadataValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream oss;
                oss << v;
                return oss.str();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                static_assert(std::is_same_v<T, std::vector<std::string>>,
                              "unhandled metadata kind");
                std::string out;
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) {
                        out += ", ";
                    }
                    out += v[i];
                }
                return out;
            }
        },
        value);
}

} // namespace graphrag

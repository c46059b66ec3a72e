#include <tinta/filter/types.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace tinta::filter {

float TransferFunction::apply(float c) const {
    float v = c;
    switch (kind) {
        case Kind::Identity:
            return c;
        case Kind::Table: {
            size_t n = table.size();
            if (n == 0) return c;
            if (n == 1) {
                v = table[0];
                break;
            }
            float pos = c * static_cast<float>(n - 1);
            size_t k = std::min(static_cast<size_t>(std::max(0.0f, std::floor(pos))), n - 2);
            v = table[k] + (pos - static_cast<float>(k)) * (table[k + 1] - table[k]);
            break;
        }
        case Kind::Discrete: {
            size_t n = table.size();
            if (n == 0) return c;
            size_t k = static_cast<size_t>(std::max(0.0f, std::floor(c * static_cast<float>(n))));
            v = table[std::min(k, n - 1)];
            break;
        }
        case Kind::Linear:
            v = slope * c + intercept;
            break;
        case Kind::Gamma:
            v = amplitude * std::pow(c, exponent) + offset;
            break;
    }
    return std::clamp(v, 0.0f, 1.0f);
}

std::vector<Input> primitive_inputs(const Kind& kind) {
    return std::visit(
        [](const auto& p) -> std::vector<Input> {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, Composite> || std::is_same_v<T, DisplacementMap> ||
                          std::is_same_v<T, Blend>) {
                return {p.input1, p.input2};
            } else if constexpr (std::is_same_v<T, Merge>) {
                return p.inputs;
            } else if constexpr (std::is_same_v<T, Flood>) {
                return {};
            } else {
                return {p.input};
            }
        },
        kind);
}

} // namespace tinta::filter

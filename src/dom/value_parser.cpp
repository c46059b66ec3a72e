#include <tinta/dom/value_parser.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace tinta::dom {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Cursor over an attribute string with the SVG number grammar.
class Scanner {
public:
    explicit Scanner(std::string_view s) : s_(s) {}

    bool at_end() const { return pos_ >= s_.size(); }
    char peek() const { return at_end() ? '\0' : s_[pos_]; }
    size_t pos() const { return pos_; }
    void advance(size_t n = 1) { pos_ = std::min(s_.size(), pos_ + n); }
    std::string_view rest() const { return s_.substr(pos_); }

    void skip_spaces() {
        while (!at_end() && is_space(s_[pos_])) pos_++;
    }

    // Skips whitespace with at most one comma.
    void skip_separator() {
        skip_spaces();
        if (peek() == ',') {
            pos_++;
            skip_spaces();
        }
    }

    bool consume(char c) {
        if (peek() != c) return false;
        pos_++;
        return true;
    }

    bool starts_with(std::string_view text) const {
        return rest().substr(0, text.size()) == text;
    }

    std::optional<float> number() {
        size_t start = pos_;
        size_t i = pos_;
        if (i < s_.size() && (s_[i] == '+' || s_[i] == '-')) i++;
        bool digits = false;
        while (i < s_.size() && is_digit(s_[i])) {
            i++;
            digits = true;
        }
        if (i < s_.size() && s_[i] == '.') {
            i++;
            while (i < s_.size() && is_digit(s_[i])) {
                i++;
                digits = true;
            }
        }
        if (!digits) return std::nullopt;
        // Exponent, but not the start of an `em`/`ex` unit.
        if (i < s_.size() && (s_[i] == 'e' || s_[i] == 'E')) {
            size_t j = i + 1;
            if (j < s_.size() && (s_[j] == '+' || s_[j] == '-')) j++;
            if (j < s_.size() && is_digit(s_[j])) {
                while (j < s_.size() && is_digit(s_[j])) j++;
                i = j;
            }
        }
        std::string text(s_.substr(start, i - start));
        char* end = nullptr;
        double value = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) return std::nullopt;
        if (!std::isfinite(value)) return std::nullopt;
        pos_ = i;
        return static_cast<float>(value);
    }

    // Path flag: a single '0' or '1' with no separator required.
    std::optional<bool> flag() {
        skip_spaces();
        char c = peek();
        if (c != '0' && c != '1') return std::nullopt;
        pos_++;
        skip_separator();
        return c == '1';
    }

    std::optional<float> list_number() {
        skip_spaces();
        auto n = number();
        if (n) skip_separator();
        return n;
    }

private:
    std::string_view s_;
    size_t pos_ = 0;
};

const std::unordered_map<std::string, uint32_t>& named_colors() {
    static const std::unordered_map<std::string, uint32_t> colors = {
        {"aliceblue", 0xf0f8ff}, {"antiquewhite", 0xfaebd7}, {"aqua", 0x00ffff},
        {"aquamarine", 0x7fffd4}, {"azure", 0xf0ffff}, {"beige", 0xf5f5dc},
        {"bisque", 0xffe4c4}, {"black", 0x000000}, {"blanchedalmond", 0xffebcd},
        {"blue", 0x0000ff}, {"blueviolet", 0x8a2be2}, {"brown", 0xa52a2a},
        {"burlywood", 0xdeb887}, {"cadetblue", 0x5f9ea0}, {"chartreuse", 0x7fff00},
        {"chocolate", 0xd2691e}, {"coral", 0xff7f50}, {"cornflowerblue", 0x6495ed},
        {"cornsilk", 0xfff8dc}, {"crimson", 0xdc143c}, {"cyan", 0x00ffff},
        {"darkblue", 0x00008b}, {"darkcyan", 0x008b8b}, {"darkgoldenrod", 0xb8860b},
        {"darkgray", 0xa9a9a9}, {"darkgreen", 0x006400}, {"darkgrey", 0xa9a9a9},
        {"darkkhaki", 0xbdb76b}, {"darkmagenta", 0x8b008b}, {"darkolivegreen", 0x556b2f},
        {"darkorange", 0xff8c00}, {"darkorchid", 0x9932cc}, {"darkred", 0x8b0000},
        {"darksalmon", 0xe9967a}, {"darkseagreen", 0x8fbc8f}, {"darkslateblue", 0x483d8b},
        {"darkslategray", 0x2f4f4f}, {"darkslategrey", 0x2f4f4f}, {"darkturquoise", 0x00ced1},
        {"darkviolet", 0x9400d3}, {"deeppink", 0xff1493}, {"deepskyblue", 0x00bfff},
        {"dimgray", 0x696969}, {"dimgrey", 0x696969}, {"dodgerblue", 0x1e90ff},
        {"firebrick", 0xb22222}, {"floralwhite", 0xfffaf0}, {"forestgreen", 0x228b22},
        {"fuchsia", 0xff00ff}, {"gainsboro", 0xdcdcdc}, {"ghostwhite", 0xf8f8ff},
        {"gold", 0xffd700}, {"goldenrod", 0xdaa520}, {"gray", 0x808080},
        {"grey", 0x808080}, {"green", 0x008000}, {"greenyellow", 0xadff2f},
        {"honeydew", 0xf0fff0}, {"hotpink", 0xff69b4}, {"indianred", 0xcd5c5c},
        {"indigo", 0x4b0082}, {"ivory", 0xfffff0}, {"khaki", 0xf0e68c},
        {"lavender", 0xe6e6fa}, {"lavenderblush", 0xfff0f5}, {"lawngreen", 0x7cfc00},
        {"lemonchiffon", 0xfffacd}, {"lightblue", 0xadd8e6}, {"lightcoral", 0xf08080},
        {"lightcyan", 0xe0ffff}, {"lightgoldenrodyellow", 0xfafad2}, {"lightgray", 0xd3d3d3},
        {"lightgreen", 0x90ee90}, {"lightgrey", 0xd3d3d3}, {"lightpink", 0xffb6c1},
        {"lightsalmon", 0xffa07a}, {"lightseagreen", 0x20b2aa}, {"lightskyblue", 0x87cefa},
        {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xb0c4de},
        {"lightyellow", 0xffffe0}, {"lime", 0x00ff00}, {"limegreen", 0x32cd32},
        {"linen", 0xfaf0e6}, {"magenta", 0xff00ff}, {"maroon", 0x800000},
        {"mediumaquamarine", 0x66cdaa}, {"mediumblue", 0x0000cd}, {"mediumorchid", 0xba55d3},
        {"mediumpurple", 0x9370db}, {"mediumseagreen", 0x3cb371}, {"mediumslateblue", 0x7b68ee},
        {"mediumspringgreen", 0x00fa9a}, {"mediumturquoise", 0x48d1cc},
        {"mediumvioletred", 0xc71585}, {"midnightblue", 0x191970}, {"mintcream", 0xf5fffa},
        {"mistyrose", 0xffe4e1}, {"moccasin", 0xffe4b5}, {"navajowhite", 0xffdead},
        {"navy", 0x000080}, {"oldlace", 0xfdf5e6}, {"olive", 0x808000},
        {"olivedrab", 0x6b8e23}, {"orange", 0xffa500}, {"orangered", 0xff4500},
        {"orchid", 0xda70d6}, {"palegoldenrod", 0xeee8aa}, {"palegreen", 0x98fb98},
        {"paleturquoise", 0xafeeee}, {"palevioletred", 0xdb7093}, {"papayawhip", 0xffefd5},
        {"peachpuff", 0xffdab9}, {"peru", 0xcd853f}, {"pink", 0xffc0cb},
        {"plum", 0xdda0dd}, {"powderblue", 0xb0e0e6}, {"purple", 0x800080},
        {"rebeccapurple", 0x663399}, {"red", 0xff0000}, {"rosybrown", 0xbc8f8f},
        {"royalblue", 0x4169e1}, {"saddlebrown", 0x8b4513}, {"salmon", 0xfa8072},
        {"sandybrown", 0xf4a460}, {"seagreen", 0x2e8b57}, {"seashell", 0xfff5ee},
        {"sienna", 0xa0522d}, {"silver", 0xc0c0c0}, {"skyblue", 0x87ceeb},
        {"slateblue", 0x6a5acd}, {"slategray", 0x708090}, {"slategrey", 0x708090},
        {"snow", 0xfffafa}, {"springgreen", 0x00ff7f}, {"steelblue", 0x4682b4},
        {"tan", 0xd2b48c}, {"teal", 0x008080}, {"thistle", 0xd8bfd8},
        {"tomato", 0xff6347}, {"turquoise", 0x40e0d0}, {"violet", 0xee82ee},
        {"wheat", 0xf5deb3}, {"white", 0xffffff}, {"whitesmoke", 0xf5f5f5},
        {"yellow", 0xffff00}, {"yellowgreen", 0x9acd32},
    };
    return colors;
}

uint8_t clamp_channel(float v) {
    return static_cast<uint8_t>(std::clamp(std::round(v), 0.0f, 255.0f));
}

float hue_to_rgb(float t1, float t2, float h) {
    if (h < 0) h += 6;
    if (h >= 6) h -= 6;
    if (h < 1) return (t2 - t1) * h + t1;
    if (h < 3) return t2;
    if (h < 4) return (t2 - t1) * (4 - h) + t1;
    return t1;
}

// Arguments of a color function, split on commas, whitespace and '/'.
std::optional<std::vector<std::string>> function_args(std::string_view inner) {
    std::vector<std::string> args;
    std::string current;
    for (char c : inner) {
        if (c == ',' || c == '/' || is_space(c)) {
            if (!current.empty()) args.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) args.push_back(current);
    if (args.size() < 3 || args.size() > 4) return std::nullopt;
    return args;
}

std::optional<float> parse_alpha(const std::string& arg) {
    if (!arg.empty() && arg.back() == '%') {
        auto n = parse_number(std::string_view(arg).substr(0, arg.size() - 1));
        if (!n) return std::nullopt;
        return std::clamp(*n / 100.0f, 0.0f, 1.0f);
    }
    auto n = parse_number(arg);
    if (!n) return std::nullopt;
    return std::clamp(*n, 0.0f, 1.0f);
}

std::optional<paint::Color> parse_rgb_function(std::string_view inner) {
    auto args = function_args(inner);
    if (!args) return std::nullopt;
    float channels[3];
    for (int i = 0; i < 3; i++) {
        const std::string& arg = (*args)[static_cast<size_t>(i)];
        if (!arg.empty() && arg.back() == '%') {
            auto n = parse_number(std::string_view(arg).substr(0, arg.size() - 1));
            if (!n) return std::nullopt;
            channels[i] = *n * 255.0f / 100.0f;
        } else {
            auto n = parse_number(arg);
            if (!n) return std::nullopt;
            channels[i] = *n;
        }
    }
    float alpha = 1.0f;
    if (args->size() == 4) {
        auto a = parse_alpha((*args)[3]);
        if (!a) return std::nullopt;
        alpha = *a;
    }
    return paint::Color{clamp_channel(channels[0]), clamp_channel(channels[1]),
                        clamp_channel(channels[2]), clamp_channel(alpha * 255.0f)};
}

std::optional<paint::Color> parse_hsl_function(std::string_view inner) {
    auto args = function_args(inner);
    if (!args) return std::nullopt;
    std::string hue_text = (*args)[0];
    if (hue_text.size() > 3 && hue_text.substr(hue_text.size() - 3) == "deg") {
        hue_text.resize(hue_text.size() - 3);
    }
    auto hue = parse_number(hue_text);
    auto sat = parse_number_or_percent((*args)[1]);
    auto light = parse_number_or_percent((*args)[2]);
    if (!hue || !sat || !light) return std::nullopt;
    float h = std::fmod(*hue, 360.0f);
    if (h < 0) h += 360.0f;
    h /= 60.0f;
    float s = std::clamp(*sat, 0.0f, 1.0f);
    float l = std::clamp(*light, 0.0f, 1.0f);
    float t2 = l <= 0.5f ? l * (s + 1) : l + s - l * s;
    float t1 = l * 2 - t2;
    float alpha = 1.0f;
    if (args->size() == 4) {
        auto a = parse_alpha((*args)[3]);
        if (!a) return std::nullopt;
        alpha = *a;
    }
    return paint::Color{clamp_channel(hue_to_rgb(t1, t2, h + 2) * 255.0f),
                        clamp_channel(hue_to_rgb(t1, t2, h) * 255.0f),
                        clamp_channel(hue_to_rgb(t1, t2, h - 2) * 255.0f),
                        clamp_channel(alpha * 255.0f)};
}

std::optional<ParsedPaint::Kind> simple_paint_kind(const std::string& lower) {
    if (lower == "none") return ParsedPaint::Kind::None;
    if (lower == "currentcolor") return ParsedPaint::Kind::CurrentColor;
    if (lower == "context-fill") return ParsedPaint::Kind::ContextFill;
    if (lower == "context-stroke") return ParsedPaint::Kind::ContextStroke;
    return std::nullopt;
}

} // namespace

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) start++;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) end--;
    return std::string(s.substr(start, end - start));
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<float> parse_number(std::string_view s) {
    std::string text = trim(s);
    Scanner sc(text);
    auto n = sc.number();
    if (!n || !sc.at_end()) return std::nullopt;
    return n;
}

std::optional<float> parse_number_or_percent(std::string_view s) {
    std::string text = trim(s);
    Scanner sc(text);
    auto n = sc.number();
    if (!n) return std::nullopt;
    if (sc.consume('%')) *n /= 100.0f;
    if (!sc.at_end()) return std::nullopt;
    return n;
}

std::optional<std::vector<float>> parse_number_list(std::string_view s) {
    std::vector<float> values;
    Scanner sc(s);
    sc.skip_spaces();
    while (!sc.at_end()) {
        auto n = sc.list_number();
        if (!n) return std::nullopt;
        values.push_back(*n);
    }
    return values;
}

namespace {

std::optional<Length> scan_length(Scanner& sc) {
    auto n = sc.number();
    if (!n) return std::nullopt;
    Length len{*n, LengthUnit::None};
    if (sc.consume('%')) {
        len.unit = LengthUnit::Percent;
        return len;
    }
    struct UnitName {
        const char* name;
        LengthUnit unit;
    };
    static constexpr UnitName kUnits[] = {
        {"px", LengthUnit::Px}, {"em", LengthUnit::Em}, {"ex", LengthUnit::Ex},
        {"in", LengthUnit::In}, {"cm", LengthUnit::Cm}, {"mm", LengthUnit::Mm},
        {"pt", LengthUnit::Pt}, {"pc", LengthUnit::Pc},
    };
    for (const auto& u : kUnits) {
        if (sc.starts_with(u.name)) {
            sc.advance(2);
            len.unit = u.unit;
            break;
        }
    }
    return len;
}

} // namespace

std::optional<Length> parse_length(std::string_view s) {
    std::string text = trim(s);
    Scanner sc(text);
    auto len = scan_length(sc);
    if (!len || !sc.at_end()) return std::nullopt;
    return len;
}

std::optional<std::vector<Length>> parse_length_list(std::string_view s) {
    std::vector<Length> values;
    Scanner sc(s);
    sc.skip_spaces();
    while (!sc.at_end()) {
        auto len = scan_length(sc);
        if (!len) return std::nullopt;
        values.push_back(*len);
        sc.skip_separator();
    }
    return values;
}

std::optional<paint::Color> parse_color(std::string_view input) {
    std::string value = to_lower(trim(input));
    if (value.empty()) return std::nullopt;

    if (value[0] == '#') {
        std::string hex = value.substr(1);
        for (char c : hex) {
            if (hex_digit(c) < 0) return std::nullopt;
        }
        auto pair = [&hex](size_t i) {
            return static_cast<uint8_t>(hex_digit(hex[i]) * 16 + hex_digit(hex[i + 1]));
        };
        auto single = [&hex](size_t i) { return static_cast<uint8_t>(hex_digit(hex[i]) * 17); };
        switch (hex.size()) {
            case 3: return paint::Color{single(0), single(1), single(2), 255};
            case 4: return paint::Color{single(0), single(1), single(2), single(3)};
            case 6: return paint::Color{pair(0), pair(2), pair(4), 255};
            case 8: return paint::Color{pair(0), pair(2), pair(4), pair(6)};
            default: return std::nullopt;
        }
    }

    if (value == "transparent") return paint::Color::transparent();

    auto open = value.find('(');
    if (open != std::string::npos) {
        if (value.back() != ')') return std::nullopt;
        std::string name = trim(std::string_view(value).substr(0, open));
        std::string_view inner = std::string_view(value).substr(open + 1, value.size() - open - 2);
        if (name == "rgb" || name == "rgba") return parse_rgb_function(inner);
        if (name == "hsl" || name == "hsla") return parse_hsl_function(inner);
        return std::nullopt;
    }

    auto& colors = named_colors();
    auto it = colors.find(value);
    if (it == colors.end()) return std::nullopt;
    uint32_t rgb = it->second;
    return paint::Color{static_cast<uint8_t>((rgb >> 16) & 0xff),
                        static_cast<uint8_t>((rgb >> 8) & 0xff),
                        static_cast<uint8_t>(rgb & 0xff), 255};
}

std::optional<std::string> parse_iri(std::string_view s) {
    std::string text = trim(s);
    if (text.size() < 2 || text[0] != '#') return std::nullopt;
    return text.substr(1);
}

std::optional<std::string> parse_func_iri(std::string_view s) {
    std::string text = trim(s);
    if (text.size() < 5 || text.compare(0, 4, "url(") != 0) return std::nullopt;
    auto close = text.find(')');
    if (close == std::string::npos) return std::nullopt;
    std::string inner = trim(std::string_view(text).substr(4, close - 4));
    if (inner.size() >= 2 && (inner.front() == '\'' || inner.front() == '"') &&
        inner.back() == inner.front()) {
        inner = inner.substr(1, inner.size() - 2);
    }
    return parse_iri(inner);
}

std::optional<ParsedPaint> parse_paint(std::string_view s) {
    std::string text = trim(s);
    if (text.empty()) return std::nullopt;
    std::string lower = to_lower(text);

    ParsedPaint paint;
    if (auto kind = simple_paint_kind(lower)) {
        paint.kind = *kind;
        return paint;
    }

    if (lower.compare(0, 4, "url(") == 0) {
        auto close = text.find(')');
        if (close == std::string::npos) return std::nullopt;
        auto id = parse_func_iri(std::string_view(text).substr(0, close + 1));
        if (!id) return std::nullopt;
        paint.kind = ParsedPaint::Kind::Url;
        paint.url = *id;
        std::string fallback = to_lower(trim(std::string_view(text).substr(close + 1)));
        if (!fallback.empty()) {
            if (auto kind = simple_paint_kind(fallback)) {
                paint.fallback_kind = *kind;
            } else if (auto color = parse_color(fallback)) {
                paint.fallback_kind = ParsedPaint::Kind::Color;
                paint.fallback_color = *color;
            }
        }
        return paint;
    }

    auto color = parse_color(text);
    if (!color) return std::nullopt;
    paint.kind = ParsedPaint::Kind::Color;
    paint.color = *color;
    return paint;
}

std::optional<geom::Transform> parse_transform(std::string_view s) {
    geom::Transform result = geom::Transform::identity();
    Scanner sc(s);
    sc.skip_spaces();
    while (!sc.at_end()) {
        std::string name;
        while (!sc.at_end() && std::isalpha(static_cast<unsigned char>(sc.peek()))) {
            name += sc.peek();
            sc.advance();
        }
        sc.skip_spaces();
        if (name.empty() || !sc.consume('(')) return std::nullopt;
        std::vector<float> args;
        sc.skip_spaces();
        while (!sc.at_end() && sc.peek() != ')') {
            auto n = sc.list_number();
            if (!n) return std::nullopt;
            args.push_back(*n);
        }
        if (!sc.consume(')')) return std::nullopt;

        geom::Transform ts;
        if (name == "matrix" && args.size() == 6) {
            ts = geom::Transform::from_svg(args[0], args[1], args[2], args[3], args[4], args[5]);
        } else if (name == "translate" && (args.size() == 1 || args.size() == 2)) {
            ts = geom::Transform::translate(args[0], args.size() == 2 ? args[1] : 0);
        } else if (name == "scale" && (args.size() == 1 || args.size() == 2)) {
            ts = geom::Transform::scale(args[0], args.size() == 2 ? args[1] : args[0]);
        } else if (name == "rotate" && args.size() == 1) {
            ts = geom::Transform::rotate(args[0]);
        } else if (name == "rotate" && args.size() == 3) {
            ts = geom::Transform::rotate_around(args[0], args[1], args[2]);
        } else if (name == "skewX" && args.size() == 1) {
            ts = geom::Transform::skew_x(args[0]);
        } else if (name == "skewY" && args.size() == 1) {
            ts = geom::Transform::skew_y(args[0]);
        } else {
            return std::nullopt;
        }
        result = result * ts;
        sc.skip_separator();
    }
    return result;
}

std::optional<geom::Path> parse_path_data(std::string_view s) {
    geom::PathBuilder builder;
    Scanner sc(s);
    sc.skip_spaces();

    char command = 0;
    char prev_command = 0;
    // Last control point of the previous curve, for S and T reflection.
    geom::Point last_control;
    bool first = true;

    while (!sc.at_end()) {
        char c = sc.peek();
        if (std::isalpha(static_cast<unsigned char>(c))) {
            if (std::string_view("MmLlHhVvCcSsQqTtAaZz").find(c) == std::string_view::npos) break;
            command = c;
            sc.advance();
            sc.skip_spaces();
        } else if (command == 0) {
            break;
        } else if (command == 'M') {
            command = 'L';
        } else if (command == 'm') {
            command = 'l';
        } else if (command == 'Z' || command == 'z') {
            // Numbers cannot follow a closepath.
            break;
        }
        if (first && command != 'M' && command != 'm') break;
        first = false;

        bool relative = std::islower(static_cast<unsigned char>(command)) != 0;
        geom::Point cur = builder.has_current_point() ? builder.current_point() : geom::Point{};
        float ox = relative ? cur.x : 0;
        float oy = relative ? cur.y : 0;
        char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(command)));

        bool ok = true;
        auto num = [&sc, &ok]() -> float {
            if (!ok) return 0;
            auto n = sc.list_number();
            if (!n) {
                ok = false;
                return 0;
            }
            return *n;
        };

        switch (upper) {
            case 'M': {
                float x = num(), y = num();
                if (!ok) break;
                // A relative moveto after closepath is relative to the subpath start.
                builder.move_to(ox + x, oy + y);
                break;
            }
            case 'L': {
                float x = num(), y = num();
                if (!ok) break;
                builder.line_to(ox + x, oy + y);
                break;
            }
            case 'H': {
                float x = num();
                if (!ok) break;
                builder.line_to(ox + x, cur.y);
                break;
            }
            case 'V': {
                float y = num();
                if (!ok) break;
                builder.line_to(cur.x, oy + y);
                break;
            }
            case 'C': {
                float x1 = num(), y1 = num(), x2 = num(), y2 = num(), x = num(), y = num();
                if (!ok) break;
                builder.cubic_to(ox + x1, oy + y1, ox + x2, oy + y2, ox + x, oy + y);
                last_control = {ox + x2, oy + y2};
                break;
            }
            case 'S': {
                float x2 = num(), y2 = num(), x = num(), y = num();
                if (!ok) break;
                geom::Point c1 = cur;
                if (prev_command == 'C' || prev_command == 'S') {
                    c1 = {2 * cur.x - last_control.x, 2 * cur.y - last_control.y};
                }
                builder.cubic_to(c1.x, c1.y, ox + x2, oy + y2, ox + x, oy + y);
                last_control = {ox + x2, oy + y2};
                break;
            }
            case 'Q': {
                float x1 = num(), y1 = num(), x = num(), y = num();
                if (!ok) break;
                builder.quad_to(ox + x1, oy + y1, ox + x, oy + y);
                last_control = {ox + x1, oy + y1};
                break;
            }
            case 'T': {
                float x = num(), y = num();
                if (!ok) break;
                geom::Point c1 = cur;
                if (prev_command == 'Q' || prev_command == 'T') {
                    c1 = {2 * cur.x - last_control.x, 2 * cur.y - last_control.y};
                }
                builder.quad_to(c1.x, c1.y, ox + x, oy + y);
                last_control = c1;
                break;
            }
            case 'A': {
                float rx = num(), ry = num(), rot = num();
                if (!ok) break;
                auto large = sc.flag();
                auto sweep = large ? sc.flag() : std::nullopt;
                if (!large || !sweep) {
                    ok = false;
                    break;
                }
                float x = num(), y = num();
                if (!ok) break;
                builder.arc_to(rx, ry, rot, *large, *sweep, ox + x, oy + y);
                break;
            }
            case 'Z':
                builder.close();
                sc.skip_spaces();
                break;
            default:
                ok = false;
                break;
        }
        if (!ok) break;
        prev_command = upper;
    }
    return builder.finish();
}

std::vector<geom::Point> parse_points(std::string_view s) {
    std::vector<geom::Point> points;
    Scanner sc(s);
    sc.skip_spaces();
    while (!sc.at_end()) {
        auto x = sc.list_number();
        if (!x) break;
        auto y = sc.list_number();
        // An odd trailing coordinate is ignored.
        if (!y) break;
        points.push_back({*x, *y});
    }
    return points;
}

std::optional<geom::Rect> parse_view_box(std::string_view s) {
    auto values = parse_number_list(s);
    if (!values || values->size() != 4) return std::nullopt;
    geom::Rect r{(*values)[0], (*values)[1], (*values)[2], (*values)[3]};
    if (!(r.width > 0) || !(r.height > 0)) return std::nullopt;
    return r;
}

std::optional<AspectRatio> parse_aspect_ratio(std::string_view s) {
    std::string text = trim(s);
    std::vector<std::string> words;
    {
        std::string current;
        for (char c : text) {
            if (is_space(c)) {
                if (!current.empty()) words.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        if (!current.empty()) words.push_back(current);
    }
    size_t i = 0;
    if (i < words.size() && words[i] == "defer") i++;
    if (i >= words.size()) return std::nullopt;

    struct AlignName {
        const char* name;
        Align align;
    };
    static constexpr AlignName kAligns[] = {
        {"none", Align::None},         {"xMinYMin", Align::XMinYMin}, {"xMidYMin", Align::XMidYMin},
        {"xMaxYMin", Align::XMaxYMin}, {"xMinYMid", Align::XMinYMid}, {"xMidYMid", Align::XMidYMid},
        {"xMaxYMid", Align::XMaxYMid}, {"xMinYMax", Align::XMinYMax}, {"xMidYMax", Align::XMidYMax},
        {"xMaxYMax", Align::XMaxYMax},
    };
    AspectRatio ar;
    bool found = false;
    for (const auto& a : kAligns) {
        if (words[i] == a.name) {
            ar.align = a.align;
            found = true;
            break;
        }
    }
    if (!found) return std::nullopt;
    i++;
    if (i < words.size()) {
        if (words[i] == "slice") {
            ar.slice = true;
        } else if (words[i] != "meet") {
            return std::nullopt;
        }
        i++;
    }
    if (i != words.size()) return std::nullopt;
    return ar;
}

geom::Transform view_box_transform(const geom::Rect& vb, const AspectRatio& ar,
                                   const geom::Size& size) {
    if (vb.is_empty()) return geom::Transform::identity();
    float sx = size.width / vb.width;
    float sy = size.height / vb.height;
    if (ar.align == Align::None) {
        return geom::Transform::scale(sx, sy) * geom::Transform::translate(-vb.x, -vb.y);
    }
    float s = ar.slice ? std::max(sx, sy) : std::min(sx, sy);
    float w = vb.width * s;
    float h = vb.height * s;

    float tx = -vb.x * s;
    float ty = -vb.y * s;
    switch (ar.align) {
        case Align::XMidYMin: case Align::XMidYMid: case Align::XMidYMax:
            tx += (size.width - w) / 2;
            break;
        case Align::XMaxYMin: case Align::XMaxYMid: case Align::XMaxYMax:
            tx += size.width - w;
            break;
        default:
            break;
    }
    switch (ar.align) {
        case Align::XMinYMid: case Align::XMidYMid: case Align::XMaxYMid:
            ty += (size.height - h) / 2;
            break;
        case Align::XMinYMax: case Align::XMidYMax: case Align::XMaxYMax:
            ty += size.height - h;
            break;
        default:
            break;
    }
    return geom::Transform{s, 0, tx, 0, s, ty};
}

std::vector<Declaration> parse_declarations(std::string_view s) {
    std::vector<Declaration> decls;
    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find(';', start);
        if (end == std::string_view::npos) end = s.size();
        std::string_view item = s.substr(start, end - start);
        start = end + 1;

        auto colon = item.find(':');
        if (colon == std::string_view::npos) continue;
        Declaration decl;
        decl.name = to_lower(trim(item.substr(0, colon)));
        std::string value = trim(item.substr(colon + 1));
        auto bang = value.rfind('!');
        if (bang != std::string::npos && to_lower(trim(value.substr(bang + 1))) == "important") {
            decl.important = true;
            value = trim(std::string_view(value).substr(0, bang));
        }
        decl.value = value;
        if (decl.name.empty()) continue;
        decls.push_back(std::move(decl));
    }
    return decls;
}

std::vector<std::string> parse_font_families(std::string_view s) {
    std::vector<std::string> families;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(',', start);
        if (end == std::string_view::npos) end = s.size();
        std::string name = trim(s.substr(start, end - start));
        if (name.size() >= 2 && (name.front() == '\'' || name.front() == '"') &&
            name.back() == name.front()) {
            name = name.substr(1, name.size() - 2);
        }
        if (!name.empty()) families.push_back(name);
        start = end + 1;
    }
    return families;
}

} // namespace tinta::dom

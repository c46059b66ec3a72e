#include <tinta/dom/stylesheet.h>

#include <algorithm>
#include <cctype>

namespace tinta::dom {

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

std::string strip_comments(std::string_view css) {
    std::string out;
    out.reserve(css.size());
    size_t i = 0;
    while (i < css.size()) {
        if (i + 1 < css.size() && css[i] == '/' && css[i + 1] == '*') {
            auto end = css.find("*/", i + 2);
            if (end == std::string_view::npos) break;
            i = end + 2;
            continue;
        }
        out += css[i++];
    }
    return out;
}

std::optional<CompoundSelector> parse_compound(std::string_view text) {
    CompoundSelector compound;
    size_t i = 0;
    if (text.empty()) return std::nullopt;
    while (i < text.size()) {
        char c = text[i];
        SimpleSelector simple;
        if (c == '*') {
            simple.type = SimpleSelector::Type::Universal;
            i++;
        } else if (c == '.' || c == '#') {
            simple.type = c == '.' ? SimpleSelector::Type::Class : SimpleSelector::Type::Id;
            size_t start = ++i;
            while (i < text.size() && is_ident_char(text[i])) i++;
            if (i == start) return std::nullopt;
            simple.name = std::string(text.substr(start, i - start));
        } else if (c == '[') {
            auto close = text.find(']', i);
            if (close == std::string_view::npos) return std::nullopt;
            std::string inner = trim(text.substr(i + 1, close - i - 1));
            simple.type = SimpleSelector::Type::Attribute;
            auto eq = inner.find('=');
            if (eq == std::string::npos) {
                simple.name = inner;
            } else {
                simple.name = trim(std::string_view(inner).substr(0, eq));
                std::string value = trim(std::string_view(inner).substr(eq + 1));
                if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                    value.back() == value.front()) {
                    value = value.substr(1, value.size() - 2);
                }
                simple.value = value;
                simple.has_value = true;
            }
            if (simple.name.empty()) return std::nullopt;
            i = close + 1;
        } else if (c == ':') {
            size_t start = ++i;
            while (i < text.size() && is_ident_char(text[i])) i++;
            if (text.substr(start, i - start) != "first-child") return std::nullopt;
            simple.type = SimpleSelector::Type::FirstChild;
        } else if (is_ident_char(c)) {
            size_t start = i;
            while (i < text.size() && is_ident_char(text[i])) i++;
            simple.type = SimpleSelector::Type::Type;
            simple.name = std::string(text.substr(start, i - start));
        } else {
            return std::nullopt;
        }
        compound.simple.push_back(std::move(simple));
    }
    return compound;
}

const Element* previous_element_sibling(const Element& element) {
    const Element* parent = element.parent();
    if (!parent) return nullptr;
    const Element* prev = nullptr;
    for (const auto& child : parent->children()) {
        if (child.get() == &element) return prev;
        if (child->is_element()) prev = static_cast<const Element*>(child.get());
    }
    return nullptr;
}

bool matches_from(const SelectorMatcher& matcher, const Element& element,
                  const ComplexSelector& selector, size_t index) {
    if (!matcher.matches_compound(element, selector.parts[index].compound)) return false;
    if (index + 1 == selector.parts.size()) return true;
    Combinator comb = selector.parts[index].combinator;
    const Element* ancestor = element.parent();
    if (comb == Combinator::Child) {
        return ancestor && matches_from(matcher, *ancestor, selector, index + 1);
    }
    while (ancestor) {
        if (matches_from(matcher, *ancestor, selector, index + 1)) return true;
        ancestor = ancestor->parent();
    }
    return false;
}

} // namespace

std::optional<ComplexSelector> parse_selector(std::string_view text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    // Tokenize into compounds and combinators, left to right.
    std::vector<std::string> compounds;
    std::vector<Combinator> combinators;
    std::string current;
    bool pending_child = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '[') {
            auto close = s.find(']', i);
            if (close == std::string::npos) return std::nullopt;
            if (current.empty() && !compounds.empty()) {
                combinators.push_back(pending_child ? Combinator::Child : Combinator::Descendant);
                pending_child = false;
            }
            current += s.substr(i, close - i + 1);
            i = close;
            continue;
        }
        if (c == '>' || c == ' ' || c == '\t' || c == '\n') {
            if (!current.empty()) {
                compounds.push_back(current);
                current.clear();
            }
            if (c == '>') pending_child = true;
            continue;
        }
        if (c == '+' || c == '~') return std::nullopt;
        if (current.empty() && !compounds.empty()) {
            combinators.push_back(pending_child ? Combinator::Child : Combinator::Descendant);
            pending_child = false;
        }
        current += c;
    }
    if (current.empty()) return std::nullopt;
    compounds.push_back(current);
    if (combinators.size() + 1 != compounds.size()) return std::nullopt;

    ComplexSelector selector;
    for (size_t i = compounds.size(); i-- > 0;) {
        auto compound = parse_compound(compounds[i]);
        if (!compound) return std::nullopt;
        ComplexSelector::Part part;
        part.compound = std::move(*compound);
        if (i > 0) part.combinator = combinators[i - 1];
        selector.parts.push_back(std::move(part));
    }
    return selector;
}

Specificity specificity(const ComplexSelector& selector) {
    Specificity spec;
    for (const auto& part : selector.parts) {
        for (const auto& simple : part.compound.simple) {
            switch (simple.type) {
                case SimpleSelector::Type::Id: spec.a++; break;
                case SimpleSelector::Type::Class:
                case SimpleSelector::Type::Attribute:
                case SimpleSelector::Type::FirstChild: spec.b++; break;
                case SimpleSelector::Type::Type: spec.c++; break;
                case SimpleSelector::Type::Universal: break;
            }
        }
    }
    return spec;
}

StyleSheet StyleSheet::parse(std::string_view input) {
    StyleSheet sheet;
    std::string css = strip_comments(input);
    size_t order = 0;
    size_t i = 0;
    while (i < css.size()) {
        while (i < css.size() && std::isspace(static_cast<unsigned char>(css[i]))) i++;
        if (i >= css.size()) break;

        if (css[i] == '@') {
            // Skip the at-rule: either up to ';' or its whole block.
            size_t semi = css.find(';', i);
            size_t brace = css.find('{', i);
            if (brace == std::string::npos || (semi != std::string::npos && semi < brace)) {
                i = semi == std::string::npos ? css.size() : semi + 1;
                continue;
            }
            int depth = 0;
            size_t j = brace;
            for (; j < css.size(); j++) {
                if (css[j] == '{') depth++;
                else if (css[j] == '}' && --depth == 0) break;
            }
            i = j + 1;
            continue;
        }

        size_t open = css.find('{', i);
        if (open == std::string::npos) break;
        size_t close = css.find('}', open);
        if (close == std::string::npos) close = css.size();

        std::string_view prelude(css.data() + i, open - i);
        std::string_view body(css.data() + open + 1, close - open - 1);
        auto declarations = parse_declarations(body);

        size_t start = 0;
        while (start <= prelude.size()) {
            size_t comma = prelude.find(',', start);
            if (comma == std::string_view::npos) comma = prelude.size();
            auto selector = parse_selector(prelude.substr(start, comma - start));
            if (selector) {
                StyleRule rule;
                rule.specificity = specificity(*selector);
                rule.selector = std::move(*selector);
                rule.declarations = declarations;
                rule.source_order = order++;
                sheet.rules.push_back(std::move(rule));
            }
            start = comma + 1;
        }
        i = close + 1;
    }
    return sheet;
}

void StyleSheet::append(const StyleSheet& other) {
    size_t base = rules.size();
    for (const auto& rule : other.rules) {
        StyleRule copy = rule;
        copy.source_order += base;
        rules.push_back(std::move(copy));
    }
}

bool SelectorMatcher::matches(const Element& element, const ComplexSelector& selector) const {
    if (selector.parts.empty()) return false;
    return matches_from(*this, element, selector, 0);
}

bool SelectorMatcher::matches_compound(const Element& element,
                                       const CompoundSelector& compound) const {
    for (const auto& simple : compound.simple) {
        if (!matches_simple(element, simple)) return false;
    }
    return true;
}

bool SelectorMatcher::matches_simple(const Element& element, const SimpleSelector& simple) const {
    switch (simple.type) {
        case SimpleSelector::Type::Universal:
            return true;
        case SimpleSelector::Type::Type:
            return element.tag_name() == simple.name;
        case SimpleSelector::Type::Class:
            return element.has_class(simple.name);
        case SimpleSelector::Type::Id:
            return element.id() == simple.name;
        case SimpleSelector::Type::Attribute: {
            const std::string* value = element.find_attribute(simple.name);
            if (!value) return false;
            return !simple.has_value || *value == simple.value;
        }
        case SimpleSelector::Type::FirstChild:
            return element.parent() && previous_element_sibling(element) == nullptr;
    }
    return false;
}

std::vector<MatchedDeclaration> collect_matching(const StyleSheet& sheet, const Element& element) {
    SelectorMatcher matcher;
    std::vector<MatchedDeclaration> result;
    for (const auto& rule : sheet.rules) {
        if (!matcher.matches(element, rule.selector)) continue;
        for (const auto& decl : rule.declarations) {
            result.push_back({&decl, rule.specificity, rule.source_order});
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const MatchedDeclaration& l, const MatchedDeclaration& r) {
                         if (!(l.specificity == r.specificity)) return l.specificity < r.specificity;
                         return l.source_order < r.source_order;
                     });
    return result;
}

} // namespace tinta::dom

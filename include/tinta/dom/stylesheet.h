#pragma once
#include <tinta/dom/node.h>
#include <tinta/dom/value_parser.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tinta::dom {

struct SimpleSelector {
    enum class Type : uint8_t { Universal, Type, Class, Id, Attribute, FirstChild };
    Type type = Type::Universal;
    std::string name;
    // Attribute selectors only: empty means presence test.
    std::string value;
    bool has_value = false;
};

struct CompoundSelector {
    std::vector<SimpleSelector> simple;
};

enum class Combinator : uint8_t { Descendant, Child };

// Compounds right to left: parts[0] is the subject, parts[i].combinator
// links parts[i] to parts[i + 1].
struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        Combinator combinator = Combinator::Descendant;
    };
    std::vector<Part> parts;
};

// (ids, classes + attributes + pseudo-classes, types)
struct Specificity {
    uint16_t a = 0, b = 0, c = 0;

    bool operator<(const Specificity& o) const {
        if (a != o.a) return a < o.a;
        if (b != o.b) return b < o.b;
        return c < o.c;
    }
    bool operator==(const Specificity& o) const { return a == o.a && b == o.b && c == o.c; }
};

Specificity specificity(const ComplexSelector& selector);

std::optional<ComplexSelector> parse_selector(std::string_view text);

struct StyleRule {
    ComplexSelector selector;
    Specificity specificity;
    std::vector<Declaration> declarations;
    size_t source_order = 0;
};

struct StyleSheet {
    std::vector<StyleRule> rules;

    // Parses rule sets; at-rules and unsupported selectors are skipped.
    static StyleSheet parse(std::string_view css);
    void append(const StyleSheet& other);
};

class SelectorMatcher {
public:
    bool matches(const Element& element, const ComplexSelector& selector) const;
    bool matches_compound(const Element& element, const CompoundSelector& compound) const;
    bool matches_simple(const Element& element, const SimpleSelector& simple) const;
};

struct MatchedDeclaration {
    const Declaration* declaration = nullptr;
    Specificity specificity;
    size_t source_order = 0;
};

// Declarations from all matching rules, sorted by increasing precedence
// (specificity, then source order).
std::vector<MatchedDeclaration> collect_matching(const StyleSheet& sheet, const Element& element);

} // namespace tinta::dom

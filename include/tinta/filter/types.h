#pragma once
#include <tinta/geom/rect.h>
#include <tinta/paint/blend_mode.h>
#include <tinta/paint/color.h>
#include <tinta/paint/paint.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tinta::filter {

// Where a primitive reads from. References only ever name results of
// earlier primitives, so the graph is acyclic by construction.
struct Input {
    enum class Kind : uint8_t { SourceGraphic, SourceAlpha, Reference };
    Kind kind = Kind::SourceGraphic;
    std::string name;

    static Input source_graphic() { return {Kind::SourceGraphic, {}}; }
    static Input source_alpha() { return {Kind::SourceAlpha, {}}; }
    static Input reference(std::string n) { return {Kind::Reference, std::move(n)}; }

    bool operator==(const Input& o) const { return kind == o.kind && name == o.name; }
};

struct GaussianBlur {
    Input input;
    float std_dev_x = 0;
    float std_dev_y = 0;
};

struct ColorMatrix {
    enum class Kind : uint8_t { Matrix, Saturate, HueRotate, LuminanceToAlpha };
    Input input;
    Kind kind = Kind::Matrix;
    // Row-major 4x5 matrix for Kind::Matrix.
    std::vector<float> matrix;
    // Saturation factor or rotation in degrees.
    float value = 0;

    static std::vector<float> identity_matrix() {
        return {1, 0, 0, 0, 0,
                0, 1, 0, 0, 0,
                0, 0, 1, 0, 0,
                0, 0, 0, 1, 0};
    }
};

struct Composite {
    enum class Operator : uint8_t { Over, In, Out, Atop, Xor, Arithmetic };
    Input input1;
    Input input2;
    Operator op = Operator::Over;
    float k1 = 0, k2 = 0, k3 = 0, k4 = 0;
};

struct Morphology {
    enum class Operator : uint8_t { Erode, Dilate };
    Input input;
    Operator op = Operator::Erode;
    float radius_x = 0;
    float radius_y = 0;
};

struct Offset {
    Input input;
    float dx = 0;
    float dy = 0;
};

struct Merge {
    std::vector<Input> inputs;
};

enum class Channel : uint8_t { R, G, B, A };

struct DisplacementMap {
    Input input1;
    Input input2;
    float scale = 0;
    Channel x_channel = Channel::A;
    Channel y_channel = Channel::A;
};

struct Flood {
    paint::Color color = paint::Color::black();
    float opacity = 1;
};

struct Blend {
    Input input1;
    Input input2;
    paint::BlendMode mode = paint::BlendMode::Normal;
};

struct TransferFunction {
    enum class Kind : uint8_t { Identity, Table, Discrete, Linear, Gamma };
    Kind kind = Kind::Identity;
    std::vector<float> table;
    float slope = 1, intercept = 0;
    float amplitude = 1, exponent = 1, offset = 0;

    float apply(float c) const;
};

struct ComponentTransfer {
    Input input;
    TransferFunction r, g, b, a;
};

struct DropShadow {
    Input input;
    float dx = 2, dy = 2;
    float std_dev_x = 2, std_dev_y = 2;
    paint::Color color = paint::Color::black();
    float opacity = 1;
};

struct Tile {
    Input input;
};

// Unsupported primitive: its input is passed through unchanged.
struct PassThrough {
    Input input;
};

using Kind = std::variant<GaussianBlur, ColorMatrix, Composite, Morphology, Offset, Merge,
                          DisplacementMap, Flood, Blend, ComponentTransfer, DropShadow, Tile,
                          PassThrough>;

struct Primitive {
    // Subregion in the filtered element's user space.
    geom::Rect rect;
    paint::ColorSpace color_space = paint::ColorSpace::LinearRGB;
    std::string result;
    Kind kind;
};

struct Filter {
    std::string id;
    // Filter region in the filtered element's user space.
    geom::Rect rect;
    std::vector<Primitive> primitives;
};

// Inputs a primitive reads, in order.
std::vector<Input> primitive_inputs(const Kind& kind);

} // namespace tinta::filter

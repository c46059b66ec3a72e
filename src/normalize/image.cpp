#include "converter.h"

namespace tinta::normalize {

namespace {

bool base64_decode_bytes(std::string_view input, std::vector<uint8_t>& output) {
    output.clear();
    output.reserve(input.size() * 3 / 4);
    unsigned int val = 0;
    int valb = -8;
    for (char c : input) {
        if (c == '=') break;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        int d = -1;
        if (c >= 'A' && c <= 'Z') d = c - 'A';
        else if (c >= 'a' && c <= 'z') d = c - 'a' + 26;
        else if (c >= '0' && c <= '9') d = c - '0' + 52;
        else if (c == '+' || c == '-') d = 62;
        else if (c == '/' || c == '_') d = 63;
        if (d < 0) return false;
        val = (val << 6) + static_cast<unsigned>(d);
        valb += 6;
        if (valb >= 0) {
            output.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return true;
}

tree::ImageRendering image_rendering(const Frame& frame, tree::ImageRendering fallback) {
    const std::string* value = frame.find("image-rendering");
    if (!value) return fallback;
    std::string s = dom::trim(*value);
    if (s == "optimizeSpeed" || s == "pixelated" || s == "crisp-edges") {
        return tree::ImageRendering::OptimizeSpeed;
    }
    if (s == "optimizeQuality" || s == "smooth" || s == "high-quality") {
        return tree::ImageRendering::OptimizeQuality;
    }
    return fallback;
}

} // namespace

void Converter::convert_image(const Frame& frame, tree::Group& out) {
    const std::string* visibility = frame.find("visibility");
    if (visibility && dom::trim(*visibility) != "visible") return;

    const std::string* href = frame.attribute("href");
    if (!href) href = frame.attribute("xlink:href");
    if (!href || href->empty()) return;

    std::shared_ptr<const tree::ImageData> data;
    if (auto it = image_cache_.find(*href); it != image_cache_.end()) {
        data = it->second;
    } else {
        std::vector<uint8_t> bytes;
        std::string_view url = *href;
        if (url.size() > 5 && dom::to_lower(url.substr(0, 5)) == "data:") {
            size_t comma = url.find(',');
            if (comma == std::string_view::npos) {
                warn("image", "malformed data url");
                return;
            }
            std::string metadata = dom::to_lower(url.substr(5, comma - 5));
            if (metadata.find("image/svg") != std::string::npos) {
                warn("image", "svg images are not supported");
                return;
            }
            std::string_view payload = url.substr(comma + 1);
            if (metadata.find("base64") != std::string::npos) {
                if (!base64_decode_bytes(payload, bytes)) {
                    warn("image", "invalid base64 image data");
                    return;
                }
            } else {
                bytes.assign(payload.begin(), payload.end());
            }
        } else if (const std::vector<uint8_t>* resource = document_.resource(url)) {
            bytes = *resource;
        } else {
            warn("image", "image resource '" + *href + "' not found");
            return;
        }

        const render::ImageDecoder* decoder =
            options_.image_decoder ? options_.image_decoder : &default_decoder_;
        data = decoder->decode(bytes);
        if (!data || data->width == 0 || data->height == 0) {
            warn("image", "failed to decode image '" + std::string(url.substr(0, 64)) + "'");
            return;
        }
        image_cache_.emplace(*href, data);
    }

    float iw = static_cast<float>(data->width);
    float ih = static_cast<float>(data->height);

    auto size_attr = [&](std::string_view name, Axis axis) -> std::optional<float> {
        const std::string* value = frame.attribute(name);
        if (!value || dom::trim(*value) == "auto") return std::nullopt;
        auto len = dom::parse_length(*value);
        if (!len) return std::nullopt;
        return to_user(*len, axis, frame, options_.dpi);
    };
    std::optional<float> w = size_attr("width", Axis::X);
    std::optional<float> h = size_attr("height", Axis::Y);
    if (w && !h) h = *w * ih / iw;
    if (h && !w) w = *h * iw / ih;
    float width = w.value_or(iw);
    float height = h.value_or(ih);
    if (!(width > 0) || !(height > 0)) return;

    float x = length_attr(frame, "x", Axis::X, 0);
    float y = length_attr(frame, "y", Axis::Y, 0);

    dom::AspectRatio ar;
    if (const std::string* par = frame.attribute("preserveAspectRatio")) {
        ar = dom::parse_aspect_ratio(*par).value_or(dom::AspectRatio{});
    }

    tree::Image image;
    image.data = std::move(data);
    image.rendering_mode = image_rendering(frame, options_.image_rendering);
    image.view_transform = geom::Transform::translate(x, y) *
                           dom::view_box_transform({0, 0, iw, ih}, ar, {width, height});
    image.clip = {x, y, width, height};
    out.children.emplace_back(std::move(image));
}

} // namespace tinta::normalize

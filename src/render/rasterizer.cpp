#include <tinta/render/rasterizer.h>

#include <tinta/core/config.h>
#include <tinta/geom/flatten.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tinta::render {

namespace {

struct Edge {
    float x0, y0, x1, y1;
    float dxdy;
    int dir;
};

struct Crossing {
    float x;
    int dir;
};

} // namespace

std::optional<Coverage> rasterize(const geom::Path& path, const geom::Transform& ts,
                                  tree::FillRule rule, bool anti_alias,
                                  const geom::IntRect& clip) {
    std::vector<geom::Polyline> lines = geom::flatten(path, ts, core::config::kFlattenTolerance);

    std::vector<Edge> edges;
    float min_x = std::numeric_limits<float>::max();
    float min_y = min_x;
    float max_x = std::numeric_limits<float>::lowest();
    float max_y = max_x;

    for (const auto& line : lines) {
        size_t n = line.points.size();
        if (n < 2) continue;
        for (size_t i = 0; i < n; ++i) {
            geom::Point a = line.points[i];
            geom::Point b = line.points[(i + 1) % n];
            min_x = std::min({min_x, a.x, b.x});
            max_x = std::max({max_x, a.x, b.x});
            min_y = std::min({min_y, a.y, b.y});
            max_y = std::max({max_y, a.y, b.y});
            if (a.y == b.y) continue;

            Edge e;
            e.dir = a.y < b.y ? 1 : -1;
            if (a.y > b.y) std::swap(a, b);
            e.x0 = a.x;
            e.y0 = a.y;
            e.x1 = b.x;
            e.y1 = b.y;
            e.dxdy = (b.x - a.x) / (b.y - a.y);
            edges.push_back(e);
        }
    }
    if (edges.empty()) return std::nullopt;

    auto bounds = geom::round_out(geom::Rect::from_ltrb(min_x, min_y, max_x, max_y));
    if (!bounds) return std::nullopt;
    auto area = bounds->intersected(clip);
    if (!area) return std::nullopt;

    std::sort(edges.begin(), edges.end(), [](const Edge& l, const Edge& r) { return l.y0 < r.y0; });

    Coverage coverage;
    coverage.rect = *area;
    size_t w = static_cast<size_t>(area->width);
    coverage.alpha.assign(w * static_cast<size_t>(area->height), 0);

    const int samples = anti_alias ? core::config::kSubScanlines : 1;
    const float weight = 1.0f / static_cast<float>(samples);
    const float left = static_cast<float>(area->x);
    const float right = static_cast<float>(area->right());

    std::vector<float> acc(w + 1);
    std::vector<const Edge*> active;
    std::vector<Crossing> crossings;
    size_t next_edge = 0;
    bool any = false;

    auto add_span = [&](float xa, float xb) {
        xa = std::clamp(xa, left, right) - left;
        xb = std::clamp(xb, left, right) - left;
        if (!(xb > xa)) return;
        if (!anti_alias) {
            size_t kl = static_cast<size_t>(std::max(0.0f, std::ceil(xa - 0.5f)));
            size_t kr = std::min(w, static_cast<size_t>(std::max(0.0f, std::ceil(xb - 0.5f))));
            for (size_t k = kl; k < kr; ++k) acc[k] += 1.0f;
            return;
        }
        size_t il = static_cast<size_t>(xa);
        size_t ir = static_cast<size_t>(xb);
        if (il == ir) {
            acc[il] += (xb - xa) * weight;
            return;
        }
        acc[il] += (static_cast<float>(il + 1) - xa) * weight;
        for (size_t k = il + 1; k < ir; ++k) acc[k] += weight;
        if (ir < w) acc[ir] += (xb - static_cast<float>(ir)) * weight;
    };

    for (int32_t py = area->y; py < area->bottom(); ++py) {
        std::fill(acc.begin(), acc.end(), 0.0f);
        bool row_hit = false;

        for (int s = 0; s < samples; ++s) {
            float sy = static_cast<float>(py) + (static_cast<float>(s) + 0.5f) * weight;
            while (next_edge < edges.size() && edges[next_edge].y0 <= sy) {
                active.push_back(&edges[next_edge++]);
            }
            active.erase(std::remove_if(active.begin(), active.end(),
                                        [sy](const Edge* e) { return e->y1 <= sy; }),
                         active.end());

            crossings.clear();
            for (const Edge* e : active) {
                if (e->y0 <= sy && sy < e->y1) {
                    crossings.push_back({e->x0 + (sy - e->y0) * e->dxdy, e->dir});
                }
            }
            if (crossings.size() < 2) continue;
            std::sort(crossings.begin(), crossings.end(),
                      [](const Crossing& l, const Crossing& r) { return l.x < r.x; });

            int winding = 0;
            for (size_t i = 0; i + 1 < crossings.size(); ++i) {
                winding += crossings[i].dir;
                bool inside = rule == tree::FillRule::NonZero ? winding != 0 : (winding & 1) != 0;
                if (inside) {
                    add_span(crossings[i].x, crossings[i + 1].x);
                    row_hit = true;
                }
            }
        }

        if (!row_hit) continue;
        uint8_t* row = coverage.alpha.data() + static_cast<size_t>(py - area->y) * w;
        for (size_t x = 0; x < w; ++x) {
            float v = std::min(acc[x], 1.0f);
            row[x] = static_cast<uint8_t>(v * 255.0f + 0.5f);
            if (row[x]) any = true;
        }
    }

    if (!any) return std::nullopt;
    return coverage;
}

} // namespace tinta::render

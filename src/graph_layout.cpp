#include "code_atlas/graph_layout.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

namespace {

constexpr size_t kGridThreshold = 500;
constexpr double kMinDistance = 0.01;

struct Cell {
    long cx;
    long cy;
    bool operator==(const Cell& o) const { return cx == o.cx && cy == o.cy; }
};

struct CellHash {
    size_t operator()(const Cell& c) const {
        return std::hash<long>()(c.cx * 73856093L ^ c.cy * 19349663L);
    }
};

void rescale(std::vector<Point>& pos) {
    if (pos.empty()) return;
    double mx = 0.0, my = 0.0;
    for (const auto& p : pos) { mx += p.x; my += p.y; }
    mx /= pos.size();
    my /= pos.size();

    double lim = 0.0;
    for (auto& p : pos) {
        p.x -= mx;
        p.y -= my;
        lim = std::max({lim, std::abs(p.x), std::abs(p.y)});
    }
    if (lim > 0.0) {
        for (auto& p : pos) { p.x /= lim; p.y /= lim; }
    }
}

} // namespace

double repulsion_for(size_t node_count, double scale) {
    if (node_count == 0) return 1.0;
    return scale / std::sqrt(static_cast<double>(node_count));
}

Layout spring_layout(const CodeGraph& graph, const LayoutOptions& options) {
    const size_t n = graph.node_count();
    Layout layout;
    if (n == 0) return layout;

    const auto& nodes = graph.nodes();
    if (n == 1) {
        layout[nodes[0].id] = {0.0, 0.0};
        return layout;
    }

    std::unordered_map<std::string, size_t> index;
    index.reserve(n);
    for (size_t i = 0; i < n; ++i) index[nodes[i].id] = i;

    // Undirected springs; a pair linked both ways counts once.
    std::vector<std::pair<size_t, size_t>> springs;
    springs.reserve(graph.edge_count());
    for (const auto& e : graph.edges()) {
        size_t a = index[e.source];
        size_t b = index[e.target];
        if (a == b) continue;
        if (a > b && graph.has_edge(e.target, e.source)) continue;
        springs.emplace_back(a, b);
    }

    std::mt19937 rng(options.seed);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::vector<Point> pos(n);
    for (auto& p : pos) { p.x = dist(rng); p.y = dist(rng); }

    const double k = options.k > 0.0 ? options.k : repulsion_for(n, 1.0);
    const int iterations = std::max(1, options.iterations);
    double t = 0.1;
    const double dt = t / static_cast<double>(iterations + 1);
    const bool use_grid = n > kGridThreshold;
    const double cell_size = 2.0 * k;

    std::vector<Point> disp(n);
    for (int iter = 0; iter < iterations; ++iter) {
        std::fill(disp.begin(), disp.end(), Point{});

        auto repel = [&](size_t i, size_t j) {
            double dx = pos[i].x - pos[j].x;
            double dy = pos[i].y - pos[j].y;
            double d = std::max(std::sqrt(dx * dx + dy * dy), kMinDistance);
            double f = (k * k) / (d * d);
            disp[i].x += dx * f;
            disp[i].y += dy * f;
        };

        if (use_grid) {
            std::unordered_map<Cell, std::vector<size_t>, CellHash> grid;
            grid.reserve(n);
            for (size_t i = 0; i < n; ++i) {
                grid[{static_cast<long>(std::floor(pos[i].x / cell_size)),
                      static_cast<long>(std::floor(pos[i].y / cell_size))}].push_back(i);
            }
            for (size_t i = 0; i < n; ++i) {
                long cx = static_cast<long>(std::floor(pos[i].x / cell_size));
                long cy = static_cast<long>(std::floor(pos[i].y / cell_size));
                for (long ox = -1; ox <= 1; ++ox) {
                    for (long oy = -1; oy <= 1; ++oy) {
                        auto it = grid.find({cx + ox, cy + oy});
                        if (it == grid.end()) continue;
                        for (size_t j : it->second) {
                            if (j != i) repel(i, j);
                        }
                    }
                }
            }
        } else {
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < n; ++j) {
                    if (j != i) repel(i, j);
                }
            }
        }

        // Attraction along edges.
        for (const auto& [i, j] : springs) {
            double dx = pos[i].x - pos[j].x;
            double dy = pos[i].y - pos[j].y;
            double d = std::max(std::sqrt(dx * dx + dy * dy), kMinDistance);
            double f = d / k;
            disp[i].x -= dx * f;
            disp[i].y -= dy * f;
            disp[j].x += dx * f;
            disp[j].y += dy * f;
        }

        for (size_t i = 0; i < n; ++i) {
            double len = std::max(std::sqrt(disp[i].x * disp[i].x + disp[i].y * disp[i].y), kMinDistance);
            pos[i].x += disp[i].x * t / len;
            pos[i].y += disp[i].y * t / len;
        }
        t -= dt;
    }

    rescale(pos);
    for (size_t i = 0; i < n; ++i) layout[nodes[i].id] = pos[i];

    spdlog::debug("📐 Spring layout: {} nodes, {} iterations, k={:.4f}{}",
                  n, iterations, k, use_grid ? " (grid)" : "");
    return layout;
}

json layout_to_json(const Layout& layout) {
    json j = json::object();
    for (const auto& [id, p] : layout) j[id] = {p.x, p.y};
    return j;
}

Layout layout_from_json(const json& j) {
    Layout layout;
    if (!j.is_object()) return layout;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& xy = it.value();
        if (xy.is_array() && xy.size() == 2) {
            layout[it.key()] = {xy[0].get<double>(), xy[1].get<double>()};
        }
    }
    return layout;
}

} // namespace code_atlas

// src/worldgen/Hydrology.cpp

#include "worldgen/Hydrology.hpp"
#include "worldgen/MapProjection.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <queue>
#include <stdexcept>
#include <vector>

namespace geosphere::worldgen {
namespace {

    inline std::size_t idx(int x, int y, int w) noexcept
    {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
    }

    inline int wrapX(int x, int w) noexcept
    {
        x %= w;
        return x < 0 ? x + w : x;
    }

    static constexpr int dx8[8] = { 1,  1,  0, -1, -1, -1,  0,  1 };
    static constexpr int dy8[8] = { 0,  1,  1,  1,  0, -1, -1, -1 };

    struct Node
    {
        float         height = 0.0f;
        std::uint64_t seq    = 0;   // insertion order, keeps pops deterministic on ties
        int           i      = 0;
    };

    struct Cmp
    {
        bool operator()(const Node& a, const Node& b) const noexcept
        {
            // min-heap by (height, seq)
            if (a.height != b.height)
                return a.height > b.height;
            return a.seq > b.seq;
        }
    };

} // namespace

DrainageMap computeDrainage(const Grid2D<float>& elevation,
                            const Grid2D<float>& runoff,
                            bool hasHydrosphere)
{
    const int w = elevation.width();
    const int h = elevation.height();
    if (!runoff.sameShape(w, h))
        throw std::invalid_argument("computeDrainage: runoff grid does not match elevation grid");

    DrainageMap out;
    out.downstream = Grid2D<int>(w, h, -1);
    out.basin      = Grid2D<int>(w, h, -1);
    out.filled     = Grid2D<float>(w, h, 0.0f);
    out.lakeDepth  = Grid2D<float>(w, h, 0.0f);
    out.flow       = Grid2D<float>(w, h, 0.0f);
    if (w <= 0 || h <= 0)
        return out;

    const std::size_t N = elevation.size();
    const float* elev = elevation.data();
    float* filled = out.filled.data();

    std::priority_queue<Node, std::vector<Node>, Cmp> pq;
    std::vector<std::uint8_t> visited(N, 0);
    std::vector<std::uint8_t> outlet(N, 0);
    std::uint64_t seq = 0;

    auto seed_cell = [&](std::size_t i)
    {
        visited[i] = 1;
        outlet[i] = 1;
        filled[i] = elev[i];
        pq.push(Node{elev[i], seq++, static_cast<int>(i)});
    };

    if (hasHydrosphere) {
        for (std::size_t i = 0; i < N; ++i)
            if (elev[i] <= 0.0f)
                seed_cell(i);
    }
    if (pq.empty()) {
        const auto lowest = std::min_element(elev, elev + N) - elev;
        seed_cell(static_cast<std::size_t>(lowest));
    }

    // Flood outward; a cell's level is never below the level it was reached from.
    std::vector<int> rank(N, 0);
    std::vector<int> order;
    order.reserve(N);

    while (!pq.empty()) {
        const Node n = pq.top();
        pq.pop();

        rank[static_cast<std::size_t>(n.i)] = static_cast<int>(order.size());
        order.push_back(n.i);

        const int cx = n.i % w;
        const int cy = n.i / w;

        for (int k = 0; k < 8; ++k) {
            const int ny = cy + dy8[k];
            if (ny < 0 || ny >= h)
                continue;
            const std::size_t j = idx(wrapX(cx + dx8[k], w), ny, w);
            if (visited[j])
                continue;
            visited[j] = 1;

            const float level = std::max(elev[j], n.height);
            filled[j] = level;
            pq.push(Node{level, seq++, static_cast<int>(j)});
        }
    }

    // Receivers: lowest neighbour by (filled, rank).
    int* down = out.downstream.data();
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const std::size_t i = idx(x, y, w);
            out.lakeDepth.data()[i] = filled[i] - elev[i];
            if (outlet[i])
                continue;

            float bestH = filled[i];
            int bestRank = rank[i];
            int bestJ = -1;
            for (int k = 0; k < 8; ++k) {
                const int ny = y + dy8[k];
                if (ny < 0 || ny >= h)
                    continue;
                const std::size_t j = idx(wrapX(x + dx8[k], w), ny, w);
                if (filled[j] < bestH || (filled[j] == bestH && rank[j] < bestRank)) {
                    bestH = filled[j];
                    bestRank = rank[j];
                    bestJ = static_cast<int>(j);
                }
            }
            down[i] = bestJ;
        }
    }

    // Basins resolve upstream from the outlets.
    int* basin = out.basin.data();
    for (const int i : order) {
        const int d = down[static_cast<std::size_t>(i)];
        basin[static_cast<std::size_t>(i)] = d < 0 ? i : basin[static_cast<std::size_t>(d)];
    }

    // Accumulate from the last flooded cell back to the outlets.
    float* flow = out.flow.data();
    const float* rain = runoff.data();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const std::size_t i = static_cast<std::size_t>(*it);
        flow[i] += rain[i];
        if (down[i] >= 0)
            flow[static_cast<std::size_t>(down[i])] += flow[i];
    }

    return out;
}

Grid2D<float> runoffFromPrecipitation(const Grid2D<float>& annualPrecipitation,
                                      const Grid2D<float>& elevation,
                                      const MapProjection& projection,
                                      double planetRadius,
                                      double yearSeconds,
                                      bool hasHydrosphere)
{
    const int w = projection.width();
    const int h = projection.height();
    if (!annualPrecipitation.sameShape(w, h) || !elevation.sameShape(w, h))
        throw std::invalid_argument("runoffFromPrecipitation: grid does not match projection");
    if (!(yearSeconds > 0.0))
        throw std::invalid_argument("runoffFromPrecipitation: year length must be positive");

    Grid2D<float> out(w, h, 0.0f);
    for (int y = 0; y < h; ++y) {
        // Cell area only depends on the row.
        const double area = projection.cellArea(0, y, planetRadius);
        for (int x = 0; x < w; ++x) {
            if (hasHydrosphere && elevation.at(x, y) <= 0.0f)
                continue;
            const double metersPerYear = annualPrecipitation.at(x, y) * 0.001;
            out.at(x, y) = static_cast<float>(metersPerYear * area / yearSeconds);
        }
    }
    return out;
}

} // namespace geosphere::worldgen

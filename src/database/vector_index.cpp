#include "facewatch/database/vector_index.hpp"
#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>
#include <utility>

namespace facewatch {

const char* to_string(Metric metric) {
    return metric == Metric::InnerProduct ? "ip" : "l2";
}

Metric metric_from_string(const std::string& name) {
    if (name == "ip" || name == "IP" || name == "cosine") return Metric::InnerProduct;
    if (name == "l2" || name == "L2") return Metric::L2;
    throw std::invalid_argument("Unknown metric: " + name);
}

VectorIndex::VectorIndex(int dim, Metric metric, const Params& params)
    : dim(dim), metric(metric), params(params), M0(params.M * 2),
      max_layer(0), entry_point(-1),
      level_mult(1.0 / std::log(static_cast<double>(std::max(2, params.M)))),
      gen(params.seed)
{
    if (dim <= 0) {
        throw std::invalid_argument("VectorIndex dimension must be positive");
    }
}

// ==================== DISTANCE ====================

float VectorIndex::distance(const EmbeddingVector& a, const EmbeddingVector& b) const {
    float acc = 0.0f;
    if (metric == Metric::InnerProduct) {
        for (size_t i = 0; i < a.size(); ++i) {
            acc += a[i] * b[i];
        }
        return 1.0f - acc;
    }

    for (size_t i = 0; i < a.size(); ++i) {
        float diff = a[i] - b[i];
        acc += diff * diff;
    }
    return acc;
}

int VectorIndex::random_layer() {
    std::uniform_real_distribution<double> dis(std::numeric_limits<double>::min(), 1.0);
    double r = dis(gen);
    int layer = static_cast<int>(-std::log(r) * level_mult);
    return std::min(layer, kMaxLayers - 1);
}

// ==================== INSERT ====================

int VectorIndex::insert(const EmbeddingVector& vector) {
    if (static_cast<int>(vector.size()) != dim) {
        throw std::invalid_argument("VectorIndex: expected dimension " + std::to_string(dim) +
                                    ", got " + std::to_string(vector.size()));
    }

    Node node;
    node.vector = vector;
    node.layer = random_layer();
    node.neighbors.resize(node.layer + 1);

    const int id = static_cast<int>(nodes.size());
    const int layer = node.layer;
    nodes.push_back(std::move(node));

    // First insertion
    if (entry_point < 0) {
        entry_point = id;
        max_layer = layer;
        return id;
    }

    // Greedy descent through the layers above the new node
    int current = entry_point;
    for (int lc = max_layer; lc > layer; --lc) {
        auto candidates = search_layer(vector, current, lc, 1);
        if (!candidates.empty()) {
            current = candidates[0];
        }
    }

    // Connect at layers [0, min(layer, max_layer)]
    for (int lc = std::min(layer, max_layer); lc >= 0; --lc) {
        auto candidates = search_layer(vector, current, lc, params.ef_construction);

        const int max_conn = (lc == 0) ? M0 : params.M;
        auto selected = select_neighbors(vector, candidates, params.M);
        nodes[id].neighbors[lc] = selected;

        // Bidirectional connections, pruned back to max_conn
        for (int neighbor_id : selected) {
            auto& links = nodes[neighbor_id].neighbors[lc];
            links.push_back(id);
            if (static_cast<int>(links.size()) > max_conn) {
                links = select_neighbors(nodes[neighbor_id].vector, links, max_conn);
            }
        }

        if (!candidates.empty()) {
            current = candidates[0];
        }
    }

    if (layer > max_layer) {
        max_layer = layer;
        entry_point = id;
    }

    return id;
}

// ==================== SEARCH ====================

std::vector<HnswResult> VectorIndex::search(const EmbeddingVector& query, int k) const {
    if (nodes.empty() || k <= 0) {
        return {};
    }
    if (static_cast<int>(query.size()) != dim) {
        throw std::invalid_argument("VectorIndex: query dimension " + std::to_string(query.size()) +
                                    " does not match index dimension " + std::to_string(dim));
    }

    int current = entry_point;
    for (int lc = max_layer; lc > 0; --lc) {
        auto candidates = search_layer(query, current, lc, 1);
        if (!candidates.empty()) {
            current = candidates[0];
        }
    }

    auto candidates = search_layer(query, current, 0, std::max(params.ef_search, k));

    std::vector<HnswResult> results;
    results.reserve(std::min(static_cast<size_t>(k), candidates.size()));
    for (int id : candidates) {
        results.push_back({id, distance(query, nodes[id].vector)});
        if (static_cast<int>(results.size()) >= k) break;
    }
    return results;
}

// ==================== SEARCH LAYER ====================

std::vector<int> VectorIndex::search_layer(const EmbeddingVector& query,
                                           int entry_id,
                                           int layer,
                                           int ef) const
{
    using Candidate = std::pair<float, int>;   // (distance, id)

    std::vector<char> visited(nodes.size(), 0);
    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> candidates;
    std::priority_queue<Candidate> w;          // max heap, worst on top

    float d = distance(query, nodes[entry_id].vector);
    candidates.push({d, entry_id});
    w.push({d, entry_id});
    visited[entry_id] = 1;

    while (!candidates.empty()) {
        auto [current_dist, current_id] = candidates.top();
        candidates.pop();

        if (current_dist > w.top().first) {
            break;
        }

        const auto& links = nodes[current_id].neighbors;
        if (layer >= static_cast<int>(links.size())) continue;

        for (int neighbor_id : links[layer]) {
            if (visited[neighbor_id]) continue;
            visited[neighbor_id] = 1;

            float d_neighbor = distance(query, nodes[neighbor_id].vector);
            if (static_cast<int>(w.size()) < ef || d_neighbor < w.top().first) {
                candidates.push({d_neighbor, neighbor_id});
                w.push({d_neighbor, neighbor_id});
                if (static_cast<int>(w.size()) > ef) {
                    w.pop();
                }
            }
        }
    }

    std::vector<int> results;
    results.reserve(w.size());
    while (!w.empty()) {
        results.push_back(w.top().second);
        w.pop();
    }
    std::reverse(results.begin(), results.end());
    return results;
}

// ==================== SELECT NEIGHBORS ====================

std::vector<int> VectorIndex::select_neighbors(const EmbeddingVector& base,
                                               const std::vector<int>& candidates,
                                               int max_count) const
{
    if (static_cast<int>(candidates.size()) <= max_count) {
        return candidates;
    }

    // Simple heuristic: keep the closest
    std::vector<std::pair<float, int>> scored;
    scored.reserve(candidates.size());
    for (int id : candidates) {
        scored.push_back({distance(base, nodes[id].vector), id});
    }
    std::sort(scored.begin(), scored.end());

    std::vector<int> selected;
    selected.reserve(max_count);
    for (int i = 0; i < max_count; ++i) {
        selected.push_back(scored[i].second);
    }
    return selected;
}

// ==================== STATS ====================

size_t VectorIndex::memory_usage() const {
    size_t total = 0;
    for (const auto& node : nodes) {
        total += node.vector.size() * sizeof(float);
        for (const auto& links : node.neighbors) {
            total += links.size() * sizeof(int);
        }
    }
    return total;
}

} // namespace facewatch

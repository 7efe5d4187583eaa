#include "SpatialIndex.hpp"
#include "GraphStore.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

static double meanLatitude(const std::vector<Node>& nodes){
    if(nodes.empty()) return 0.0;
    double sum = 0.0;
    for(const Node& n : nodes) sum += n.lat;
    return sum / nodes.size();
}

static void checkQueryPoint(double lng, double lat){
    if(!std::isfinite(lng) || !std::isfinite(lat)){
        throw InvalidRequestError("query point must have finite coordinates");
    }
}

// True when (dist, id) should replace the current best.
static bool closer(double dist, const std::string& id, double best_dist, const std::string& best_id){
    if(dist < best_dist - SpatialIndex::NEAREST_TIE_TOLERANCE_M) return true;
    return dist <= best_dist + SpatialIndex::NEAREST_TIE_TOLERANCE_M && id < best_id;
}

LinearScanIndex::LinearScanIndex(const std::vector<Node>& nodes)
    : projection(meanLatitude(nodes)) {
    entries.reserve(nodes.size());
    for(const Node& n : nodes){
        entries.push_back({n.id, n.lng, n.lat});
    }
}

std::string LinearScanIndex::nearest(double lng, double lat) const {
    checkQueryPoint(lng, lat);
    if(entries.empty()){
        throw EmptyGraphError("nearest lookup on an empty node set");
    }
    size_t best = 0;
    double min_dist = projection.distance(lng, lat, entries[0].lng, entries[0].lat);
    for(size_t i = 1; i < entries.size(); ++i){
        double dist = projection.distance(lng, lat, entries[i].lng, entries[i].lat);
        if(closer(dist, entries[i].id, min_dist, entries[best].id)){
            min_dist = dist;
            best = i;
        }
    }
    return entries[best].id;
}

KdTreeIndex::KdTreeIndex(const std::vector<Node>& nodes)
    : root(-1), projection(meanLatitude(nodes)) {
    points.reserve(nodes.size());
    for(const Node& n : nodes){
        points.push_back({n.id, projection.x(n.lng), projection.y(n.lat)});
    }
    if(points.empty()) return;

    std::vector<uint32_t> order(points.size());
    for(uint32_t i = 0; i < order.size(); ++i) order[i] = i;
    tree.reserve(points.size());
    root = build(order, 0, order.size(), 0);
}

int32_t KdTreeIndex::build(std::vector<uint32_t>& order, size_t begin, size_t end, int depth){
    if(begin >= end) return -1;

    const uint8_t axis = static_cast<uint8_t>(depth & 1);
    const size_t median = (begin + end) / 2;
    std::nth_element(order.begin() + begin, order.begin() + median, order.begin() + end,
                     [&](uint32_t a, uint32_t b){
                         return axis == 0 ? points[a].x < points[b].x : points[a].y < points[b].y;
                     });

    const int32_t self = static_cast<int32_t>(tree.size());
    tree.push_back({order[median], -1, -1, axis});

    // Children are built before their indices are stored; push_back may reallocate.
    const int32_t left = build(order, begin, median, depth + 1);
    const int32_t right = build(order, median + 1, end, depth + 1);
    tree[self].left = left;
    tree[self].right = right;
    return self;
}

void KdTreeIndex::search(int32_t node, double qx, double qy, uint32_t& best, double& best_dist) const {
    if(node < 0) return;
    const KdNode& kd = tree[node];
    const Point& p = points[kd.point];

    double dx = qx - p.x;
    double dy = qy - p.y;
    double dist = std::sqrt(dx*dx + dy*dy);
    if(best == std::numeric_limits<uint32_t>::max() || closer(dist, p.id, best_dist, points[best].id)){
        best = kd.point;
        best_dist = dist;
    }

    double diff = (kd.axis == 0) ? dx : dy;
    int32_t near_side = (diff < 0) ? kd.left : kd.right;
    int32_t far_side = (diff < 0) ? kd.right : kd.left;

    search(near_side, qx, qy, best, best_dist);
    // Inclusive bound so that equidistant points across the split still compete on id.
    if(std::fabs(diff) <= best_dist + NEAREST_TIE_TOLERANCE_M){
        search(far_side, qx, qy, best, best_dist);
    }
}

std::string KdTreeIndex::nearest(double lng, double lat) const {
    checkQueryPoint(lng, lat);
    if(points.empty()){
        throw EmptyGraphError("nearest lookup on an empty node set");
    }
    uint32_t best = std::numeric_limits<uint32_t>::max();
    double best_dist = INF;
    search(root, projection.x(lng), projection.y(lat), best, best_dist);
    return points[best].id;
}

std::unique_ptr<SpatialIndex> makeSpatialIndex(SpatialIndexKind kind, const std::vector<Node>& nodes){
    if(kind == SpatialIndexKind::KdTree){
        return std::unique_ptr<SpatialIndex>(new KdTreeIndex(nodes));
    }
    return std::unique_ptr<SpatialIndex>(new LinearScanIndex(nodes));
}

NearestNodeLocator::NearestNodeLocator(const GraphStore& graph_store, SpatialIndexKind index_kind)
    : store(graph_store), kind(index_kind) {
    rebuild();
}

std::string NearestNodeLocator::nearest(double lng, double lat) const {
    return current()->nearest(lng, lat);
}

void NearestNodeLocator::rebuild(){
    auto graph = store.snapshot();
    std::shared_ptr<const SpatialIndex> fresh = makeSpatialIndex(kind, graph->getNodes());

    std::lock_guard<std::mutex> lock(mutex);
    index = std::move(fresh);
}

std::shared_ptr<const SpatialIndex> NearestNodeLocator::current() const {
    std::lock_guard<std::mutex> lock(mutex);
    return index;
}

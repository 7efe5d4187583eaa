#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Geometry.hpp"
#include "Graph.hpp"

class GraphStore;

enum class SpatialIndexKind { Linear, KdTree };

// Nearest-intersection lookup. Distances are planar metres under a
// LocalProjection centred on the mean latitude of the indexed nodes; two
// candidates closer than NEAREST_TIE_TOLERANCE_M resolve to the smaller id.
class SpatialIndex {
public:
    static constexpr double NEAREST_TIE_TOLERANCE_M = 1e-6;

    virtual ~SpatialIndex() = default;

    // Throws EmptyGraphError when no nodes were indexed.
    virtual std::string nearest(double lng, double lat) const = 0;
    virtual size_t size() const = 0;
};

class LinearScanIndex : public SpatialIndex {
private:
    struct Entry {
        std::string id;
        double lng;
        double lat;
    };
    std::vector<Entry> entries;
    LocalProjection projection;

public:
    explicit LinearScanIndex(const std::vector<Node>& nodes);

    std::string nearest(double lng, double lat) const override;
    size_t size() const override { return entries.size(); }
};

class KdTreeIndex : public SpatialIndex {
private:
    struct Point {
        std::string id;
        double x;
        double y;
    };
    struct KdNode {
        uint32_t point;
        int32_t left;   // -1 if none
        int32_t right;  // -1 if none
        uint8_t axis;   // 0 = x, 1 = y
    };

    std::vector<Point> points;
    std::vector<KdNode> tree;
    int32_t root;
    LocalProjection projection;

    int32_t build(std::vector<uint32_t>& order, size_t begin, size_t end, int depth);
    void search(int32_t node, double qx, double qy, uint32_t& best, double& best_dist) const;

public:
    explicit KdTreeIndex(const std::vector<Node>& nodes);

    std::string nearest(double lng, double lat) const override;
    size_t size() const override { return points.size(); }
};

std::unique_ptr<SpatialIndex> makeSpatialIndex(SpatialIndexKind kind, const std::vector<Node>& nodes);

// Holds the published index for a GraphStore. rebuild() constructs the new
// index off to the side and swaps it in; lookups already running keep the
// instance they started with.
class NearestNodeLocator {
private:
    const GraphStore& store;
    SpatialIndexKind kind;
    mutable std::mutex mutex;
    std::shared_ptr<const SpatialIndex> index;

public:
    NearestNodeLocator(const GraphStore& graph_store, SpatialIndexKind index_kind);

    std::string nearest(double lng, double lat) const;
    void rebuild();
    std::shared_ptr<const SpatialIndex> current() const;
};
#endif

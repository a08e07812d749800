#pragma once

#include "geometry.h"
#include "pin_locator.h"
#include "schematic.h"

#include <exception>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kicadfile {

// Union-find with path halving and union by size
class DisjointSet {
public:
    int add();
    int find(int v);
    void unite(int a, int b);
    size_t size() const { return parent_.size(); }

private:
    std::vector<int> parent_;
    std::vector<int> weight_;
};

struct NetPin {
    std::string reference;
    std::string pin;
    std::string pin_name;
    std::string electrical_type;
    Point position;
};

struct NetMembers {
    std::string name;
    bool explicit_name = false; // from a label or power symbol
    std::vector<NetPin> pins;
    std::vector<Label> labels;
    std::vector<Wire> wires;
    std::vector<Junction> junctions;
    std::vector<std::string> power_symbols; // references
};

// Net graph of one sheet. Vertices are wire end points, junctions, label
// anchors and pin positions, bucketed by coordinate; edges are shared
// coordinates, wire segments, points lying on a wire and equal names.
// Building never fails on naming conflicts: a component with two
// different names of the same rank raises AmbiguousConnectivityError
// only when a query touches it.
class ConnectivityGraph {
public:
    ConnectivityGraph(const Schematic& sch, PinLocator& locator);

    // Net of a component pin; nullopt when the pin touches nothing.
    // A pin shared by several placed units resolves through every copy
    // and raises AmbiguousConnectivityError when copies sit on different
    // nets. NotFoundError for an unknown reference or pin number.
    std::optional<std::string> net_of(const std::string& reference, const std::string& pin);

    NetMembers members_of(const std::string& net_name);

    // Pin numbers of every placed unit of a reference, naturally sorted
    std::vector<std::string> pin_numbers(const std::string& reference);

    // Every net that reaches at least one component pin
    std::vector<NetMembers> nets();

    // Pins sharing their net with nothing else, excluding no-connect marks
    std::vector<NetPin> floating_pins();
    // Power symbols whose net reaches no component pin
    std::vector<std::string> unconnected_power();

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    struct CoordKey {
        long long x;
        long long y;
        bool operator==(const CoordKey& o) const { return x == o.x && y == o.y; }
    };
    struct CoordHash {
        size_t operator()(const CoordKey& k) const {
            return std::hash<long long>()(k.x) * 31 + std::hash<long long>()(k.y);
        }
    };

    struct NameClaim {
        std::string name;
        int rank;
    };

    struct Component {
        std::vector<NameClaim> claims;
        std::optional<std::string> name;
        bool explicit_name = false;
        std::string conflict_a, conflict_b;
        bool ambiguous = false;
    };

    struct PinNode {
        NetPin pin;
        int vertex;
    };
    struct PowerNode {
        std::string reference;
        std::string net; // empty for flags that name nothing
        int vertex;
    };
    struct LabelNode {
        Label label;
        int vertex;
    };

    DisjointSet sets_;
    std::unordered_map<CoordKey, int, CoordHash> vertex_of_;
    std::vector<Point> vertex_pos_;
    std::vector<std::pair<Wire, int>> wires_;
    std::vector<std::pair<Junction, int>> junctions_;
    std::vector<LabelNode> labels_;
    std::vector<PinNode> pins_;
    std::vector<PowerNode> power_;
    std::vector<int> no_connects_;
    std::map<std::string, std::exception_ptr> pin_errors_;
    std::unordered_map<int, Component> components_;
    bool named_ = false;
    std::vector<std::string> warnings_;

    int vertex(const Point& p);
    void connect_wire_interiors(const std::vector<std::pair<int, int>>& segments);
    void name_components();
    const Component& component_of(int vertex);
    const Component& checked(int vertex);
    NetMembers collect(int root, const Component& comp);
    std::optional<std::string> net_at(const PinNode& node);
};

} // namespace kicadfile

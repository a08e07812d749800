#include "connectivity.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>

namespace kicadfile {

static const double COORD_SCALE = 1.0 / COORD_EPSILON; // hash resolution
static const double GRID_CELL = 2.54;                  // wire bucket size

// Name precedence: global names beat sheet-local ones
static const int RANK_GLOBAL = 3;
static const int RANK_HIERARCHICAL = 2;
static const int RANK_LOCAL = 1;

// ── DisjointSet ─────────────────────────────────────────────────────

int DisjointSet::add() {
    int id = static_cast<int>(parent_.size());
    parent_.push_back(id);
    weight_.push_back(1);
    return id;
}

int DisjointSet::find(int v) {
    while (parent_[v] != v) {
        parent_[v] = parent_[parent_[v]];
        v = parent_[v];
    }
    return v;
}

void DisjointSet::unite(int a, int b) {
    a = find(a);
    b = find(b);
    if (a == b) return;
    if (weight_[a] < weight_[b]) std::swap(a, b);
    parent_[b] = a;
    weight_[a] += weight_[b];
}

// ── Graph construction ──────────────────────────────────────────────

static int label_rank(LabelKind kind) {
    switch (kind) {
        case LabelKind::Global:       return RANK_GLOBAL;
        case LabelKind::Hierarchical: return RANK_HIERARCHICAL;
        default:                      return RANK_LOCAL;
    }
}

static bool pin_less(const NetPin& a, const NetPin& b) {
    if (a.reference != b.reference) return natural_less(a.reference, b.reference);
    return natural_less(a.pin, b.pin);
}

int ConnectivityGraph::vertex(const Point& p) {
    CoordKey key{std::llround(p.x * COORD_SCALE), std::llround(p.y * COORD_SCALE)};
    auto it = vertex_of_.find(key);
    if (it != vertex_of_.end()) return it->second;
    int v = sets_.add();
    vertex_of_.emplace(key, v);
    vertex_pos_.push_back(p);
    return v;
}

ConnectivityGraph::ConnectivityGraph(const Schematic& sch, PinLocator& locator) {
    std::vector<std::pair<int, int>> segments;
    for (auto& w : sch.wires) {
        int a = vertex(w.start);
        int b = vertex(w.end);
        sets_.unite(a, b);
        wires_.emplace_back(w, a);
        segments.emplace_back(a, b);
    }
    for (auto& j : sch.junctions)
        junctions_.emplace_back(j, vertex(j.position));
    for (auto& l : sch.labels)
        labels_.push_back({l, vertex(l.position)});
    for (auto& nc : sch.no_connects)
        no_connects_.push_back(vertex(nc.position));

    for (auto& sym : sch.symbols) {
        std::vector<PinPosition> pins;
        try {
            pins = locator.pins_of(sym);
        } catch (const Error& e) {
            warnings_.push_back("pins of " + sym.reference + " unavailable: " + e.what());
            pin_errors_.emplace(sym.reference, std::current_exception());
            continue;
        }
        for (auto& p : pins) {
            if (sym.power) {
                // Only a power_in pin makes the symbol a net name; flags
                // such as PWR_FLAG drive a net without naming it
                std::string net;
                if (p.electrical_type == "power_in")
                    net = sym.value.empty() ? split_lib_id(sym.lib_id).second : sym.value;
                power_.push_back({sym.reference, net, vertex(p.position)});
            } else {
                NetPin np{sym.reference, p.number, p.name, p.electrical_type, p.position};
                pins_.push_back({np, vertex(p.position)});
            }
        }
    }

    connect_wire_interiors(segments);

    // Items carrying the same name are one net
    std::unordered_map<std::string, int> by_name;
    auto join_name = [&](const std::string& name, int v) {
        auto it = by_name.find(name);
        if (it == by_name.end()) by_name.emplace(name, v);
        else sets_.unite(it->second, v);
    };
    for (auto& l : labels_) join_name(l.label.text, l.vertex);
    for (auto& p : power_)
        if (!p.net.empty()) join_name(p.net, p.vertex);
}

void ConnectivityGraph::connect_wire_interiors(const std::vector<std::pair<int, int>>& segments) {
    auto cell = [](double v) { return static_cast<long long>(std::floor(v / GRID_CELL)); };

    std::unordered_map<CoordKey, std::vector<size_t>, CoordHash> buckets;
    for (size_t i = 0; i < segments.size(); i++) {
        const Point& a = vertex_pos_[segments[i].first];
        const Point& b = vertex_pos_[segments[i].second];
        long long x0 = cell(std::min(a.x, b.x)), x1 = cell(std::max(a.x, b.x));
        long long y0 = cell(std::min(a.y, b.y)), y1 = cell(std::max(a.y, b.y));
        for (long long cx = x0; cx <= x1; cx++)
            for (long long cy = y0; cy <= y1; cy++)
                buckets[{cx, cy}].push_back(i);
    }

    for (size_t v = 0; v < vertex_pos_.size(); v++) {
        const Point& p = vertex_pos_[v];
        auto it = buckets.find({cell(p.x), cell(p.y)});
        if (it == buckets.end()) continue;
        for (size_t i : it->second) {
            auto [a, b] = segments[i];
            if (static_cast<int>(v) == a || static_cast<int>(v) == b) continue;
            if (point_on_segment(p, vertex_pos_[a], vertex_pos_[b]))
                sets_.unite(static_cast<int>(v), a);
        }
    }
}

// ── Naming ──────────────────────────────────────────────────────────

void ConnectivityGraph::name_components() {
    if (named_) return;
    named_ = true;

    for (auto& l : labels_)
        components_[sets_.find(l.vertex)].claims.push_back({l.label.text, label_rank(l.label.kind)});
    for (auto& p : power_)
        if (!p.net.empty()) components_[sets_.find(p.vertex)].claims.push_back({p.net, RANK_GLOBAL});

    std::unordered_map<int, const NetPin*> first_pin;
    for (auto& p : pins_) {
        int root = sets_.find(p.vertex);
        auto it = first_pin.find(root);
        if (it == first_pin.end() || pin_less(p.pin, *it->second)) first_pin[root] = &p.pin;
        components_[root];
    }

    for (auto& [root, comp] : components_) {
        if (!comp.claims.empty()) {
            int top = 0;
            for (auto& c : comp.claims) top = std::max(top, c.rank);
            std::set<std::string> names;
            for (auto& c : comp.claims)
                if (c.rank == top) names.insert(c.name);
            comp.explicit_name = true;
            comp.name = *names.begin();
            if (names.size() > 1) {
                comp.ambiguous = true;
                comp.conflict_a = *names.begin();
                comp.conflict_b = *std::next(names.begin());
            }
        } else {
            auto it = first_pin.find(root);
            if (it != first_pin.end())
                comp.name = "Net-(" + it->second->reference + "-Pad" + it->second->pin + ")";
        }
    }
}

const ConnectivityGraph::Component& ConnectivityGraph::component_of(int v) {
    name_components();
    return components_[sets_.find(v)];
}

const ConnectivityGraph::Component& ConnectivityGraph::checked(int v) {
    const Component& c = component_of(v);
    if (c.ambiguous) throw AmbiguousConnectivityError(c.conflict_a, c.conflict_b);
    return c;
}

NetMembers ConnectivityGraph::collect(int root, const Component& comp) {
    NetMembers m;
    m.name = comp.name.value_or("");
    m.explicit_name = comp.explicit_name;
    for (auto& p : pins_)
        if (sets_.find(p.vertex) == root) m.pins.push_back(p.pin);
    for (auto& l : labels_)
        if (sets_.find(l.vertex) == root) m.labels.push_back(l.label);
    for (auto& [w, v] : wires_)
        if (sets_.find(v) == root) m.wires.push_back(w);
    for (auto& [j, v] : junctions_)
        if (sets_.find(v) == root) m.junctions.push_back(j);
    for (auto& p : power_)
        if (sets_.find(p.vertex) == root) m.power_symbols.push_back(p.reference);
    std::sort(m.pins.begin(), m.pins.end(), pin_less);
    return m;
}

// ── Queries ─────────────────────────────────────────────────────────

std::optional<std::string> ConnectivityGraph::net_of(const std::string& reference,
                                                     const std::string& pin) {
    auto err = pin_errors_.find(reference);
    if (err != pin_errors_.end()) std::rethrow_exception(err->second);

    std::vector<const PinNode*> nodes;
    bool known_ref = false;
    for (auto& p : pins_) {
        if (p.pin.reference != reference) continue;
        known_ref = true;
        if (p.pin.pin == pin) nodes.push_back(&p);
    }
    if (nodes.empty()) {
        if (!known_ref) throw NotFoundError("symbol", reference);
        throw NotFoundError("pin", reference + ":" + pin, {{"reference", reference}, {"pin", pin}});
    }

    // A pin common to several placed units is one pad, so every
    // connected copy must sit on the same net
    std::optional<std::string> net;
    int net_root = -1;
    for (auto* node : nodes) {
        auto here = net_at(*node);
        if (!here) continue;
        int root = sets_.find(node->vertex);
        if (net && root != net_root) throw AmbiguousConnectivityError(*net, *here);
        net = here;
        net_root = root;
    }
    return net;
}

std::optional<std::string> ConnectivityGraph::net_at(const PinNode& node) {
    const Component& comp = checked(node.vertex);
    if (comp.explicit_name) return comp.name;

    int root = sets_.find(node.vertex);
    NetMembers m = collect(root, comp);
    size_t others = m.pins.size() - 1 + m.labels.size() + m.wires.size() +
                    m.junctions.size() + m.power_symbols.size();
    if (others == 0) return std::nullopt;
    return comp.name;
}

std::vector<std::string> ConnectivityGraph::pin_numbers(const std::string& reference) {
    auto err = pin_errors_.find(reference);
    if (err != pin_errors_.end()) std::rethrow_exception(err->second);
    std::set<std::string> numbers;
    for (auto& p : pins_)
        if (p.pin.reference == reference) numbers.insert(p.pin.pin);
    std::vector<std::string> out(numbers.begin(), numbers.end());
    std::sort(out.begin(), out.end(), natural_less);
    return out;
}

NetMembers ConnectivityGraph::members_of(const std::string& net_name) {
    name_components();
    for (auto& [root, comp] : components_) {
        bool claims_name = comp.name && *comp.name == net_name;
        for (auto& c : comp.claims)
            if (c.name == net_name) claims_name = true;
        if (!claims_name) continue;
        if (comp.ambiguous) throw AmbiguousConnectivityError(comp.conflict_a, comp.conflict_b);
        return collect(root, comp);
    }
    throw NotFoundError("net", net_name);
}

std::vector<NetMembers> ConnectivityGraph::nets() {
    name_components();
    std::set<int> roots;
    for (auto& p : pins_) roots.insert(sets_.find(p.vertex));

    std::vector<NetMembers> out;
    for (int root : roots) {
        const Component& comp = components_[root];
        if (comp.ambiguous) throw AmbiguousConnectivityError(comp.conflict_a, comp.conflict_b);
        out.push_back(collect(root, comp));
    }
    std::sort(out.begin(), out.end(), [](const NetMembers& a, const NetMembers& b) {
        return natural_less(a.name, b.name);
    });
    return out;
}

std::vector<NetPin> ConnectivityGraph::floating_pins() {
    std::unordered_map<int, int> count;
    for (auto& p : pins_) count[sets_.find(p.vertex)]++;
    for (auto& l : labels_) count[sets_.find(l.vertex)]++;
    for (auto& w : wires_) count[sets_.find(w.second)]++;
    for (auto& j : junctions_) count[sets_.find(j.second)]++;
    for (auto& p : power_) count[sets_.find(p.vertex)]++;
    std::set<int> marked(no_connects_.begin(), no_connects_.end());

    std::vector<NetPin> out;
    for (auto& p : pins_) {
        if (marked.count(p.vertex)) continue;
        if (count[sets_.find(p.vertex)] == 1) out.push_back(p.pin);
    }
    std::sort(out.begin(), out.end(), pin_less);
    return out;
}

std::vector<std::string> ConnectivityGraph::unconnected_power() {
    std::set<int> with_pins;
    for (auto& p : pins_) with_pins.insert(sets_.find(p.vertex));
    std::vector<std::string> out;
    for (auto& p : power_)
        if (!with_pins.count(sets_.find(p.vertex))) out.push_back(p.reference);
    std::sort(out.begin(), out.end(), natural_less);
    return out;
}

} // namespace kicadfile

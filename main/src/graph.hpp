#pragma once

#include "package.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Size still attributed to the node, own footprint plus blame received
struct Pending {
    double bytes = 0;
};

// Fully redistributed to its parents; neither a source nor a sink anymore
struct Collapsed {};

using BlameState = std::variant<Pending, Collapsed>;

struct PackageNode {
    std::string name;
    BlameState state;
    std::set<std::string> dep_children;
    std::set<std::string> dep_parents;

    bool collapsed() const { return std::holds_alternative<Collapsed>(state); }
    bool is_root() const { return dep_parents.empty(); }

    // Throws std::bad_variant_access on a collapsed node
    double size() const { return std::get<Pending>(state).bytes; }

    // Adds blame to a pending node; returns false if the node is collapsed
    bool receive(double bytes);

    // Marks the node collapsed and returns the size it held
    double collapse();
};

class PackageGraph {
public:
    using NodeMap = std::map<std::string, PackageNode, std::less<>>;

    PackageNode* find(std::string_view name);
    const PackageNode* find(std::string_view name) const;
    // Throws PkgslimException for unknown names
    PackageNode& at(std::string_view name);
    const PackageNode& at(std::string_view name) const;

    NodeMap& nodes() { return nodes_; }
    const NodeMap& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }

    // Sum of all pending sizes
    double pending_total() const;

private:
    friend PackageGraph build_graph(const std::vector<PackageRecord>& records);

    NodeMap nodes_;
};

// Creates every node first, then the symmetric edges. Alternatives that are
// not installed are skipped; every installed alternative gets an edge.
PackageGraph build_graph(const std::vector<PackageRecord>& records);

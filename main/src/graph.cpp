#include "graph.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

bool PackageNode::receive(double bytes) {
    if (auto* pending = std::get_if<Pending>(&state)) {
        pending->bytes += bytes;
        return true;
    }
    return false;
}

double PackageNode::collapse() {
    double bytes = size();
    state = Collapsed{};
    return bytes;
}

PackageNode* PackageGraph::find(std::string_view name) {
    auto it = nodes_.find(name);
    return it != nodes_.end() ? &it->second : nullptr;
}

const PackageNode* PackageGraph::find(std::string_view name) const {
    auto it = nodes_.find(name);
    return it != nodes_.end() ? &it->second : nullptr;
}

PackageNode& PackageGraph::at(std::string_view name) {
    if (auto* node = find(name)) return *node;
    throw PkgslimException(string_format("error.unknown_package", std::string(name)));
}

const PackageNode& PackageGraph::at(std::string_view name) const {
    if (const auto* node = find(name)) return *node;
    throw PkgslimException(string_format("error.unknown_package", std::string(name)));
}

double PackageGraph::pending_total() const {
    double total = 0;
    for (const auto& [name, node] : nodes_) {
        if (!node.collapsed()) total += node.size();
    }
    return total;
}

PackageGraph build_graph(const std::vector<PackageRecord>& records) {
    PackageGraph graph;
    std::vector<const PackageRecord*> accepted;
    accepted.reserve(records.size());

    for (const auto& record : records) {
        PackageNode node;
        node.name = record.name;
        node.state = Pending{static_cast<double>(record.own_size)};
        if (graph.nodes_.emplace(record.name, std::move(node)).second) {
            accepted.push_back(&record);
        } else {
            log_warning(string_format("warning.duplicate_package", record.name));
        }
    }

    for (const PackageRecord* record_ptr : accepted) {
        const PackageRecord& record = *record_ptr;
        PackageNode& pkg = graph.nodes_.find(record.name)->second;
        for (const auto& group : record.dependency_groups) {
            for (const auto& alternative : group) {
                if (alternative == record.name) continue;
                auto dep = graph.nodes_.find(alternative);
                if (dep == graph.nodes_.end()) {
                    // Alternative deps are not always installed
                    continue;
                }
                pkg.dep_children.insert(alternative);
                dep->second.dep_parents.insert(record.name);
            }
        }
    }
    return graph;
}

#include "clusterer.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <set>
#include <string>

namespace dedup::resolution {

std::vector<Cluster> ClusterSignals(const std::vector<MatchSignal>& signals) {
  std::map<std::string, std::set<std::string>> adjacency;

  for (const auto& signal : signals) {
    const auto& ids = signal.contact_ids;
    if (ids.size() < 2) continue;

    for (size_t i = 0; i < ids.size(); ++i) {
      for (size_t j = i + 1; j < ids.size(); ++j) {
        if (ids[i] == ids[j]) continue;
        adjacency[ids[i]].insert(ids[j]);
        adjacency[ids[j]].insert(ids[i]);
      }
    }
  }

  std::vector<Cluster>  clusters;
  std::set<std::string> visited;

  // map order makes BFS roots ascend, so clusters come out sorted by smallest id
  for (const auto& [root, _] : adjacency) {
    if (visited.contains(root)) continue;

    Cluster                 component;
    std::queue<std::string> frontier;
    frontier.push(root);
    visited.insert(root);

    while (!frontier.empty()) {
      auto current = std::move(frontier.front());
      frontier.pop();

      for (const auto& neighbor : adjacency.at(current)) {
        if (visited.insert(neighbor).second) frontier.push(neighbor);
      }
      component.push_back(std::move(current));
    }

    if (component.size() >= 2) {
      std::sort(component.begin(), component.end());
      clusters.push_back(std::move(component));
    }
  }
  return clusters;
}

} // namespace dedup::resolution

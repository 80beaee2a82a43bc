#pragma once

#include <vector>

#include "internal/resolution/match_signal.hpp"

namespace dedup::resolution {

/*
  Groups signals into duplicate clusters.

  Each signal connects every pair of its contact ids; clusters are the
  connected components with at least two members. Members are sorted and
  clusters ordered by their smallest id.
*/
std::vector<Cluster> ClusterSignals(const std::vector<MatchSignal>& signals);

} // namespace dedup::resolution

#include "top_list.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <vector>

bool TopList::offer(const Candidate &candidate) {
  if (capacity_ == 0)
    return false;
  if (entries_.size() == capacity_ &&
      !ranks_before(candidate, entries_.back()))
    return false;

  // upper_bound keeps full ties in insertion order
  auto pos = std::upper_bound(entries_.begin(), entries_.end(), candidate,
                              ranks_before);
  entries_.insert(pos, candidate);
  if (entries_.size() > capacity_)
    entries_.pop_back();
  return true;
}

Ranker::Ranker(size_t top_n, size_t summary_capacity)
    : global_(top_n), summary_(summary_capacity), empty_(0) {
  for (Subsystem subsystem : ranked_subsystems())
    per_subsystem_.emplace(subsystem, TopList(top_n));
}

void Ranker::offer(const Candidate &candidate) {
  ++offered_;
  auto it = per_subsystem_.find(candidate.subsystem);
  if (it != per_subsystem_.end()) {
    it->second.offer(candidate);
  } else {
    LOG(LogLevel::WARN, LogComponent::RULES_RANKING,
        "Candidate from unranked subsystem "
            << subsystem_to_string(candidate.subsystem)
            << " goes to the merged list only");
  }
  global_.offer(candidate);
  summary_.offer(candidate);
}

const TopList &Ranker::list_for(Subsystem subsystem) const {
  auto it = per_subsystem_.find(subsystem);
  return it == per_subsystem_.end() ? empty_ : it->second;
}

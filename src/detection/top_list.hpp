#ifndef TOP_LIST_HPP
#define TOP_LIST_HPP

#include "core/candidate.hpp"
#include "core/sample.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

// Bounded ranked list: score descending, then timestamp ascending, then
// insertion order. Never holds more than its capacity.
class TopList {
public:
  explicit TopList(size_t capacity) : capacity_(capacity) {}

  // Returns false when the candidate did not make the list
  bool offer(const Candidate &candidate);

  const std::vector<Candidate> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

private:
  size_t capacity_;
  std::vector<Candidate> entries_;
};

// Per-subsystem lists plus the merged global list, each capped at top_n, and
// a larger merged list backing the summary file.
class Ranker {
public:
  Ranker(size_t top_n, size_t summary_capacity);

  void offer(const Candidate &candidate);

  const TopList &list_for(Subsystem subsystem) const;
  const TopList &global() const { return global_; }
  const TopList &summary() const { return summary_; }
  uint64_t offered() const { return offered_; }

private:
  std::map<Subsystem, TopList> per_subsystem_;
  TopList global_;
  TopList summary_;
  TopList empty_;
  uint64_t offered_ = 0;
};

#endif // TOP_LIST_HPP

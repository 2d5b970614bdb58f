#ifndef CANDIDATE_HPP
#define CANDIDATE_HPP

#include "sample.hpp"

#include <string>

// A scored observation eligible for ranking. Higher score = worse.
struct Candidate {
  int score = 0;
  std::string timestamp;
  std::string description;
  Subsystem subsystem = Subsystem::CPU;

  Candidate() = default;
  Candidate(int score, std::string timestamp, std::string description,
            Subsystem subsystem);
};

// Ranking order: score descending, then earlier timestamp first
bool ranks_before(const Candidate &lhs, const Candidate &rhs);

// "score;timestamp;description", the format of the summary and workspace files
std::string candidate_to_record(const Candidate &candidate);

#endif // CANDIDATE_HPP

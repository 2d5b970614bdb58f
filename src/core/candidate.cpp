#include "candidate.hpp"

#include <string>
#include <utility>

Candidate::Candidate(int score, std::string timestamp, std::string description,
                     Subsystem subsystem)
    : score(score), timestamp(std::move(timestamp)),
      description(std::move(description)), subsystem(subsystem) {}

bool ranks_before(const Candidate &lhs, const Candidate &rhs) {
  if (lhs.score != rhs.score)
    return lhs.score > rhs.score;
  return lhs.timestamp < rhs.timestamp;
}

std::string candidate_to_record(const Candidate &candidate) {
  return std::to_string(candidate.score) + ";" + candidate.timestamp + ";" +
         candidate.description;
}

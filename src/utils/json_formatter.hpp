#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/candidate.hpp"
#include "detection/top_list.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json candidate_to_json_object(const Candidate &candidate);
nlohmann::json top_list_to_json_array(const TopList &list);

// {"generated_at": ..., "top_n": K, "subsystems": {"cpu": [...], ...},
//  "global": [...]}
nlohmann::json ranking_to_json_object(const Ranker &ranker, size_t top_n);
std::string format_ranking_to_json(const Ranker &ranker, size_t top_n);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP

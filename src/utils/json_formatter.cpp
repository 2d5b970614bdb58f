#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>

nlohmann::json JsonFormatter::candidate_to_json_object(const Candidate &candidate) {
  nlohmann::json j;
  j["score"] = candidate.score;
  j["timestamp"] = candidate.timestamp;
  j["subsystem"] = subsystem_key(candidate.subsystem);
  j["description"] = candidate.description;
  return j;
}

nlohmann::json JsonFormatter::top_list_to_json_array(const TopList &list) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &candidate : list.entries())
    arr.push_back(candidate_to_json_object(candidate));
  return arr;
}

nlohmann::json JsonFormatter::ranking_to_json_object(const Ranker &ranker,
                                                     size_t top_n) {
  nlohmann::json j;
  j["generated_at"] = Utils::current_iso8601_time();
  j["top_n"] = top_n;

  nlohmann::json subsystems = nlohmann::json::object();
  for (Subsystem subsystem : ranked_subsystems())
    subsystems[subsystem_key(subsystem)] =
        top_list_to_json_array(ranker.list_for(subsystem));
  j["subsystems"] = std::move(subsystems);
  j["global"] = top_list_to_json_array(ranker.global());
  return j;
}

std::string JsonFormatter::format_ranking_to_json(const Ranker &ranker,
                                                  size_t top_n) {
  return ranking_to_json_object(ranker, top_n)
      .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

#ifndef SUMMARY_WRITER_HPP
#define SUMMARY_WRITER_HPP

#include "detection/top_list.hpp"

#include <cstddef>
#include <string>

namespace SummaryWriter {

// "# sar summary: <ISO time>" followed by at most max_lines
// "score;timestamp;description" records of the merged ranking
std::string format_summary(const TopList &summary, size_t max_lines,
                           const std::string &generated_at);

bool write_summary_file(const std::string &path, const TopList &summary,
                        size_t max_lines);

} // namespace SummaryWriter

#endif // SUMMARY_WRITER_HPP

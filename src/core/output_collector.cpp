/**
 * @file output_collector.cpp
 * @brief Implementation of the output collector
 * 
 * @date 2025
 */

#include "capsule/core/output_collector.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace capsule {
namespace core {

OutputCollector::OutputCollector(std::size_t max_bytes)
    : max_bytes_(max_bytes) {
}

bool OutputCollector::AppendLine(std::string line) {
    if (truncated_) {
        return false;
    }

    // Joined size grows by the line plus its separator
    std::size_t added = line.size() + (lines_.empty() ? 0 : 1);
    if (max_bytes_ > 0 && bytes_ + added > max_bytes_) {
        truncated_ = true;
        lines_.emplace_back(TRUNCATION_MARKER);
        spdlog::warn("Program output reached the {} byte cap, dropping further lines", max_bytes_);
        return false;
    }

    bytes_ += added;
    lines_.push_back(std::move(line));
    return true;
}

std::string OutputCollector::Text() const {
    return utils::StringUtils::Join(lines_, "\n");
}

} // namespace core
} // namespace capsule

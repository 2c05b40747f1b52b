/**
 * @file output_collector.hpp
 * @brief Ordered, size-capped accumulation of program log lines
 * 
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace capsule {
namespace core {

/**
 * @class OutputCollector
 * @brief Collects one line per log emission, in emission order
 * 
 * Lines are kept until the byte cap would be exceeded; at that point a
 * single `[output truncated]` marker line is appended and everything after
 * it is dropped. The collector outlives the program's failure so partial
 * output is still reported.
 * 
 * **Thread Safety**: NOT thread-safe. Owned and written by the runner thread.
 */
class OutputCollector {
public:
    static constexpr const char* TRUNCATION_MARKER = "[output truncated]";

    /**
     * @param max_bytes Cap on the joined output size (0 = unlimited)
     */
    explicit OutputCollector(std::size_t max_bytes = 0);

    /**
     * @brief Append one line
     * @return false if the line was dropped because the cap was reached
     */
    bool AppendLine(std::string line);

    /// Lines joined by newline, no trailing newline
    std::string Text() const;

    const std::vector<std::string>& Lines() const { return lines_; }
    std::size_t ByteCount() const { return bytes_; }
    bool IsTruncated() const { return truncated_; }
    bool Empty() const { return lines_.empty(); }

private:
    std::size_t max_bytes_;
    std::vector<std::string> lines_;
    std::size_t bytes_{0};
    bool truncated_{false};
};

} // namespace core
} // namespace capsule

/**
 * @file program_loader.hpp
 * @brief Reading and admission checks for program text
 * 
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>

namespace capsule {
namespace core {

/**
 * @class ProgramValidationError
 * @brief Program text rejected before compilation
 */
class ProgramValidationError : public std::runtime_error {
public:
    explicit ProgramValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ProgramLoader
 * @brief Loads program text and rejects what can never compile
 * 
 * Rejected: empty or whitespace-only text, text containing NUL bytes,
 * text larger than the configured limit.
 * 
 * **Usage Example**:
 * @code
 * ProgramLoader loader(256 * 1024);
 * std::string program = loader.LoadFile("examples/summarize.js");
 * spdlog::info("Program {}", ProgramLoader::Fingerprint(program).substr(0, 12));
 * @endcode
 */
class ProgramLoader {
public:
    explicit ProgramLoader(std::size_t max_program_bytes);

    /**
     * @throws ProgramValidationError describing the first violated rule
     */
    void Validate(const std::string& program) const;

    /**
     * @brief Read and validate a program file
     * @throws std::runtime_error if the file cannot be read
     * @throws ProgramValidationError if the text is rejected
     */
    std::string LoadFile(const std::filesystem::path& path) const;

    /**
     * @brief Read and validate a program from a stream (e.g. stdin)
     * @throws ProgramValidationError if the text is rejected
     */
    std::string ReadStream(std::istream& in) const;

    /// SHA-256 of the program text, hex encoded
    static std::string Fingerprint(const std::string& program);

    std::size_t MaxProgramBytes() const { return max_program_bytes_; }

private:
    std::size_t max_program_bytes_;
};

} // namespace core
} // namespace capsule

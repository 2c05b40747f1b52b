/**
 * @file program_loader.cpp
 * @brief Implementation of program loading and validation
 * 
 * @date 2025
 */

#include "capsule/core/program_loader.hpp"
#include "capsule/utils/hash_utils.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace capsule {
namespace core {

ProgramLoader::ProgramLoader(std::size_t max_program_bytes)
    : max_program_bytes_(max_program_bytes) {
}

void ProgramLoader::Validate(const std::string& program) const {
    if (utils::StringUtils::Trim(program).empty()) {
        throw ProgramValidationError("Program is empty");
    }
    if (program.find('\0') != std::string::npos) {
        throw ProgramValidationError("Program contains NUL bytes");
    }
    if (max_program_bytes_ > 0 && program.size() > max_program_bytes_) {
        throw ProgramValidationError("Program is too large (" + std::to_string(program.size()) +
                                     " bytes, limit " + std::to_string(max_program_bytes_) + ")");
    }
}

std::string ProgramLoader::LoadFile(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("Program file not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open program file: " + path.string());
    }

    std::string program = ReadStream(file);
    spdlog::debug("Loaded program {} ({} bytes)", path.string(), program.size());
    return program;
}

std::string ProgramLoader::ReadStream(std::istream& in) const {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string program = buffer.str();
    Validate(program);
    return program;
}

std::string ProgramLoader::Fingerprint(const std::string& program) {
    return utils::HashUtils::ComputeSHA256(program);
}

} // namespace core
} // namespace capsule

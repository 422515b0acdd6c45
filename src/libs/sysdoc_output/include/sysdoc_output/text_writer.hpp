#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace sysdoc_output {

class OutputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Subfolder of the target folder that receives diagram descriptions.
constexpr const char* text_subfolder = "txt";

// Writes `content` to <target_folder>/txt/<name>.<suffix> (no dot when
// `suffix` is empty) and returns the written files. Throws OutputError.
std::vector<std::filesystem::path> write_to_file(const std::string& content,
    const std::string& name, const std::string& suffix,
    const std::filesystem::path& target_folder);

} // namespace sysdoc_output

#include <sysdoc_output/text_writer.hpp>
#include <sysdoc_common/logging.hpp>
#include <fstream>

namespace sysdoc_output {

std::vector<std::filesystem::path> write_to_file(const std::string& content,
    const std::string& name, const std::string& suffix,
    const std::filesystem::path& target_folder)
{
    const std::filesystem::path folder = target_folder / text_subfolder;
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec)
        throw OutputError("Cannot create " + folder.string() + ": " + ec.message());

    const std::filesystem::path file = folder / (suffix.empty() ? name : name + "." + suffix);
    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f)
        throw OutputError("Cannot open " + file.string() + " for writing");
    f << content;
    f.close();
    if (!f)
        throw OutputError("Failed writing " + file.string());

    sysdoc_common::logger()->debug("Wrote {}", file.string());
    return { file };
}

} // namespace sysdoc_output

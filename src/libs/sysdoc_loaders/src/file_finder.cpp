#include <sysdoc_loaders/metadata_loader.hpp>
#include <sysdoc_common/logging.hpp>
#include <algorithm>

namespace sysdoc_loaders {

std::vector<std::filesystem::path> find_files_with_name(const std::filesystem::path& root,
    const std::string& name, const std::string& extension)
{
    std::vector<std::filesystem::path> found;
    const std::string file_name = name + extension;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) return found;

    std::filesystem::recursive_directory_iterator it(root, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == file_name)
            found.push_back(it->path());
    }
    if (ec)
        sysdoc_common::logger()->warn("Search below {} stopped early: {}", root.string(), ec.message());

    std::sort(found.begin(), found.end());
    return found;
}

} // namespace sysdoc_loaders

#include <cadence/core/filesystem.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace cadence::core {

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) return false;
    file << text;
    return file.good();
}

} // namespace cadence::core

/// @file line_source.cpp
/// @brief Line splitting for captured diagnostics

#include <typesizes/line_source.hpp>

#include <fstream>
#include <stdexcept>

namespace typesizes {

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(
            std::string("Cannot open input file: ") + path.string());
    }
    return read_lines(file);
}

} // namespace typesizes

#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace typesizes {

/// Split captured compiler output into lines. A trailing newline does not
/// produce an empty last line.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

/// Read all lines of a stream
[[nodiscard]] std::vector<std::string> read_lines(std::istream& in);

/// Read all lines of a file. Throws std::runtime_error if it cannot be opened.
[[nodiscard]] std::vector<std::string> read_file_lines(const std::filesystem::path& path);

} // namespace typesizes

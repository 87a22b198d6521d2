#pragma once

#include "tally/error.hpp"
#include "tally/log.hpp"
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace Ballot::Tally::detail {

inline auto read_text_file(const std::filesystem::path& path) -> std::expected<std::string, std::error_code>
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        logger().error(std::format("cannot open '{}' for reading", path.string()));
        return std::unexpected(Error::IoError);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        logger().error(std::format("read error on '{}'", path.string()));
        return std::unexpected(Error::IoError);
    }
    return text;
}

inline auto write_text_file(const std::filesystem::path& path, std::string_view text)
    -> std::expected<void, std::error_code>
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        logger().error(std::format("cannot open '{}' for writing", path.string()));
        return std::unexpected(Error::IoError);
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        logger().error(std::format("write error on '{}'", path.string()));
        return std::unexpected(Error::IoError);
    }
    return {};
}

// 第一行，去掉首尾空白
inline std::string first_line(std::string_view text)
{
    auto end = text.find('\n');
    std::string_view line = text.substr(0, end);
    const auto ws = " \t\r\n";
    auto b = line.find_first_not_of(ws);
    if (b == std::string_view::npos)
        return {};
    auto e = line.find_last_not_of(ws);
    return std::string(line.substr(b, e - b + 1));
}

} // namespace Ballot::Tally::detail

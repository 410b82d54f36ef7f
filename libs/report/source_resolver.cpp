/**
 * @file source_resolver.cpp
 * @brief Source file lookup for stuck point summaries
 */

#include "stuckrank/report.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace stuckrank::report {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] std::string package_directory(std::string_view class_fqn)
{
    const auto dot = class_fqn.rfind('.');
    if (dot == std::string_view::npos) {
        return {};
    }
    std::string dir(class_fqn.substr(0, dot));
    std::ranges::replace(dir, '.', '/');
    return dir;
}

}  // namespace

SourceResolver::SourceResolver(fs::path root)
    : m_root(std::move(root))
{}

std::optional<fs::path> SourceResolver::find_source_file(std::string_view class_fqn,
                                                         std::string_view file_name) const
{
    std::error_code ec;
    const auto package_dir = package_directory(class_fqn);
    const auto direct = m_root / package_dir / std::string(file_name);
    if (fs::is_regular_file(direct, ec)) {
        return direct;
    }
    if (!fs::is_directory(m_root, ec)) {
        return std::nullopt;
    }

    std::vector<fs::path> matches;
    for (auto it = fs::recursive_directory_iterator(
             m_root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename().string() == file_name) {
            matches.push_back(it->path());
        }
    }
    if (matches.empty()) {
        return std::nullopt;
    }
    std::ranges::sort(matches);
    if (!package_dir.empty()) {
        for (const auto& match : matches) {
            if (match.generic_string().find(package_dir) != std::string::npos) {
                return match;
            }
        }
    }
    return matches.front();
}

std::map<std::int32_t, std::string> SourceResolver::read_context(const fs::path& file,
                                                                 std::int32_t target,
                                                                 std::int32_t radius) const
{
    std::map<std::int32_t, std::string> context;
    std::ifstream in(file);
    if (!in) {
        return context;
    }
    const auto first = std::max(1, target - radius);
    const auto last = target + radius;
    std::string text;
    for (std::int32_t number = 1; number <= last && std::getline(in, text); ++number) {
        if (number >= first) {
            if (!text.empty() && text.back() == '\r') {
                text.pop_back();
            }
            context.emplace(number, text);
        }
    }
    return context;
}

}  // namespace stuckrank::report

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gitscope {

inline constexpr std::string_view kSectionPrefix = "@@HAPI_REPO ";
inline constexpr std::string_view kSectionEnd = "@@HAPI_REPO_END";

struct RepoSection {
  std::optional<std::string> repo; // nullopt: legacy single-repo output
  std::string body;
};

std::string percent_encode(std::string_view s);
// При некорректной последовательности возвращает вход без изменений.
std::string percent_decode(std::string_view s);

std::string trim(std::string_view s);

std::string wrap_section(std::string_view repo, std::string_view output);

std::vector<RepoSection> split_sections(std::string_view text);

// repo -> body; legacy section keyed by ""
std::unordered_map<std::string, std::string>
section_bodies_by_repo(const std::vector<RepoSection> &sections);

} // namespace gitscope

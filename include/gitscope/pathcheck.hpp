#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace gitscope {

struct PathCheck {
  bool valid{false};
  std::optional<std::string> error;
};

using PathValidator = std::function<PathCheck(
    const std::filesystem::path &candidate, const std::filesystem::path &root)>;

// candidate разрешается относительно root (лексически, без симлинков)
PathCheck validate_path(const std::filesystem::path &candidate,
                        const std::filesystem::path &root);

std::filesystem::path resolve_against(const std::filesystem::path &base,
                                      const std::filesystem::path &p);

bool is_path_inside(const std::filesystem::path &target,
                    const std::filesystem::path &parent);

std::string to_posix(const std::filesystem::path &p);

} // namespace gitscope

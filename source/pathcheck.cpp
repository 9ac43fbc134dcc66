#include <gitscope/pathcheck.hpp>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace gitscope {

fs::path resolve_against(const fs::path &base, const fs::path &p) {
  fs::path abs = p.is_absolute() ? p : fs::absolute(base) / p;
  abs = abs.lexically_normal();
  // "/a/b/" -> "/a/b"
  if (abs.has_relative_path() && abs.filename().empty())
    abs = abs.parent_path();
  return abs;
}

bool is_path_inside(const fs::path &target, const fs::path &parent) {
  auto t = resolve_against(fs::current_path(), target);
  auto p = resolve_against(fs::current_path(), parent);
  auto rel = t.lexically_relative(p);
  if (rel.empty())
    return false;
  if (rel == ".")
    return true;
  if (rel.is_absolute())
    return false;
  return *rel.begin() != "..";
}

PathCheck validate_path(const fs::path &candidate, const fs::path &root) {
  PathCheck r;
  if (candidate.empty()) {
    r.error = "Path is empty";
    return r;
  }
  auto abs = resolve_against(root, candidate);
  if (!is_path_inside(abs, root)) {
    r.error = fmt::format("Path '{}' is outside the working directory",
                          candidate.string());
    return r;
  }
  r.valid = true;
  return r;
}

std::string to_posix(const fs::path &p) { return p.generic_string(); }

} // namespace gitscope

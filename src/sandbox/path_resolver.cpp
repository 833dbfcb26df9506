#include "sandbox/path_resolver.hpp"

#include <system_error>

namespace file_server::sandbox {

namespace fs = std::filesystem;

namespace {

// Same bound as Linux MAXSYMLINKS.
constexpr int kMaxSymlinkHops = 40;

// weakly_canonical() resolves symlinks only along the existing prefix. A link
// whose target does not exist is left in place, so return the first component
// that is still a symlink, or an empty path.
fs::path find_unresolved_symlink(const fs::path& path) {
  fs::path prefix;
  for (const auto& component : path) {
    prefix /= component;
    std::error_code ec;
    const auto status = fs::symlink_status(prefix, ec);
    if (ec) {
      return {};
    }
    if (fs::is_symlink(status)) {
      return prefix;
    }
  }
  return {};
}

}  // namespace

OutOfBoundsError::OutOfBoundsError(const std::string& raw_path)
    : std::runtime_error("Error: path is outside the root directory: " + raw_path), raw_path_(raw_path) {}

PathResolver::PathResolver(const fs::path& root) {
  std::error_code ec;
  if (!fs::exists(root, ec) || ec) {
    throw std::runtime_error("root directory does not exist: " + root.string());
  }
  if (!fs::is_directory(root, ec) || ec) {
    throw std::runtime_error("root is not a directory: " + root.string());
  }

  root_ = fs::canonical(root, ec);
  if (ec) {
    throw std::runtime_error("unable to resolve root directory " + root.string() + ": " + ec.message());
  }
}

bool PathResolver::is_within_root(const fs::path& root, const fs::path& child) {
  auto root_it = root.begin();
  auto child_it = child.begin();
  for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
    if (*root_it != *child_it) {
      return false;
    }
  }
  return root_it == root.end();
}

fs::path PathResolver::resolve(const std::string& raw_path) const {
  return resolve_relative(fs::path(raw_path).relative_path(), raw_path);
}

fs::path PathResolver::resolve_entry(const std::string& raw_path) const {
  fs::path relative = fs::path(raw_path).relative_path();
  if (!relative.has_filename() && relative.has_parent_path()) {
    relative = relative.parent_path();
  }

  const fs::path name = relative.filename();
  if (name.empty() || name == "." || name == "..") {
    return resolve(raw_path);
  }
  return resolve_relative(relative.parent_path(), raw_path) / name;
}

fs::path PathResolver::resolve_relative(const fs::path& relative, const std::string& raw_path) const {
  fs::path candidate = root_ / relative;

  fs::path resolved;
  for (int hops = 0;; ++hops) {
    resolved = fs::weakly_canonical(candidate);

    const fs::path link = find_unresolved_symlink(resolved);
    if (link.empty()) {
      break;
    }
    if (hops >= kMaxSymlinkHops) {
      throw fs::filesystem_error("too many levels of symbolic links", fs::path(raw_path),
                                 std::make_error_code(std::errc::too_many_symbolic_link_levels));
    }

    fs::path target = fs::read_symlink(link);
    if (target.is_relative()) {
      target = link.parent_path() / target;
    }
    const fs::path rest = resolved.lexically_relative(link);
    candidate = rest == fs::path(".") ? target : target / rest;
  }

  // weakly_canonical keeps a trailing separator for "dir/"; drop it so the
  // component-wise comparison and reported paths are uniform.
  if (!resolved.has_filename() && resolved.has_relative_path()) {
    resolved = resolved.parent_path();
  }

  if (!is_within_root(root_, resolved)) {
    throw OutOfBoundsError(raw_path);
  }
  return resolved;
}

}  // namespace file_server::sandbox

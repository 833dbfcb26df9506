#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace file_server::sandbox {

class OutOfBoundsError : public std::runtime_error {
 public:
  explicit OutOfBoundsError(const std::string& raw_path);

  const std::string& raw_path() const { return raw_path_; }

 private:
  std::string raw_path_;
};

// Resolves client paths inside a fixed root directory. Absolute inputs are
// reinterpreted relative to the root, so "/etc/passwd" names <root>/etc/passwd.
class PathResolver {
 public:
  explicit PathResolver(const std::filesystem::path& root);

  // Returns the canonical absolute target, which is the root itself or a
  // descendant of it. Throws OutOfBoundsError otherwise, and
  // std::filesystem::filesystem_error when canonicalization fails.
  std::filesystem::path resolve(const std::string& raw_path) const;

  // Like resolve(), but leaves the final component as named: a symlink there
  // yields the path of the link itself rather than its target.
  std::filesystem::path resolve_entry(const std::string& raw_path) const;

  const std::filesystem::path& root() const { return root_; }

 private:
  std::filesystem::path resolve_relative(const std::filesystem::path& relative, const std::string& raw_path) const;

  static bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& child);

  std::filesystem::path root_;
};

}  // namespace file_server::sandbox

#include "tools/file_tools.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace file_server::tools {

namespace fs = std::filesystem;

namespace {

constexpr const char* kReadFailure = "Error reading file: ";
constexpr const char* kWriteFailure = "Error writing file: ";
constexpr const char* kListFailure = "Error listing directory: ";
constexpr const char* kCreateFailure = "Error creating directory: ";
constexpr const char* kDeleteFailure = "Error deleting file: ";

std::string require_string(const nlohmann::json& arguments, const std::string& name) {
  const auto it = arguments.find(name);
  if (it == arguments.end() || it->is_null()) {
    throw std::invalid_argument("Error: missing required argument '" + name + "'");
  }
  if (!it->is_string()) {
    throw std::invalid_argument("Error: argument '" + name + "' must be a string");
  }

  const auto& value = it->get_ref<const std::string&>();
  if (value.find('\0') != std::string::npos) {
    throw std::invalid_argument("Error: argument '" + name + "' must not contain NUL bytes");
  }
  return value;
}

std::string describe(const char* prefix, const std::error_code& ec, const fs::path& path) {
  return std::string(prefix) + ec.message() + ": " + path.string();
}

std::string describe(const char* prefix, const std::errc code, const fs::path& path) {
  return describe(prefix, std::make_error_code(code), path);
}

// errno is left by the underlying open(2) when a file stream fails to open.
std::error_code last_open_error() {
  const int err = errno;
  return std::error_code(err != 0 ? err : EIO, std::generic_category());
}

// Missing paths are a normal answer; any other stat failure is an I/O error.
fs::file_status checked_status(const fs::path& path, bool follow_symlinks = true) {
  std::error_code ec;
  const auto status = follow_symlinks ? fs::status(path, ec) : fs::symlink_status(path, ec);
  if (ec && status.type() != fs::file_type::not_found) {
    throw fs::filesystem_error("status", path, ec);
  }
  return status;
}

// The JSON serializer rejects invalid UTF-8 with type_error 316.
bool is_valid_utf8(const std::string& text) {
  try {
    (void)nlohmann::json(text).dump();
  } catch (const nlohmann::json::type_error&) {
    return false;
  }
  return true;
}

// A trailing separator ("a/b.txt/") can only name a directory.
bool names_directory(const std::string& raw_path) {
  const fs::path path(raw_path);
  return !path.has_filename() && path.has_relative_path();
}

// Maps the exceptions a handler body may raise onto tool outcomes.
template <typename Operation>
ToolOutcome guarded(const char* failure_prefix, Operation&& operation) {
  try {
    return operation();
  } catch (const std::invalid_argument& ex) {
    return ToolOutcome::failure(OutcomeKind::invalid_argument, ex.what());
  } catch (const sandbox::OutOfBoundsError& ex) {
    return ToolOutcome::failure(OutcomeKind::out_of_bounds, ex.what());
  } catch (const fs::filesystem_error& ex) {
    const auto& path = ex.path1();
    std::string text = std::string(failure_prefix) + ex.code().message();
    if (!path.empty()) {
      text += ": " + path.string();
    }
    return ToolOutcome::failure(OutcomeKind::io_failure, std::move(text));
  } catch (const std::exception& ex) {
    return ToolOutcome::failure(OutcomeKind::io_failure, std::string(failure_prefix) + ex.what());
  }
}

}  // namespace

FileTools::FileTools(const sandbox::PathResolver& resolver) : resolver_(resolver) {}

ToolOutcome FileTools::read_file(const nlohmann::json& arguments) const {
  return guarded(kReadFailure, [&]() {
    const auto raw_path = require_string(arguments, "path");
    const auto path = resolver_.resolve(raw_path);

    const auto status = checked_status(path);
    if (!fs::exists(status)) {
      return ToolOutcome::failure(OutcomeKind::not_found,
                                  describe(kReadFailure, std::errc::no_such_file_or_directory, path));
    }
    if (fs::is_directory(status)) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, describe(kReadFailure, std::errc::is_a_directory, path));
    }
    if (names_directory(raw_path)) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, describe(kReadFailure, std::errc::not_a_directory, path));
    }

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
      return ToolOutcome::failure(OutcomeKind::io_failure, describe(kReadFailure, last_open_error(), path));
    }

    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
      return ToolOutcome::failure(OutcomeKind::io_failure, describe(kReadFailure, std::errc::io_error, path));
    }
    if (!is_valid_utf8(content)) {
      return ToolOutcome::failure(OutcomeKind::io_failure,
                                  std::string(kReadFailure) + "invalid UTF-8 content: " + path.string());
    }

    return ToolOutcome::success(std::move(content));
  });
}

ToolOutcome FileTools::write_file(const nlohmann::json& arguments) const {
  return guarded(kWriteFailure, [&]() {
    const auto raw_path = require_string(arguments, "path");
    const auto content = require_string(arguments, "content");
    const auto path = resolver_.resolve(raw_path);

    if (fs::is_directory(checked_status(path))) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, describe(kWriteFailure, std::errc::is_a_directory, path));
    }
    if (names_directory(raw_path)) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, describe(kWriteFailure, std::errc::not_a_directory, path));
    }

    fs::create_directories(path.parent_path());

    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return ToolOutcome::failure(OutcomeKind::io_failure, describe(kWriteFailure, last_open_error(), path));
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (out.fail()) {
      return ToolOutcome::failure(OutcomeKind::io_failure, describe(kWriteFailure, std::errc::io_error, path));
    }

    return ToolOutcome::success("Successfully wrote to " + path.string());
  });
}

ToolOutcome FileTools::list_directory(const nlohmann::json& arguments) const {
  return guarded(kListFailure, [&]() {
    const auto raw_path = require_string(arguments, "path");
    const auto path = resolver_.resolve(raw_path);

    const auto status = checked_status(path);
    if (!fs::exists(status)) {
      return ToolOutcome::failure(OutcomeKind::not_found, "Directory does not exist: " + raw_path);
    }
    if (!fs::is_directory(status)) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, "Path is not a directory: " + raw_path);
    }

    std::vector<std::pair<std::string, bool>> entries;
    for (const auto& entry : fs::directory_iterator(path)) {
      // Follows symlinks; a dangling link is listed as a file.
      std::error_code ec;
      const bool is_directory = entry.is_directory(ec);
      entries.emplace_back(entry.path().filename().string(), is_directory && !ec);
    }

    if (entries.empty()) {
      return ToolOutcome::success("Directory is empty");
    }

    std::sort(entries.begin(), entries.end());
    std::string listing;
    for (const auto& [name, is_directory] : entries) {
      if (!listing.empty()) {
        listing += '\n';
      }
      listing += name + (is_directory ? " (directory)" : " (file)");
    }
    return ToolOutcome::success(std::move(listing));
  });
}

ToolOutcome FileTools::create_directory(const nlohmann::json& arguments) const {
  return guarded(kCreateFailure, [&]() {
    const auto path = resolver_.resolve(require_string(arguments, "path"));

    const auto status = checked_status(path);
    if (fs::exists(status) && !fs::is_directory(status)) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, describe(kCreateFailure, std::errc::file_exists, path));
    }

    fs::create_directories(path);
    return ToolOutcome::success("Successfully created directory: " + path.string());
  });
}

ToolOutcome FileTools::delete_file(const nlohmann::json& arguments) const {
  return guarded(kDeleteFailure, [&]() {
    const auto raw_path = require_string(arguments, "path");
    // A symlink is removed itself, never the file it points to.
    const auto path = resolver_.resolve_entry(raw_path);

    const auto status = checked_status(path, false);
    if (!fs::exists(status)) {
      return ToolOutcome::failure(OutcomeKind::not_found, "File does not exist: " + raw_path);
    }
    if (fs::is_directory(status)) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, "Path is a directory, not a file: " + raw_path);
    }
    if (names_directory(raw_path)) {
      return ToolOutcome::failure(OutcomeKind::wrong_type, describe(kDeleteFailure, std::errc::not_a_directory, path));
    }

    fs::remove(path);
    return ToolOutcome::success("Successfully deleted file: " + path.string());
  });
}

}  // namespace file_server::tools

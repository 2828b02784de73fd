#include "code_package.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <system_error>

namespace strata {
namespace {

namespace fs = std::filesystem;

// Earliest timestamp a zip entry can carry; keeps packages byte-stable across runs.
constexpr std::time_t kZipEpoch{ 315532800 };

struct archive_zip_writer : unmovable {
  explicit archive_zip_writer(std::vector<unsigned char> &out) : handle(archive_write_new()) {
    if (!handle) { throw std::runtime_error("archive_write_new failed"); }
    if (archive_write_set_format_zip(handle) != ARCHIVE_OK) {
      fail_construction("zip format unavailable: ");
    }
    // No block padding after the central directory.
    archive_write_set_bytes_in_last_block(handle, 1);
    if (archive_write_open(handle, &out, nullptr, &append, nullptr) != ARCHIVE_OK) {
      fail_construction("Failed to open zip writer: ");
    }
  }

  ~archive_zip_writer() {
    if (handle) { archive_write_free(handle); }
  }

  void close() {
    if (archive_write_close(handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to finish zip: ") +
                               archive_error_string(handle));
    }
  }

  archive *handle{ nullptr };

 private:
  // The destructor does not run for a throwing constructor.
  [[noreturn]] void fail_construction(char const *what) {
    char const *detail{ archive_error_string(handle) };
    std::string message{ std::string(what) + (detail ? detail : "unknown error") };
    archive_write_free(handle);
    handle = nullptr;
    throw std::runtime_error(message);
  }

  static la_ssize_t append(archive *, void *client, void const *buffer, size_t length) {
    auto *out{ static_cast<std::vector<unsigned char> *>(client) };
    auto const *bytes{ static_cast<unsigned char const *>(buffer) };
    out->insert(out->end(), bytes, bytes + length);
    return static_cast<la_ssize_t>(length);
  }
};

struct archive_entry_ptr : unmovable {
  archive_entry_ptr() : handle(archive_entry_new()) {
    if (!handle) { throw std::runtime_error("archive_entry_new failed"); }
  }
  ~archive_entry_ptr() { archive_entry_free(handle); }

  archive_entry *handle{ nullptr };
};

bool excluded(fs::path const &relative) {
  for (auto const &part : relative) {
    if (part == "__pycache__") { return true; }
  }
  return relative.extension() == ".pyc";
}

// Regular files under dir, relative to root, sorted so archives are reproducible.
std::vector<fs::path> collect_files(fs::path const &root, fs::path const &dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::recursive_directory_iterator it{ dir, ec }, end; it != end; it.increment(ec)) {
    if (ec) { break; }
    if (!it->is_regular_file()) { continue; }
    auto rel{ fs::relative(it->path(), root) };
    if (!excluded(rel)) { files.push_back(std::move(rel)); }
  }
  if (ec) {
    throw std::runtime_error("Failed to walk " + dir.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());
  return files;
}

void add_file(archive_zip_writer &writer, fs::path const &root, fs::path const &rel) {
  auto const content{ util_load_file(root / rel) };

  archive_entry_ptr entry;
  archive_entry_set_pathname(entry.handle, rel.generic_string().c_str());
  archive_entry_set_filetype(entry.handle, AE_IFREG);
  archive_entry_set_perm(entry.handle, 0644);
  archive_entry_set_size(entry.handle, static_cast<la_int64_t>(content.size()));
  archive_entry_set_mtime(entry.handle, kZipEpoch, 0);

  if (archive_write_header(writer.handle, entry.handle) != ARCHIVE_OK) {
    throw std::runtime_error("Failed to add " + rel.generic_string() + ": " +
                             archive_error_string(writer.handle));
  }
  if (!content.empty() &&
      archive_write_data(writer.handle, content.data(), content.size()) < 0) {
    throw std::runtime_error("Failed to write " + rel.generic_string() + ": " +
                             archive_error_string(writer.handle));
  }
}

}  // namespace

std::vector<unsigned char> code_package_build(fs::path const &source_root,
                                              std::string const &function_name,
                                              std::vector<std::string> const &shared_dirs) {
  if (auto const prebuilt{ source_root / (function_name + ".zip") };
      fs::is_regular_file(prebuilt)) {
    tui::debug("Using prebuilt package %s", prebuilt.string().c_str());
    return util_load_file(prebuilt);
  }

  auto const function_dir{ source_root / "lambdas" / function_name };
  if (!fs::is_directory(function_dir)) {
    throw configuration_error("no code for function '" + function_name + "': " +
                              function_dir.string() + " is not a directory");
  }

  auto files{ collect_files(source_root, function_dir) };
  for (auto const &shared : shared_dirs) {
    auto const dir{ source_root / shared };
    if (!fs::is_directory(dir)) {
      tui::debug("Shared directory %s not found, skipping", dir.string().c_str());
      continue;
    }
    auto more{ collect_files(source_root, dir) };
    files.insert(files.end(), more.begin(), more.end());
  }

  std::vector<unsigned char> zip;
  {
    archive_zip_writer writer{ zip };
    for (auto const &rel : files) { add_file(writer, source_root, rel); }
    writer.close();
  }

  tui::debug("Packaged %s: %zu files, %zu bytes",
             function_name.c_str(),
             files.size(),
             zip.size());
  return zip;
}

}  // namespace strata

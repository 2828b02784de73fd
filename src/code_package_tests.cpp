#include "code_package.h"

#include "errors.h"

#include "doctest/doctest.h"

#include "archive.h"
#include "archive_entry.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

struct temp_source_tree {
  fs::path root;

  temp_source_tree() {
    static std::atomic<int> counter{ 0 };
    root = fs::temp_directory_path() /
           ("strata-package-test-" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(root);
    fs::create_directories(root);
  }

  ~temp_source_tree() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void write(fs::path const &rel, std::string const &content) const {
    fs::create_directories((root / rel).parent_path());
    std::ofstream out{ root / rel, std::ios::binary };
    out << content;
  }
};

// Entry path -> content, read back with libarchive.
std::map<std::string, std::string> read_zip(std::vector<unsigned char> const &zip) {
  std::map<std::string, std::string> out;

  archive *reader{ archive_read_new() };
  REQUIRE(reader);
  archive_read_support_format_zip(reader);
  archive_read_support_filter_none(reader);
  REQUIRE(archive_read_open_memory(reader, zip.data(), zip.size()) == ARCHIVE_OK);

  archive_entry *entry{ nullptr };
  while (archive_read_next_header(reader, &entry) == ARCHIVE_OK) {
    std::string content;
    char buf[4096];
    for (la_ssize_t n; (n = archive_read_data(reader, buf, sizeof buf)) > 0;) {
      content.append(buf, static_cast<size_t>(n));
    }
    out.emplace(archive_entry_pathname(entry), std::move(content));
  }

  archive_read_free(reader);
  return out;
}

}  // namespace

TEST_CASE("code_package_build packs the function and shared code") {
  temp_source_tree tree;
  tree.write("lambdas/upload_images/handler.py", "def handler(event, context): pass\n");
  tree.write("lambdas/upload_images/__init__.py", "");
  tree.write("lambdas/upload_images/__pycache__/handler.cpython-39.pyc", "junk");
  tree.write("lambdas/upload_images/stale.pyc", "junk");
  tree.write("lambdas/list_images/handler.py", "other function\n");
  tree.write("common/s3.py", "BUCKET = None\n");

  auto const zip{ strata::code_package_build(tree.root, "upload_images") };
  REQUIRE_FALSE(zip.empty());
  CHECK(zip[0] == 'P');
  CHECK(zip[1] == 'K');

  auto const entries{ read_zip(zip) };
  CHECK(entries.size() == 3);
  REQUIRE(entries.count("lambdas/upload_images/handler.py") == 1);
  CHECK(entries.at("lambdas/upload_images/handler.py") ==
        "def handler(event, context): pass\n");
  CHECK(entries.count("lambdas/upload_images/__init__.py") == 1);
  REQUIRE(entries.count("common/s3.py") == 1);
  CHECK(entries.at("common/s3.py") == "BUCKET = None\n");
  CHECK(entries.count("lambdas/list_images/handler.py") == 0);
}

TEST_CASE("code_package_build is byte-stable across runs") {
  temp_source_tree tree;
  tree.write("lambdas/list_images/handler.py", "print('list')\n");
  tree.write("lambdas/list_images/util/paging.py", "PAGE = 10\n");

  auto const first{ strata::code_package_build(tree.root, "list_images") };
  auto const second{ strata::code_package_build(tree.root, "list_images") };
  CHECK(first == second);
}

TEST_CASE("code_package_build works without shared directories") {
  temp_source_tree tree;
  tree.write("lambdas/s3_listener/handler.py", "x = 1\n");

  auto const entries{ read_zip(strata::code_package_build(tree.root, "s3_listener")) };
  CHECK(entries.size() == 1);
  CHECK(entries.count("lambdas/s3_listener/handler.py") == 1);
}

TEST_CASE("code_package_build prefers a prebuilt archive") {
  temp_source_tree tree;
  tree.write("delete_images.zip", "prebuilt-bytes");
  tree.write("lambdas/delete_images/handler.py", "ignored\n");

  auto const zip{ strata::code_package_build(tree.root, "delete_images") };
  CHECK(std::string(zip.begin(), zip.end()) == "prebuilt-bytes");
}

TEST_CASE("code_package_build without function code is a configuration error") {
  temp_source_tree tree;
  tree.write("common/s3.py", "");
  CHECK_THROWS_AS(strata::code_package_build(tree.root, "ghost"),
                  strata::configuration_error);
}

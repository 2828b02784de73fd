#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace strata {

// Zip archive for one function. A prebuilt <source_root>/<name>.zip wins; otherwise
// lambdas/<name> and each shared directory under source_root are packed, keeping
// their relative paths and skipping __pycache__ and *.pyc. Throws configuration_error
// when the function directory is missing, std::runtime_error on archive failures.
std::vector<unsigned char> code_package_build(
    std::filesystem::path const &source_root,
    std::string const &function_name,
    std::vector<std::string> const &shared_dirs = { "common" });

}  // namespace strata

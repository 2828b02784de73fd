#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "aws_util.h"
#include "tui.h"

#include <string_view>

int main(int argc, char **argv) {
  doctest::Context context;
  context.applyCommandLine(argc, argv);

  strata::tui::init();
  strata::tui::set_output_handler([](std::string_view) {});
  strata::aws_init();

  int const result{ context.run() };
  strata::aws_shutdown();
  return result;
}

#include "phase2_support.h"

namespace {

void verify_all() {
  phase2_test::run_lexer_tests();
  phase2_test::run_parser_tests();
}

}  // namespace

int main() {
  verify_all();
  return 0;
}

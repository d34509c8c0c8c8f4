#include "phase3_support.h"

namespace {

void verify_all() {
  phase3_test::run_compiler_signature_tests();
  phase3_test::run_compiler_error_tests();
}

}  // namespace

int main() {
  verify_all();
  return 0;
}

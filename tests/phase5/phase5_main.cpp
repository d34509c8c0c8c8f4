#include "phase5_support.h"

namespace {

void verify_all() {
  phase5_test::run_array_model_tests();
  phase5_test::run_structure_tests();
  phase5_test::run_pervade_tests();
}

}  // namespace

int main() {
  verify_all();
  return 0;
}

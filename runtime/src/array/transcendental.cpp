#include "transcendental.h"

#include <cmath>

#if defined(TACIT_HAS_MPFR)
#include <mpfr.h>
#endif

namespace tacit::transcendental {

#if defined(TACIT_HAS_MPFR)

namespace {

// Per-thread scratch registers; worker pool threads each get their own.
struct MpfrScratch {
  MpfrScratch() {
    mpfr_init2(x, 53);
    mpfr_init2(y, 53);
    mpfr_init2(out, 53);
    mpfr_init2(wide_x, 128);
    mpfr_init2(wide_y, 128);
    mpfr_init2(wide_out, 128);
  }

  ~MpfrScratch() {
    mpfr_clear(x);
    mpfr_clear(y);
    mpfr_clear(out);
    mpfr_clear(wide_x);
    mpfr_clear(wide_y);
    mpfr_clear(wide_out);
  }

  MpfrScratch(const MpfrScratch&) = delete;
  MpfrScratch& operator=(const MpfrScratch&) = delete;

  mpfr_t x;
  mpfr_t y;
  mpfr_t out;
  mpfr_t wide_x;
  mpfr_t wide_y;
  mpfr_t wide_out;
};

MpfrScratch& scratch() {
  thread_local MpfrScratch registers;
  return registers;
}

template <typename Kernel>
double unary(double value, Kernel kernel) {
  auto& regs = scratch();
  mpfr_set_d(regs.x, value, MPFR_RNDN);
  kernel(regs.y, regs.x, MPFR_RNDN);
  return mpfr_get_d(regs.y, MPFR_RNDN);
}

}  // namespace

double sin(double x) { return unary(x, mpfr_sin); }
double cos(double x) { return unary(x, mpfr_cos); }
double tan(double x) { return unary(x, mpfr_tan); }
double asin(double x) { return unary(x, mpfr_asin); }
double acos(double x) { return unary(x, mpfr_acos); }
double exp(double x) { return unary(x, mpfr_exp); }

double pow(double base, double exponent) {
  auto& regs = scratch();
  mpfr_set_d(regs.x, base, MPFR_RNDN);
  mpfr_set_d(regs.y, exponent, MPFR_RNDN);
  mpfr_pow(regs.out, regs.x, regs.y, MPFR_RNDN);
  return mpfr_get_d(regs.out, MPFR_RNDN);
}

double log_base(double base, double x) {
  auto& regs = scratch();
  mpfr_set_d(regs.wide_x, x, MPFR_RNDN);
  mpfr_set_d(regs.wide_y, base, MPFR_RNDN);
  mpfr_log(regs.wide_x, regs.wide_x, MPFR_RNDN);
  mpfr_log(regs.wide_y, regs.wide_y, MPFR_RNDN);
  mpfr_div(regs.wide_out, regs.wide_x, regs.wide_y, MPFR_RNDN);
  return mpfr_get_d(regs.wide_out, MPFR_RNDN);
}

double atan2(double y, double x) {
  auto& regs = scratch();
  mpfr_set_d(regs.y, y, MPFR_RNDN);
  mpfr_set_d(regs.x, x, MPFR_RNDN);
  mpfr_atan2(regs.out, regs.y, regs.x, MPFR_RNDN);
  return mpfr_get_d(regs.out, MPFR_RNDN);
}

#else

double sin(double x) { return std::sin(x); }
double cos(double x) { return std::cos(x); }
double tan(double x) { return std::tan(x); }
double asin(double x) { return std::asin(x); }
double acos(double x) { return std::acos(x); }
double exp(double x) { return std::exp(x); }
double pow(double base, double exponent) { return std::pow(base, exponent); }
double log_base(double base, double x) { return std::log(x) / std::log(base); }
double atan2(double y, double x) { return std::atan2(y, x); }

#endif

}  // namespace tacit::transcendental

#pragma once

namespace tacit::transcendental {

// Correctly rounded when built with MPFR, <cmath> otherwise.
double sin(double x);
double cos(double x);
double tan(double x);
double asin(double x);
double acos(double x);
double exp(double x);
double pow(double base, double exponent);
double log_base(double base, double x);
double atan2(double y, double x);

}  // namespace tacit::transcendental

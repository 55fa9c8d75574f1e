#include "ewma.hpp"
#include <cmath>

Ewma::Ewma(double alpha) : var(kInitialVariance), a(alpha) {}

void Ewma::update(double x) {
    if (!mu) {
        mu = x;
        var = kInitialVariance;
        return;
    }
    // d uses the pre-update mean
    double d = x - *mu;
    *mu += a * d;
    var = (1.0 - a) * (var + a * d * d);
}

double Ewma::z(double x) const {
    if (!mu) return 0.0;
    return (x - *mu) / std::sqrt(var + kZEpsilon);
}

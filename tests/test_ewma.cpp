// tests/test_ewma.cpp
#include <cmath>
#include <iostream>
#include "../src/ewma.hpp"

int main() {
    Ewma e(0.15);
    if (e.mean()) {
        std::cerr << "mean defined before any sample\n";
        return 2;
    }
    if (e.z(0.0) != 0.0 || e.z(1e6) != 0.0 || e.z(-5.0) != 0.0) {
        std::cerr << "z must be 0 before any sample\n";
        return 3;
    }

    e.update(42.0);
    if (!e.mean() || *e.mean() != 42.0) {
        std::cerr << "first sample must set the mean exactly\n";
        return 4;
    }
    if (e.variance() != Ewma::kInitialVariance) {
        std::cerr << "first sample must set variance to 1e-6, got " << e.variance() << "\n";
        return 5;
    }

    // one step by hand: d = 10, mu = 42 + 1.5, var = 0.85 * (1e-6 + 0.15 * 100)
    e.update(52.0);
    double mu = *e.mean();
    double var = e.variance();
    if (std::fabs(mu - 43.5) > 1e-12 || std::fabs(var - 0.85 * (1e-6 + 15.0)) > 1e-9) {
        std::cerr << "update rule wrong: mu=" << mu << " var=" << var << "\n";
        return 6;
    }
    double z = e.z(50.0);
    double expect = (50.0 - mu) / std::sqrt(var + Ewma::kZEpsilon);
    if (std::fabs(z - expect) > 1e-12) {
        std::cerr << "z wrong: " << z << " vs " << expect << "\n";
        return 7;
    }

    // constant stream: mean -> v, variance -> 0, z(v) -> 0
    Ewma c(0.10);
    for (int i = 0; i < 500; ++i) c.update(7.0);
    if (std::fabs(*c.mean() - 7.0) > 1e-12 || c.variance() > 1e-20) {
        std::cerr << "constant stream did not settle: var=" << c.variance() << "\n";
        return 8;
    }
    if (std::fabs(c.z(7.0)) > 1e-9) {
        std::cerr << "z of the constant should be ~0\n";
        return 9;
    }

    // a constant stream that later jumps
    Ewma j(0.15);
    for (int i = 0; i < 50; ++i) j.update(100.0 + (i % 2));
    if (j.z(400.0) < 10.0) {
        std::cerr << "spike should score a large z, got " << j.z(400.0) << "\n";
        return 10;
    }

    std::cout << "test_ewma: OK\n";
    return 0;
}

#pragma once
#include <optional>

// Exponentially-weighted mean/variance estimator.
// mean() is empty until the first update; z() of anything is 0 until then.
class Ewma {
public:
    explicit Ewma(double alpha);

    void update(double x);
    double z(double x) const;

    std::optional<double> mean() const { return mu; }
    double variance() const { return var; }
    double alpha() const { return a; }

    static constexpr double kInitialVariance = 1e-6;
    static constexpr double kZEpsilon = 1e-9;

private:
    std::optional<double> mu;
    double var;
    double a;
};

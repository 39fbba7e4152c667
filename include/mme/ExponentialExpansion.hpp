#pragma once
#include <armadillo>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#ifndef constants
#define PI 3.141592653589793
#endif

namespace mme {

/**
 * The ExponentialExpansion class approximates 1/x on the interval [1,X] by a finite sum of exponentials, 
 * 1/x ~ sum_k w_k*exp(-beta_k*x), with a maximum relative error below a requested bound. The terms come from the trapezoidal 
 * rule applied to 1/x = int exp(s - x*exp(s)) ds, and the step is refined until the sampled relative error meets the bound.
 */
class ExponentialExpansion {

    protected:
        double X_ = 1.;
        double eps_ = 1.;
        arma::colvec weights_;
        arma::colvec exponents_;
        // Maximum relative error sampled on a logarithmic grid of [1,X]
        double error_ = 0.;
        
    public:  // Const references to attributes (read-only)
        const double& X = X_;
        const double& eps = eps_;
        const arma::colvec& weights = weights_;
        const arma::colvec& exponents = exponents_;
        const double& error = error_;

    public:
        ExponentialExpansion() = default;
        ExponentialExpansion(const double X, const double eps, const uint32_t max_terms = 2000);
        ExponentialExpansion(const ExponentialExpansion& other);
        ExponentialExpansion& operator=(const ExponentialExpansion& other);
        ~ExponentialExpansion() = default;

        uint32_t numTerms() const { return weights_.n_elem; }
        // Value of the expansion at x
        double evaluate(const double x) const;
        // Maximum of |x*evaluate(x) - 1| over a logarithmic grid of npoints points in [1,X]
        double sampleRelativeError(const uint32_t npoints = 2000) const;

    private:
        void buildTerms(const double h);

};

}

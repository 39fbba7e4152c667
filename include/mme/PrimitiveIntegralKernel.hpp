#pragma once
#include "mme/IntegralParameters.hpp"
#include "mme/BasisSet.hpp"

#ifndef constants
#define PI 3.141592653589793
#define TWOPI 6.283185307179586
#endif

namespace mme {

// Space in which a primitive integral is summed
enum class Space {G, R};

/**
 * The PrimitiveIntegralKernel class evaluates the periodic two-center Coulomb integrals between two primitive Cartesian 
 * Gaussians (all the Cartesian components with angular momentum in a range), either with the truncated reciprocal sum 
 * (G space) or with the exponential expansion of 1/G^2 turned into direct lattice sums (R space). The cheaper admissible 
 * branch is selected for each pair. The kernel is not modified by the evaluations and may be shared between threads.
 */
class PrimitiveIntegralKernel {

    protected:
        IntegralParameters params_;
        // Scaled expansion of 1/G^2 on [G_min^2, G_cutoff^2]: 1/G^2 ~ sum_k weights_k*exp(-exponents_k*G^2)
        arma::colvec weights_;
        arma::colvec exponents_;

    public:  // Const references to attributes (read-only)
        const IntegralParameters& params = params_;

    public:
        PrimitiveIntegralKernel(const IntegralParameters& params);
        PrimitiveIntegralKernel(const PrimitiveIntegralKernel& other);
        ~PrimitiveIntegralKernel() = default;

        // Add the integrals between the Cartesian primitives with angular momenta la_min..la_max (exponent za) and 
        // lb_min..lb_max (exponent zb) to hab, starting at (off_a, off_b). The counter of the selected space is incremented
        Space integrate(const int la_min, const int la_max, const int lb_min, const int lb_max, const double za, const double zb, 
                        const arma::colvec& rab, arma::mat& hab, const uint64_t off_a, const uint64_t off_b, PassCounters& counters) const;
        // Space selected for the pair with total angular momentum la+lb. Throws std::invalid_argument if neither branch is admissible
        Space selectSpace(const double za, const double zb, const int la, const int lb, const arma::colvec& rab) const;

        // Number of reciprocal vectors summed in G space
        uint64_t costG(const double mu, const int l) const;
        // Number of lattice vectors summed in R space, over all the expansion terms. rnorm is measured from the nearest lattice point
        uint64_t costR(const double mu, const int l, const double rnorm) const;

        // Derivatives d^t/dx^t d^u/dy^u d^v/dz^v F(r), t+u+v <= l, of F(r) = (4pi/Omega)*sum_{G/=0} exp(-G^2/(4mu))/G^2 cos(G.r)
        arma::cube hermiteTensorG(const double mu, const int l, const arma::colvec& r) const;
        // Same derivatives, computed with the exponential expansion and the direct lattice sums
        arma::cube hermiteTensorR(const double mu, const int l, const arma::colvec& r) const;

        // Expansion coefficients E^{i,0}_{t} of a Cartesian Gaussian in Hermite Gaussians with the same exponent and center
        static arma::colvec Efun_single(const int i, const double p);

    protected:
        // Method to evaluate the n-th derivative of the cosine function at arg
        static double derivative_cos(const int n, const double arg);
        // Squared radius beyond which the l-th derivatives of prefac*exp(-x^2/(4alpha)) fall below eps_cutoff
        double tailRadius2(const double alpha, const double prefac, const int l) const;
        // Prefactor of the direct lattice sum of the k-th expansion term
        double termPrefactor(const uint32_t k, const double alpha) const;

};

}

#pragma once
#include "mme/Lattice.hpp"
#include "mme/ExponentialExpansion.hpp"

namespace mme {

// Numerical targets of the calibration and of the integration passes
struct CalibrationSettings {
    // Truncation error of the lattice sums
    double eps_cutoff = 1e-10;
    // Maximum relative error of the exponential expansion
    double eps_minimax = 1e-10;
    // Maximum number of terms allowed in either branch of a primitive integral
    uint64_t max_terms = 10000000;
    // Print calibration and G/R diagnostics (rank 0 only)
    bool info = false;
};

// One row of the cutoff table: extreme exponent and angular momentum, reciprocal cutoff and estimated truncation error
struct CutoffEntry {
    double zeta;
    int l;
    double G_cutoff;
    double error;
};

/**
 * Number of primitive integrals evaluated in each space during one pass. Owned by the caller of the kernel and 
 * reduced over all the processes at the end of the pass.
 */
struct PassCounters {
    uint64_t G_count = 0;
    uint64_t R_count = 0;

    PassCounters& operator+=(const PassCounters& other){
        G_count += other.G_count;
        R_count += other.R_count;
        return *this;
    }
    uint64_t total() const { return G_count + R_count; }
};

/**
 * The IntegralParameters class bundles the result of a calibration: the cell, the expansion order l_max, the reciprocal cutoff 
 * up to which the exponential expansion is valid, the expansion itself, the cutoff table and the estimated minimax error.
 * It is not modified after construction.
 */
class IntegralParameters {

    protected:
        Lattice lattice_;
        CalibrationSettings settings_;
        int l_max_;
        double G_cutoff_;
        ExponentialExpansion expansion_;
        std::vector<CutoffEntry> cutoff_table_;
        double minimax_error_;

    public:  // Const references to attributes (read-only)
        const Lattice& lattice = lattice_;
        const CalibrationSettings& settings = settings_;
        const int& l_max = l_max_;
        const double& G_cutoff = G_cutoff_;
        const ExponentialExpansion& expansion = expansion_;
        const std::vector<CutoffEntry>& cutoff_table = cutoff_table_;
        const double& minimax_error = minimax_error_;

    public:
        IntegralParameters(const Lattice& lattice, const CalibrationSettings& settings, const int l_max, const double G_cutoff, 
                           const ExponentialExpansion& expansion, const std::vector<CutoffEntry>& cutoff_table, const double minimax_error);
        IntegralParameters(const IntegralParameters& other);
        ~IntegralParameters() = default;

        // Print the calibration report
        void print() const;

};

// Smallest |G| such that G^2/(4mu) - (l/2)*ln(G^2) >= ln(1/eps), i.e. the reciprocal cutoff of a Gaussian of reduced exponent mu 
// differentiated l times
double reciprocalCutoff(const double mu, const int l, const double eps);
// Estimated truncation error of the reciprocal sum beyond G_cutoff: (2/pi)*int_{G_cutoff}^{inf} G^{2l}*exp(-G^2/(4mu)) dG
double reciprocalTailError(const double mu, const int l, const double G_cutoff);

}

#pragma once
#include <armadillo>
#include <algorithm>
#include <cstdint>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef constants
#define PI 3.141592653589793
#endif

namespace mme {

/**
 * A set of contracted shells sharing the same primitive exponents. The contraction matrix sphi maps the Cartesian primitive
 * functions of the set onto its spherical functions. Cartesian primitives are indexed by ipgf*ncartRange() + cartOffset(l) + icart, 
 * with icart running over (lx,ly,lz) as lx = l,...,0 and ly = l-lx,...,0.
 */
struct ShellSet {
    int lmin = 0;
    int lmax = 0;
    int npgf = 0;
    // Primitive exponents: (npgf)
    arma::colvec zet;
    // Number of spherical functions and offset of the first one within the basis set
    int nsgf = 0;
    int first_sgf = 0;
    // Contraction matrix: (npgf*ncartRange(), nsgf)
    arma::mat sphi;

    // Number of Cartesian functions with l in [lmin,lmax]
    int ncartRange() const;
    // Offset of the first Cartesian function of angular momentum l within the block of one primitive
    int cartOffset(const int l) const;

    // Build a set from the exponents, the contraction coefficients (npgf,nshell) and the angular momentum of each shell
    static ShellSet fromShells(const arma::colvec& zet, const arma::mat& coefs, const std::vector<int>& shell_l);
};

/**
 * The BasisSet class holds the ordered shell sets of one atomic kind for a given basis type (e.g. "ORB" or "AUX").
 */
class BasisSet {

    protected:
        std::string basis_type_;
        std::vector<ShellSet> sets_;
        int nsgf_ = 0;

    public:  // Const references to attributes (read-only)
        const std::string& basis_type = basis_type_;
        const std::vector<ShellSet>& sets = sets_;
        const int& nsgf = nsgf_;

    public:
        BasisSet(const std::string& basis_type = "");
        BasisSet(const BasisSet& other);
        BasisSet& operator=(const BasisSet& other);
        ~BasisSet() = default;

        // Append a shell set, assigning its offset in the spherical-function numbering of the basis
        void addSet(const ShellSet& set);
        bool empty() const { return sets_.empty(); }

};

// Number of Cartesian functions of angular momentum l
int ncart(const int l);
// Cartesian exponents (lx,ly,lz) of the icart-th function of angular momentum l
void cartExponents(const int l, const int icart, int& lx, int& ly, int& lz);
// Coefficient of the Cartesian function (lx,ly,lz) in the real solid harmonic (l,m), for Cartesian functions normalized as x^l
double solidHarmonicCoefficient(const int l, const int m, const int lx, const int ly, const int lz);
// Normalization constant of a primitive Cartesian Gaussian x^l*exp(-zeta*r^2)
double primitiveNorm(const int l, const double zeta);

}

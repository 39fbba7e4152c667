#pragma once
#include <armadillo>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef constants
#define PI 3.141592653589793
#define TWOPI 6.283185307179586
#endif

namespace mme {

/** 
 *  The Lattice class holds the periodic cell (3D, atomic units) and manipulates information about reciprocal and direct space. 
 *  It is used to wrap atomic positions into the cell and to size the direct and reciprocal lattice sums of the integrals.
 */
class Lattice {
    
    protected:
        // Basis of Bravais vectors (R1,R2,R3) in bohr, stored by columns: (3,3)
        arma::mat Rbasis_;
        // Unit cell volume in bohr^3
        double unitCellVolume_;
        // Basis of reciprocal vectors (G1,G2,G3) in bohr^-1, stored by columns: (3,3)
        arma::mat Gbasis_;
        // Inverse of Rbasis, used to obtain fractional coordinates
        arma::mat Rbasis_inv_;
        // Norm of the shortest non-zero reciprocal lattice vector
        double Gmin_;
        
    public:  // Const references to attributes (read-only)
        const arma::mat& Rbasis = Rbasis_;
        const double& unitCellVolume = unitCellVolume_;
        const arma::mat& Gbasis = Gbasis_;
        const double& Gmin = Gmin_;

    public:
        Lattice(const arma::mat& Rbasis);
        Lattice(const Lattice& other);
        virtual ~Lattice() = default;

    public: 
        // Map a position into the cell centered at the origin (fractional coordinates in [-0.5,0.5))
        arma::colvec wrapIntoCell(const arma::colvec& r) const;
        // Method to generate a kronecker-like list of integer combinations, centered at zero, with the box half-widths given in ni
        arma::imat generateCombinations(const std::vector<int32_t>& ni) const;
        // Half-widths of the box of integer combinations of the Bravais vectors that contains every R with |R| <= radius
        std::vector<int32_t> boxDirect(const double radius) const;
        // Half-widths of the box of integer combinations of the reciprocal vectors that contains every G with |G| <= radius
        std::vector<int32_t> boxReciprocal(const double radius) const;
        // Number of lattice points in the box with half-widths ni
        static uint64_t boxCount(const std::vector<int32_t>& ni);
        // List of reciprocal vectors with 0 < |G| <= Gcut, only one of each (G,-G) pair, stored by columns
        arma::mat generateGlist_half(const double Gcut) const;
        
    protected:
        // Method to compute the unit cell volume
        void computeUnitCellVolume();
        // Compute the reciprocal lattice vectors {G_1,G_2,G_3} and store them by columns in Gbasis
        void calculateGbasis();
        // Find the norm of the shortest non-zero reciprocal lattice vector
        void calculateGmin();

};

}

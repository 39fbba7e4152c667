#pragma once
#include "mme/Kind.hpp"

namespace mme {

/**
 * The ExponentStatistics class scans the primitives of a collection of kinds and extracts the extreme exponents and angular
 * momenta that bound the errors of the integrals: the largest angular momentum l_m, the largest and smallest exponents zet_m 
 * and zet_mm, the largest exponent zet_l among the primitives with l = l_m and the largest angular momentum l_zet among the 
 * primitives with exponent zet_m.
 */
class ExponentStatistics {

    protected:
        int l_m_ = -1;
        double zet_m_ = 0.;
        double zet_mm_ = 0.;
        double zet_l_ = 0.;
        int l_zet_ = -1;

    public:  // Const references to attributes (read-only)
        const int& l_m = l_m_;
        const double& zet_m = zet_m_;
        const double& zet_mm = zet_mm_;
        const double& zet_l = zet_l_;
        const int& l_zet = l_zet_;

    public:
        // Scan the basis sets of the given type of all kinds
        ExponentStatistics(const std::vector<Kind>& kinds, const std::string& basis_type = "");
        ExponentStatistics(const ExponentStatistics& other);
        ~ExponentStatistics() = default;

};

}

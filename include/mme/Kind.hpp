#pragma once
#include "mme/BasisSet.hpp"

namespace mme {

/**
 * The Kind class groups the basis sets of one atomic kind, one per basis type.
 */
class Kind {

    protected:
        std::string label_;
        std::vector<BasisSet> basis_sets_;

    public:  // Const references to attributes (read-only)
        const std::string& label = label_;
        const std::vector<BasisSet>& basis_sets = basis_sets_;

    public:
        Kind(const std::string& label);
        Kind(const Kind& other);
        Kind& operator=(const Kind& other);
        ~Kind() = default;

        void addBasisSet(const BasisSet& basis);
        // Basis set of the given type. An empty type selects the first basis set of the kind
        const BasisSet& basis(const std::string& basis_type = "") const;
        bool hasBasis(const std::string& basis_type = "") const;

};

/**
 * Atom of the unit cell: index of its kind in the kind list and Cartesian position (bohr).
 */
struct Atom {
    uint32_t kind;
    arma::colvec position;
};

}

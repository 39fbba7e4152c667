/**
 * @file fixtures.hpp
 * @brief Small periodic systems shared by the unit tests.
 */
#pragma once
#include "mme.hpp"

namespace mme_test {

// Cubic cell of side L (bohr), lattice vectors by columns
inline arma::mat cubicCell(const double L){
    return L*arma::eye<arma::mat>(3,3);
}

/**
 * Two kinds in a cubic cell of side 8 bohr: kind A carries an sp set with two primitives and a single-primitive d set, 
 * kind B a contracted s set. Three atoms, one of them outside the cell so that the positions are wrapped.
 */
struct SmallSystem {
    mme::Lattice lattice{cubicCell(8.0)};
    std::vector<mme::Kind> kinds;
    std::vector<mme::Atom> atoms;

    SmallSystem() {
        mme::BasisSet basis_A("ORB");
        basis_A.addSet(mme::ShellSet::fromShells(arma::colvec{3.0, 0.6}, arma::mat{{0.4, 0.3}, {0.7, 0.8}}, {0, 1}));
        basis_A.addSet(mme::ShellSet::fromShells(arma::colvec{0.8}, arma::mat{{1.0}}, {2}));
        mme::Kind kind_A("A");
        kind_A.addBasisSet(basis_A);

        mme::BasisSet basis_B("ORB");
        basis_B.addSet(mme::ShellSet::fromShells(arma::colvec{1.5, 0.4}, arma::mat{{0.5}, {0.6}}, {0}));
        mme::Kind kind_B("B");
        kind_B.addBasisSet(basis_B);

        kinds = {kind_A, kind_B};
        atoms = {
            mme::Atom{0, arma::colvec{0.0, 0.0, 0.0}},
            mme::Atom{1, arma::colvec{2.0, 1.0, -1.5}},
            mme::Atom{0, arma::colvec{7.5, 4.0, 3.0}}
        };
    }

    // Number of primitive pairs of a full pass over the ORB basis
    uint64_t primitivePairs() const {
        uint64_t total = 0;
        for(const auto& atom_a : atoms){
            for(const auto& set_a : kinds[atom_a.kind].basis("ORB").sets){
                for(const auto& atom_b : atoms){
                    for(const auto& set_b : kinds[atom_b.kind].basis("ORB").sets){
                        total += set_a.npgf*set_b.npgf;
                    }
                }
            }
        }
        return total;
    }

    uint64_t nsgf() const {
        uint64_t total = 0;
        for(const auto& atom : atoms){
            total += kinds[atom.kind].basis("ORB").nsgf;
        }
        return total;
    }
};

}

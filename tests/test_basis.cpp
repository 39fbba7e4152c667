/**
 * @file test_basis.cpp
 * @brief Unit tests for the shell sets: Cartesian ordering, solid harmonics and contraction matrices.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "fixtures.hpp"

namespace {

double doubleFactorial(const int n){
    double result = 1.;
    for(int i = n; i > 1; i -= 2){
        result *= i;
    }
    return result;
}

// Overlap of two Cartesian functions of angular momentum l at the same center, both carrying the normalization of x^l
double cartesianOverlap(const int l, const int ax, const int ay, const int az, const int bx, const int by, const int bz){
    int sx = ax + bx, sy = ay + by, sz = az + bz;
    if((sx % 2) || (sy % 2) || (sz % 2)){
        return 0.;
    }
    return doubleFactorial(sx - 1)*doubleFactorial(sy - 1)*doubleFactorial(sz - 1)/doubleFactorial(2*l - 1);
}

}

TEST_CASE("BasisSet: Cartesian ordering", "[basis]") {
    REQUIRE(mme::ncart(0) == 1);
    REQUIRE(mme::ncart(2) == 6);
    REQUIRE(mme::ncart(4) == 15);

    int lx, ly, lz;
    mme::cartExponents(2, 0, lx, ly, lz);
    REQUIRE((lx == 2 && ly == 0 && lz == 0));
    mme::cartExponents(2, 1, lx, ly, lz);
    REQUIRE((lx == 1 && ly == 1 && lz == 0));
    mme::cartExponents(2, 3, lx, ly, lz);
    REQUIRE((lx == 0 && ly == 2 && lz == 0));
    mme::cartExponents(2, 5, lx, ly, lz);
    REQUIRE((lx == 0 && ly == 0 && lz == 2));
    REQUIRE_THROWS_AS(mme::cartExponents(1, 3, lx, ly, lz), std::invalid_argument);
}

/**
 * @test Real solid harmonics
 * @brief Known p and d coefficients, and orthonormality up to g functions.
 */
TEST_CASE("BasisSet: real solid harmonics", "[basis]") {
    SECTION("p functions are y, z, x for m = -1, 0, 1") {
        REQUIRE(mme::solidHarmonicCoefficient(1, -1, 0, 1, 0) == Approx(1.0));
        REQUIRE(mme::solidHarmonicCoefficient(1, 0, 0, 0, 1) == Approx(1.0));
        REQUIRE(mme::solidHarmonicCoefficient(1, 1, 1, 0, 0) == Approx(1.0));
        REQUIRE(mme::solidHarmonicCoefficient(1, 1, 0, 1, 0) == Approx(0.0).margin(1e-14));
    }
    SECTION("d functions") {
        REQUIRE(mme::solidHarmonicCoefficient(2, 0, 0, 0, 2) == Approx(1.0));
        REQUIRE(mme::solidHarmonicCoefficient(2, 0, 2, 0, 0) == Approx(-0.5));
        REQUIRE(mme::solidHarmonicCoefficient(2, -2, 1, 1, 0) == Approx(std::sqrt(3.)));
        REQUIRE(mme::solidHarmonicCoefficient(2, 2, 0, 2, 0) == Approx(-0.5*std::sqrt(3.)));
    }
    SECTION("Orthonormality") {
        for(int l = 0; l <= 4; l++){
            for(int m1 = -l; m1 <= l; m1++){
                for(int m2 = -l; m2 <= l; m2++){
                    double ovlp = 0.;
                    for(int ia = 0; ia < mme::ncart(l); ia++){
                        int ax, ay, az;
                        mme::cartExponents(l, ia, ax, ay, az);
                        for(int ib = 0; ib < mme::ncart(l); ib++){
                            int bx, by, bz;
                            mme::cartExponents(l, ib, bx, by, bz);
                            ovlp += mme::solidHarmonicCoefficient(l, m1, ax, ay, az)*mme::solidHarmonicCoefficient(l, m2, bx, by, bz)*
                                    cartesianOverlap(l, ax, ay, az, bx, by, bz);
                        }
                    }
                    REQUIRE(ovlp == Approx((m1 == m2)? 1. : 0.).margin(1e-12));
                }
            }
        }
    }
}

/**
 * @test Contraction matrix of a set
 * @brief Layout of sphi rows (primitive, then Cartesian offset of each l) and columns (shells, m = -l..l).
 */
TEST_CASE("BasisSet: contraction matrix", "[basis]") {
    double zeta = 1.3;
    mme::ShellSet set = mme::ShellSet::fromShells(arma::colvec{zeta}, arma::mat{{1.0, 1.0}}, {0, 1});

    REQUIRE(set.lmin == 0);
    REQUIRE(set.lmax == 1);
    REQUIRE(set.nsgf == 4);
    REQUIRE(set.ncartRange() == 4);
    REQUIRE(set.cartOffset(1) == 1);
    REQUIRE(set.sphi.n_rows == 4);
    REQUIRE(set.sphi.n_cols == 4);

    REQUIRE(set.sphi(0,0) == Approx(mme::primitiveNorm(0, zeta)));
    REQUIRE(set.sphi(0,0) == Approx(std::pow(2*zeta/PI, 0.75)));
    // p_{-1} = y, p_0 = z, p_1 = x
    REQUIRE(set.sphi(2,1) == Approx(mme::primitiveNorm(1, zeta)));
    REQUIRE(set.sphi(3,2) == Approx(mme::primitiveNorm(1, zeta)));
    REQUIRE(set.sphi(1,3) == Approx(mme::primitiveNorm(1, zeta)));
    REQUIRE(arma::accu(arma::abs(set.sphi)) == Approx(mme::primitiveNorm(0, zeta) + 3*mme::primitiveNorm(1, zeta)));

    SECTION("Contracted shells are normalized") {
        arma::colvec zet {2.0, 0.5};
        mme::ShellSet contracted = mme::ShellSet::fromShells(zet, arma::mat{{0.3}, {0.9}}, {0});
        double norm2 = 0.;
        for(int p = 0; p < 2; p++){
            for(int q = 0; q < 2; q++){
                double c_p = contracted.sphi(p,0)/mme::primitiveNorm(0, zet(p));
                double c_q = contracted.sphi(q,0)/mme::primitiveNorm(0, zet(q));
                norm2 += c_p*c_q*std::pow(2*std::sqrt(zet(p)*zet(q))/(zet(p) + zet(q)), 1.5);
            }
        }
        REQUIRE(norm2 == Approx(1.0));
    }
    SECTION("Invalid input") {
        REQUIRE_THROWS_AS(mme::ShellSet::fromShells(arma::colvec{-1.0}, arma::mat{{1.0}}, {0}), std::invalid_argument);
        REQUIRE_THROWS_AS(mme::ShellSet::fromShells(arma::colvec{1.0, 2.0}, arma::mat{{1.0}}, {0}), std::invalid_argument);
        REQUIRE_THROWS_AS(mme::ShellSet::fromShells(arma::colvec{1.0}, arma::mat{{0.0}}, {0}), std::invalid_argument);
    }
}

TEST_CASE("BasisSet: spherical-function offsets", "[basis]") {
    mme_test::SmallSystem system;
    const mme::BasisSet& basis_A = system.kinds[0].basis("ORB");

    REQUIRE(basis_A.nsgf == 4 + 5);
    REQUIRE(basis_A.sets[0].first_sgf == 0);
    REQUIRE(basis_A.sets[1].first_sgf == 4);
    REQUIRE(system.kinds[0].basis().nsgf == basis_A.nsgf);
    REQUIRE(system.nsgf() == 9 + 1 + 9);
    REQUIRE_THROWS_AS(system.kinds[0].basis("AUX"), std::invalid_argument);
    REQUIRE_FALSE(system.kinds[1].hasBasis("AUX"));
}

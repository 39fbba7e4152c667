/**
 * @file test_kernel.cpp
 * @brief Unit tests for the primitive integral kernel: Hermite expansion coefficients, lattice sums in both spaces
 * and branch selection.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "fixtures.hpp"

// Madelung constant of the simple cubic lattice
static const double madelung_sc = 2.837297479480620;

TEST_CASE("PrimitiveIntegralKernel: Hermite coefficients of a Cartesian Gaussian", "[kernel]") {
    double p = 0.7;

    arma::colvec E0 = mme::PrimitiveIntegralKernel::Efun_single(0, p);
    REQUIRE(E0.n_elem == 1);
    REQUIRE(E0(0) == Approx(1.0));

    arma::colvec E1 = mme::PrimitiveIntegralKernel::Efun_single(1, p);
    REQUIRE(E1.n_elem == 2);
    REQUIRE(E1(0) == Approx(0.0).margin(1e-15));
    REQUIRE(E1(1) == Approx(0.5/p));

    arma::colvec E2 = mme::PrimitiveIntegralKernel::Efun_single(2, p);
    REQUIRE(E2.n_elem == 3);
    REQUIRE(E2(0) == Approx(0.5/p));
    REQUIRE(E2(1) == Approx(0.0).margin(1e-15));
    REQUIRE(E2(2) == Approx(0.25/(p*p)));

    arma::colvec E3 = mme::PrimitiveIntegralKernel::Efun_single(3, p);
    REQUIRE(E3(1) == Approx(0.75/(p*p)));
    REQUIRE(E3(3) == Approx(0.125/(p*p*p)));

    REQUIRE_THROWS_AS(mme::PrimitiveIntegralKernel::Efun_single(-1, p), std::invalid_argument);
}

/**
 * @test Lattice sum at zero separation
 * @brief For two s primitives with exponent 1 on the same site of a cubic cell,
 * (a|a) = pi^3*(2*sqrt(mu/pi) - xi/L + pi/(Omega*mu)) with mu = 1/2. Both spaces must reproduce it.
 */
TEST_CASE("PrimitiveIntegralKernel: Ewald closed form at zero separation", "[kernel]") {
    double L = 10.0;
    mme::Lattice lattice(mme_test::cubicCell(L));
    mme::ErrorCalibrator calibrator(lattice);
    mme::IntegralParameters params = calibrator.calibrateCustom(1.0, {1.0}, {0}, 0);
    mme::PrimitiveIntegralKernel kernel(params);

    double mu = 0.5;
    double F0 = 2*std::sqrt(mu/PI) - madelung_sc/L + PI/(L*L*L*mu);
    arma::colvec origin(3, arma::fill::zeros);

    arma::cube tensorG = kernel.hermiteTensorG(mu, 0, origin);
    arma::cube tensorR = kernel.hermiteTensorR(mu, 0, origin);
    REQUIRE(tensorG(0,0,0) == Approx(F0).epsilon(1e-9));
    REQUIRE(tensorR(0,0,0) == Approx(F0).margin(1e-8));

    SECTION("Full primitive integral") {
        arma::mat hab(1, 1, arma::fill::zeros);
        mme::PassCounters counters;
        mme::Space space = kernel.integrate(0, 0, 0, 0, 1.0, 1.0, origin, hab, 0, 0, counters);

        REQUIRE(space == mme::Space::G);
        REQUIRE(counters.G_count == 1);
        REQUIRE(counters.R_count == 0);
        REQUIRE(hab(0,0) == Approx(std::pow(PI, 3)*F0).epsilon(1e-8));
        REQUIRE(std::isfinite(hab(0,0)));
        REQUIRE(hab(0,0) > 0.);

        // Accumulates rather than overwrites
        kernel.integrate(0, 0, 0, 0, 1.0, 1.0, origin, hab, 0, 0, counters);
        REQUIRE(hab(0,0) == Approx(2*std::pow(PI, 3)*F0).epsilon(1e-8));
        REQUIRE(counters.total() == 2);
    }
    SECTION("Selection is deterministic") {
        for(int rep = 0; rep < 5; rep++){
            REQUIRE(kernel.selectSpace(1.0, 1.0, 0, 0, origin) == mme::Space::G);
        }
        REQUIRE(kernel.costG(mu, 0) < kernel.costR(mu, 0, 0.0));
    }
}

/**
 * @test Agreement of both spaces for high derivatives
 * @brief All the derivatives of F up to order 4, at a general separation, must coincide in G and R space.
 */
TEST_CASE("PrimitiveIntegralKernel: G and R space agree", "[kernel]") {
    mme::Lattice lattice(mme_test::cubicCell(8.0));
    mme::ErrorCalibrator calibrator(lattice);
    mme::IntegralParameters params = calibrator.calibrateCustom(0.8, {3.0, 0.8}, {1, 2}, 2);
    mme::PrimitiveIntegralKernel kernel(params);

    double za = 1.2;
    double zb = 0.9;
    double mu = za*zb/(za + zb);
    int l = 4;
    arma::colvec r {1.3, -0.7, 2.1};

    arma::cube tensorG = kernel.hermiteTensorG(mu, l, r);
    arma::cube tensorR = kernel.hermiteTensorR(mu, l, r);
    REQUIRE(tensorG.n_rows == l + 1);
    REQUIRE(tensorR.n_slices == l + 1);
    REQUIRE(arma::abs(tensorG).max() > 1e-2);
    for(int t = 0; t <= l; t++){
        for(int u = 0; u <= l - t; u++){
            for(int v = 0; v <= l - t - u; v++){
                REQUIRE(tensorR(t,u,v) == Approx(tensorG(t,u,v)).epsilon(1e-9).margin(1e-8));
            }
        }
    }

    SECTION("Derivatives of a periodic even function") {
        // F(-r) = F(r), so odd derivatives change sign
        arma::cube tensor_minus = kernel.hermiteTensorG(mu, l, -r);
        REQUIRE(tensor_minus(0,0,0) == Approx(tensorG(0,0,0)));
        REQUIRE(tensor_minus(1,0,0) == Approx(-tensorG(1,0,0)));
        REQUIRE(tensor_minus(1,1,1) == Approx(-tensorG(1,1,1)));
        REQUIRE(tensor_minus(2,0,2) == Approx(tensorG(2,0,2)));

        arma::colvec r_shifted = r + lattice.Rbasis.col(1);
        arma::cube tensor_shifted = kernel.hermiteTensorG(mu, l, r_shifted);
        REQUIRE(tensor_shifted(0,2,1) == Approx(tensorG(0,2,1)).epsilon(1e-10));
    }
    SECTION("Cartesian blocks of a d-d pair") {
        arma::mat habG(6, 6, arma::fill::zeros);
        mme::PassCounters counters;
        kernel.integrate(2, 2, 2, 2, za, zb, r, habG, 0, 0, counters);
        REQUIRE(counters.total() == 1);
        REQUIRE(habG.is_finite());

        // Swapping the primitives and the direction of the separation transposes the block
        arma::mat habT(6, 6, arma::fill::zeros);
        kernel.integrate(2, 2, 2, 2, zb, za, -r, habT, 0, 0, counters);
        REQUIRE(arma::approx_equal(habG, habT.t(), "absdiff", 1e-9));
    }
}

/**
 * @test Branch selection with separation
 * @brief For tight primitives the direct sums are cheaper near a lattice point and the reciprocal sum wins far from it.
 * Within the cell there is a single switch, and the selection repeats with the lattice.
 */
TEST_CASE("PrimitiveIntegralKernel: selection along a ray", "[kernel]") {
    mme::Lattice lattice(mme_test::cubicCell(10.0));
    mme::ErrorCalibrator calibrator(lattice);
    mme::IntegralParameters params = calibrator.calibrateCustom(3.0, {3.0}, {0}, 0);
    mme::PrimitiveIntegralKernel kernel(params);

    // Body diagonal up to just before the corner of the cell
    std::vector<mme::Space> spaces;
    for(double t = 0.; t <= 4.76; t += 0.25){
        spaces.push_back(kernel.selectSpace(3.0, 3.0, 0, 0, arma::colvec{t, t, t}));
    }
    REQUIRE(spaces.front() == mme::Space::R);
    REQUIRE(spaces.back() == mme::Space::G);
    int switches = 0;
    for(size_t i = 1; i < spaces.size(); i++){
        if(spaces[i] != spaces[i-1]){
            switches++;
        }
    }
    REQUIRE(switches == 1);

    SECTION("Cost grows with the distance to the nearest lattice point") {
        uint64_t previous = 0;
        for(double d = 0.; d <= 8.; d += 0.5){
            uint64_t cost = kernel.costR(1.5, 0, d);
            REQUIRE(cost >= previous);
            previous = cost;
        }
        REQUIRE(kernel.costR(1.5, 0, 0.) < kernel.costG(1.5, 0));
        REQUIRE(kernel.costR(1.5, 0, 4.75*std::sqrt(3.)) > kernel.costG(1.5, 0));
    }
    SECTION("Selection repeats with the lattice") {
        for(double t = 0.; t <= 4.76; t += 0.25){
            arma::colvec r {t, t, t};
            arma::colvec r_far = r + 3*lattice.Rbasis.col(0) - 2*lattice.Rbasis.col(2);
            REQUIRE(kernel.selectSpace(3.0, 3.0, 0, 0, r_far) == kernel.selectSpace(3.0, 3.0, 0, 0, r));
        }
        arma::colvec r_image {30.5, -19.5, 0.5};
        REQUIRE(kernel.selectSpace(3.0, 3.0, 0, 0, r_image) == mme::Space::R);
    }
    SECTION("Far images give the same derivatives") {
        arma::colvec r {1.2, -2.3, 0.4};
        arma::colvec r_far = r + 4*lattice.Rbasis.col(1) + 2*lattice.Rbasis.col(2);
        arma::cube tensor = kernel.hermiteTensorR(1.5, 0, r);
        arma::cube tensor_far = kernel.hermiteTensorR(1.5, 0, r_far);
        REQUIRE(tensor_far(0,0,0) == Approx(tensor(0,0,0)).epsilon(1e-10).margin(1e-12));
    }
}

TEST_CASE("PrimitiveIntegralKernel: failures", "[kernel]") {
    mme::Lattice lattice(mme_test::cubicCell(10.0));
    arma::colvec origin(3, arma::fill::zeros);

    SECTION("No branch within the term budget") {
        mme::CalibrationSettings settings;
        settings.max_terms = 1000;
        mme::ErrorCalibrator calibrator(lattice, settings);
        mme::PrimitiveIntegralKernel kernel(calibrator.calibrateCustom(1.0, {1.0}, {0}, 0));

        REQUIRE(kernel.costG(0.5, 0) > 1000);
        REQUIRE_THROWS_AS(kernel.selectSpace(1.0, 1.0, 0, 0, origin), std::invalid_argument);
        arma::mat hab(1, 1, arma::fill::zeros);
        mme::PassCounters counters;
        REQUIRE_THROWS_AS(kernel.integrate(0, 0, 0, 0, 1.0, 1.0, origin, hab, 0, 0, counters), std::invalid_argument);
        REQUIRE(counters.total() == 0);
    }
    SECTION("Angular momentum beyond the calibration") {
        mme::ErrorCalibrator calibrator(lattice);
        mme::PrimitiveIntegralKernel kernel(calibrator.calibrateCustom(1.0, {1.0}, {0}, 0));
        REQUIRE_THROWS_AS(kernel.selectSpace(1.0, 1.0, 1, 0, origin), std::invalid_argument);
        REQUIRE_THROWS_AS(kernel.selectSpace(-1.0, 1.0, 0, 0, origin), std::invalid_argument);
    }
    SECTION("Block outside the buffer") {
        mme::ErrorCalibrator calibrator(lattice);
        mme::PrimitiveIntegralKernel kernel(calibrator.calibrateCustom(1.0, {1.0}, {1}, 1));
        arma::mat hab(2, 2, arma::fill::zeros);
        mme::PassCounters counters;
        REQUIRE_THROWS_AS(kernel.integrate(1, 1, 0, 0, 1.0, 1.0, origin, hab, 0, 0, counters), std::logic_error);
    }
}

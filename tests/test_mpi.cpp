/**
 * @file test_mpi.cpp
 * @brief Integration passes over a real MPI group. Run with several processes.
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "fixtures.hpp"

int main(int argc, char* argv[]){

    MPI_Init(&argc, &argv);
    int result = Catch::Session().run(argc, argv);

    // Failure in any rank fails the test
    int global_result = 0;
    MPI_Allreduce(&result, &global_result, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);
    MPI_Finalize();
    return global_result;

}

/**
 * @test Global sum over the MPI group
 * @brief Every process ends with the same matrix as a single-process pass, for both distributions, and the counters
 * are reduced over the group.
 */
TEST_CASE("CommunicatorMPI: pass over the group", "[mpi]") {
    mme_test::SmallSystem system;
    mme::ErrorCalibrator calibrator(system.lattice);
    mme::IntegralParameters params = calibrator.calibrate(system.kinds, "ORB");

    mme::CommunicatorLocal local;
    mme::IntegralsMME2C reference_integrals(params, local);
    arma::mat reference;
    reference_integrals.integrate(system.kinds, system.atoms, reference, "ORB", "ORB");

    mme::CommunicatorMPI comm(MPI_COMM_WORLD);
    REQUIRE(comm.procSize() >= 1);

    for(auto distribution : {mme::Distribution::RoundRobin, mme::Distribution::Block}){
        mme::IntegralsMME2C integrals(params, comm, distribution);
        arma::mat hab;
        integrals.integrate(system.kinds, system.atoms, hab, "ORB", "ORB");

        REQUIRE(arma::approx_equal(hab, reference, "absdiff", 1e-10));
        REQUIRE(integrals.counters.G_count == reference_integrals.counters.G_count);
        REQUIRE(integrals.counters.R_count == reference_integrals.counters.R_count);
        REQUIRE(integrals.counters.total() == system.primitivePairs());
    }

    SECTION("Sum of explicit buffers") {
        arma::mat buffer(4, 3);
        buffer.fill(comm.procRank() + 1.0);
        comm.sumInPlace(buffer);
        double expected = 0.5*comm.procSize()*(comm.procSize() + 1);
        REQUIRE(buffer(0,0) == Approx(expected));
        REQUIRE(buffer(3,2) == Approx(expected));

        mme::PassCounters counters;
        counters.G_count = 2;
        counters.R_count = static_cast<uint64_t>(comm.procRank());
        comm.sumInPlace(counters);
        REQUIRE(counters.G_count == 2*static_cast<uint64_t>(comm.procSize()));
        REQUIRE(counters.R_count == static_cast<uint64_t>(comm.procSize()*(comm.procSize() - 1)/2));
        comm.barrier();
    }
}

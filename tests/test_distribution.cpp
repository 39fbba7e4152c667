/**
 * @file test_distribution.cpp
 * @brief Unit tests for the work distribution, the reducers and the G/R diagnostics.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "fixtures.hpp"
#include <sstream>

TEST_CASE("WorkDistributor: round-robin owner", "[distribution]") {
    REQUIRE(mme::owner(0, 1) == 0);
    REQUIRE(mme::owner(17, 1) == 0);
    REQUIRE(mme::owner(0, 4) == 0);
    REQUIRE(mme::owner(5, 4) == 1);
    REQUIRE(mme::owner(11, 4) == 3);
    REQUIRE(mme::owner(12, 4) == 0);
    REQUIRE_THROWS_AS(mme::owner(3, 0), std::invalid_argument);
}

/**
 * @test Block limits
 * @brief The blocks of all ranks are contiguous, disjoint and cover [0,total), the first (total mod size) ranks
 * taking one extra index.
 */
TEST_CASE("WorkDistributor: block limits cover the range", "[distribution]") {
    for(uint64_t total : {0ul, 1ul, 7ul, 64ul, 101ul}){
        for(int size : {1, 2, 3, 8}){
            uint64_t expected_begin = 0;
            for(int rank = 0; rank < size; rank++){
                uint64_t begin, end;
                mme::blockLimits(total, size, rank, begin, end);
                REQUIRE(begin == expected_begin);
                REQUIRE(end >= begin);
                uint64_t length = total/size + ((static_cast<uint64_t>(rank) < total % size)? 1 : 0);
                REQUIRE(end - begin == length);
                expected_begin = end;
            }
            REQUIRE(expected_begin == total);
        }
    }
    uint64_t begin, end;
    REQUIRE_THROWS_AS(mme::blockLimits(10, 2, 2, begin, end), std::invalid_argument);
    REQUIRE_THROWS_AS(mme::blockLimits(10, 0, 0, begin, end), std::invalid_argument);
}

TEST_CASE("WorkDistributor: every index has exactly one owner", "[distribution]") {
    uint64_t total = 53;
    for(auto distribution : {mme::Distribution::RoundRobin, mme::Distribution::Block}){
        for(int size : {1, 2, 4, 8}){
            std::vector<int> owners(total, 0);
            uint64_t counted = 0;
            for(int rank = 0; rank < size; rank++){
                mme::WorkDistributor distributor(distribution, rank, size);
                uint64_t owned = 0;
                for(uint64_t index = 0; index < total; index++){
                    if(distributor.owns(index, total)){
                        owners[index]++;
                        owned++;
                    }
                }
                REQUIRE(owned == distributor.ownedCount(total));
                REQUIRE_FALSE(distributor.owns(total, total));
                counted += owned;
            }
            REQUIRE(counted == total);
            for(int n : owners){
                REQUIRE(n == 1);
            }
        }
    }

    SECTION("Round-robin follows the owner rule") {
        mme::WorkDistributor distributor(mme::Distribution::RoundRobin, 2, 3);
        REQUIRE(distributor.owns(2, total));
        REQUIRE(distributor.owns(5, total));
        REQUIRE_FALSE(distributor.owns(6, total));
    }
    SECTION("Invalid process layouts") {
        REQUIRE_THROWS_AS(mme::WorkDistributor(mme::Distribution::Block, 3, 3), std::invalid_argument);
        REQUIRE_THROWS_AS(mme::WorkDistributor(mme::Distribution::Block, -1, 3), std::invalid_argument);
        REQUIRE_THROWS_AS(mme::WorkDistributor(mme::Distribution::RoundRobin, 0, 0), std::invalid_argument);
    }
}

TEST_CASE("WorkDistributor: parse distribution names", "[distribution]") {
    REQUIRE(mme::parseDistribution("roundrobin") == mme::Distribution::RoundRobin);
    REQUIRE(mme::parseDistribution("block") == mme::Distribution::Block);
    REQUIRE_THROWS_AS(mme::parseDistribution("cyclic"), std::invalid_argument);
    REQUIRE_THROWS_AS(mme::parseDistribution(""), std::invalid_argument);
}

TEST_CASE("Reducer: element-wise sums", "[distribution]") {
    mme::MatrixReducer matrix_reducer;
    arma::mat a {{1.0, 2.0}, {3.0, 4.0}};
    arma::mat b {{0.5, -2.0}, {1.0, 0.0}};
    arma::mat c {{-1.5, 0.0}, {0.0, 6.0}};

    arma::mat sum = matrix_reducer.reduce({a, b, c});
    REQUIRE(sum(0,0) == Approx(0.0).margin(1e-15));
    REQUIRE(sum(0,1) == Approx(0.0).margin(1e-15));
    REQUIRE(sum(1,0) == Approx(4.0));
    REQUIRE(sum(1,1) == Approx(10.0));
    REQUIRE(arma::approx_equal(matrix_reducer.combine(a, b), matrix_reducer.combine(b, a), "absdiff", 0.0));
    REQUIRE(arma::approx_equal(matrix_reducer.reduce({a}), a, "absdiff", 0.0));

    REQUIRE_THROWS_AS(matrix_reducer.combine(a, arma::mat(3, 2, arma::fill::zeros)), std::logic_error);
    REQUIRE_THROWS_AS(matrix_reducer.reduce(std::vector<arma::mat>{}), std::invalid_argument);

    SECTION("Counters") {
        mme::CountersReducer counters_reducer;
        mme::PassCounters c1, c2, c3;
        c1.G_count = 3; c1.R_count = 1;
        c2.G_count = 0; c2.R_count = 5;
        c3.G_count = 7; c3.R_count = 0;
        mme::PassCounters total = counters_reducer.reduce({c1, c2, c3});
        REQUIRE(total.G_count == 10);
        REQUIRE(total.R_count == 6);
        REQUIRE(total.total() == 16);
    }
}

TEST_CASE("Diagnostics: percentages and report", "[distribution]") {
    mme::PassCounters counters;
    counters.G_count = 3;
    counters.R_count = 1;
    mme::Diagnostics diagnostics(counters);
    REQUIRE(diagnostics.percentG() == Approx(75.0));
    REQUIRE(diagnostics.percentR() == Approx(25.0));

    std::ostringstream os;
    diagnostics.report(os);
    std::string expected = "MME| Percentage of integrals evaluated in\n"
                           "MME|   G space:      75.0\n"
                           "MME|   R space:      25.0\n";
    REQUIRE(os.str() == expected);

    SECTION("Empty pass") {
        mme::Diagnostics empty(mme::PassCounters{});
        REQUIRE(empty.percentG() == 0.);
        REQUIRE(empty.percentR() == 0.);
    }
    SECTION("Only one space") {
        mme::PassCounters only_R;
        only_R.R_count = 12;
        mme::Diagnostics diagnostics_R(only_R);
        REQUIRE(diagnostics_R.percentG() == 0.);
        REQUIRE(diagnostics_R.percentR() == Approx(100.0));
    }
}

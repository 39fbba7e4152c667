#pragma once
#include "mme/Communicator.hpp"
#include "mme/Diagnostics.hpp"
#include "mme/Kind.hpp"
#include "mme/PrimitiveIntegralKernel.hpp"
#include "mme/WorkDistributor.hpp"
#include <array>
#include <chrono>
#include <exception>
#include <fstream>
#include <omp.h>

namespace mme {

/**
 * The IntegralsMME2C class computes the periodic two-center Coulomb integrals between basis functions with the MME kernel.
 * The pairs of the pass are split among the processes of the communicator, each process accumulates its own pairs in a 
 * zeroed copy of the full matrix, and a single global sum completes the result in every process.
 */
class IntegralsMME2C {

    protected:
        PrimitiveIntegralKernel kernel_;
        const Communicator& comm_;
        WorkDistributor distributor_;
        // Reduced counters of the last pass
        PassCounters counters_;

    public:  // Const references to attributes (read-only)
        const PrimitiveIntegralKernel& kernel = kernel_;
        const WorkDistributor& distributor = distributor_;
        const PassCounters& counters = counters_;

    public:
        IntegralsMME2C(const IntegralParameters& params, const Communicator& comm, const Distribution distribution = Distribution::RoundRobin);
        IntegralsMME2C(const IntegralsMME2C& other);
        ~IntegralsMME2C() = default;

        // Integrals between the basis functions of type basis_type_a (rows) and basis_type_b (columns) of all atoms. 
        // hab is resized to (nsgf_a, nsgf_b) and overwritten
        void integrate(const std::vector<Kind>& kinds, const std::vector<Atom>& atoms, arma::mat& hab, 
                       const std::string& basis_type_a = "", const std::string& basis_type_b = "");
        // Integrals between unnormalized s-type primitives with exponents zeta (positions ra, by columns) and zetb (positions rb).
        // hab is resized to (n_zeta, n_zetb) and overwritten
        void integrate_s(const arma::colvec& zeta, const arma::colvec& zetb, const arma::mat& ra, const arma::mat& rb, arma::mat& hab);
        // Store the entries above 10^-tol in a text file (rank 0 only)
        void saveIntegrals(const arma::mat& hab, const int tol, const std::string& filename) const;

    protected:
        void prepare();
        void finalize(const PassCounters& local_counters);

};

}

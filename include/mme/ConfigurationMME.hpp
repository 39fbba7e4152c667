#pragma once
#include <armadillo>
#include "mme/ConfigurationBase.hpp"
#include "mme/IntegralParameters.hpp"
#include "mme/Kind.hpp"
#include "mme/WorkDistributor.hpp"

namespace mme {

/**
 * The ConfigurationMME class is a specialization of ConfigurationBase to parse the input of the MME integrals: 
 * cell, atoms, basis sets of each kind, target errors and output options.
 */
class ConfigurationMME : public ConfigurationBase {

    protected:
        // Lattice vectors (bohr), stored by rows as in the file
        arma::mat cell_;
        std::vector<Kind> kinds_;
        std::vector<Atom> atoms_;

    public:  // Const references to attributes (read-only)
        const arma::mat& cell = cell_;
        const std::vector<Kind>& kinds = kinds_;
        const std::vector<Atom>& atoms = atoms_;

    struct configurationRun {
        // Basis type used for both rows and columns. Empty to use the first basis set of each kind
        std::string basis_type = "";
        // Target errors, term limit and info flag
        CalibrationSettings settings;
        // Work split among the processes
        Distribution distribution = Distribution::RoundRobin;
        // Output file of the integral matrix, and tolerance: entries > 10^-tolerance are stored
        std::string output = "mme_integrals.MME2c";
        int tolerance = 10;
    };

    public:
        configurationRun runInfo;

    protected:
        ConfigurationMME() = default;
    public:
        ConfigurationMME(const std::string& config_file);

        // Lattice vectors by columns, as expected by Lattice
        arma::mat Rbasis() const { return cell_.t(); }

    protected:
        void parseContent() override;
        void checkContentCoherence();
        // Parse the kind definitions of the basis block
        void parseBasis(const std::vector<std::string>& content);
        // Index of the kind with the given label, or kinds.size() if it does not exist
        uint32_t findKind(const std::string& label) const;

};

}

#pragma once
#include "mme/ExponentStatistics.hpp"
#include "mme/IntegralParameters.hpp"

namespace mme {

/**
 * The ErrorCalibrator class derives the parameters of the integrals from the extreme exponents and angular momenta of the basis:
 * the expansion order, the reciprocal cutoff table with its truncation errors, and the exponential expansion with its minimax 
 * error. It only bounds errors, it does not compute any integral. Calibration is deterministic and must be repeated whenever 
 * the basis collection changes.
 */
class ErrorCalibrator {

    protected:
        Lattice lattice_;
        CalibrationSettings settings_;
        int procMPI_rank_;

    public:  // Const references to attributes (read-only)
        const Lattice& lattice = lattice_;
        const CalibrationSettings& settings = settings_;

    public:
        ErrorCalibrator(const Lattice& lattice, const CalibrationSettings& settings = CalibrationSettings(), const int procMPI_rank = 0);
        ErrorCalibrator(const ErrorCalibrator& other);
        ~ErrorCalibrator() = default;

        // Calibrate from the basis sets of the given type of all kinds
        IntegralParameters calibrate(const std::vector<Kind>& kinds, const std::string& basis_type = "") const;
        // Calibrate from precomputed exponent statistics
        IntegralParameters calibrate(const ExponentStatistics& stats) const;
        // Calibrate from explicit extremes: the exponent bounding the minimax error, the (exponent, angular momentum) rows 
        // of the cutoff table, and the expansion order
        IntegralParameters calibrateCustom(const double zet_err_minimax, const std::vector<double>& zet_err_cutoff, 
                                           const std::vector<int>& l_err_cutoff, const int l_max) const;

        // Reciprocal lattice sum (4pi/Omega)*sum_{G/=0} exp(-G^2/(4mu))/G^2 at zero separation
        double reciprocalSelfSum(const double mu) const;

};

}

#include "mme/ErrorCalibrator.hpp"

namespace mme {

/**
 * Constructor.
 * @param lattice Periodic cell.
 * @param settings Target errors and term limit.
 * @param procMPI_rank Rank of the current MPI process. Only rank 0 prints the calibration report.
 */
ErrorCalibrator::ErrorCalibrator(const Lattice& lattice, const CalibrationSettings& settings, const int procMPI_rank) 
    : lattice_{lattice}, settings_(settings), procMPI_rank_{procMPI_rank} {

    if(!(settings.eps_cutoff > 0) || !(settings.eps_minimax > 0)){
        throw std::invalid_argument("ERROR ErrorCalibrator: the target errors must be positive");
    }
    if(settings.max_terms == 0){
        throw std::invalid_argument("ERROR ErrorCalibrator: max_terms must be positive");
    }

}

ErrorCalibrator::ErrorCalibrator(const ErrorCalibrator& other) : ErrorCalibrator(other.lattice_, other.settings_, other.procMPI_rank_) {}

/**
 * Calibrate from the basis sets of the given type of all kinds.
 * @param kinds List of atomic kinds.
 * @param basis_type Type of the basis sets. If empty, the first basis set of each kind is used.
 * @return IntegralParameters Calibrated parameters.
 */
IntegralParameters ErrorCalibrator::calibrate(const std::vector<Kind>& kinds, const std::string& basis_type) const{

    ExponentStatistics stats(kinds, basis_type);
    return calibrate(stats);

}

/**
 * Calibrate from the exponent statistics. The cutoff table has the rows (zet_m, l_zet) and (zet_l, l_m), the minimax error
 * is bounded with the smallest exponent zet_mm, and l_max is the largest angular momentum of the table.
 * @param stats Exponent statistics of the basis collection.
 * @return IntegralParameters Calibrated parameters.
 */
IntegralParameters ErrorCalibrator::calibrate(const ExponentStatistics& stats) const{

    std::vector<double> zet_c {stats.zet_m, stats.zet_l};
    std::vector<int> l_c {stats.l_zet, stats.l_m};
    int l_max = std::max(l_c[0], l_c[1]);
    return calibrateCustom(stats.zet_mm, zet_c, l_c, l_max);

}

/**
 * Calibrate from explicit extremes. Each row (zeta,l) of the cutoff table gets the reciprocal cutoff of the pair (zeta,zeta),
 * i.e. reduced exponent zeta/2 and derivative order 2l, together with its estimated truncation error. The calibrated cutoff is 
 * the largest one, and it fixes the interval [1,(G_cutoff/G_min)^2] of the exponential expansion.
 * @param zet_err_minimax Exponent whose self-interaction bounds the minimax error.
 * @param zet_err_cutoff Exponents of the cutoff table.
 * @param l_err_cutoff Angular momenta of the cutoff table.
 * @param l_max Expansion order: maximum angular momentum of any primitive in the subsequent integrals.
 * @return IntegralParameters Calibrated parameters.
 */
IntegralParameters ErrorCalibrator::calibrateCustom(const double zet_err_minimax, const std::vector<double>& zet_err_cutoff, 
                                                    const std::vector<int>& l_err_cutoff, const int l_max) const{

    if(zet_err_cutoff.empty() || zet_err_cutoff.size() != l_err_cutoff.size()){
        throw std::invalid_argument("ERROR calibrateCustom: the cutoff table needs the same (non-zero) number of exponents and angular momenta");
    }
    if(!(zet_err_minimax > 0)){
        throw std::invalid_argument("ERROR calibrateCustom: non-positive exponent for the minimax error: " + std::to_string(zet_err_minimax));
    }
    if(l_max < 0){
        throw std::invalid_argument("ERROR calibrateCustom: negative expansion order l_max = " + std::to_string(l_max));
    }

    std::vector<CutoffEntry> cutoff_table;
    double G_cutoff = 0.;
    for(uint32_t row = 0; row < zet_err_cutoff.size(); row++){
        double zeta = zet_err_cutoff[row];
        int l = l_err_cutoff[row];
        if(!(zeta > 0) || l < 0){
            throw std::invalid_argument("ERROR calibrateCustom: invalid cutoff row with zeta = " + std::to_string(zeta) + ", l = " + std::to_string(l));
        }
        if(l > l_max){
            throw std::invalid_argument("ERROR calibrateCustom: the cutoff row with l = " + std::to_string(l) + " exceeds l_max = " + std::to_string(l_max));
        }
        double mu = 0.5*zeta;
        double G_row = reciprocalCutoff(mu, 2*l, settings_.eps_cutoff);
        double err_row = reciprocalTailError(mu, l, G_row);
        cutoff_table.push_back(CutoffEntry{zeta, l, G_row, err_row});
        G_cutoff = std::max(G_cutoff, G_row);
    }

    double X = std::max(std::pow(G_cutoff/lattice_.Gmin, 2), 2.);
    ExponentialExpansion expansion(X, settings_.eps_minimax);
    double minimax_error = expansion.error*reciprocalSelfSum(0.5*zet_err_minimax);

    IntegralParameters params(lattice_, settings_, l_max, G_cutoff, expansion, cutoff_table, minimax_error);
    if(settings_.info && procMPI_rank_ == 0){
        params.print();
    }
    return params;

}

/**
 * Reciprocal lattice sum (4pi/Omega)*sum_{G/=0} exp(-G^2/(4mu))/G^2, truncated at the cutoff of eps_cutoff. 
 * Each (G,-G) pair is added once with a factor 2.
 * @param mu Reduced exponent.
 * @return double Value of the sum.
 */
double ErrorCalibrator::reciprocalSelfSum(const double mu) const{

    double G_pair = reciprocalCutoff(mu, 0, settings_.eps_cutoff);
    arma::mat Glist = lattice_.generateGlist_half(G_pair);
    double sum = 0.;
    for(uint32_t Gind = 0; Gind < Glist.n_cols; Gind++){
        double normsq_G = arma::dot(Glist.col(Gind), Glist.col(Gind));
        sum += std::exp(-0.25*normsq_G/mu)/normsq_G;
    }
    return 2*sum*4*PI/lattice_.unitCellVolume;

}

}

#include "mme/IntegralParameters.hpp"

namespace mme {

IntegralParameters::IntegralParameters(const Lattice& lattice, const CalibrationSettings& settings, const int l_max, const double G_cutoff, 
    const ExponentialExpansion& expansion, const std::vector<CutoffEntry>& cutoff_table, const double minimax_error) 
    : lattice_{lattice}, settings_(settings), l_max_{l_max}, G_cutoff_{G_cutoff}, expansion_{expansion}, 
      cutoff_table_(cutoff_table), minimax_error_{minimax_error} {

    if(l_max < 0){
        throw std::invalid_argument("ERROR IntegralParameters: negative expansion order l_max = " + std::to_string(l_max));
    }

}

IntegralParameters::IntegralParameters(const IntegralParameters& other) 
    : IntegralParameters(other.lattice_, other.settings_, other.l_max_, other.G_cutoff_, other.expansion_, 
                         other.cutoff_table_, other.minimax_error_) {}

/**
 * Print the calibration report to std::cout.
 * @return void.
 */
void IntegralParameters::print() const{

    std::cout << "MME| Expansion order (l_max): " << l_max_ << std::endl;
    std::cout << "MME| Number of exponential terms: " << expansion_.numTerms() << std::endl;
    std::cout << "MME| G cutoff (bohr^-1): " << G_cutoff_ << ". Shortest G (bohr^-1): " << lattice_.Gmin << std::endl;
    std::cout << "MME| Estimated minimax error: " << minimax_error_ << std::endl;
    for(const CutoffEntry& entry : cutoff_table_){
        std::cout << "MME| Cutoff error for zeta = " << entry.zeta << ", l = " << entry.l << ": " << entry.error << 
            " (G cutoff " << entry.G_cutoff << ")" << std::endl;
    }

}

/**
 * Reciprocal cutoff of exp(-G^2/(4mu)) multiplied by G^l, solved by fixed-point iteration of 
 * G^2 = 4mu*(ln(1/eps) + (l/2)*ln(max(G^2,1))).
 * @param mu Reduced exponent.
 * @param l Total derivative order.
 * @param eps Truncation error.
 * @return double Cutoff norm in bohr^-1.
 */
double reciprocalCutoff(const double mu, const int l, const double eps){

    if(!(mu > 0) || !(eps > 0) || l < 0){
        throw std::invalid_argument("ERROR reciprocalCutoff: invalid arguments mu = " + std::to_string(mu) + ", l = " + std::to_string(l));
    }
    double logeps = std::max(std::log(1./eps), 0.);
    double g2 = 4*mu*logeps;
    for(int iter = 0; iter < 100; iter++){
        double g2_new = 4*mu*(logeps + 0.5*l*std::log(std::max(g2, 1.)));
        if(std::abs(g2_new - g2) <= 1e-12*std::max(g2_new, 1.)){
            g2 = g2_new;
            break;
        }
        g2 = g2_new;
    }
    return std::sqrt(g2);

}

/**
 * Integrated tail of the reciprocal sum beyond the cutoff, computed with Simpson's rule up to the point where the integrand has 
 * decayed by a further factor exp(-40).
 * @param mu Reduced exponent.
 * @param l Angular momentum (the integrand carries G^{2l}).
 * @param G_cutoff Lower limit of the integral.
 * @return double Estimated truncation error.
 */
double reciprocalTailError(const double mu, const int l, const double G_cutoff){

    double G_upper = std::sqrt(G_cutoff*G_cutoff + 4*mu*(40. + l*std::log(std::max(G_cutoff*G_cutoff, 1.))));
    const int nint = 2000;
    double step = (G_upper - G_cutoff)/nint;
    auto integrand = [mu,l](const double G){ return std::pow(G, 2*l)*std::exp(-0.25*G*G/mu); };
    double sum = integrand(G_cutoff) + integrand(G_upper);
    for(int i = 1; i < nint; i++){
        sum += ((i % 2)? 4. : 2.)*integrand(G_cutoff + i*step);
    }
    return (2./PI)*sum*step/3.;

}

}

#include "mme/ExponentialExpansion.hpp"

namespace mme {

/**
 * Constructor that builds the expansion of 1/x on [1,X] with maximum relative error eps. The initial step of the trapezoidal rule
 * is pi^2/(ln(10/eps)), and it is reduced by a factor 0.85 until the sampled error falls below eps.
 * @param X Upper bound of the interval, X >= 1.
 * @param eps Requested maximum relative error, 0 < eps < 1.
 * @param max_terms Maximum number of exponential terms.
 */
ExponentialExpansion::ExponentialExpansion(const double X, const double eps, const uint32_t max_terms) : X_{X}, eps_{eps} {

    if(!(X >= 1.)){
        throw std::invalid_argument("ERROR ExponentialExpansion: the interval [1,X] requires X >= 1, but X = " + std::to_string(X));
    }
    if(!(eps > 0.) || !(eps < 1.)){
        throw std::invalid_argument("ERROR ExponentialExpansion: the requested error must be in (0,1), but eps = " + std::to_string(eps));
    }

    double logfac = std::log(10./eps);
    double h = PI*PI/logfac;
    const int max_refinements = 30;
    for(int iter = 0; iter <= max_refinements; iter++){
        double s_min = std::log(0.1*eps/X_);
        double s_max = std::log(logfac);
        uint32_t nterms = static_cast<uint32_t>( std::ceil((s_max - s_min)/h) ) + 1;
        if(nterms > max_terms){
            break;
        }
        buildTerms(h);
        error_ = sampleRelativeError();
        if(error_ <= eps_){
            return;
        }
        h *= 0.85;
    }
    throw std::invalid_argument("ERROR ExponentialExpansion: the expansion of 1/x on [1," + std::to_string(X) + 
        "] cannot reach the relative error " + std::to_string(eps) + " within " + std::to_string(max_terms) + " terms");

}

ExponentialExpansion::ExponentialExpansion(const ExponentialExpansion& other) 
    : X_{other.X_}, eps_{other.eps_}, weights_{other.weights_}, exponents_{other.exponents_}, error_{other.error_} {}

ExponentialExpansion& ExponentialExpansion::operator=(const ExponentialExpansion& other){
    X_ = other.X_;
    eps_ = other.eps_;
    weights_ = other.weights_;
    exponents_ = other.exponents_;
    error_ = other.error_;
    return *this;
}

/**
 * Nodes s_k = s_min + k*h of the trapezoidal rule, covering [s_min,s_max], with weights w_k = h*exp(s_k) and exponents 
 * beta_k = exp(s_k). The lower limit truncates the integral with relative error eps/10 at x = X, and the upper limit with
 * relative error below eps/10 for every x >= 1.
 * @param h Step of the trapezoidal rule.
 * @return void.
 */
void ExponentialExpansion::buildTerms(const double h){

    double logfac = std::log(10./eps_);
    double s_min = std::log(0.1*eps_/X_);
    double s_max = std::log(logfac);
    uint32_t nterms = static_cast<uint32_t>( std::ceil((s_max - s_min)/h) ) + 1;

    weights_.set_size(nterms);
    exponents_.set_size(nterms);
    for(uint32_t k = 0; k < nterms; k++){
        double s = s_min + k*h;
        exponents_(k) = std::exp(s);
        weights_(k) = h*exponents_(k);
    }

}

double ExponentialExpansion::evaluate(const double x) const{

    return arma::accu( weights_ % arma::exp(-x*exponents_) );

}

/**
 * Maximum relative error of the expansion over a logarithmic grid of [1,X].
 * @param npoints Number of grid points, including both ends.
 * @return double max_j |x_j*evaluate(x_j) - 1|.
 */
double ExponentialExpansion::sampleRelativeError(const uint32_t npoints) const{

    double logX = std::log(X_);
    double max_err = 0.;
    for(uint32_t j = 0; j < npoints; j++){
        double x = (npoints > 1)? std::exp(logX*j/(npoints - 1)) : 1.;
        max_err = std::max(max_err, std::abs(x*evaluate(x) - 1.));
    }
    return max_err;

}

}

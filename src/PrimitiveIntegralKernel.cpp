#include "mme/PrimitiveIntegralKernel.hpp"

namespace mme {

/**
 * Constructor that stores the calibrated parameters and scales the exponential expansion of 1/x on [1,X] to 1/G^2 on 
 * [G_min^2, X*G_min^2].
 * @param params Calibrated parameters.
 */
PrimitiveIntegralKernel::PrimitiveIntegralKernel(const IntegralParameters& params) : params_{params} {

    double Gmin2 = params_.lattice.Gmin*params_.lattice.Gmin;
    weights_   = params_.expansion.weights/Gmin2;
    exponents_ = params_.expansion.exponents/Gmin2;

}

PrimitiveIntegralKernel::PrimitiveIntegralKernel(const PrimitiveIntegralKernel& other) : PrimitiveIntegralKernel(other.params_) {}

/**
 * Method to compute the integrals between all the Cartesian components of two primitive Gaussians, 
 * (a|b) = (pi^2/(za*zb))^{3/2} sum_{tuv,t'u'v'} E^a_{tuv} E^b_{t'u'v'} (-1)^{t'+u'+v'} d^{t+t'}_x d^{u+u'}_y d^{v+v'}_z F(rab),
 * and add them to hab. The Cartesian components of angular momentum la start at row off_a + sum_{l=la_min}^{la-1} ncart(l), 
 * and likewise for the columns.
 * @param la_min Minimum angular momentum of the first primitive.
 * @param la_max Maximum angular momentum of the first primitive.
 * @param lb_min Minimum angular momentum of the second primitive.
 * @param lb_max Maximum angular momentum of the second primitive.
 * @param za Exponent of the first primitive.
 * @param zb Exponent of the second primitive.
 * @param rab Separation vector between the centers, ra - rb (bohr).
 * @param hab Accumulation buffer.
 * @param off_a Row offset in hab.
 * @param off_b Column offset in hab.
 * @param counters Counters of the current pass.
 * @return Space Space in which the integrals were evaluated.
 */
Space PrimitiveIntegralKernel::integrate(const int la_min, const int la_max, const int lb_min, const int lb_max, const double za, const double zb, 
                                         const arma::colvec& rab, arma::mat& hab, const uint64_t off_a, const uint64_t off_b, PassCounters& counters) const{

    if(la_min < 0 || la_min > la_max || lb_min < 0 || lb_min > lb_max){
        throw std::invalid_argument("ERROR PrimitiveIntegralKernel::integrate: invalid angular momentum ranges [" + std::to_string(la_min) + "," + 
            std::to_string(la_max) + "], [" + std::to_string(lb_min) + "," + std::to_string(lb_max) + "]");
    }
    uint64_t ncart_a = 0;
    for(int la = la_min; la <= la_max; la++){
        ncart_a += ncart(la);
    }
    uint64_t ncart_b = 0;
    for(int lb = lb_min; lb <= lb_max; lb++){
        ncart_b += ncart(lb);
    }
    if(off_a + ncart_a > hab.n_rows || off_b + ncart_b > hab.n_cols){
        throw std::logic_error("ERROR PrimitiveIntegralKernel::integrate: the block of the primitive pair does not fit in the buffer");
    }

    Space space = selectSpace(za, zb, la_max, lb_max, rab);
    int l_tot = la_max + lb_max;
    double mu = za*zb/(za + zb);
    arma::cube hermite = (space == Space::G)? hermiteTensorG(mu, l_tot, rab) : hermiteTensorR(mu, l_tot, rab);
    if(space == Space::G){
        counters.G_count++;
    }
    else{
        counters.R_count++;
    }

    std::vector<arma::colvec> Evec_a, Evec_b;
    for(int i = 0; i <= la_max; i++){
        Evec_a.push_back(Efun_single(i, za));
    }
    for(int i = 0; i <= lb_max; i++){
        Evec_b.push_back(Efun_single(i, zb));
    }
    double prefac = std::pow(PI*PI/(za*zb), 1.5);

    uint64_t row = off_a;
    for(int la = la_min; la <= la_max; la++){
        for(int icart_a = 0; icart_a < ncart(la); icart_a++, row++){
            int i_a, j_a, k_a;
            cartExponents(la, icart_a, i_a, j_a, k_a);

            uint64_t col = off_b;
            for(int lb = lb_min; lb <= lb_max; lb++){
                for(int icart_b = 0; icart_b < ncart(lb); icart_b++, col++){
                    int i_b, j_b, k_b;
                    cartExponents(lb, icart_b, i_b, j_b, k_b);

                    double integral {0.};
                    for(int t_a = i_a; t_a >= 0; t_a -= 2){
                        for(int u_a = j_a; u_a >= 0; u_a -= 2){
                            for(int v_a = k_a; v_a >= 0; v_a -= 2){
                                double Eijk_a = Evec_a[i_a](t_a)*Evec_a[j_a](u_a)*Evec_a[k_a](v_a);

                                for(int t_b = i_b; t_b >= 0; t_b -= 2){
                                    for(int u_b = j_b; u_b >= 0; u_b -= 2){
                                        for(int v_b = k_b; v_b >= 0; v_b -= 2){
                                            double sign_b {(((t_b + u_b + v_b) % 2) == 0)? 1. : -1.};
                                            double Eijk_b = Evec_b[i_b](t_b)*Evec_b[j_b](u_b)*Evec_b[k_b](v_b);
                                            integral += sign_b*Eijk_a*Eijk_b*hermite(t_a + t_b, u_a + u_b, v_a + v_b);
                                        }
                                    }
                                }

                            }
                        }
                    }
                    hab(row, col) += prefac*integral;

                }
            }

        }
    }

    return space;

}

/**
 * Select the space of a primitive pair. G space is admissible when its number of reciprocal vectors does not exceed max_terms. 
 * R space is admissible when the reciprocal cutoff of the pair lies within the range of the exponential expansion and its 
 * number of lattice vectors does not exceed max_terms. The cheaper admissible branch is taken, G space in case of a tie.
 * The R cost depends on rab only through its offset from the nearest lattice point, so the selection is periodic.
 * @param za Exponent of the first primitive.
 * @param zb Exponent of the second primitive.
 * @param la Angular momentum of the first primitive.
 * @param lb Angular momentum of the second primitive.
 * @param rab Separation vector (bohr).
 * @return Space Selected space.
 */
Space PrimitiveIntegralKernel::selectSpace(const double za, const double zb, const int la, const int lb, const arma::colvec& rab) const{

    if(!(za > 0) || !(zb > 0)){
        throw std::invalid_argument("ERROR PrimitiveIntegralKernel: non-positive exponents zeta_a = " + std::to_string(za) + ", zeta_b = " + std::to_string(zb));
    }
    if(la > params_.l_max || lb > params_.l_max){
        throw std::invalid_argument("ERROR PrimitiveIntegralKernel: angular momenta la = " + std::to_string(la) + ", lb = " + std::to_string(lb) + 
            " exceed the calibrated l_max = " + std::to_string(params_.l_max));
    }
    int l = la + lb;
    double mu = za*zb/(za + zb);
    uint64_t max_terms = params_.settings.max_terms;

    uint64_t nG = costG(mu, l);
    bool G_admissible = (nG <= max_terms);
    bool R_admissible = (reciprocalCutoff(mu, l, params_.settings.eps_cutoff) <= params_.G_cutoff);
    uint64_t nR = 0;
    if(R_admissible){
        nR = costR(mu, l, arma::norm(params_.lattice.wrapIntoCell(rab)));
        R_admissible = (nR <= max_terms);
    }

    if(G_admissible && (!R_admissible || nG <= nR)){
        return Space::G;
    }
    else if(R_admissible){
        return Space::R;
    }
    throw std::invalid_argument("ERROR PrimitiveIntegralKernel: neither G nor R space converges within " + std::to_string(max_terms) + 
        " terms for zeta_a = " + std::to_string(za) + ", zeta_b = " + std::to_string(zb) + ", la = " + std::to_string(la) + ", lb = " + std::to_string(lb));

}

/**
 * Number of reciprocal vectors summed in G space: half of the non-zero points of the box containing |G| <= G_pair.
 * @param mu Reduced exponent of the pair.
 * @param l Total angular momentum of the pair.
 * @return uint64_t Number of terms.
 */
uint64_t PrimitiveIntegralKernel::costG(const double mu, const int l) const{

    double G_pair = reciprocalCutoff(mu, l, params_.settings.eps_cutoff);
    return (Lattice::boxCount(params_.lattice.boxReciprocal(G_pair)) - 1)/2;

}

/**
 * Number of lattice vectors summed in R space: for each term of the expansion, the points of the box containing 
 * |R| <= |r| + r_k, r_k being the tail radius of the term.
 * @param mu Reduced exponent of the pair.
 * @param l Total angular momentum of the pair.
 * @param rnorm Norm of the separation vector relative to its nearest lattice point (bohr).
 * @return uint64_t Number of terms.
 */
uint64_t PrimitiveIntegralKernel::costR(const double mu, const int l, const double rnorm) const{

    uint64_t count = 0;
    for(uint32_t k = 0; k < exponents_.n_elem; k++){
        double alpha = 0.25/mu + exponents_(k);
        double radius = std::sqrt( tailRadius2(alpha, termPrefactor(k, alpha), l) );
        count += Lattice::boxCount(params_.lattice.boxDirect(rnorm + radius));
    }
    return count;

}

/**
 * Derivatives of F(r) in G space. Only one vector of each (G,-G) pair is summed, with a factor 2.
 * @param mu Reduced exponent of the pair.
 * @param l Maximum total derivative order.
 * @param r Separation vector (bohr).
 * @return arma::cube Tensor with entry (t,u,v) = d^t/dx^t d^u/dy^u d^v/dz^v F(r), for t+u+v <= l.
 */
arma::cube PrimitiveIntegralKernel::hermiteTensorG(const double mu, const int l, const arma::colvec& r) const{

    arma::cube hermite(l + 1, l + 1, l + 1, arma::fill::zeros);
    const arma::mat& Gbasis = params_.lattice.Gbasis;
    double G_pair = reciprocalCutoff(mu, l, params_.settings.eps_cutoff);
    double G_pair2 = G_pair*G_pair;
    std::vector<int32_t> mi = params_.lattice.boxReciprocal(G_pair);

    arma::colvec Gpow_x(l + 1), Gpow_y(l + 1), Gpow_z(l + 1), dcos(l + 1);
    for(int32_t m1 = 0; m1 <= mi[0]; m1++){
        for(int32_t m2 = (m1 == 0)? 0 : -mi[1]; m2 <= mi[1]; m2++){
            for(int32_t m3 = (m1 == 0 && m2 == 0)? 1 : -mi[2]; m3 <= mi[2]; m3++){
                arma::colvec Gn = m1*Gbasis.col(0) + m2*Gbasis.col(1) + m3*Gbasis.col(2);
                double normsq_Gn = arma::dot(Gn, Gn);
                if(normsq_Gn > G_pair2){
                    continue;
                }
                double fac = std::exp(-0.25*normsq_Gn/mu)/normsq_Gn;
                double arg = arma::dot(Gn, r);
                Gpow_x(0) = 1.;
                Gpow_y(0) = 1.;
                Gpow_z(0) = 1.;
                dcos(0) = derivative_cos(0, arg);
                for(int n = 1; n <= l; n++){
                    Gpow_x(n) = Gpow_x(n-1)*Gn(0);
                    Gpow_y(n) = Gpow_y(n-1)*Gn(1);
                    Gpow_z(n) = Gpow_z(n-1)*Gn(2);
                    dcos(n) = derivative_cos(n, arg);
                }
                for(int t = 0; t <= l; t++){
                    for(int u = 0; u <= l - t; u++){
                        for(int v = 0; v <= l - t - u; v++){
                            hermite(t,u,v) += fac*Gpow_x(t)*Gpow_y(u)*Gpow_z(v)*dcos(t + u + v);
                        }
                    }
                }
            }
        }
    }
    hermite *= 8*PI/params_.lattice.unitCellVolume;
    return hermite;

}

/**
 * Derivatives of F(r) in R space. Replacing 1/G^2 by sum_k w_k*exp(-beta_k*G^2), each term becomes a Gaussian reciprocal sum 
 * that is transformed into a direct lattice sum: sum_{G/=0} exp(-alpha*G^2) cos(G.r) = Omega/(4pi*alpha)^{3/2} sum_R exp(-|r-R|^2/(4alpha)) - 1, 
 * with alpha = 1/(4mu) + beta_k. The derivatives of the Gaussians are d^n/dx^n exp(-c*x^2) = (-sqrt(c))^n H_n(sqrt(c)*x) exp(-c*x^2).
 * @param mu Reduced exponent of the pair.
 * @param l Maximum total derivative order.
 * @param r Separation vector (bohr).
 * @return arma::cube Tensor with entry (t,u,v) = d^t/dx^t d^u/dy^u d^v/dz^v F(r), for t+u+v <= l.
 */
arma::cube PrimitiveIntegralKernel::hermiteTensorR(const double mu, const int l, const arma::colvec& r) const{

    arma::cube hermite(l + 1, l + 1, l + 1, arma::fill::zeros);
    const arma::mat& Rbasis = params_.lattice.Rbasis;
    // Images are counted from the lattice point nearest to r
    arma::colvec r_cell = params_.lattice.wrapIntoCell(r);
    double rnorm = arma::norm(r_cell);
    double volFac = 4*PI/params_.lattice.unitCellVolume;

    arma::mat gauss_der(l + 1, 3);
    for(uint32_t k = 0; k < exponents_.n_elem; k++){
        double alpha = 0.25/mu + exponents_(k);
        double prefac = termPrefactor(k, alpha);
        double radius2 = tailRadius2(alpha, prefac, l);
        double c = 0.25/alpha;
        double c_sqrt = std::sqrt(c);
        std::vector<int32_t> ni = params_.lattice.boxDirect(rnorm + std::sqrt(radius2));

        for(int32_t n1 = -ni[0]; n1 <= ni[0]; n1++){
            for(int32_t n2 = -ni[1]; n2 <= ni[1]; n2++){
                for(int32_t n3 = -ni[2]; n3 <= ni[2]; n3++){
                    arma::colvec d = r_cell - (n1*Rbasis.col(0) + n2*Rbasis.col(1) + n3*Rbasis.col(2));
                    if(arma::dot(d, d) > radius2){
                        continue;
                    }
                    for(int dim = 0; dim < 3; dim++){
                        double y = c_sqrt*d(dim);
                        double gauss = std::exp(-y*y);
                        // Physicists' Hermite polynomials: H_{n+1}(y) = 2y*H_n(y) - 2n*H_{n-1}(y)
                        double H_prev = 0.;
                        double H_curr = 1.;
                        double scale = 1.;
                        for(int n = 0; n <= l; n++){
                            gauss_der(n, dim) = scale*H_curr*gauss;
                            double H_next = 2*y*H_curr - 2*n*H_prev;
                            H_prev = H_curr;
                            H_curr = H_next;
                            scale *= -c_sqrt;
                        }
                    }
                    for(int t = 0; t <= l; t++){
                        for(int u = 0; u <= l - t; u++){
                            for(int v = 0; v <= l - t - u; v++){
                                hermite(t,u,v) += prefac*gauss_der(t,0)*gauss_der(u,1)*gauss_der(v,2);
                            }
                        }
                    }
                }
            }
        }
        // G = 0 term
        hermite(0,0,0) -= volFac*weights_(k);
    }
    return hermite;

}

/**
 * Analogous to Efun_single in the Coulomb integrals, generalized to any i through the recursion 
 * E^{i+1}_{t} = E^{i}_{t-1}/(2p) + (t+1)*E^{i}_{t+1}.
 * @param i Index i of the cartesian Gaussian.
 * @param p Exponent of the cartesian Gaussian.
 * @return arma::colvec Vector where each entry indicates a value of t, and contains E^{i,0}_{t}.
 */
arma::colvec PrimitiveIntegralKernel::Efun_single(const int i, const double p){

    if(i < 0){
        throw std::invalid_argument("PrimitiveIntegralKernel::Efun_single error: negative index i = " + std::to_string(i));
    }
    double facp = 0.5/p;
    arma::colvec Evec {1.0};
    for(int ii = 0; ii < i; ii++){
        arma::colvec Evec_next(ii + 2, arma::fill::zeros);
        for(int t = 0; t <= ii + 1; t++){
            double val {0.};
            if(t >= 1){
                val += facp*Evec(t - 1);
            }
            if(t + 1 <= ii){
                val += (t + 1)*Evec(t + 1);
            }
            Evec_next(t) = val;
        }
        Evec = Evec_next;
    }
    return Evec;

}

/**
 * Method to evaluate the n-th derivative of the cosine function at arg.
 * @param n Order of the derivative, possibly 0 (in which case the derivative is the identity operator).
 * @param arg Argument in which the derivative is evaluated.
 * @return double d^n/dx^n cos(x) | x = arg.
 */
double PrimitiveIntegralKernel::derivative_cos(const int n, const double arg){

    switch(n % 4)
    {
    case 0: {
        return std::cos(arg);
    }
    case 1: {
        return -std::sin(arg);
    }
    case 2: {
        return -std::cos(arg);
    }
    case 3: {
        return std::sin(arg);
    }
    default: 
        throw std::logic_error("PrimitiveIntegralKernel::derivative_cos error: this statement should never be reached");
    }

}

/**
 * Squared tail radius of prefac*exp(-x^2/(4alpha)) differentiated l times, whose magnitude behaves as 
 * prefac*(x/(2alpha))^l*exp(-x^2/(4alpha)). Solved by fixed-point iteration.
 * @param alpha Gaussian parameter of the term.
 * @param prefac Prefactor of the term.
 * @param l Total derivative order.
 * @return double Squared radius (bohr^2).
 */
double PrimitiveIntegralKernel::tailRadius2(const double alpha, const double prefac, const int l) const{

    double logeps = std::log(1./params_.settings.eps_cutoff) + std::log(std::max(prefac, 1.));
    double x = 4*alpha*logeps;
    for(int iter = 0; iter < 100; iter++){
        double x_new = 4*alpha*(logeps + 0.5*l*std::log(std::max(0.25*x/(alpha*alpha), 1.)));
        if(std::abs(x_new - x) <= 1e-12*std::max(x_new, 1.)){
            return x_new;
        }
        x = x_new;
    }
    return x;

}

double PrimitiveIntegralKernel::termPrefactor(const uint32_t k, const double alpha) const{
    return 4*PI*weights_(k)/std::pow(4*PI*alpha, 1.5);
}

}

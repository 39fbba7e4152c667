#include "mme/BasisSet.hpp"

namespace mme {

namespace {

double factorial(const int n){
    double result = 1.;
    for(int i = 2; i <= n; i++){
        result *= i;
    }
    return result;
}

// Double factorial, with (-1)!! = 1
double doubleFactorial(const int n){
    double result = 1.;
    for(int i = n; i > 1; i -= 2){
        result *= i;
    }
    return result;
}

double binomial(const int n, const int k){
    if(k < 0 || k > n){
        return 0.;
    }
    return factorial(n)/(factorial(k)*factorial(n - k));
}

int parity(const int i){
    return (i % 2)? -1 : 1;
}

}

int ncart(const int l){
    return ((l + 1)*(l + 2))/2;
}

/**
 * Cartesian exponents of the icart-th Cartesian function of angular momentum l, in the order lx = l,...,0 and, for each lx, 
 * ly = l-lx,...,0.
 * @param l Angular momentum.
 * @param icart Index of the Cartesian function, in [0,ncart(l)).
 * @param lx Exponent of x (output).
 * @param ly Exponent of y (output).
 * @param lz Exponent of z (output).
 * @return void.
 */
void cartExponents(const int l, const int icart, int& lx, int& ly, int& lz){

    int count = 0;
    for(int ix = l; ix >= 0; ix--){
        for(int iy = l - ix; iy >= 0; iy--){
            if(count == icart){
                lx = ix;
                ly = iy;
                lz = l - ix - iy;
                return;
            }
            count++;
        }
    }
    throw std::invalid_argument("ERROR cartExponents: Cartesian index " + std::to_string(icart) + " out of range for l = " + std::to_string(l));

}

/**
 * Coefficient of the Cartesian function x^lx*y^ly*z^lz in the real solid harmonic of order (l,m), assuming that all the 
 * Cartesian functions carry the normalization of x^l. The spherical functions of a shell are ordered as m = -l,...,l.
 * @param l Angular momentum.
 * @param m Magnetic quantum number of the real solid harmonic.
 * @param lx Exponent of x.
 * @param ly Exponent of y.
 * @param lz Exponent of z.
 * @return double Coefficient.
 */
double solidHarmonicCoefficient(const int l, const int m, const int lx, const int ly, const int lz){

    int abs_m = std::abs(m);
    if((lx + ly - abs_m) % 2){
        return 0.;
    }
    int j = (lx + ly - abs_m)/2;
    if(j < 0){
        return 0.;
    }
    int comp = (m >= 0)? 1 : -1;
    int i = abs_m - lx;
    if(comp != parity(i)){
        return 0.;
    }

    double pfac = std::sqrt( factorial(2*lx)*factorial(2*ly)*factorial(2*lz)*factorial(l)*factorial(l - abs_m) / 
        (factorial(2*l)*factorial(lx)*factorial(ly)*factorial(lz)*factorial(l + abs_m)) );
    pfac /= std::pow(2., l)*factorial(l);
    pfac *= (m < 0)? parity((i - 1)/2) : parity(i/2);

    double sum = 0.;
    for(int ii = j; ii <= (l - abs_m)/2; ii++){
        double pfac1 = binomial(l,ii)*binomial(ii,j)*parity(ii)*factorial(2*(l - ii))/factorial(l - abs_m - 2*ii);
        double sum1 = 0.;
        int k_min = std::max((lx - abs_m)/2, 0);
        int k_max = std::min(j, lx/2);
        for(int k = k_min; k <= k_max; k++){
            if(lx - 2*k <= abs_m){
                sum1 += binomial(j,k)*binomial(abs_m, lx - 2*k)*parity(k);
            }
        }
        sum += pfac1*sum1;
    }
    sum *= std::sqrt( doubleFactorial(2*l - 1)/(doubleFactorial(2*lx - 1)*doubleFactorial(2*ly - 1)*doubleFactorial(2*lz - 1)) );

    return (m == 0)? pfac*sum : std::sqrt(2.)*pfac*sum;

}

double primitiveNorm(const int l, const double zeta){
    return std::pow(2*zeta/PI, 0.75)*std::pow(4*zeta, 0.5*l)/std::sqrt(doubleFactorial(2*l - 1));
}

int ShellSet::ncartRange() const{
    return cartOffset(lmax + 1);
}

int ShellSet::cartOffset(const int l) const{
    int offset = 0;
    for(int li = lmin; li < l; li++){
        offset += ncart(li);
    }
    return offset;
}

/**
 * Build a shell set from its primitive exponents and the contraction coefficients of each shell. The contracted shells are
 * normalized, and their primitives carry the normalization constant of x^l*exp(-zeta*r^2).
 * @param zet Primitive exponents: (npgf).
 * @param coefs Contraction coefficients, one column per shell: (npgf,nshell).
 * @param shell_l Angular momentum of each shell.
 * @return ShellSet The set, with first_sgf = 0.
 */
ShellSet ShellSet::fromShells(const arma::colvec& zet, const arma::mat& coefs, const std::vector<int>& shell_l){

    if(zet.n_elem == 0 || shell_l.empty()){
        throw std::invalid_argument("ERROR ShellSet::fromShells: a shell set needs at least one exponent and one shell");
    }
    if(coefs.n_rows != zet.n_elem || coefs.n_cols != shell_l.size()){
        throw std::invalid_argument("ERROR ShellSet::fromShells: the contraction coefficients must be a (npgf,nshell) matrix");
    }
    for(uint32_t ipgf = 0; ipgf < zet.n_elem; ipgf++){
        if(!(zet(ipgf) > 0)){
            throw std::invalid_argument("ERROR ShellSet::fromShells: non-positive exponent " + std::to_string(zet(ipgf)));
        }
    }

    ShellSet set;
    set.zet = zet;
    set.npgf = zet.n_elem;
    set.lmin = *std::min_element(shell_l.begin(), shell_l.end());
    set.lmax = *std::max_element(shell_l.begin(), shell_l.end());
    if(set.lmin < 0){
        throw std::invalid_argument("ERROR ShellSet::fromShells: negative angular momentum");
    }
    set.nsgf = 0;
    for(int l : shell_l){
        set.nsgf += 2*l + 1;
    }
    set.first_sgf = 0;

    int ncart_range = set.ncartRange();
    set.sphi.zeros(set.npgf*ncart_range, set.nsgf);
    int sgf = 0;
    for(uint32_t ishell = 0; ishell < shell_l.size(); ishell++){
        int l = shell_l[ishell];
        // Normalization of the contracted shell, from the overlap of its normalized primitives
        double norm2 = 0.;
        for(int p = 0; p < set.npgf; p++){
            for(int q = 0; q < set.npgf; q++){
                double ovlp = std::pow(2*std::sqrt(zet(p)*zet(q))/(zet(p) + zet(q)), l + 1.5);
                norm2 += coefs(p,ishell)*coefs(q,ishell)*ovlp;
            }
        }
        if(!(norm2 > 0)){
            throw std::invalid_argument("ERROR ShellSet::fromShells: shell " + std::to_string(ishell) + " has vanishing contraction coefficients");
        }
        double fac_contr = 1./std::sqrt(norm2);

        for(int m = -l; m <= l; m++){
            for(int ipgf = 0; ipgf < set.npgf; ipgf++){
                double fac = fac_contr*coefs(ipgf,ishell)*primitiveNorm(l, zet(ipgf));
                for(int icart = 0; icart < ncart(l); icart++){
                    int lx, ly, lz;
                    cartExponents(l, icart, lx, ly, lz);
                    set.sphi(ipgf*ncart_range + set.cartOffset(l) + icart, sgf) = fac*solidHarmonicCoefficient(l, m, lx, ly, lz);
                }
            }
            sgf++;
        }
    }
    return set;

}

BasisSet::BasisSet(const std::string& basis_type) : basis_type_{basis_type} {}

BasisSet::BasisSet(const BasisSet& other) : basis_type_{other.basis_type_}, sets_{other.sets_}, nsgf_{other.nsgf_} {}

BasisSet& BasisSet::operator=(const BasisSet& other){
    basis_type_ = other.basis_type_;
    sets_ = other.sets_;
    nsgf_ = other.nsgf_;
    return *this;
}

void BasisSet::addSet(const ShellSet& set){
    ShellSet set_copy = set;
    set_copy.first_sgf = nsgf_;
    nsgf_ += set_copy.nsgf;
    sets_.push_back(set_copy);
}

}

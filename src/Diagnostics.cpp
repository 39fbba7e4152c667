#include "mme/Diagnostics.hpp"

namespace mme {

Diagnostics::Diagnostics(const PassCounters& counters) : counters_(counters) {}

double Diagnostics::percentG() const{
    uint64_t total = counters_.total();
    return (total == 0)? 0. : 100.*counters_.G_count/total;
}

double Diagnostics::percentR() const{
    uint64_t total = counters_.total();
    return (total == 0)? 0. : 100.*counters_.R_count/total;
}

void Diagnostics::report(std::ostream& os) const{

    std::ios_base::fmtflags flags = os.flags();
    std::streamsize prec = os.precision();
    os << "MME| Percentage of integrals evaluated in" << std::endl;
    os << std::fixed << std::setprecision(1);
    os << "MME|   G space:" << std::setw(10) << percentG() << std::endl;
    os << "MME|   R space:" << std::setw(10) << percentR() << std::endl;
    os.flags(flags);
    os.precision(prec);

}

}

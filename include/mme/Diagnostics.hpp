#pragma once
#include "mme/IntegralParameters.hpp"
#include <iomanip>
#include <iostream>

namespace mme {

/**
 * Percentage split of the primitive integrals between G and R space, from the reduced counters of a pass.
 * Purely observational.
 */
class Diagnostics {

    protected:
        PassCounters counters_;

    public:
        Diagnostics(const PassCounters& counters);

        // Percentages in [0,100]. Both are 0 if no integral was evaluated
        double percentG() const;
        double percentR() const;
        // Write the report lines "MME| Percentage of integrals evaluated in" ...
        void report(std::ostream& os = std::cout) const;

};

}

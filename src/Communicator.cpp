#include "mme/Communicator.hpp"

namespace mme {

CommunicatorLocal::CommunicatorLocal(const int procRank, const int procSize) : procRank_{procRank}, procSize_{procSize} {

    if(procSize <= 0 || procRank < 0 || procRank >= procSize){
        throw std::invalid_argument("ERROR CommunicatorLocal: invalid rank " + std::to_string(procRank) + " for " + std::to_string(procSize) + " processes");
    }

}

}

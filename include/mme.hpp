#pragma once

#include "mme/Lattice.hpp"
#include "mme/BasisSet.hpp"
#include "mme/Kind.hpp"
#include "mme/ExponentStatistics.hpp"
#include "mme/ExponentialExpansion.hpp"
#include "mme/IntegralParameters.hpp"
#include "mme/ErrorCalibrator.hpp"
#include "mme/PrimitiveIntegralKernel.hpp"
#include "mme/WorkDistributor.hpp"
#include "mme/Communicator.hpp"
#include "mme/CommunicatorMPI.hpp"
#include "mme/Reducer.hpp"
#include "mme/Diagnostics.hpp"
#include "mme/IntegralsMME2C.hpp"
#include "mme/ConfigurationBase.hpp"
#include "mme/ConfigurationMME.hpp"
#include "mme/ConfigurationMME_MPI.hpp"
#include "mme/utils.hpp"

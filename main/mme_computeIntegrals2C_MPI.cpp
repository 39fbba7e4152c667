#include <mpi.h>
#include <tclap/CmdLine.h>
#include "mme.hpp"

int main(int argc, char* argv[]){

    int procMPI_rank, procMPI_size;

    MPI_Init (&argc,&argv);
    MPI_Comm_rank (MPI_COMM_WORLD, &procMPI_rank);
    MPI_Comm_size (MPI_COMM_WORLD, &procMPI_size);
    if(procMPI_rank == 0){
        mme::printHeader();
        std::cout << std::endl;
        mme::printParallelizationMPI(procMPI_size);
        std::cout << std::endl;
        std::cout << "+---------------------------------------------------------------------------+" << std::endl;
        std::cout << "|                        2-CENTER MME COULOMB INTEGRALS                     |" << std::endl;
        std::cout << "+---------------------------------------------------------------------------+" << std::endl;
    }

    try{
        TCLAP::CmdLine cmd("Periodic 2-center Coulomb integrals with the MME method", ' ', "1.0");
        TCLAP::UnlabeledValueArg<std::string> configArg("file", "Configuration file (cell, atoms, basis and run options)", true, "", "filename", cmd);
        TCLAP::ValueArg<std::string> outputArg("o", "output", "Output file of the integral matrix, overrides the configuration file", false, "", "filename", cmd);
        TCLAP::SwitchArg infoArg("i", "info", "Print the calibration and the G/R split of the integrals", cmd, false);
        cmd.parse(argc, argv);

        mme::ConfigurationMME_MPI config(configArg.getValue(), procMPI_rank, procMPI_size);
        if(infoArg.getValue()){
            config.runInfo.settings.info = true;
        }
        if(!outputArg.getValue().empty()){
            config.runInfo.output = outputArg.getValue();
        }
        mme::Lattice lattice(config.Rbasis());
        mme::CommunicatorMPI comm(MPI_COMM_WORLD);

        if(procMPI_rank == 0){
            std::cout << "Calibrating the MME parameters... " << std::flush;
        }
        auto begin = std::chrono::high_resolution_clock::now();
        mme::ErrorCalibrator calibrator(lattice, config.runInfo.settings, procMPI_rank);
        if(procMPI_rank == 0 && config.runInfo.settings.info){
            std::cout << std::endl;
        }
        mme::IntegralParameters params = calibrator.calibrate(config.kinds, config.runInfo.basis_type);
        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - begin);
        if(procMPI_rank == 0){
            std::cout << "Done! Elapsed wall-clock time: " << std::to_string( elapsed.count() * 1e-3 ) << " seconds." << std::endl;
        }

        mme::IntegralsMME2C integrals(params, comm, config.runInfo.distribution);
        arma::mat hab;
        integrals.integrate(config.kinds, config.atoms, hab, config.runInfo.basis_type, config.runInfo.basis_type);
        integrals.saveIntegrals(hab, config.runInfo.tolerance, config.runInfo.output);
        if(procMPI_rank == 0){
            std::cout << "Values above 10^-" << std::to_string(config.runInfo.tolerance) << " stored in the file: " << config.runInfo.output << std::endl;
        }
    }
    catch(const TCLAP::ArgException& e){
        if(procMPI_rank == 0){
            std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        }
        MPI_Abort(MPI_COMM_WORLD, 1);
    }
    catch(const std::exception& e){
        std::cerr << "Rank " << procMPI_rank << ": " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();
    return 0;

}

/*! @file main.cpp
 *  @brief Exact enumeration driver for the ising_exact::hamiltonian class
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-10
 */

// For time benchmarking
#include <chrono>

// C++ Standard Library headers
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

// Project headers
#include "hamiltonian.hpp"
#include "misc.hpp"
#include "model_io.hpp"

// Third-party headers
// Commonly provided by 'libfmt' packages (at least, on Debian). Check out
// their GitHub, or your system's packaging documentation for info on obtaining
// a copy.
#include <fmt/core.h>
#include <boost/program_options.hpp>

static const char* backend_name(int backend)
{
    switch (backend)
    {
        case ising_exact::BACKEND_THREADS:
            return "std::thread";
        case ising_exact::BACKEND_OPENMP:
            return "OpenMP";
        default:
            return "serial";
    }
}

int run(int argc, char *argv[])
{
    namespace po = boost::program_options;
    po::options_description desc("Supported options");

    auto hw_threads = ising_exact::hamiltonian::max_threads();

    desc.add_options()
        ("help", "Print help info")
        ("model", po::value<std::string>(), "Model file (sites/bond/coupling/field directives)")
        ("tmin", po::value<double>()->default_value(0.5), "Set starting temperature")
        ("tmax", po::value<double>()->default_value(5.), "Set final temperature")
        ("dt", po::value<double>()->default_value(0.1), "Set temperature step")
        ("backend", po::value<int>()->default_value(ising_exact::BACKEND_SERIAL),
            "Set enumeration backend (0 serial, 1 std::thread, 2 OpenMP)")
        ("threads", po::value<unsigned>()->default_value(hw_threads), "Set number of worker threads")
        ("output-dir", po::value<std::string>()->default_value("output"), "Set output directory")
        ("ground-state", po::bool_switch(), "Also search for the lowest energy configuration");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help") || !vm.count("model"))
    {
        std::cout << desc << "\n";
        return 1;
    }

    auto model_file = vm["model"].as<std::string>();
    auto tmin = vm["tmin"].as<double>();
    auto tmax = vm["tmax"].as<double>();
    auto dt = vm["dt"].as<double>();
    auto backend = vm["backend"].as<int>();
    auto nthreads = vm["threads"].as<unsigned>();
    auto output_dir = vm["output-dir"].as<std::string>();
    auto ground = vm["ground-state"].as<bool>();

    if (!(tmin > 0.) || tmax < tmin || !(dt > 0.))
    {
        std::cerr << "Error: need 0 < tmin <= tmax and dt > 0" << std::endl;
        return 1;
    }
    auto N = ising_exact::temperature_count(tmin, tmax, dt);

    auto spec = ising_exact::read_model(model_file);
    ising_exact::hamiltonian ham(spec.couplings, spec.fields);
    ham.set_backend(backend);
    ham.set_threads(nthreads);
    // Throws for models too large to enumerate, before any output is written
    auto nconfigs = ham.num_configs();

    std::cout << "Initializing enumeration with parameters:"
        << "\n\tmodel = " << model_file
        << "\n\tsites = " << ham.size()
        << "\n\tconfigurations = " << nconfigs
        << "\n\ttmin = " << tmin
        << "\n\ttmax = " << tmax
        << "\n\tdt = " << dt
        << "\n\tbackend = " << backend_name(backend)
        << "\n\tthreads = " << ham.get_threads()
        << "\n\toutput-dir = " << output_dir
        << "\n\tground-state = " << ground
        << std::endl;

    if (backend == ising_exact::BACKEND_THREADS)
    {
        auto nworkers = static_cast<unsigned>(std::min<unsigned long long>(ham.get_threads(), nconfigs));
        for (auto i = 0u; i < nworkers; i++)
        {
            auto block = ising_exact::block_range(nconfigs, nworkers, i);
            std::cerr << fmt::format("Thread {} handles indices in range [{},{}]\n",
                    i, block.first, block.last - 1);
        }
    }

    // Example: "output/<sites>/temp_vars.dat"
    output_dir += "/" + std::to_string(ham.size()) + "/";
    std::filesystem::create_directories(output_dir);

    std::ofstream output_file(output_dir + "temp_vars.dat");
    if (!output_file.is_open())
    {
        std::cerr << "Error: cannot write " << output_dir << "temp_vars.dat" << std::endl;
        return 1;
    }
    output_file << "#T    E    M    HC    MS\n";

    auto start = std::chrono::steady_clock::now();
    for (auto i = 0u; i < N; i++)
    {
        auto T = tmin + i * dt;
        auto avg = ham.compute_average_values(T);
        output_file << fmt::format("{:.6f} {:.10g} {:.10g} {:.10g} {:.10g}\n", T,
                avg.energy, avg.magnetization, avg.heat_capacity, avg.susceptibility);
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    std::cout << fmt::format("Wrote {} temperatures to {}temp_vars.dat in {:.3f} s",
            N, output_dir, elapsed.count()) << std::endl;

    if (ground)
    {
        auto gs = ham.get_lowest_energy_config();
        std::cout << fmt::format("Lowest energy = {:.10g}", gs.energy)
            << "\nConfiguration = " << gs.config << std::endl;
    }

    return 0;
}

int main(int argc, char *argv[])
{
    try
    {
        return run(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

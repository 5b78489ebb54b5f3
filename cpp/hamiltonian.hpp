/*! @file hamiltonian.hpp
 *  @brief Ising Hamiltonian class interface
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-04
 */

#ifndef HAMILTONIAN_HPP
#define HAMILTONIAN_HPP

#include <vector>

#include "bitstring.hpp"
#include "misc.hpp"

namespace ising_exact
{
    /*! One entry of a site's coupling list */
    struct coupling
    {
        int neighbor;
        double strength;
    };

    /*! Row i holds the (neighbor, strength) pairs listed for site i */
    typedef std::vector<std::vector<coupling>> coupling_list;

    struct ground_state
    {
        double energy;
        bitstring config;
    };

    /*! Largest site count we are willing to enumerate (2^N configurations) */
    constexpr int MAX_ENUM_SITES = 62;

    /*! H = sum_<ij> J_ij s_i s_j + sum_i mu_i s_i over an arbitrary graph.
     *
     *  Couplings are stored exactly as supplied. energy() only counts an entry
     *  (j, J) of site i when j >= i, so a bond must be listed at both endpoints
     *  to be counted once; an entry listed only at the larger endpoint is dropped.
     */
    class hamiltonian
    {
        public:
            /*! Construct from a per-site coupling list and one field per site */
            hamiltonian(const coupling_list& J, std::vector<double> mu);

            /*! Number of sites */
            int size() const;

            /*! Energy of the input configuration */
            double energy(const bitstring& config) const;

            /*! Exact <E>, <M>, heat capacity and susceptibility at temperature T */
            thermo_averages compute_average_values(double T) const;

            /*! Exhaustive search for the lowest energy configuration. Ties resolve
             *  to the lowest integer index. */
            ground_state get_lowest_energy_config() const;

            /*! Local fields, read-only; the vector always holds N entries */
            const std::vector<double>& fields() const;
            /*! Bounds-checked access to the field at site i, for in-place perturbation */
            double& field(int i);
            double field(int i) const;
            void set_field(int i, double value);

            /*! Neighbor indices and strengths of site i, in input order */
            const std::vector<int>& neighbors(int i) const;
            const std::vector<double>& strengths(int i) const;

            /*! Select the enumeration backend (see ENUM_BACKENDS) */
            void set_backend(int backend);
            /*! Number of workers used by the parallel backends, capped at max_threads() */
            void set_threads(unsigned n);
            int get_backend() const;
            unsigned get_threads() const;
            /*! Hardware concurrency, or 1 when it is unknown */
            static unsigned max_threads();

            /*! 2^N; throws std::invalid_argument above MAX_ENUM_SITES */
            unsigned long long num_configs() const;

        private:
            /*! Running sums over one block of configurations */
            struct partial_sums
            {
                double Z = 0.;
                double E = 0.;
                double EE = 0.;
                double M = 0.;
                double MM = 0.;
            };

            /*! Best configuration found in one block; found is false for an empty block */
            struct partial_min
            {
                bool found = false;
                double emin = 0.;
                unsigned long long index = 0;
            };

            void accumulate_block(double T, index_block block, partial_sums& out) const;
            void minimize_block(index_block block, partial_min& out) const;

            partial_sums sums_serial(double T, unsigned long long total) const;
            partial_sums sums_threads(double T, unsigned long long total) const;
            partial_sums sums_openmp(double T, unsigned long long total) const;

            partial_min min_serial(unsigned long long total) const;
            partial_min min_threads(unsigned long long total) const;
            partial_min min_openmp(unsigned long long total) const;

            void check_site(int i) const;

            int N;
            std::vector<std::vector<int>> nodes;
            std::vector<std::vector<double>> js;
            std::vector<double> mu;

            int algo_backend;
            unsigned nthreads;
    };
}

#endif

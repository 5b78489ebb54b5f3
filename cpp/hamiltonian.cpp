/*! @file hamiltonian.cpp
 *  @brief Ising Hamiltonian class implementation
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-04
 */

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <omp.h>

#include "hamiltonian.hpp"

namespace ising_exact
{
    namespace
    {
        // Partials must arrive in block order; only a strict improvement replaces
        // the earlier block's minimizer.
        template <class It>
        It merge_minima(It first, It last)
        {
            auto best = last;
            for (auto it = first; it != last; ++it)
            {
                if (!it->found)
                {
                    continue;
                }
                if (best == last || it->emin < best->emin)
                {
                    best = it;
                }
            }
            return best;
        }
    }

    hamiltonian::hamiltonian(const coupling_list& J, std::vector<double> mu)
        : N(static_cast<int>(J.size())), mu(std::move(mu)),
        algo_backend(BACKEND_SERIAL), nthreads(1)
    {
        if (N == 0)
        {
            throw std::invalid_argument("hamiltonian needs at least one site");
        }
        if (static_cast<int>(this->mu.size()) != N)
        {
            throw dimension_mismatch(fmt::format("{} sites but {} local fields", N, this->mu.size()));
        }

        // Reshape the input pairs into parallel neighbor/strength arrays
        nodes.resize(N);
        js.resize(N);
        for (auto i = 0; i < N; i++)
        {
            nodes[i].reserve(J[i].size());
            js[i].reserve(J[i].size());
            for (const auto& c : J[i])
            {
                if (c.neighbor < 0 || c.neighbor >= N)
                {
                    throw index_out_of_range(fmt::format("site {} lists neighbor {} outside [0, {})",
                                i, c.neighbor, N));
                }
                nodes[i].push_back(c.neighbor);
                js[i].push_back(c.strength);
            }
        }
    }

    int hamiltonian::size() const
    {
        return N;
    }

    double hamiltonian::energy(const bitstring& config) const
    {
        if (config.size() != N)
        {
            throw dimension_mismatch(fmt::format("configuration has {} sites, hamiltonian has {}",
                        config.size(), N));
        }

        double e = 0.;
        for (auto i = 0; i < N; i++)
        {
            const auto& nbrs = nodes[i];
            const auto& strs = js[i];
            for (std::size_t k = 0; k < nbrs.size(); k++)
            {
                auto j = nbrs[k];
                // Each bond counts once, from its lower endpoint
                if (j < i)
                {
                    continue;
                }
                if (config[i] == config[j])
                {
                    e += strs[k];
                }
                else
                {
                    e -= strs[k];
                }
            }
        }

        for (auto i = 0; i < N; i++)
        {
            e += mu[i] * config.spin(i);
        }
        return e;
    }

    thermo_averages hamiltonian::compute_average_values(double T) const
    {
        if (!(T > 0.))
        {
            throw std::invalid_argument(fmt::format("temperature must be positive, got {}", T));
        }
        auto total = num_configs();

        partial_sums s;
        switch (algo_backend)
        {
            case BACKEND_THREADS:
                s = sums_threads(T, total);
                break;
            case BACKEND_OPENMP:
                s = sums_openmp(T, total);
                break;
            default:
                s = sums_serial(T, total);
                break;
        }

        thermo_averages avg;
        avg.energy = s.E / s.Z;
        avg.magnetization = s.M / s.Z;
        auto EE = s.EE / s.Z;
        auto MM = s.MM / s.Z;
        avg.heat_capacity = (EE - avg.energy * avg.energy) / (T * T);
        avg.susceptibility = (MM - avg.magnetization * avg.magnetization) / T;
        return avg;
    }

    ground_state hamiltonian::get_lowest_energy_config() const
    {
        auto total = num_configs();

        partial_min best;
        switch (algo_backend)
        {
            case BACKEND_THREADS:
                best = min_threads(total);
                break;
            case BACKEND_OPENMP:
                best = min_openmp(total);
                break;
            default:
                best = min_serial(total);
                break;
        }

        bitstring config(N);
        config.from_integer(best.index);
        return {best.emin, config};
    }

    const std::vector<double>& hamiltonian::fields() const
    {
        return mu;
    }

    double& hamiltonian::field(int i)
    {
        check_site(i);
        return mu[i];
    }

    double hamiltonian::field(int i) const
    {
        check_site(i);
        return mu[i];
    }

    void hamiltonian::set_field(int i, double value)
    {
        check_site(i);
        mu[i] = value;
    }

    const std::vector<int>& hamiltonian::neighbors(int i) const
    {
        check_site(i);
        return nodes[i];
    }

    const std::vector<double>& hamiltonian::strengths(int i) const
    {
        check_site(i);
        return js[i];
    }

    void hamiltonian::set_backend(int backend)
    {
        if (backend < 0 || backend >= NUM_BACKENDS)
        {
            throw std::invalid_argument(fmt::format("backend {} not supported", backend));
        }
        algo_backend = backend;
    }

    void hamiltonian::set_threads(unsigned n)
    {
        if (n == 0)
        {
            throw std::invalid_argument("thread count must be at least 1");
        }
        nthreads = std::min(n, max_threads());
    }

    int hamiltonian::get_backend() const
    {
        return algo_backend;
    }

    unsigned hamiltonian::get_threads() const
    {
        return nthreads;
    }

    unsigned hamiltonian::max_threads()
    {
        return std::max(1u, std::thread::hardware_concurrency());
    }

    void hamiltonian::accumulate_block(double T, index_block block, partial_sums& out) const
    {
        // One scratch configuration per worker, overwritten every iteration
        bitstring conf(N);
        for (auto i = block.first; i < block.last; i++)
        {
            conf.from_integer(i);
            auto Ei = energy(conf);
            auto Zi = std::exp(-Ei / T);
            double Mi = conf.magnetization();
            out.E += Ei * Zi;
            out.EE += Ei * Ei * Zi;
            out.M += Mi * Zi;
            out.MM += Mi * Mi * Zi;
            out.Z += Zi;
        }
    }

    void hamiltonian::minimize_block(index_block block, partial_min& out) const
    {
        if (block.first >= block.last)
        {
            return;
        }
        bitstring conf(N);
        conf.from_integer(block.first);
        out.found = true;
        out.emin = energy(conf);
        out.index = block.first;
        for (auto i = block.first + 1; i < block.last; i++)
        {
            conf.from_integer(i);
            auto ecurrent = energy(conf);
            // Strictly smaller only: the earliest index keeps a tie
            if (ecurrent < out.emin)
            {
                out.emin = ecurrent;
                out.index = i;
            }
        }
    }

    hamiltonian::partial_sums hamiltonian::sums_serial(double T, unsigned long long total) const
    {
        partial_sums s;
        accumulate_block(T, {0, total}, s);
        return s;
    }

    hamiltonian::partial_sums hamiltonian::sums_threads(double T, unsigned long long total) const
    {
        auto nworkers = static_cast<unsigned>(std::min<unsigned long long>(nthreads, total));
        std::unique_ptr<partial_sums[]> partials(new partial_sums[nworkers]());

        run_workers(nworkers, [&](unsigned i)
        {
            accumulate_block(T, block_range(total, nworkers, i), partials[i]);
        });

        partial_sums s;
        for (auto i = 0u; i < nworkers; i++)
        {
            s.Z += partials[i].Z;
            s.E += partials[i].E;
            s.EE += partials[i].EE;
            s.M += partials[i].M;
            s.MM += partials[i].MM;
        }
        return s;
    }

    hamiltonian::partial_sums hamiltonian::sums_openmp(double T, unsigned long long total) const
    {
        double Z = 0., E = 0., EE = 0., M = 0., MM = 0.;
        auto count = static_cast<long long>(total);

        #pragma omp parallel num_threads(nthreads) reduction(+:Z,E,EE,M,MM)
        {
            bitstring conf(N);
            #pragma omp for schedule(static)
            for (long long i = 0; i < count; i++)
            {
                conf.from_integer(static_cast<std::uint64_t>(i));
                auto Ei = energy(conf);
                auto Zi = std::exp(-Ei / T);
                double Mi = conf.magnetization();
                E += Ei * Zi;
                EE += Ei * Ei * Zi;
                M += Mi * Zi;
                MM += Mi * Mi * Zi;
                Z += Zi;
            }
        }

        partial_sums s;
        s.Z = Z;
        s.E = E;
        s.EE = EE;
        s.M = M;
        s.MM = MM;
        return s;
    }

    hamiltonian::partial_min hamiltonian::min_serial(unsigned long long total) const
    {
        partial_min best;
        minimize_block({0, total}, best);
        return best;
    }

    hamiltonian::partial_min hamiltonian::min_threads(unsigned long long total) const
    {
        auto nworkers = static_cast<unsigned>(std::min<unsigned long long>(nthreads, total));
        std::vector<partial_min> partials(nworkers);

        run_workers(nworkers, [&](unsigned i)
        {
            minimize_block(block_range(total, nworkers, i), partials[i]);
        });

        return *merge_minima(partials.begin(), partials.end());
    }

    hamiltonian::partial_min hamiltonian::min_openmp(unsigned long long total) const
    {
        std::vector<partial_min> partials(nthreads);

        #pragma omp parallel num_threads(nthreads)
        {
            auto tid = static_cast<unsigned>(omp_get_thread_num());
            auto nt = static_cast<unsigned>(omp_get_num_threads());
            minimize_block(block_range(total, nt, tid), partials[tid]);
        }

        return *merge_minima(partials.begin(), partials.end());
    }

    unsigned long long hamiltonian::num_configs() const
    {
        if (N > MAX_ENUM_SITES)
        {
            throw std::invalid_argument(fmt::format("{} sites is too many to enumerate (limit {})",
                        N, MAX_ENUM_SITES));
        }
        return 1ull << N;
    }

    void hamiltonian::check_site(int i) const
    {
        if (i < 0 || i >= N)
        {
            throw index_out_of_range(fmt::format("site {} outside [0, {})", i, N));
        }
    }
}

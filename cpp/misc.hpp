/*! @file misc.hpp
 *  @brief Shared enums, result records and exception types
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-08
 */

#ifndef MISC_HPP
#define MISC_HPP

#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace ising_exact
{
    enum ENUM_BACKENDS
    {
        BACKEND_SERIAL = 0,
        BACKEND_THREADS = 1,
        BACKEND_OPENMP = 2,
        NUM_BACKENDS = 3
    };

    /*! Raised when a configuration or sequence has the wrong number of sites */
    class dimension_mismatch : public std::length_error
    {
        public:
            explicit dimension_mismatch(const std::string& what)
                : std::length_error(what) {}
    };

    /*! Raised when a site index falls outside [0, N) */
    class index_out_of_range : public std::out_of_range
    {
        public:
            explicit index_out_of_range(const std::string& what)
                : std::out_of_range(what) {}
    };

    struct thermo_averages
    {
        // <E>
        double energy;
        // <M>, with M the net spin sum(2*b - 1)
        double magnetization;
        // (<E^2> - <E>^2) / T^2
        double heat_capacity;
        // (<M^2> - <M>^2) / T
        double susceptibility;
    };

    /*! Half-open index range [first, last) assigned to one worker */
    struct index_block
    {
        unsigned long long first;
        unsigned long long last;
    };

    /*! Splits [0, total) into `count` contiguous blocks; the remainder is spread
     *  over the first (total % count) blocks. */
    inline index_block block_range(unsigned long long total, unsigned count, unsigned i)
    {
        auto blocksize = total / count;
        auto remainder = total % count;
        auto first = i * blocksize + (i < remainder ? i : remainder);
        if (i < remainder)
        {
            blocksize++;
        }
        return {first, first + blocksize};
    }

    /*! Number of points in tmin, tmin + dt, ... up to and including tmax. The
     *  slack keeps tmax on the grid when (tmax - tmin) / dt rounds just below an
     *  integer, e.g. 0.1 to 0.3 in steps of 0.1. */
    inline unsigned temperature_count(double tmin, double tmax, double dt)
    {
        return static_cast<unsigned>(std::floor((tmax - tmin) / dt + 1e-9)) + 1;
    }

    /*! Runs work(i) for i in [0, nworkers), each on its own std::thread, and
     *  joins them all. If a spawn fails, the workers already running are joined
     *  before the exception is rethrown. */
    template <class F>
    void run_workers(unsigned nworkers, F work)
    {
        std::vector<std::thread> threads;
        threads.reserve(nworkers);
        try
        {
            for (auto i = 0u; i < nworkers; i++)
            {
                threads.emplace_back(work, i);
            }
        }
        catch (...)
        {
            for (auto& t : threads)
            {
                t.join();
            }
            throw;
        }
        for (auto& t : threads)
        {
            t.join();
        }
    }
}

#endif

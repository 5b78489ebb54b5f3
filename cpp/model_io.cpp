/*! @file model_io.cpp
 *  @brief Plain-text model file reader
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-10
 */

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

#include "model_io.hpp"

namespace ising_exact
{
    namespace
    {
        void parse_error(std::size_t line_no, const std::string& msg)
        {
            throw std::runtime_error(fmt::format("line {}: {}", line_no, msg));
        }

        int read_site(std::istringstream& ss, std::size_t line_no, int N)
        {
            int i = 0;
            if (!(ss >> i))
            {
                parse_error(line_no, "expected a site index");
            }
            if (i < 0 || i >= N)
            {
                parse_error(line_no, fmt::format("site {} outside [0, {})", i, N));
            }
            return i;
        }

        double read_value(std::istringstream& ss, std::size_t line_no)
        {
            double v = 0.;
            if (!(ss >> v))
            {
                parse_error(line_no, "expected a number");
            }
            return v;
        }
    }

    model_spec parse_model(std::istream& in)
    {
        model_spec spec;
        int N = 0;
        std::size_t line_no = 0;

        for (std::string line; std::getline(in, line);)
        {
            line_no++;
            auto hash = line.find('#');
            if (hash != std::string::npos)
            {
                line.erase(hash);
            }

            std::istringstream ss(line);
            std::string directive;
            if (!(ss >> directive))
            {
                // Blank or comment-only
                continue;
            }

            if (directive == "sites")
            {
                if (N != 0)
                {
                    parse_error(line_no, "'sites' given twice");
                }
                if (!(ss >> N) || N <= 0)
                {
                    parse_error(line_no, "'sites' needs a positive count");
                }
                spec.couplings.assign(N, std::vector<coupling>());
                spec.fields.assign(N, 0.);
            }
            else if (N == 0)
            {
                parse_error(line_no, fmt::format("'{}' before 'sites'", directive));
            }
            else if (directive == "bond" || directive == "coupling")
            {
                auto i = read_site(ss, line_no, N);
                auto j = read_site(ss, line_no, N);
                auto J = read_value(ss, line_no);
                spec.couplings[i].push_back({j, J});
                if (directive == "bond")
                {
                    spec.couplings[j].push_back({i, J});
                }
            }
            else if (directive == "field")
            {
                auto i = read_site(ss, line_no, N);
                spec.fields[i] = read_value(ss, line_no);
            }
            else
            {
                parse_error(line_no, fmt::format("unknown directive '{}'", directive));
            }

            std::string trailing;
            if (ss >> trailing)
            {
                parse_error(line_no, fmt::format("unexpected trailing '{}'", trailing));
            }
        }

        if (N == 0)
        {
            throw std::runtime_error("model has no 'sites' line");
        }
        return spec;
    }

    model_spec read_model(const std::string& fname)
    {
        std::ifstream infile(fname);
        if (!infile.is_open())
        {
            throw std::runtime_error(fmt::format("Error opening model file '{}'", fname));
        }
        return parse_model(infile);
    }
}

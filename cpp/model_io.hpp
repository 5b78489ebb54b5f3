/*! @file model_io.hpp
 *  @brief Plain-text model file reader
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-10
 */

#ifndef MODEL_IO_HPP
#define MODEL_IO_HPP

#include <istream>
#include <string>
#include <vector>

#include "hamiltonian.hpp"

namespace ising_exact
{
    struct model_spec
    {
        coupling_list couplings;
        std::vector<double> fields;
    };

    /*! Parses a model description. One directive per line, '#' starts a comment:
     *
     *      sites N           number of sites; must come before anything else
     *      bond i j J        lists (j, J) at site i and (i, J) at site j
     *      coupling i j J    lists (j, J) at site i only
     *      field i mu        local field at site i (default 0)
     *
     *  Throws std::runtime_error with the offending line number on bad input.
     */
    model_spec parse_model(std::istream& in);

    /*! Opens fname and hands it to parse_model */
    model_spec read_model(const std::string& fname);
}

#endif

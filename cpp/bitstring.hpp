/*! @file bitstring.hpp
 *  @brief Bitstring class interface file
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-08
 */

#ifndef BITSTRING_HPP
#define BITSTRING_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ising_exact
{
    /*! A fixed-length configuration of N bits, one per site. Bit 0 is the most
     *  significant bit of the integer encoding. */
    class bitstring
    {
        public:
            // Underlying data types
            typedef int value_type;
            typedef std::vector<value_type> container;
            typedef container::const_iterator const_iterator;

            /*! Constructs an all-zero configuration of n bits */
            explicit bitstring(int n);

            /*! Number of sites */
            int size() const;
            /*! Number of 1 bits */
            int count_on() const;
            /*! Number of 0 bits */
            int count_off() const;

            /*! Element-access member functions */
            value_type operator[](int i) const { return data[i]; }
            value_type at(int i) const;
            void set(int i, value_type bit);
            const container& bits() const { return data; }

            /*! Toggles bit i in place */
            void flip(int i);
            /*! Copies a 0/1 sequence of length N positionally */
            void set_bits(const std::vector<value_type>& seq);

            /*! Base 10 value of the bits, bit 0 most significant */
            std::uint64_t to_integer() const;
            /*! Sets the bits so that to_integer() == dec. Throws for dec >= 2^N.
             *  The parameter is unsigned, so a negative value cast by the caller
             *  arrives as a large one; below 64 bits that is rejected as out of
             *  range, at 64 bits and above every value is a valid configuration. */
            void from_integer(std::uint64_t dec);

            /*! The +1/-1 spin at site i, mapped from (0,1) with f(x)=2*x-1 */
            int spin(int i) const { return 2 * data[i] - 1; }
            /*! Total spin */
            int magnetization() const;

            /*! Renders as "[ 1 0 1 0 ]" */
            std::string to_string() const;

            const_iterator begin() const { return data.begin(); }
            const_iterator end() const { return data.end(); }

            bool operator==(const bitstring& other) const;
            bool operator!=(const bitstring& other) const { return !(*this == other); }

        private:
            void check_index(int i) const;

            int length;
            container data;
    };

    std::ostream& operator<<(std::ostream& os, const bitstring& bs);
}
#endif

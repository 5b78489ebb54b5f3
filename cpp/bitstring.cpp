/*! @file bitstring.cpp
 *  @brief Bitstring class implementation file
 *  @author Sameed Pervaiz (pervaiz.8@osu.edu)
 *  @copyright GPLv3
 *  @date 2021-05-08
 */

#include "bitstring.hpp"
#include "misc.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

namespace ising_exact
{
    bitstring::bitstring(int n)
        : length(n), data(n > 0 ? n : 0, 0)
    {
        if (n <= 0)
        {
            throw std::invalid_argument(fmt::format("bitstring length must be positive, got {}", n));
        }
    }

    int bitstring::size() const
    {
        return length;
    }

    int bitstring::count_on() const
    {
        return static_cast<int>(std::count(data.begin(), data.end(), 1));
    }

    int bitstring::count_off() const
    {
        return length - count_on();
    }

    int bitstring::at(int i) const
    {
        check_index(i);
        return data[i];
    }

    void bitstring::set(int i, int bit)
    {
        check_index(i);
        if (bit != 0 && bit != 1)
        {
            throw std::invalid_argument(fmt::format("bit value must be 0 or 1, got {}", bit));
        }
        data[i] = bit;
    }

    void bitstring::flip(int i)
    {
        check_index(i);
        data[i] ^= 1;
    }

    void bitstring::set_bits(const std::vector<int>& seq)
    {
        if (static_cast<int>(seq.size()) != length)
        {
            throw dimension_mismatch(fmt::format("expected {} bits, got {}", length, seq.size()));
        }
        // Validate everything first so a bad sequence leaves us untouched
        for (auto b : seq)
        {
            if (b != 0 && b != 1)
            {
                throw std::invalid_argument(fmt::format("bit value must be 0 or 1, got {}", b));
            }
        }
        std::copy(seq.begin(), seq.end(), data.begin());
    }

    std::uint64_t bitstring::to_integer() const
    {
        if (length > 64)
        {
            throw std::overflow_error(fmt::format("{} bits do not fit in a 64-bit integer", length));
        }
        // Horner's rule, walking from the most significant bit
        std::uint64_t dec = 0;
        for (auto b : data)
        {
            dec = (dec << 1) | static_cast<std::uint64_t>(b);
        }
        return dec;
    }

    void bitstring::from_integer(std::uint64_t dec)
    {
        if (length < 64 && dec >= (std::uint64_t{1} << length))
        {
            throw std::invalid_argument(fmt::format("{} is out of range for {} bits", dec, length));
        }
        for (auto x = length - 1; x >= 0; x--)
        {
            data[x] = static_cast<int>(dec & 1u);
            dec >>= 1;
        }
    }

    int bitstring::magnetization() const
    {
        return 2 * count_on() - length;
    }

    std::string bitstring::to_string() const
    {
        std::string str = "[ ";
        for (auto b : data)
        {
            str += fmt::format("{} ", b);
        }
        str += "]";
        return str;
    }

    bool bitstring::operator==(const bitstring& other) const
    {
        return length == other.length && data == other.data;
    }

    void bitstring::check_index(int i) const
    {
        if (i < 0 || i >= length)
        {
            throw index_out_of_range(fmt::format("site {} outside [0, {})", i, length));
        }
    }

    std::ostream& operator<<(std::ostream& os, const bitstring& bs)
    {
        return os << bs.to_string();
    }
}

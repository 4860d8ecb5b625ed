// print the GCD of a fixed pair of integers

#include <cstdint>
#include <iostream>

#include "gcd.hpp"

int main()
{
    std::uint32_t result = euclid::find_gcd(120, 48);
    std::cout << result << "\n";
}

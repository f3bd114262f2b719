/** \file
 *
 * \brief Definition of general purpose utilities
 *
 * Although the utilities in this file do not depend on the War specific
 * classes, they are inside the WarCheck namespace to avoid name conflicts.
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <concepts>
#include <ranges>
#include <stdexcept>
#include <type_traits>

namespace WarCheck {

/** \brief Range over integers
 *
 * Generate an increasing range over integers from \p m to \p n
 * (exclusive). This can be used in ranged for
 *
 * \code{.cc}
 * for (const auto i : from_to(1, 27)) {
 *     std::cout << "Round " << i << std::endl;
 * }
 * \endcode
 *
 * \param m the lower bound
 * \param n the upper bound
 *
 * \return A range from \p m to \p n (exclusive upper bound)
 *
 * \throw std::invalid_argument if \p m > \p n
 *
 * \sa to()
 */
template<std::integral Integer>
constexpr auto from_to(std::type_identity_t<Integer> m, Integer n)
{
    if (m > n) {
        throw std::invalid_argument {"Invalid integer range"};
    }
    return std::ranges::views::iota(m, n);
}

/** \brief Shorthand for from_to(0, n)
 *
 * \param n the upper bound of the range
 *
 * \return A range from 0 to \p n (exclusive upper bound)
 *
 * \throw std::invalid_argument if \p n < 0
 *
 * \sa from_to()
 */
template<std::integral Integer>
constexpr auto to(Integer n)
{
    return from_to(Integer {}, n);
}

}

#endif // UTILITY_HH_

/** \file
 *
 * \brief Definition of general purpose utilities
 *
 * Although the utilities in this do not depend on any other classes or
 * functions inside the Whoopie namespace, the functions are still inside the
 * namespace to avoid name conflicts.
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <cstddef>
#include <ranges>
#include <stdexcept>
#include <type_traits>

namespace Whoopie {

/** \brief Check if 0 <= i < n
 *
 * \param i the index to check
 * \param n the upper bound
 *
 * \return i, if 0 <= i < n
 *
 * \throw std::out_of_range, if i < 0 || i >= n
 */
template<typename Integer1, typename Integer2>
constexpr auto checkIndex(Integer1 i, Integer2 n)
{
    if (i < 0 || i >= n) {
        throw std::out_of_range("Index out of range");
    }
    return i;
}

/** \brief Check if pointer (or pointer‐like object) is dereferencable, and
 * dereference it
 *
 * \param p pointer to be referenced
 *
 * \return reference to whatever p points to
 *
 * \throw std::invalid_argument, if p is null
 */
template<typename T>
constexpr decltype(auto) dereference(const T& p)
{
    if (!p) {
        throw std::invalid_argument("Trying to dereference nullptr");
    }
    return *p;
}

/** \brief Range over integers
 *
 * Generate an increasing range over integers from \p m to \p n
 * (exclusive). This can be used in ranged for
 *
 * \code{.cc}
 * for (const auto i : from_to(271, 314)) {
 *     std::cout << i << std::endl;
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

/** \brief Signed size of a container
 *
 * \param c a sized container
 *
 * \return the size of \p c as int
 */
template<typename Container>
constexpr int isize(const Container& c)
{
    return static_cast<int>(std::size(c));
}

}

#endif // UTILITY_HH_

/** \file
 *
 * \brief Definition of fundamental War constants needed by several classes
 */

#ifndef WARCONSTANTS_HH_
#define WARCONSTANTS_HH_

#include <array>

/** \brief Top level namespace of the WarCheck framework
 *
 * The WarCheck namespace directly contains classes related to fundamental
 * concepts of the card game War and its transcripts. It also contains
 * subnamespaces for clearly identifiable collections of higher level
 * functionality.
 */
namespace WarCheck {

/** \brief Number of players in War game
 */
constexpr auto N_PLAYERS = 2;

/** \brief Number of cards in playing card deck
 */
constexpr auto N_CARDS = 52;

/** \brief Number of cards dealt to each player
 */
constexpr auto N_CARDS_PER_PLAYER = N_CARDS / N_PLAYERS; // 26

/** \brief Player number of the first player
 */
constexpr auto PLAYER_1 = 1;

/** \brief Player number of the second player
 */
constexpr auto PLAYER_2 = 2;

/** \brief Player numbers in playing order
 */
constexpr std::array<int, N_PLAYERS> PLAYERS {PLAYER_1, PLAYER_2};

}

#endif // WARCONSTANTS_HH_

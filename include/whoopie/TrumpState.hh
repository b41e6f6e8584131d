/** \file
 *
 * \brief Definition of the trump state and its transition function
 */

#ifndef TRUMPSTATE_HH_
#define TRUMPSTATE_HH_

#include "whoopie/Card.hh"

#include <iosfwd>
#include <optional>
#include <variant>

namespace Whoopie {

/** \brief The live trump state of a stanza
 *
 * When \ref jTrumpActive is set, no fixed trump suit is locked in: all cards
 * are trump in a trick led by a joker, and the led suit is trump after a
 * joker was played to the trick.
 */
struct TrumpState {
    std::optional<Suit> trumpSuit;  ///< \brief The trump suit, if any
    bool jTrumpActive {false};      ///< \brief Is J-Trump in effect

    /// \brief Equality comparison
    bool operator==(const TrumpState&) const = default;
};

/** \brief The effect of playing a card on the trump state
 *
 * \sa getTrumpStateAfterPlay()
 */
struct TrumpChange {
    std::optional<Suit> newTrumpSuit;  ///< \brief Trump suit after the play
    bool newJTrumpActive {false};      ///< \brief J-Trump after the play
    bool wasWhoopie {false};           ///< \brief Did a Whoopie card set trump
    bool wasScramble {false};          ///< \brief Was the card a joker

    /** \brief The trump state after the play
     */
    TrumpState getTrumpState() const;

    /// \brief Equality comparison
    bool operator==(const TrumpChange&) const = default;
};

/** \brief Whoopie rank not yet defined
 *
 * This is the state of a stanza whose defining card was a joker, until a suit
 * card is led. The lead defines the Whoopie rank and the trump suit.
 */
struct PendingDefinition {
    /// \brief Equality comparison
    bool operator==(const PendingDefinition&) const = default;
};

/** \brief Whoopie rank defined for the rest of the stanza
 */
struct DefinedWhoopieRank {
    Rank rank;  ///< \brief The Whoopie rank

    /// \brief Equality comparison
    bool operator==(const DefinedWhoopieRank&) const = default;
};

/** \brief The definition state of the Whoopie rank in a stanza
 */
using WhoopieDefinition = std::variant<PendingDefinition, DefinedWhoopieRank>;

/** \brief Get the Whoopie rank
 *
 * \return the Whoopie rank, or none if the definition is pending
 */
std::optional<Rank> getWhoopieRank(const WhoopieDefinition& definition);

/** \brief Determine if the Whoopie rank is still to be defined by a lead
 */
bool isDefinitionPending(const WhoopieDefinition& definition);

/** \brief Trump state derived from the Whoopie defining card
 */
struct InitialTrump {
    WhoopieDefinition definition;  ///< \brief Whoopie rank definition
    TrumpState trump;              ///< \brief Initial trump state

    /// \brief Equality comparison
    bool operator==(const InitialTrump&) const = default;
};

/** \brief Derive the initial trump state from the defining card
 *
 * A suit card defines the Whoopie rank and the trump suit. A joker leaves both
 * undefined (J-Trump active) until the first lead.
 *
 * \param definingCard the card turned up after dealing
 *
 * \return the initial definition and trump state
 */
InitialTrump makeInitialTrump(const Card& definingCard);

/** \brief Outcome of a lead with respect to the Whoopie rank definition
 *
 * \sa defineFromLead()
 */
struct LeadDefinition {
    WhoopieDefinition definition;  ///< \brief Definition after the lead
    TrumpState trump;              ///< \brief Trump state before the lead card
                                   ///< takes effect
    bool autoWin {false};          ///< \brief Does the lead win automatically

    /// \brief Equality comparison
    bool operator==(const LeadDefinition&) const = default;
};

/** \brief Resolve the Whoopie rank definition for a lead
 *
 * If the definition is already done, nothing changes. While pending, a suit
 * card led defines the Whoopie rank to be its rank and the trump suit to be
 * its suit. A joker led while pending wins the trick automatically, and the
 * definition stays pending until the next lead of the same player.
 *
 * \param definition the current definition state
 * \param trump the current trump state
 * \param leadCard the card led
 *
 * \return the definition and the trump state in effect for \p leadCard
 */
LeadDefinition defineFromLead(
    const WhoopieDefinition& definition, const TrumpState& trump,
    const Card& leadCard);

/** \brief Determine the trump change caused by playing a card
 *
 * - A joker led makes every card trump for the trick and activates J-Trump.
 * - A joker played to a trick makes the led suit trump for the rest of the
 *   trick and activates J-Trump until the next Whoopie card.
 * - A Whoopie card (a suit card of the Whoopie rank) makes its suit trump and
 *   cancels J-Trump.
 * - Other cards change nothing.
 *
 * \param card the card played
 * \param trump the trump state before the play
 * \param whoopieRank the Whoopie rank, if defined
 * \param leadSuit the suit led to the trick, if any
 * \param isLead is \p card the first card of the trick
 *
 * \return the trump change
 */
TrumpChange getTrumpStateAfterPlay(
    const Card& card, const TrumpState& trump,
    std::optional<Rank> whoopieRank, std::optional<Suit> leadSuit,
    bool isLead);

/** \brief Output a TrumpState to stream
 */
std::ostream& operator<<(std::ostream& os, const TrumpState& trump);

/** \brief Output a PendingDefinition to stream
 */
std::ostream& operator<<(std::ostream& os, const PendingDefinition&);

/** \brief Output a DefinedWhoopieRank to stream
 */
std::ostream& operator<<(std::ostream& os, const DefinedWhoopieRank& defined);

}

#endif // TRUMPSTATE_HH_

#pragma once
#include <string>
#include <vector>
#include "../core/Card.hpp"

// Per-deck counts over the cards' state and due date.
struct DeckStats {
    std::string deck;
    int total = 0;
    int due = 0;
    int fresh = 0; // state New
    int learning = 0;
    int review = 0;
    int relearning = 0;
};

// One entry per deck, in order of first appearance. New cards always count
// as due.
std::vector<DeckStats> computeDeckStats(const std::vector<Card>& cards, TimePoint now);

// Review queue for one deck: due Learning/Review/Relearning cards, oldest due
// first, followed by at most `new_limit` New cards.
std::vector<Card*> dueCards(std::vector<Card>& cards, const std::string& deck, TimePoint now, std::size_t new_limit = 20);

#include "DeckQueries.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::vector<DeckStats> computeDeckStats(const std::vector<Card>& cards, TimePoint now) {
    std::vector<DeckStats> stats;

    for (const auto& c : cards) {
        auto it = std::find_if(stats.begin(), stats.end(),
            [&c](const DeckStats& s) { return s.deck == c.deck; });
        if (it == stats.end()) {
            stats.push_back(DeckStats{});
            stats.back().deck = c.deck;
            it = stats.end() - 1;
        }

        DeckStats& s = *it;
        s.total++;
        if (c.isDue(now)) s.due++;

        switch (c.schedule.state) {
        case CardState::New:        s.fresh++; break;
        case CardState::Learning:   s.learning++; break;
        case CardState::Review:     s.review++; break;
        case CardState::Relearning: s.relearning++; break;
        }
    }

    return stats;
}

std::vector<Card*> dueCards(std::vector<Card>& cards, const std::string& deck, TimePoint now, std::size_t new_limit) {
    std::vector<Card*> due;
    std::vector<Card*> fresh;

    for (auto& c : cards) {
        if (c.deck != deck) continue;
        if (c.schedule.state == CardState::New) {
            if (fresh.size() < new_limit) fresh.push_back(&c);
        }
        else if (c.schedule.due_date <= now) {
            due.push_back(&c);
        }
    }

    std::stable_sort(due.begin(), due.end(),
        [](const Card* a, const Card* b) {
            return a->schedule.due_date < b->schedule.due_date;
        });

    spdlog::debug("Deck '{}': {} due, {} new queued", deck, due.size(), fresh.size());
    due.insert(due.end(), fresh.begin(), fresh.end());
    return due;
}

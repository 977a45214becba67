#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <limits>
#include <exception>
#include <memory>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "../core/Scheduler.hpp"
#include "../core/SchedulerConfig.hpp"
#include "../storage/DeckQueries.hpp"
#include "../storage/Storage.hpp"

void listAllCards(const std::vector<Card>& cards) {
    std::cout << "\n===== ALL CARDS =====\n";

    if (cards.empty()) {
        std::cout << "No cards stored.\n";
        return;
    }

    TimePoint now = Clock::now();
    for (size_t i = 0; i < cards.size(); i++) {
        const Card& c = cards[i];
        const SchedulingRecord& s = c.schedule;
        std::cout << i + 1 << ". [" << c.deck << "] " << c.front << "\n";
        std::cout << "   State: " << stateToString(s.state) << "\n";
        if (s.state != CardState::New) {
            std::cout << "   Stability: " << std::fixed << std::setprecision(2) << s.stability << " days\n";
            std::cout << "   Difficulty: " << s.difficulty << "\n";
            std::cout << "   Recall now: " << std::setprecision(1)
                << currentRetrievability(s, now) * 100.0 << "%\n";
            std::cout << "   Interval: " << s.scheduled_days << " days\n";
            std::cout << "   Due: " << formatDueDate(s.due_date) << "\n";
        }
        std::cout << "   Reps: " << s.reps << "  Lapses: " << s.lapses << "\n";
        std::cout << "-----------------------------\n";
    }
}

void showDeckStats(const std::vector<Card>& cards) {
    std::cout << "\n===== DECKS =====\n";
    auto stats = computeDeckStats(cards, Clock::now());
    if (stats.empty()) {
        std::cout << "No decks.\n";
        return;
    }
    for (const auto& s : stats) {
        std::cout << s.deck << ": " << s.total << " cards, " << s.due << " due"
            << " (new " << s.fresh
            << ", learning " << s.learning
            << ", review " << s.review
            << ", relearning " << s.relearning << ")\n";
    }
}

Rating askRating(const IntervalPreview& preview) {
    while (true) {
        std::cout << "\nHow well did you remember?\n"
            " 1 = AGAIN (" << preview[Rating::Again].label << ")\n"
            " 2 = HARD  (" << preview[Rating::Hard].label << ")\n"
            " 3 = GOOD  (" << preview[Rating::Good].label << ")\n"
            " 4 = EASY  (" << preview[Rating::Easy].label << ")\n> ";
        int q;
        if (std::cin >> q) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            try {
                return parseRating(q);
            }
            catch (const InvalidRatingError& e) {
                std::cout << e.what() << "\n";
                continue;
            }
        }
        if (std::cin.eof()) throw std::runtime_error("input closed");
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Invalid input.\n";
    }
}

void reviewDeck(std::vector<Card>& cards, Scheduler& scheduler) {
    std::string deck;
    std::cout << "Deck to review: "; std::getline(std::cin, deck);

    auto due = dueCards(cards, deck, Clock::now());
    if (due.empty()) { std::cout << "No cards due.\n"; return; }

    for (auto* card : due) {
        TimePoint now = Clock::now();
        std::cout << "\n[" << stateToString(card->schedule.state) << "] " << card->front << "\n";
        std::cout << "(press Enter to show the answer)";
        std::string dummy; std::getline(std::cin, dummy);
        std::cout << card->back << "\n";

        try {
            IntervalPreview preview = scheduler.preview(card->schedule, now);
            if (card->schedule.state != CardState::New) {
                std::cout << "Chance you remembered: " << std::fixed << std::setprecision(1)
                    << preview.retrievability * 100.0 << "%\n";
            }

            Rating rating = askRating(preview);
            ReviewOutcome out = scheduler.review(card->schedule, rating, Clock::now());
            card->schedule = out.record;
            std::cout << "Next review: " << formatDueDate(card->schedule.due_date) << "\n";
        }
        catch (const CorruptRecordError& e) {
            spdlog::error("Card {} skipped: {}", card->id, e.what());
            std::cout << "Card skipped: " << e.what() << "\n";
        }
    }
}

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "usage: " << argv[0] << " <deck-file> [config-file]\n";
        return 2;
    }
    const std::string deckFile = argv[1];

    SchedulerConfig config = SchedulerConfig::defaults();
    try {
        if (argc == 3) config = SchedulerConfig::loadFile(argv[2]);
    }
    catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    Log::init(config.log_level);

    std::string passphrase;
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);
    if (passphrase.empty()) { std::cerr << "Passphrase required.\n"; return 1; }

    std::vector<Card> cards;
    if (!Storage::loadDeck(cards, deckFile, passphrase)) {
        std::cerr << "Could not open deck '" << deckFile << "' (see log).\n";
        return 1;
    }

    std::unique_ptr<Scheduler> scheduler;
    try {
        scheduler = std::make_unique<Scheduler>(config);
    }
    catch (const std::runtime_error& e) {
        spdlog::critical("Scheduler unavailable: {}", e.what());
        std::cerr << "Could not start the scheduler: " << e.what() << "\n";
        return 1;
    }

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "1. Add Card\n"
            "2. Review Deck\n"
            "3. List All Cards\n"
            "4. Deck Overview\n"
            "5. Save & Exit\n> ";

        int choice;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            std::cin.clear(); std::string dummy; std::getline(std::cin, dummy);
            continue;
        }
        std::cin.ignore();

        if (choice == 1) {
            std::string deck, front, back;
            std::cout << "Deck: "; std::getline(std::cin, deck);
            std::cout << "Question: "; std::getline(std::cin, front);
            if (deck.empty() || front.empty()) { std::cout << "Deck and question required.\n"; continue; }
            std::cout << "Answer: "; std::getline(std::cin, back);

            cards.emplace_back(deck, front, back);
            std::cout << "Card added.\n";
        }
        else if (choice == 2) {
            try {
                reviewDeck(cards, *scheduler);
            }
            catch (const std::runtime_error& e) {
                std::cout << "\nReview aborted: " << e.what() << "\n";
                break;
            }
        }
        else if (choice == 3) {
            listAllCards(cards);
        }
        else if (choice == 4) {
            showDeckStats(cards);
        }
        else if (choice == 5) {
            break;
        }
        else std::cout << "Invalid.\n";
    }

    if (!Storage::saveDeck(cards, deckFile, passphrase)) {
        std::cout << "Error saving deck.\n";
        return 1;
    }
    std::cout << "Goodbye!\n";
    return 0;
}

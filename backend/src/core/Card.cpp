#include "Card.hpp"
#include <chrono>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

Card::Card(const std::string& d, const std::string& f, const std::string& b)
    : deck(d), front(f), back(b)
{
    id = generateID();
    schedule.due_date = Clock::now(); // new cards are due right away
    spdlog::info("Created Card: ID={}, Deck={}", id, deck);
}

bool Card::isDue(TimePoint now) const {
    return schedule.state == CardState::New || schedule.due_date <= now;
}

// "<creation millis in hex>-<64 random bits in hex>"
std::string Card::generateID() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    auto created = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();

    unsigned char nonce[8];
    randombytes_buf(nonce, sizeof nonce);
    char hex[sizeof nonce * 2 + 1];
    sodium_bin2hex(hex, sizeof hex, nonce, sizeof nonce);

    return fmt::format("{:x}-{}", created, hex);
}

#pragma once
#include <string>
#include "SchedulingRecord.hpp"

class Card {
public:
    Card() = default;
    Card(const std::string& deck, const std::string& front, const std::string& back = "");

    // Basic fields
    std::string id;          // Auto-generated
    std::string deck;        // Theme the card belongs to
    std::string front;       // Question
    std::string back;        // Answer

    SchedulingRecord schedule;

    bool isDue(TimePoint now) const;

    // Throws std::runtime_error if libsodium cannot be initialised.
    static std::string generateID();
};

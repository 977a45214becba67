#pragma once
#include <vector>
#include <string>
#include "../core/Card.hpp"

// Storage handles per-deck encrypted card files.
//
// Deck file format:
//   Header: 8 bytes ASCII "RVDECK1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (key = Argon2id(passphrase, salt))
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// The plaintext is one block per card:
//   id \n deck \n front \n back \n
//   state stability difficulty scheduled_days due last_review reps lapses step \n
//   ---
// with newlines and backslashes inside text fields escaped, and the
// scheduling numbers in StoredRecord form. A schedule line of the form
//   sm2 ease interval due last_review reps lapses
// is an old SM-2 row; it is migrated on load and saved back in FSRS form.

class Storage {
public:
    static bool saveDeck(const std::vector<Card>& cards, const std::string& filename, const std::string& passphrase);

    // A missing file loads as an empty deck and succeeds.
    static bool loadDeck(std::vector<Card>& cards, const std::string& filename, const std::string& passphrase);

    static std::string serializeCards(const std::vector<Card>& cards);
    static bool parseCards(const std::string& plain, std::vector<Card>& cards);
};

#include "Storage.hpp"
#include "StoredRecord.hpp"
#include <fstream>
#include <sstream>
#include <cstring>
#include <iterator>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "RVDECK1\n";

static std::string escapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else out += c;
    }
    return out;
}

static std::string unescapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            ++i;
            out += (s[i] == 'n') ? '\n' : s[i];
        }
        else {
            out += s[i];
        }
    }
    return out;
}

// Derives the secretbox key from a passphrase. Returns false on failure.
static bool deriveKey(const std::string& passphrase, const unsigned char* salt, std::vector<unsigned char>& key) {
    key.assign(crypto_secretbox_KEYBYTES, 0);

    if (crypto_pwhash(key.data(),
        key.size(),
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt,
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation");
        key.clear();
        return false;
    }
    return true;
}

static void wipeKey(std::vector<unsigned char>& key) {
    if (!key.empty()) {
        sodium_memzero(key.data(), key.size());
        key.clear();
    }
}

std::string Storage::serializeCards(const std::vector<Card>& cards) {
    std::ostringstream oss;

    for (const auto& c : cards) {
        StoredRecord r = encodeRecord(c.schedule);
        oss << escapeField(c.id) << "\n"
            << escapeField(c.deck) << "\n"
            << escapeField(c.front) << "\n"
            << escapeField(c.back) << "\n"
            << r.state << " "
            << r.stability << " "
            << r.difficulty << " "
            << r.scheduled_days << " "
            << r.due_date << " "
            << r.last_review << " "
            << r.reps << " "
            << r.lapses << " "
            << r.step << "\n"
            << "---\n";
    }

    return oss.str();
}

bool Storage::parseCards(const std::string& plain, std::vector<Card>& cards) {
    std::istringstream iss(plain);
    cards.clear();

    std::string line;
    while (std::getline(iss, line)) {
        Card c;
        c.id = unescapeField(line);

        std::string deck, front, back, numbers;
        if (!std::getline(iss, deck) || !std::getline(iss, front) ||
            !std::getline(iss, back) || !std::getline(iss, numbers)) {
            spdlog::error("Truncated card block after id '{}'", c.id);
            return false;
        }
        c.deck = unescapeField(deck);
        c.front = unescapeField(front);
        c.back = unescapeField(back);

        StoredRecord r;
        std::istringstream nss(numbers);
        if (numbers.compare(0, 4, "sm2 ") == 0) {
            LegacyRecord legacy;
            std::string tag;
            if (!(nss >> tag >> legacy.ease >> legacy.interval >> legacy.due_date
                >> legacy.last_review >> legacy.reps >> legacy.lapses)) {
                spdlog::error("Malformed SM-2 schedule line for card '{}'", c.id);
                return false;
            }
            r = migrateLegacyRecord(legacy);
            spdlog::info("Migrated SM-2 schedule of card '{}' (ease {})", c.id, legacy.ease);
        }
        else if (!(nss >> r.state >> r.stability >> r.difficulty >> r.scheduled_days
            >> r.due_date >> r.last_review >> r.reps >> r.lapses >> r.step)) {
            spdlog::error("Malformed schedule line for card '{}'", c.id);
            return false;
        }
        c.schedule = decodeRecord(r);

        std::string sep;
        if (!std::getline(iss, sep) || sep != "---") {
            spdlog::error("Missing separator after card '{}'", c.id);
            return false;
        }

        cards.push_back(c);
    }

    return true;
}

bool Storage::saveDeck(const std::vector<Card>& cards, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Saving {} encrypted cards to '{}'", cards.size(), filename);
    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        return false;
    }
    if (passphrase.empty()) {
        spdlog::error("Refusing to save deck with an empty passphrase");
        return false;
    }

    unsigned char salt[crypto_pwhash_SALTBYTES];
    randombytes_buf(salt, sizeof(salt));

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::string plain = serializeCards(cards);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    wipeKey(key);
    if (rc != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(salt), sizeof(salt));
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

bool Storage::loadDeck(std::vector<Card>& cards, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Loading encrypted cards from '{}'", filename);
    cards.clear();

    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Deck file '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    unsigned char salt[crypto_pwhash_SALTBYTES];
    in.read(reinterpret_cast<char*>(salt), sizeof(salt));
    if (in.gcount() != sizeof(salt)) {
        spdlog::error("Failed to read salt");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    // one spare byte so an empty deck still gets a valid buffer
    size_t plen = ciphertext.size() - crypto_secretbox_MACBYTES;
    std::vector<unsigned char> plain(plen + 1);
    int rc = crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data());
    wipeKey(key);
    if (rc != 0) {
        spdlog::error("Decryption failed (wrong passphrase or damaged file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plen);
    if (!parseCards(plain_str, cards)) {
        cards.clear();
        return false;
    }

    spdlog::info("Loaded {} cards", cards.size());
    return true;
}

#pragma once
#include <string>
#include <vector>
#include "../core/CardState.hpp"
#include "../core/StudyItem.hpp"
#include "Repositories.hpp"

// Everything a learner's deck file holds.
struct DeckSnapshot {
    std::vector<StudyItem> items;
    std::vector<CardState> cards;
    std::vector<ReviewRecord> history;
    std::vector<SessionRecord> sessions;
};

// Storage handles the encrypted deck file.
//
// Layout:
//   Header: 8 bytes ASCII "RCDECK1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (key derivation)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// The key is derived from the passphrase with crypto_pwhash (Argon2id).
// The plaintext is the line-based text produced by serializeDeck().
class Storage {
public:
    static bool saveDeck(const DeckSnapshot& deck, const std::string& filename, const std::string& passphrase);

    // A missing file yields an empty deck and returns true.
    static bool loadDeck(DeckSnapshot& deck, const std::string& filename, const std::string& passphrase);

    static std::string serializeDeck(const DeckSnapshot& deck);
    // Throws PersistenceError (or ValidationError for out-of-range enums) on malformed input.
    static DeckSnapshot parseDeck(const std::string& plain);
};

#include "storage.hpp"
#include "../utils/Errors.hpp"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "RCDECK1\n";
static const char FORMAT_LINE[] = "recollect-deck 1";
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

namespace {

/* -------------------------
   Text encoding helpers
   ------------------------- */

std::string escapeField(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char ch : in) {
        switch (ch) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default: out += ch;
        }
    }
    return out;
}

std::string unescapeField(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '\\' || i + 1 == in.size()) {
            out += in[i];
            continue;
        }
        char next = in[++i];
        switch (next) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        default: out += next;
        }
    }
    return out;
}

std::vector<std::string> splitTabs(const std::string& line) {
    std::vector<std::string> parts;
    std::string cur;
    for (char ch : line) {
        if (ch == '\t') {
            parts.push_back(cur);
            cur.clear();
        }
        else {
            cur += ch;
        }
    }
    parts.push_back(cur);
    return parts;
}

template <typename T>
void writeOptional(std::ostream& os, const std::optional<T>& v) {
    if (v) os << *v;
    else os << "-";
}

template <typename T>
std::optional<T> readOptional(std::istream& is) {
    std::string tok;
    if (!(is >> tok))
        throw PersistenceError("Unexpected end of record");
    if (tok == "-")
        return std::nullopt;
    std::istringstream ts(tok);
    T v{};
    if (!(ts >> v))
        throw PersistenceError("Malformed value '" + tok + "'");
    return v;
}

template <typename T>
T readValue(std::istream& is, const char* what) {
    T v{};
    if (!(is >> v))
        throw PersistenceError(std::string("Malformed or missing ") + what);
    return v;
}

std::size_t readSectionHeader(std::istream& in, const std::string& name) {
    std::string line;
    if (!std::getline(in, line))
        throw PersistenceError("Missing '" + name + "' section");
    std::istringstream ls(line);
    std::string got;
    std::size_t count = 0;
    if (!(ls >> got >> count) || got != name)
        throw PersistenceError("Expected '" + name + "' section, got '" + line + "'");
    return count;
}

std::string nextLine(std::istream& in, const std::string& section) {
    std::string line;
    if (!std::getline(in, line))
        throw PersistenceError("Truncated '" + section + "' section");
    return line;
}

bool deriveKey(std::vector<unsigned char>& key, const std::string& passphrase, const unsigned char* salt) {
    key.assign(ENC_KEY_BYTES, 0);
    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt,
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during deck key derivation (likely out of memory)");
        key.clear();
        return false;
    }
    return true;
}

void wipe(std::vector<unsigned char>& key) {
    if (!key.empty())
        sodium_memzero(key.data(), key.size());
    key.clear();
}

} // namespace

/* -------------------------
   Plaintext format
   ------------------------- */

std::string Storage::serializeDeck(const DeckSnapshot& deck) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << FORMAT_LINE << "\n";

    oss << "items " << deck.items.size() << "\n";
    for (const auto& it : deck.items) {
        oss << it.item_id << "\t"
            << escapeField(it.prompt) << "\t"
            << escapeField(it.answer) << "\t"
            << escapeField(it.category) << "\t"
            << escapeField(it.tagsAsLine()) << "\n";
    }

    oss << "cards " << deck.cards.size() << "\n";
    for (const auto& c : deck.cards) {
        oss << c.card_id << " " << c.learner_id << " " << c.item_id << " "
            << c.difficulty << " " << c.stability << " " << c.retrievability << " "
            << static_cast<int>(c.phase) << " " << c.review_count << " " << c.lapse_count << " " << c.success_count << " ";
        writeOptional(oss, c.last_review);
        oss << " " << c.next_review << " " << c.created_at << " " << c.updated_at << "\n";
    }

    oss << "history " << deck.history.size() << "\n";
    for (const auto& r : deck.history) {
        oss << r.review_id << " " << r.card_id << " " << r.item_id << " " << r.learner_id << " "
            << ratingValue(r.rating) << " " << r.response_time_ms << " "
            << r.difficulty_before << " " << r.stability_before << " " << r.retrievability_before << " "
            << static_cast<int>(r.phase_before) << " "
            << r.difficulty_after << " " << r.stability_after << " " << r.retrievability_after << " "
            << static_cast<int>(r.phase_after) << " " << r.interval_days << " ";
        writeOptional(oss, r.session_id);
        oss << " " << r.reviewed_at << "\n";
    }

    oss << "sessions " << deck.sessions.size() << "\n";
    for (const auto& s : deck.sessions) {
        oss << s.session_id << " " << s.learner_id << " "
            << sessionTypeName(s.type) << " " << sessionStatusName(s.status) << " "
            << s.start_time << " ";
        writeOptional(oss, s.end_time);
        oss << " " << s.duration_seconds << " " << s.questions_reviewed << " " << s.questions_correct << " "
            << s.average_response_time_ms << " " << s.retention_rate << " "
            << s.target_retention << " " << s.max_reviews << "\n";
    }

    return oss.str();
}

DeckSnapshot Storage::parseDeck(const std::string& plain) {
    std::istringstream in(plain);
    DeckSnapshot deck;

    std::string header;
    if (!std::getline(in, header) || header != FORMAT_LINE)
        throw PersistenceError("Unsupported deck format");

    std::size_t n = readSectionHeader(in, "items");
    for (std::size_t i = 0; i < n; ++i) {
        std::vector<std::string> f = splitTabs(nextLine(in, "items"));
        if (f.size() != 5)
            throw PersistenceError("Item row has " + std::to_string(f.size()) + " fields, expected 5");
        StudyItem item;
        try {
            item.item_id = std::stoll(f[0]);
        }
        catch (const std::exception&) {
            throw PersistenceError("Malformed item id '" + f[0] + "'");
        }
        item.prompt = unescapeField(f[1]);
        item.answer = unescapeField(f[2]);
        item.category = unescapeField(f[3]);
        item.setTags(StudyItem::splitTagsLine(unescapeField(f[4])));
        deck.items.push_back(item);
    }

    n = readSectionHeader(in, "cards");
    for (std::size_t i = 0; i < n; ++i) {
        std::istringstream ls(nextLine(in, "cards"));
        CardState c;
        c.card_id = readValue<std::int64_t>(ls, "card id");
        c.learner_id = readValue<std::int64_t>(ls, "learner id");
        c.item_id = readValue<std::int64_t>(ls, "item id");
        c.difficulty = readValue<double>(ls, "difficulty");
        c.stability = readValue<double>(ls, "stability");
        c.retrievability = readValue<double>(ls, "retrievability");
        c.phase = phaseFromInt(readValue<int>(ls, "phase"));
        c.review_count = readValue<int>(ls, "review count");
        c.lapse_count = readValue<int>(ls, "lapse count");
        c.success_count = readValue<int>(ls, "success count");
        c.last_review = readOptional<std::time_t>(ls);
        c.next_review = readValue<std::time_t>(ls, "next review");
        c.created_at = readValue<std::time_t>(ls, "created at");
        c.updated_at = readValue<std::time_t>(ls, "updated at");
        deck.cards.push_back(c);
    }

    n = readSectionHeader(in, "history");
    for (std::size_t i = 0; i < n; ++i) {
        std::istringstream ls(nextLine(in, "history"));
        ReviewRecord r;
        r.review_id = readValue<std::int64_t>(ls, "review id");
        r.card_id = readValue<std::int64_t>(ls, "card id");
        r.item_id = readValue<std::int64_t>(ls, "item id");
        r.learner_id = readValue<std::int64_t>(ls, "learner id");
        r.rating = ratingFromInt(readValue<int>(ls, "rating"));
        r.response_time_ms = readValue<long long>(ls, "response time");
        r.difficulty_before = readValue<double>(ls, "difficulty before");
        r.stability_before = readValue<double>(ls, "stability before");
        r.retrievability_before = readValue<double>(ls, "retrievability before");
        r.phase_before = phaseFromInt(readValue<int>(ls, "phase before"));
        r.difficulty_after = readValue<double>(ls, "difficulty after");
        r.stability_after = readValue<double>(ls, "stability after");
        r.retrievability_after = readValue<double>(ls, "retrievability after");
        r.phase_after = phaseFromInt(readValue<int>(ls, "phase after"));
        r.interval_days = readValue<int>(ls, "interval");
        r.session_id = readOptional<std::int64_t>(ls);
        r.reviewed_at = readValue<std::time_t>(ls, "reviewed at");
        deck.history.push_back(r);
    }

    n = readSectionHeader(in, "sessions");
    for (std::size_t i = 0; i < n; ++i) {
        std::istringstream ls(nextLine(in, "sessions"));
        SessionRecord s;
        s.session_id = readValue<std::int64_t>(ls, "session id");
        s.learner_id = readValue<std::int64_t>(ls, "learner id");
        s.type = sessionTypeFromString(readValue<std::string>(ls, "session type"));
        s.status = sessionStatusFromString(readValue<std::string>(ls, "session status"));
        s.start_time = readValue<std::time_t>(ls, "start time");
        s.end_time = readOptional<std::time_t>(ls);
        s.duration_seconds = readValue<long long>(ls, "duration");
        s.questions_reviewed = readValue<int>(ls, "questions reviewed");
        s.questions_correct = readValue<int>(ls, "questions correct");
        s.average_response_time_ms = readValue<long long>(ls, "average response time");
        s.retention_rate = readValue<double>(ls, "retention rate");
        s.target_retention = readValue<double>(ls, "target retention");
        s.max_reviews = readValue<int>(ls, "max reviews");
        deck.sessions.push_back(s);
    }

    return deck;
}

/* -------------------------
   Encrypted file
   ------------------------- */

bool Storage::saveDeck(const DeckSnapshot& deck, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Saving deck ({} items, {} cards, {} reviews) to '{}'",
        deck.items.size(), deck.cards.size(), deck.history.size(), filename);

    if (sodium_init() < 0) {
        spdlog::error("Failed to initialize libsodium");
        return false;
    }
    if (passphrase.empty()) {
        spdlog::error("Refusing to save deck with an empty passphrase");
        return false;
    }

    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, sizeof(salt));

    std::vector<unsigned char> key;
    if (!deriveKey(key, passphrase, salt))
        return false;

    std::string plain = serializeDeck(deck);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    wipe(key);
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

bool Storage::loadDeck(DeckSnapshot& deck, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Loading encrypted deck from '{}'", filename);
    deck = DeckSnapshot();

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

    unsigned char salt[SALT_BYTES];
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
    if (!deriveKey(key, passphrase, salt))
        return false;

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    int rc = crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data());
    wipe(key);
    if (rc != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    try {
        deck = parseDeck(plain_str);
    }
    catch (const std::runtime_error& e) {
        spdlog::error("Deck '{}' is malformed: {}", filename, e.what());
        deck = DeckSnapshot();
        return false;
    }

    spdlog::info("Loaded {} items, {} cards, {} reviews, {} sessions",
        deck.items.size(), deck.cards.size(), deck.history.size(), deck.sessions.size());
    return true;
}

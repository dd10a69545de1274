#include "storage/storage.hpp"
#include "utils/Errors.hpp"
#include "TestSupport.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace {

using testing_support::Near;

std::filesystem::path DeckPath(const std::string& test_name) {
    const auto base_dir = std::filesystem::temp_directory_path() / "recollect_storage_tests";
    std::filesystem::create_directories(base_dir);
    const auto path = base_dir / (test_name + ".dat");
    std::filesystem::remove(path);
    return path;
}

DeckSnapshot SampleDeck() {
    DeckSnapshot deck;

    StudyItem item(3, "Line one\nline\ttwo \\ end", "answer with spaces", "lang");
    item.setTags({ "verbs", "chapter 2" });
    deck.items.push_back(item);
    deck.items.push_back(StudyItem(7, "Second", "2"));

    CardState card;
    card.card_id = 11;
    card.item_id = 3;
    card.difficulty = 4.137300000000001;
    card.stability = 2.5170719999999999;
    card.retrievability = 0.6721;
    card.phase = Phase::REVIEW;
    card.review_count = 5;
    card.lapse_count = 1;
    card.success_count = 4;
    card.last_review = 1700000000;
    card.next_review = 1700086400;
    card.created_at = 1690000000;
    card.updated_at = 1700000000;
    deck.cards.push_back(card);

    CardState fresh;
    fresh.card_id = 12;
    fresh.item_id = 7;
    deck.cards.push_back(fresh);

    ReviewRecord review;
    review.review_id = 21;
    review.card_id = 11;
    review.item_id = 3;
    review.rating = Rating::HARD;
    review.response_time_ms = 8500;
    review.stability_before = 1.25;
    review.stability_after = 2.5170719999999999;
    review.phase_before = Phase::LEARNING;
    review.phase_after = Phase::REVIEW;
    review.interval_days = 1;
    review.session_id = 4;
    review.reviewed_at = 1700000000;
    deck.history.push_back(review);

    ReviewRecord outside = review;
    outside.review_id = 22;
    outside.session_id.reset();
    deck.history.push_back(outside);

    SessionRecord session;
    session.session_id = 4;
    session.type = SessionType::WEAK_FOCUS;
    session.status = SessionStatus::COMPLETED;
    session.start_time = 1699999000;
    session.end_time = 1700000100;
    session.duration_seconds = 1100;
    session.questions_reviewed = 1;
    session.retention_rate = 0.5;
    deck.sessions.push_back(session);

    return deck;
}

void AssertSampleDeck(const DeckSnapshot& deck) {
    assert(deck.items.size() == 2);
    assert(deck.items[0].prompt == "Line one\nline\ttwo \\ end");
    assert(deck.items[0].answer == "answer with spaces");
    assert(deck.items[0].category == "lang");
    assert(deck.items[0].tags.size() == 2);
    assert(deck.items[0].hasTag("chapter 2"));
    assert(deck.items[1].category.empty());

    assert(deck.cards.size() == 2);
    assert(deck.cards[0].card_id == 11);
    assert(deck.cards[0].difficulty == 4.137300000000001);
    assert(deck.cards[0].stability == 2.5170719999999999);
    assert(deck.cards[0].phase == Phase::REVIEW);
    assert(deck.cards[0].last_review && *deck.cards[0].last_review == 1700000000);
    assert(!deck.cards[1].last_review);
    assert(deck.cards[1].phase == Phase::NEW);

    assert(deck.history.size() == 2);
    assert(deck.history[0].rating == Rating::HARD);
    assert(deck.history[0].session_id && *deck.history[0].session_id == 4);
    assert(!deck.history[1].session_id);
    assert(deck.history[0].phase_after == Phase::REVIEW);

    assert(deck.sessions.size() == 1);
    assert(deck.sessions[0].type == SessionType::WEAK_FOCUS);
    assert(deck.sessions[0].status == SessionStatus::COMPLETED);
    assert(deck.sessions[0].end_time && *deck.sessions[0].end_time == 1700000100);
    assert(Near(deck.sessions[0].retention_rate, 0.5));
}

void TestPlaintextFormatPreservesDeck() {
    std::string text = Storage::serializeDeck(SampleDeck());
    AssertSampleDeck(Storage::parseDeck(text));
}

void TestMalformedPlaintextIsRejected() {
    const std::string bad[] = {
        "",
        "some other format\n",
        "recollect-deck 1\nitems 1\n",
        "recollect-deck 1\nitems 0\ncards 1\n1 1 1 x\n",
        std::string("recollect-deck 1\nitems 0\ncards 0\nhistory 0\nsessions 0\n").substr(0, 40),
    };
    for (const auto& text : bad) {
        bool threw = false;
        try {
            Storage::parseDeck(text);
        } catch (const PersistenceError&) {
            threw = true;
        }
        assert(threw);
    }

    bool threw = false;
    try {
        Storage::parseDeck("recollect-deck 1\nitems 0\ncards 1\n1 1 1 5 1 1 9 0 0 0 - 0 0 0\nhistory 0\nsessions 0\n");
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
}

void TestEncryptedSaveAndLoad() {
    const auto path = DeckPath("roundtrip");
    assert(Storage::saveDeck(SampleDeck(), path.string(), "correct horse"));

    std::ifstream in(path, std::ios::binary);
    std::string header(8, '\0');
    in.read(&header[0], 8);
    assert(header == "RCDECK1\n");
    std::string rest((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(rest.find("Line one") == std::string::npos);

    DeckSnapshot loaded;
    assert(Storage::loadDeck(loaded, path.string(), "correct horse"));
    AssertSampleDeck(loaded);
}

void TestWrongPassphraseFails() {
    const auto path = DeckPath("wrong_pass");
    assert(Storage::saveDeck(SampleDeck(), path.string(), "right"));

    DeckSnapshot loaded;
    loaded.items.push_back(StudyItem(1, "stale", "x"));
    assert(!Storage::loadDeck(loaded, path.string(), "wrong"));
    assert(loaded.items.empty());
}

void TestMissingFileIsEmptyDeck() {
    const auto path = DeckPath("missing");
    DeckSnapshot loaded;
    assert(Storage::loadDeck(loaded, path.string(), "anything"));
    assert(loaded.items.empty());
    assert(loaded.cards.empty());
}

void TestCorruptFileFails() {
    const auto badMagic = DeckPath("bad_magic");
    {
        std::ofstream out(badMagic, std::ios::binary);
        out << "NOTADECK and then some bytes";
    }
    DeckSnapshot loaded;
    assert(!Storage::loadDeck(loaded, badMagic.string(), "pw"));

    const auto tampered = DeckPath("tampered");
    assert(Storage::saveDeck(SampleDeck(), tampered.string(), "pw"));
    {
        std::fstream io(tampered, std::ios::binary | std::ios::in | std::ios::out);
        io.seekg(-1, std::ios::end);
        char last = 0;
        io.get(last);
        io.seekp(-1, std::ios::end);
        io.put(static_cast<char>(last ^ 0x01));
    }
    assert(!Storage::loadDeck(loaded, tampered.string(), "pw"));
}

void TestEmptyPassphraseIsRefused() {
    const auto path = DeckPath("empty_pass");
    assert(!Storage::saveDeck(SampleDeck(), path.string(), ""));
    assert(!std::filesystem::exists(path));
}

} // namespace

int main() {
    testing_support::QuietLogs();

    TestPlaintextFormatPreservesDeck();
    TestMalformedPlaintextIsRejected();
    TestEncryptedSaveAndLoad();
    TestWrongPassphraseFails();
    TestMissingFileIsEmptyDeck();
    TestCorruptFileFails();
    TestEmptyPassphraseIsRefused();

    std::cout << "recollect_unit_storage: pass\n";
    return 0;
}

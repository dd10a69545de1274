#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <sodium.h>
#include <spdlog/spdlog.h>

#include "../analytics/DeckStats.hpp"
#include "../config/ConfigLoader.hpp"
#include "../core/Enrollment.hpp"
#include "../core/ItemBank.hpp"
#include "../core/Notifications.hpp"
#include "../core/ParameterStore.hpp"
#include "../core/ReviewService.hpp"
#include "../session/SessionManager.hpp"
#include "../storage/MemoryStore.hpp"
#include "../storage/storage.hpp"
#include "../utils/Errors.hpp"
#include "../utils/logging.hpp"

static constexpr std::int64_t LEARNER_ID = 1;

int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof())
            return -1;
        std::cin.clear();
        std::string dummy; std::getline(std::cin, dummy);
        return 0;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

std::string formatTime(std::time_t t) {
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M");
    return oss.str();
}

void listAllItems(const ItemBank& bank, const CardReader& cards) {
    std::cout << "\n===== ALL ITEMS =====\n";

    std::vector<StudyItem> items = bank.allItems();
    if (items.empty()) {
        std::cout << "No items stored.\n";
        return;
    }

    for (const auto& it : items) {
        std::cout << it.item_id << ". " << it.prompt << "\n";
        std::cout << "   Category: " << (it.category.empty() ? "(none)" : it.category) << "\n";
        std::cout << "   Tags: " << (it.tags.empty() ? "(none)" : it.tagsAsLine()) << "\n";

        std::optional<CardState> card = cards.findByItem(LEARNER_ID, it.item_id);
        if (!card) {
            std::cout << "   (not enrolled)\n";
        }
        else {
            std::cout << "   Phase: " << phaseName(card->phase)
                << " | " << SessionManager::difficultyLabel(*card) << "\n";
            std::cout << std::fixed << std::setprecision(2)
                << "   Difficulty: " << card->difficulty
                << "  Stability: " << card->stability << " days\n";
            std::cout << "   Reviews: " << card->review_count << "  Lapses: " << card->lapse_count << "\n";
            if (!card->neverReviewed())
                std::cout << "   Next review: " << formatTime(card->next_review) << "\n";
        }
        std::cout << "-----------------------------\n";
    }
}

/* -------------------------
   Study session loop
   -------------------------
   An empty answer skips the item, ":q" ends the session early.
*/
void runSession(SessionManager& sessions, SessionType type) {
    SessionConfig config = sessions.defaultConfig(type, LEARNER_ID);

    SessionStart start;
    try {
        start = sessions.startSession(config);
    }
    catch (const std::runtime_error& e) {
        std::cout << "Could not start session: " << e.what() << "\n";
        return;
    }

    if (start.items.empty()) {
        std::cout << "Nothing to study for a " << sessionTypeName(type) << " session.\n";
        sessions.endSession(start.session_id);
        return;
    }

    std::cout << "\n===== " << sessionTypeName(type) << " SESSION (" << start.items.size() << " items) =====\n";

    bool quit = false;
    while (!quit) {
        std::optional<ItemPresentation> next = sessions.getNextItem(start.session_id);
        if (!next)
            break;

        std::cout << "\n[" << next->question_number << "/" << next->total_questions << "] "
            << next->difficulty_label;
        if (!next->category.empty())
            std::cout << " | " << next->category;
        if (next->days_since_last_review)
            std::cout << " | last seen " << *next->days_since_last_review << " day(s) ago";
        std::cout << "\n" << next->item.prompt << "\n> ";

        auto shown = std::chrono::steady_clock::now();
        std::string line;
        if (!std::getline(std::cin, line))
            break;
        long long elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - shown).count();

        if (line == ":q") {
            quit = true;
            continue;
        }

        std::optional<std::string> answer;
        if (!line.empty())
            answer = line;

        AnswerOutcome out = sessions.submitAnswer(start.session_id, next->item.item_id, answer, elapsed_ms);
        if (!out.success) {
            std::cout << "Answer not recorded (" << errorKindName(out.error) << "): " << out.error_message << "\n";
            break;
        }

        if (out.skipped)
            std::cout << "Skipped. Answer: " << next->item.answer << "\n";
        else if (out.correct)
            std::cout << "Correct!\n";
        else
            std::cout << "Incorrect. Answer: " << next->item.answer << "\n";

        std::cout << "Rated " << ratingName(out.rating)
            << ", next review in " << out.review.interval_days << " day(s)\n";
    }

    SessionProgress progress = sessions.getSessionProgress(start.session_id);
    SessionSummary summary = quit ? sessions.cancelSession(start.session_id)
                                  : sessions.endSession(start.session_id);

    std::cout << "\n===== SESSION SUMMARY =====\n"
        << "Answered:   " << summary.questions_completed << "/" << summary.questions_total << "\n"
        << "Correct:    " << summary.correct_answers << "\n"
        << "Incorrect:  " << summary.incorrect_answers << "\n"
        << "Skipped:    " << summary.skipped << "\n"
        << std::fixed << std::setprecision(1)
        << "Accuracy:   " << summary.accuracy_percentage << "%\n"
        << "Completion: " << summary.completion_rate << "%\n"
        << "Avg time:   " << summary.average_response_time_ms / 1000.0 << " s\n"
        << "Minutes:    " << progress.elapsed_time_minutes << "\n";
}

void showDeckStats(const MemoryStore& store, std::time_t now) {
    DeckSummary s = DeckStats::compute(store, store, LEARNER_ID, now);

    std::cout << "\n===== DECK STATISTICS =====\n"
        << "Cards:      " << s.total_cards
        << " (new " << s.new_cards << ", learning " << s.learning_cards << ", review " << s.review_cards << ")\n"
        << "Due now:    " << s.due_cards << " (overdue " << s.overdue_cards << ")\n"
        << std::fixed << std::setprecision(2)
        << "Difficulty: " << s.average_difficulty << " avg\n"
        << "Stability:  " << s.average_stability << " days avg\n"
        << "Retention:  " << s.retention_rate * 100.0 << "% over " << s.recent_reviews << " review(s), last 30 days\n"
        << "Leeches:    " << s.leech_count << "\n";

    for (const auto& c : DeckStats::findLeeches(store, LEARNER_ID))
        std::cout << "   - item " << c.item_id << " (" << c.lapse_count << " lapses)\n";
}

int main(int argc, char** argv) {
    AppConfig config;
    if (argc > 1) {
        try {
            config = ConfigLoader::loadFromYaml(argv[1]);
        }
        catch (const ConfigurationError& e) {
            std::cerr << "Invalid configuration: " << e.what() << "\n";
            return 1;
        }
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init(config.logging);

    std::unique_ptr<ParameterStore> params;
    try {
        params = std::make_unique<ParameterStore>(config.scheduler);
    }
    catch (const ConfigurationError& e) {
        spdlog::critical("Scheduler parameters rejected: {}", e.what());
        std::cerr << "Invalid scheduler parameters: " << e.what() << "\n";
        return 1;
    }

    const std::string& deckPath = config.storage.deck_path;
    std::string passphrase;
    std::cout << "Deck: " << deckPath << "\nPassphrase: ";
    if (!std::getline(std::cin, passphrase) || passphrase.empty()) {
        std::cout << "A passphrase is required.\n";
        return 1;
    }

    DeckSnapshot deck;
    if (!Storage::loadDeck(deck, deckPath, passphrase)) {
        std::cout << "Could not open deck (wrong passphrase or damaged file).\n";
        return 1;
    }

    ItemBank bank;
    MemoryStore store;
    try {
        for (const auto& item : deck.items)
            bank.add(item);
        store.restore(deck.cards, deck.history, deck.sessions);
    }
    catch (const std::runtime_error& e) {
        spdlog::critical("Deck contents rejected: {}", e.what());
        std::cout << "Deck contents are inconsistent: " << e.what() << "\n";
        return 1;
    }

    SystemClock clock;
    EventBus bus;
    bus.subscribe([](const CardScheduledEvent& ev) {
        spdlog::debug("Card {} due {} (interval {}d)", ev.card_id, static_cast<long long>(ev.next_review), ev.interval_days);
    });

    ReviewService reviews(store, store, store, *params, clock, &bus);
    SessionRegistry registry;
    SessionManager sessions(store, store, store, bank, reviews, registry, clock, config.session);
    Enrollment enrollment(store, store, clock);

    // Items added by an older deck without cards get enrolled here
    enrollment.enrollCatalog(LEARNER_ID, bank);

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Due now: " << reviews.getDueCards(LEARNER_ID, static_cast<std::size_t>(config.session.max_reviews)).size() << "\n"
            "1. Add Item\n"
            "2. List All Items\n"
            "3. Review Session\n"
            "4. Learn Session\n"
            "5. Weak Focus Session\n"
            "6. Deck Statistics\n"
            "7. Reset Progress\n"
            "8. Save & Exit\n> ";

        int choice = readChoice();
        if (choice < 0)
            choice = 8;

        if (choice == 1) {
            StudyItem item;
            std::string tags_line;
            std::cout << "Enter prompt: "; std::getline(std::cin, item.prompt);
            if (item.prompt.empty()) { std::cout << "Prompt required.\n"; continue; }

            std::cout << "Enter answer: "; std::getline(std::cin, item.answer);
            std::cout << "Enter category: "; std::getline(std::cin, item.category);
            std::cout << "Enter tags (comma-separated): "; std::getline(std::cin, tags_line);
            item.setTags(StudyItem::splitTagsLine(tags_line));

            try {
                std::int64_t id = bank.add(item);
                enrollment.enrollItem(LEARNER_ID, id);
                std::cout << "Item " << id << " added.\n";
            }
            catch (const ValidationError& e) {
                std::cout << "Item rejected: " << e.what() << "\n";
            }
        }

        else if (choice == 2) {
            listAllItems(bank, store);
        }

        else if (choice == 3) {
            runSession(sessions, SessionType::REVIEW);
        }

        else if (choice == 4) {
            runSession(sessions, SessionType::LEARN);
        }

        else if (choice == 5) {
            runSession(sessions, SessionType::WEAK_FOCUS);
        }

        else if (choice == 6) {
            showDeckStats(store, clock.now());
        }

        else if (choice == 7) {
            std::cout << "Type RESET to discard all scheduling progress: ";
            std::string confirm; std::getline(std::cin, confirm);
            if (confirm != "RESET") { std::cout << "Cancelled.\n"; continue; }

            std::size_t n = enrollment.resetProgress(LEARNER_ID, bank);
            std::cout << n << " card(s) reset. Review history is kept.\n";
        }

        else if (choice == 8) {
            deck.items = bank.allItems();
            deck.cards = store.allCards();
            deck.history = store.allHistory();
            deck.sessions = store.allSessions();

            if (!Storage::saveDeck(deck, deckPath, passphrase)) {
                std::cout << "Error saving deck.\n";
                sodium_memzero(&passphrase[0], passphrase.size());
                Log::shutdown();
                return 1;
            }

            sodium_memzero(&passphrase[0], passphrase.size());
            std::cout << "Goodbye!\n";
            break;
        }

        else std::cout << "Invalid.\n";
    }

    Log::shutdown();
    return 0;
}

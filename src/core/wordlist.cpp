#include "notwords/wordlist.hpp"
#include "notwords/config.hpp"
#include "notwords/error.hpp"
#include "notwords/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>

namespace notwords {

namespace {

constexpr size_t HUMAN_WORDLIST_SIZE = 256;

const char* const HUMAN_WORDLIST[HUMAN_WORDLIST_SIZE] = {
    "ack", "alabama", "alanine", "alaska", "alpha", "angel", "apart", "april",
    "arizona", "arkansas", "artist", "asparagus", "aspen", "august", "autumn",
    "avocado", "bacon", "bakerloo", "batman", "beer", "berlin", "beryllium", "black",
    "blossom", "blue", "bluebird", "bravo", "bulldog", "burger", "butter",
    "california", "carbon", "cardinal", "carolina", "carpet", "cat", "ceiling",
    "charlie", "chicken", "coffee", "cola", "cold", "colorado", "comet", "connecticut",
    "crazy", "cup", "dakota", "december", "delaware", "delta", "diet", "don", "double",
    "early", "earth", "east", "echo", "edward", "eight", "eighteen", "eleven", "emma",
    "enemy", "equal", "failed", "fanta", "fifteen", "fillet", "finch", "fish", "five",
    "fix", "floor", "florida", "football", "four", "fourteen", "foxtrot", "freddie",
    "friend", "fruit", "gee", "georgia", "glucose", "golf", "green", "grey", "hamper",
    "happy", "harry", "hawaii", "helium", "high", "hot", "hotel", "hydrogen", "idaho",
    "illinois", "india", "indigo", "ink", "iowa", "island", "item", "jersey", "jig",
    "johnny", "juliet", "july", "jupiter", "kansas", "kentucky", "kilo", "king",
    "kitten", "lactose", "lake", "lamp", "lemon", "leopard", "lima", "lion", "lithium",
    "london", "louisiana", "low", "magazine", "magnesium", "maine", "mango", "march",
    "mars", "maryland", "massachusetts", "may", "mexico", "michigan", "mike",
    "minnesota", "mirror", "mississippi", "missouri", "mobile", "mockingbird",
    "monkey", "montana", "moon", "mountain", "muppet", "music", "nebraska", "neptune",
    "network", "nevada", "nine", "nineteen", "nitrogen", "north", "november", "nuts",
    "october", "ohio", "oklahoma", "one", "orange", "oranges", "oregon", "oscar",
    "oven", "oxygen", "papa", "paris", "pasta", "pennsylvania", "pip", "pizza",
    "pluto", "potato", "princess", "purple", "quebec", "queen", "quiet", "red",
    "river", "robert", "robin", "romeo", "rugby", "sad", "salami", "saturn",
    "september", "seven", "seventeen", "shade", "sierra", "single", "sink", "six",
    "sixteen", "skylark", "snake", "social", "sodium", "solar", "south", "spaghetti",
    "speaker", "spring", "stairway", "steak", "stream", "summer", "sweet", "table",
    "tango", "ten", "tennessee", "tennis", "texas", "thirteen", "three", "timing",
    "triple", "twelve", "twenty", "two", "uncle", "undress", "uniform", "uranus",
    "utah", "vegan", "venus", "vermont", "victor", "video", "violet", "virginia",
    "washington", "west", "whiskey", "white", "william", "winner", "winter",
    "wisconsin", "wolfram", "wyoming", "xray", "yankee", "yellow", "zebra", "zulu"
};

constexpr char SYLLABLE_CONSONANTS[] = "bdfghjklmnprstvz";
constexpr char SYLLABLE_VOWELS[] = "aeiou";
constexpr size_t CONSONANT_COUNT = sizeof(SYLLABLE_CONSONANTS) - 1;
constexpr size_t VOWEL_COUNT = sizeof(SYLLABLE_VOWELS) - 1;
constexpr size_t SYLLABLE_COUNT = CONSONANT_COUNT * VOWEL_COUNT;
static_assert(CONSONANT_COUNT == 16 && VOWEL_COUNT == 5, "syllable mapping relies on coprime table sizes");

std::string trim_lower(const std::string& line) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    auto begin = std::find_if(line.begin(), line.end(), not_space);
    auto end = std::find_if(line.rbegin(), line.rend(), not_space).base();
    if (begin >= end) return {};

    std::string word(begin, end);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return word;
}

} // anonymous namespace

// =============================================================================
// Wordlist
// =============================================================================

Wordlist::Wordlist(std::vector<std::string> words)
    : words_(std::move(words))
{
    NOTWORDS_CHECK(!words_.empty(), ErrorCode::INVALID_WORDLIST, "Wordlist is empty");
    NOTWORDS_CHECK(words_.size() <= UINT32_MAX, ErrorCode::INVALID_WORDLIST, "Wordlist is too large");

    index_.reserve(words_.size());
    for (size_t i = 0; i < words_.size(); ++i) {
        if (words_[i].empty()) {
            NOTWORDS_THROW(ErrorCode::INVALID_WORDLIST,
                           "Empty word at position " + std::to_string(i));
        }
        if (!index_.emplace(words_[i], static_cast<uint32_t>(i)).second) {
            NOTWORDS_THROW(ErrorCode::INVALID_WORDLIST,
                           "Duplicate word '" + words_[i] + "' at position " + std::to_string(i));
        }
    }
}

std::optional<uint32_t> Wordlist::index_of(std::string_view word) const {
    auto it = index_.find(std::string(word));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Wordlist Wordlist::truncated(size_t n) const {
    if (n >= words_.size()) {
        return *this;
    }
    return Wordlist(std::vector<std::string>(words_.begin(), words_.begin() + static_cast<std::ptrdiff_t>(n)));
}

Wordlist Wordlist::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IOError("Cannot open wordlist file: " + path, __func__,
                      "Check the words.* configuration entries");
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(file, line)) {
        std::string word = trim_lower(line);
        if (!word.empty()) {
            words.push_back(std::move(word));
        }
    }

    LOG_INFO("Loaded ", words.size(), " words from ", path);
    return Wordlist(std::move(words));
}

Wordlist Wordlist::human() {
    return Wordlist(std::vector<std::string>(HUMAN_WORDLIST, HUMAN_WORDLIST + HUMAN_WORDLIST_SIZE));
}

Wordlist Wordlist::syllabic(size_t size) {
    NOTWORDS_CHECK_ARGUMENT(size > 0, "Syllabic wordlist size must be positive");

    // Fewest syllables per word, then the smallest alphabet that still covers `size`.
    // A fixed syllable count keeps every word distinct.
    size_t syllables = 1;
    for (size_t capacity = SYLLABLE_COUNT; capacity < size; capacity *= SYLLABLE_COUNT) {
        ++syllables;
    }
    size_t alphabet = 1;
    while (true) {
        size_t capacity = 1;
        for (size_t s = 0; s < syllables && capacity < size; ++s) capacity *= alphabet;
        if (capacity >= size) break;
        ++alphabet;
    }

    std::vector<std::string> words;
    words.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        std::string word(syllables * 2, ' ');
        size_t value = i;
        for (size_t s = syllables; s > 0; --s) {
            // 16 and 5 are coprime, so x -> (x mod 16, x mod 5) is one-to-one on [0, 80)
            const size_t syllable = value % alphabet;
            value /= alphabet;
            word[(s - 1) * 2] = SYLLABLE_CONSONANTS[syllable % CONSONANT_COUNT];
            word[(s - 1) * 2 + 1] = SYLLABLE_VOWELS[syllable % VOWEL_COUNT];
        }
        words.push_back(std::move(word));
    }
    return Wordlist(std::move(words));
}

// =============================================================================
// Vocabulary
// =============================================================================

size_t Vocabulary::slot(WordCount count) noexcept {
    switch (count) {
        case WordCount::Three: return 0;
        case WordCount::Four:  return 1;
        case WordCount::Six:   return 2;
    }
    return 0;
}

std::shared_ptr<const Wordlist> Vocabulary::fit(const Wordlist& list, WordCount count) {
    const size_t radix = required_radix(count);
    if (list.size() < radix) {
        throw NotwordsException(
            ErrorCode::INDEX_OUT_OF_RANGE,
            "Wordlist of " + std::to_string(list.size()) + " words cannot address 2^" +
                std::to_string(bit_precision(count)) + " cells with " +
                std::to_string(word_count_value(count)) + " words",
            __func__,
            "Provide at least " + std::to_string(radix) + " distinct words");
    }
    return std::make_shared<const Wordlist>(list.truncated(radix));
}

Vocabulary::Vocabulary(const Wordlist& three, const Wordlist& four, const Wordlist& six)
    : lists_{fit(three, WordCount::Three), fit(four, WordCount::Four), fit(six, WordCount::Six)}
{}

Vocabulary::Vocabulary(const Wordlist& shared)
    : Vocabulary(shared, shared, shared)
{}

const Wordlist& Vocabulary::wordlist(WordCount count) const {
    return *lists_[slot(count)];
}

Vocabulary Vocabulary::standard() {
    return Vocabulary(Wordlist::syllabic(required_radix(WordCount::Three)),
                      Wordlist::syllabic(required_radix(WordCount::Four)),
                      Wordlist::human());
}

Vocabulary Vocabulary::from_config(const Config& config) {
    auto pick = [&config](const std::string& key, Wordlist fallback) {
        const std::string path = config.get<std::string>(key);
        if (path.empty()) {
            LOG_DEBUG("Using built-in wordlist for ", key);
            return fallback;
        }
        return Wordlist::load(path);
    };

    return Vocabulary(pick("words.three", Wordlist::syllabic(required_radix(WordCount::Three))),
                      pick("words.four", Wordlist::syllabic(required_radix(WordCount::Four))),
                      pick("words.six", Wordlist::human()));
}

} // namespace notwords

#include "synth/fake_data_provider.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <unordered_map>

namespace doubleblind {

namespace {

// ============================================================================
// Locale vocabularies (ASCII only, so derived emails stay valid)
// ============================================================================

struct LocaleData {
    std::vector<std::string_view> first_names;
    std::vector<std::string_view> last_names;
    std::vector<std::string_view> cities;
    std::vector<std::string_view> streets;
    std::vector<std::string_view> company_suffixes;
};

const LocaleData& en_us() {
    static const LocaleData data{
        {"James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael", "Linda",
         "David", "Elizabeth", "William", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
         "Thomas", "Sarah", "Charles", "Karen", "Daniel", "Nancy", "Matthew", "Lisa",
         "Anthony", "Betty", "Mark", "Sandra", "Steven", "Ashley", "Paul", "Emily"},
        {"Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
         "Rodriguez", "Martinez", "Hernandez", "Lopez", "Wilson", "Anderson", "Taylor",
         "Moore", "Jackson", "Martin", "Lee", "Thompson", "White", "Harris", "Clark",
         "Lewis", "Robinson", "Walker", "Young", "Allen", "King", "Wright", "Scott", "Green"},
        {"Springfield", "Riverside", "Fairview", "Franklin", "Greenville", "Bristol",
         "Clinton", "Madison", "Georgetown", "Salem", "Arlington", "Ashland", "Dover",
         "Oxford", "Jackson", "Burlington", "Manchester", "Milton", "Newport", "Auburn"},
        {"Main", "Oak", "Pine", "Maple", "Cedar", "Elm", "Washington", "Lake", "Hill",
         "Park", "Walnut", "Sunset", "Lincoln", "Jefferson", "Ridge", "Meadow"},
        {"Inc", "LLC", "Group", "Holdings", "Partners", "Labs"},
    };
    return data;
}

const LocaleData& de_de() {
    static const LocaleData data{
        {"Lukas", "Anna", "Leon", "Lea", "Finn", "Hannah", "Jonas", "Mia", "Paul", "Lena",
         "Felix", "Emma", "Maximilian", "Sophie", "Elias", "Marie", "Noah", "Laura",
         "Tim", "Julia", "Jan", "Katharina", "Niklas", "Johanna"},
        {"Mueller", "Schmidt", "Schneider", "Fischer", "Weber", "Meyer", "Wagner", "Becker",
         "Schulz", "Hoffmann", "Koch", "Richter", "Klein", "Wolf", "Schroeder", "Neumann",
         "Schwarz", "Zimmermann", "Braun", "Krueger", "Hofmann", "Hartmann", "Lange", "Werner"},
        {"Berlin", "Hamburg", "Muenchen", "Koeln", "Frankfurt", "Stuttgart", "Duesseldorf",
         "Leipzig", "Dortmund", "Essen", "Bremen", "Dresden", "Hannover", "Nuernberg"},
        {"Haupt", "Schul", "Garten", "Bahnhof", "Dorf", "Berg", "Kirch", "Wald", "Ring",
         "Linden", "Birken", "Mozart"},
        {"GmbH", "AG", "KG", "GmbH & Co. KG"},
    };
    return data;
}

const LocaleData& fr_fr() {
    static const LocaleData data{
        {"Gabriel", "Louise", "Raphael", "Emma", "Leo", "Jade", "Louis", "Alice", "Lucas",
         "Chloe", "Adam", "Lina", "Hugo", "Rose", "Arthur", "Anna", "Jules", "Mia",
         "Nathan", "Julia", "Paul", "Camille", "Victor", "Manon"},
        {"Martin", "Bernard", "Thomas", "Petit", "Robert", "Richard", "Durand", "Dubois",
         "Moreau", "Laurent", "Simon", "Michel", "Lefebvre", "Leroy", "Roux", "David",
         "Bertrand", "Morel", "Fournier", "Girard", "Bonnet", "Dupont", "Lambert", "Fontaine"},
        {"Paris", "Marseille", "Lyon", "Toulouse", "Nice", "Nantes", "Strasbourg",
         "Montpellier", "Bordeaux", "Lille", "Rennes", "Reims", "Toulon", "Grenoble"},
        {"de la Paix", "Victor Hugo", "de la Republique", "Jean Jaures", "Pasteur",
         "du Moulin", "des Lilas", "de l'Eglise", "Voltaire", "Gambetta"},
        {"SA", "SARL", "SAS", "et Fils"},
    };
    return data;
}

const LocaleData& locale_data(std::string_view locale) {
    if (locale == "de_DE") return de_de();
    if (locale == "fr_FR") return fr_fr();
    return en_us();
}

constexpr std::array<std::string_view, 40> kLoremWords = {
    "lorem", "ipsum", "dolor", "sit", "amet", "consectetur", "adipiscing", "elit",
    "sed", "do", "eiusmod", "tempor", "incididunt", "ut", "labore", "et", "dolore",
    "magna", "aliqua", "enim", "ad", "minim", "veniam", "quis", "nostrud",
    "exercitation", "ullamco", "laboris", "nisi", "aliquip", "ex", "ea", "commodo",
    "consequat", "duis", "aute", "irure", "in", "reprehenderit", "voluptate",
};

constexpr std::array<std::string_view, 3> kEmailDomains = {
    "example.com", "example.org", "example.net",
};

// ============================================================================
// Random helpers
// ============================================================================

int uniform(Rng& rng, int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng);
}

template<typename Container>
std::string_view pick(Rng& rng, const Container& items) {
    return items[static_cast<size_t>(uniform(rng, 0, static_cast<int>(items.size()) - 1))];
}

std::string ascii_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

std::string random_digits(Rng& rng, size_t count) {
    std::string out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out += static_cast<char>('0' + uniform(rng, 0, 9));
    }
    return out;
}

// ============================================================================
// Generators
// ============================================================================

std::string full_name(Rng& rng, const LocaleData& data) {
    const auto first = pick(rng, data.first_names);
    const char initial = static_cast<char>('A' + uniform(rng, 0, 25));
    const auto last = pick(rng, data.last_names);
    return std::format("{} {}. {}", first, initial, last);
}

std::string email(Rng& rng, const LocaleData& data) {
    const auto first = ascii_lower(pick(rng, data.first_names));
    const auto last = ascii_lower(pick(rng, data.last_names));
    const int discriminator = uniform(rng, 1000, 999999);
    return std::format("{}.{}{}@{}", first, last, discriminator, pick(rng, kEmailDomains));
}

std::string username(Rng& rng, const LocaleData& data) {
    const auto first = ascii_lower(pick(rng, data.first_names));
    return std::format("{}_{}", first, uniform(rng, 10000, 9999999));
}

std::string phone(Rng& rng, std::string_view locale) {
    if (locale == "de_DE") {
        return std::format("+49 {} {}", uniform(rng, 30, 99), random_digits(rng, 7));
    }
    if (locale == "fr_FR") {
        return std::format("+33 {} {:02d} {:02d} {:02d} {:02d}", uniform(rng, 1, 5),
            uniform(rng, 0, 99), uniform(rng, 0, 99), uniform(rng, 0, 99), uniform(rng, 0, 99));
    }
    return std::format("+1 ({}) 555-{}", uniform(rng, 201, 989), random_digits(rng, 4));
}

// Area never 000, 666 or 900-999; group never 00; serial never 0000
std::string ssn(Rng& rng) {
    int area = uniform(rng, 1, 898);
    if (area >= 666) ++area;
    const int group = uniform(rng, 1, 99);
    const int serial = uniform(rng, 1, 9999);
    return std::format("{:03d}-{:02d}-{:04d}", area, group, serial);
}

std::string address(Rng& rng, std::string_view locale, const LocaleData& data) {
    const auto street = pick(rng, data.streets);
    const int number = uniform(rng, 1, 9999);
    if (locale == "de_DE") {
        return std::format("{}strasse {}", street, number % 999 + 1);
    }
    if (locale == "fr_FR") {
        return std::format("{} rue {}", number % 999 + 1, street);
    }
    static constexpr std::array<std::string_view, 5> kSuffixes = {"St", "Ave", "Rd", "Ln", "Blvd"};
    return std::format("{} {} {}", number, street, pick(rng, kSuffixes));
}

std::string credit_card(Rng& rng) {
    std::string digits = "4" + random_digits(rng, 14);
    digits += static_cast<char>('0' + BuiltinFakeDataProvider::luhn_check_digit(digits));
    return digits;
}

std::string ip_address(Rng& rng) {
    return std::format("10.{}.{}.{}", uniform(rng, 0, 255), uniform(rng, 0, 255),
                       uniform(rng, 1, 254));
}

Date date_of_birth(Rng& rng) {
    const int year = uniform(rng, 1940, 2005);
    const int month = uniform(rng, 1, 12);
    const int day = uniform(rng, 1, 28);
    return Date{year, month, day};
}

std::string sentence(Rng& rng) {
    const int words = uniform(rng, 4, 12);
    std::string out;
    for (int i = 0; i < words; ++i) {
        if (i > 0) out += ' ';
        out += pick(rng, kLoremWords);
    }
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    out += '.';
    return out;
}

enum class Kind {
    FIRST_NAME, LAST_NAME, FULL_NAME, EMAIL, USERNAME, PHONE, SSN, ADDRESS, CITY,
    POSTCODE, CREDIT_CARD, IP_ADDRESS, DATE_OF_BIRTH, COMPANY, WORD, SENTENCE
};

const std::unordered_map<std::string_view, Kind>& kind_table() {
    static const std::unordered_map<std::string_view, Kind> table = {
        {"first_name",    Kind::FIRST_NAME},
        {"last_name",     Kind::LAST_NAME},
        {"full_name",     Kind::FULL_NAME},
        {"email",         Kind::EMAIL},
        {"username",      Kind::USERNAME},
        {"phone",         Kind::PHONE},
        {"ssn",           Kind::SSN},
        {"address",       Kind::ADDRESS},
        {"city",          Kind::CITY},
        {"postcode",      Kind::POSTCODE},
        {"credit_card",   Kind::CREDIT_CARD},
        {"ip_address",    Kind::IP_ADDRESS},
        {"date_of_birth", Kind::DATE_OF_BIRTH},
        {"company",       Kind::COMPANY},
        {"word",          Kind::WORD},
        {"sentence",      Kind::SENTENCE},
    };
    return table;
}

} // anonymous namespace

// ============================================================================
// BuiltinFakeDataProvider
// ============================================================================

Scalar BuiltinFakeDataProvider::generate(std::string_view kind, std::string_view locale,
                                         Rng& rng) const {
    const auto& table = kind_table();
    const auto it = table.find(kind);
    if (it == table.end()) {
        throw UnknownCategoryError(std::format("Fake data provider cannot generate '{}'", kind));
    }

    const auto& data = locale_data(locale);
    switch (it->second) {
        case Kind::FIRST_NAME:    return std::string(pick(rng, data.first_names));
        case Kind::LAST_NAME:     return std::string(pick(rng, data.last_names));
        case Kind::FULL_NAME:     return full_name(rng, data);
        case Kind::EMAIL:         return email(rng, data);
        case Kind::USERNAME:      return username(rng, data);
        case Kind::PHONE:         return phone(rng, locale);
        case Kind::SSN:           return ssn(rng);
        case Kind::ADDRESS:       return address(rng, locale, data);
        case Kind::CITY:          return std::string(pick(rng, data.cities));
        case Kind::POSTCODE:      return std::format("{:05d}", uniform(rng, 1001, 99950));
        case Kind::CREDIT_CARD:   return credit_card(rng);
        case Kind::IP_ADDRESS:    return ip_address(rng);
        case Kind::DATE_OF_BIRTH: return date_of_birth(rng);
        case Kind::COMPANY:
            return std::format("{} {}", pick(rng, data.last_names), pick(rng, data.company_suffixes));
        case Kind::WORD:          return std::string(pick(rng, kLoremWords));
        case Kind::SENTENCE:      return sentence(rng);
    }
    throw UnknownCategoryError(std::format("Fake data provider cannot generate '{}'", kind));
}

bool BuiltinFakeDataProvider::supports(std::string_view kind) const {
    return kind_table().contains(kind);
}

const std::vector<std::string>& BuiltinFakeDataProvider::supported_kinds() {
    static const std::vector<std::string> kinds = [] {
        std::vector<std::string> out;
        for (const auto& [name, kind] : kind_table()) out.emplace_back(name);
        std::sort(out.begin(), out.end());
        return out;
    }();
    return kinds;
}

const std::vector<std::string>& BuiltinFakeDataProvider::supported_locales() {
    static const std::vector<std::string> locales = {"de_DE", "en_US", "fr_FR"};
    return locales;
}

int BuiltinFakeDataProvider::luhn_check_digit(std::string_view digits) {
    int sum = 0;
    bool double_digit = true;   // rightmost payload digit is doubled
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        double_digit = !double_digit;
    }
    return (10 - sum % 10) % 10;
}

bool BuiltinFakeDataProvider::luhn_valid(std::string_view number) {
    std::string digits;
    digits.reserve(number.size());
    for (const char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    if (digits.size() < 13 || digits.size() > 19) return false;

    const std::string_view payload(digits.data(), digits.size() - 1);
    return luhn_check_digit(payload) == digits.back() - '0';
}

} // namespace doubleblind

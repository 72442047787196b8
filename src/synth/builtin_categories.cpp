#include "synth/builtin_categories.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <random>
#include <stdexcept>
#include <string>

namespace doubleblind {

namespace {

constexpr int kMaxFreeTextWords = 64;
constexpr int kMaxIdDigits = 15;       // Exact in a JSON double
constexpr int kMinDiscriminator = 2;
constexpr int kMaxDiscriminator = 99999;

// Word count of a string original (0 without one), at most kMaxFreeTextWords
int word_count(const Scalar* original) {
    if (!original || !std::holds_alternative<std::string>(*original)) return 0;
    const auto& text = std::get<std::string>(*original);
    int count = 0;
    bool in_word = false;
    for (const char c : text) {
        const bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !in_word) ++count;
        in_word = !space;
    }
    return std::min(count, kMaxFreeTextWords);
}

int digit_count(const Scalar* original) {
    if (!original || !std::holds_alternative<int64_t>(*original)) return 0;
    const int64_t value = std::get<int64_t>(*original);
    std::string digits = std::to_string(value);
    if (!digits.empty() && digits[0] == '-') digits.erase(0, 1);
    return static_cast<int>(digits.size());
}

// Strategy that forwards to a provider kind
SynthesisStrategy provider_strategy(std::shared_ptr<const IFakeDataProvider> provider,
                                    std::string kind) {
    return [provider = std::move(provider), kind = std::move(kind)](SynthesisContext& ctx) {
        return provider->generate(kind, ctx.locale, ctx.rng);
    };
}

int discriminator(Rng& rng) {
    std::uniform_int_distribution<int> dist(kMinDiscriminator, kMaxDiscriminator);
    return dist(rng);
}

std::string expect_string(const Scalar& value, std::string_view kind) {
    if (!std::holds_alternative<std::string>(value)) {
        throw TypeMismatchError(std::format(
            "Fake data provider returned a non-string value for '{}'", kind));
    }
    return std::get<std::string>(value);
}

// Provider kind drawn from a small vocabulary: the bare value first, then
// "<value><separator><n>" once a retry shows the bare value is taken
SynthesisStrategy vocabulary_strategy(std::shared_ptr<const IFakeDataProvider> provider,
                                      std::string kind, std::string separator) {
    return [provider = std::move(provider), kind = std::move(kind),
            separator = std::move(separator)](SynthesisContext& ctx) -> Scalar {
        std::string value = expect_string(provider->generate(kind, ctx.locale, ctx.rng), kind);
        if (ctx.attempt == 0) return value;
        return std::format("{}{}{}", value, separator, discriminator(ctx.rng));
    };
}

SynthesisStrategy free_text_strategy(std::shared_ptr<const IFakeDataProvider> provider) {
    return [provider = std::move(provider)](SynthesisContext& ctx) -> Scalar {
        const int words = word_count(ctx.original);
        if (words == 0) {
            std::string text = expect_string(
                provider->generate("sentence", ctx.locale, ctx.rng), "sentence");
            if (ctx.attempt == 0) return text;
            return std::format("{} {}", text, discriminator(ctx.rng));
        }
        std::string out;
        for (int i = 0; i < words; ++i) {
            if (i > 0) out += ' ';
            out += expect_string(provider->generate("word", ctx.locale, ctx.rng), "word");
        }
        // Keeps the word count: the discriminator is glued to the last word
        if (ctx.attempt > 0) out += std::to_string(discriminator(ctx.rng));
        return out;
    };
}

// Random integer with the same number of digits as the original (8 without
// one). From the second retry on, each retry adds a digit so that originals
// filling their whole digit range still find a free value.
Scalar numeric_id(SynthesisContext& ctx) {
    int digits = digit_count(ctx.original);
    if (digits == 0) digits = 8;
    if (ctx.attempt > 1) digits += static_cast<int>(ctx.attempt) - 1;
    digits = std::min(digits, kMaxIdDigits);

    int64_t lo = 1;
    for (int i = 1; i < digits; ++i) lo *= 10;
    const int64_t hi = lo * 10 - 1;
    if (digits == 1) lo = 0;

    std::uniform_int_distribution<int64_t> dist(lo, hi);
    return dist(ctx.rng);
}

} // anonymous namespace

void register_builtin_categories(CategoryRegistry& registry,
                                 std::shared_ptr<const IFakeDataProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("register_builtin_categories requires a fake data provider");
    }

    // Output spaces large enough that random retries find a free value
    static constexpr std::string_view kStringKinds[] = {
        "email", "full_name", "username", "phone", "ssn", "address", "postcode",
        "credit_card", "ip_address",
    };
    for (const auto kind : kStringKinds) {
        registry.register_category(std::string(kind), PrimitiveType::STRING,
                                   provider_strategy(provider, std::string(kind)));
    }

    // A few dozen words each
    registry.register_category("first_name", PrimitiveType::STRING,
                               vocabulary_strategy(provider, "first_name", ""));
    registry.register_category("last_name", PrimitiveType::STRING,
                               vocabulary_strategy(provider, "last_name", ""));
    registry.register_category("city", PrimitiveType::STRING,
                               vocabulary_strategy(provider, "city", " "));
    registry.register_category("company", PrimitiveType::STRING,
                               vocabulary_strategy(provider, "company", " "));

    registry.register_category("date_of_birth", PrimitiveType::DATE,
                               provider_strategy(provider, "date_of_birth"));
    registry.register_category("free_text", PrimitiveType::STRING, free_text_strategy(provider));
    registry.register_category("numeric_id", PrimitiveType::INTEGER, numeric_id);

    registry.register_alias("name", "full_name");
    registry.register_alias("national_id", "ssn");
}

std::shared_ptr<CategoryRegistry> make_default_registry() {
    auto registry = std::make_shared<CategoryRegistry>();
    register_builtin_categories(*registry, std::make_shared<BuiltinFakeDataProvider>());
    return registry;
}

} // namespace doubleblind

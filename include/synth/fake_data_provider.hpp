#pragma once

#include "core/types.hpp"
#include "registry/category_registry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace doubleblind {

/**
 * @brief Fake-data collaborator: generate(kind, locale) -> plausible value.
 *
 * Implementations must draw all randomness from the supplied engine so
 * that synthesis stays reproducible for a given run seed.
 */
class IFakeDataProvider {
public:
    virtual ~IFakeDataProvider() = default;

    /**
     * @brief Produce a fake value of the given kind
     * @throws UnknownCategoryError if the kind is not supported
     */
    [[nodiscard]] virtual Scalar generate(std::string_view kind, std::string_view locale,
                                          Rng& rng) const = 0;

    [[nodiscard]] virtual bool supports(std::string_view kind) const = 0;
};

/**
 * @brief Dependency-free provider with en_US, de_DE and fr_FR vocabularies.
 *
 * Kinds: first_name, last_name, full_name, email, username, phone, ssn,
 * address, city, postcode, credit_card, ip_address, date_of_birth,
 * company, word, sentence. Unknown locales fall back to en_US.
 *
 * Emails use the reserved example.* domains, IPs the 10.0.0.0/8 range and
 * card numbers are Luhn-valid test numbers starting with 4.
 */
class BuiltinFakeDataProvider : public IFakeDataProvider {
public:
    [[nodiscard]] Scalar generate(std::string_view kind, std::string_view locale,
                                  Rng& rng) const override;

    [[nodiscard]] bool supports(std::string_view kind) const override;

    [[nodiscard]] static const std::vector<std::string>& supported_kinds();
    [[nodiscard]] static const std::vector<std::string>& supported_locales();

    /// Luhn check digit for a digit string
    [[nodiscard]] static int luhn_check_digit(std::string_view digits);
    [[nodiscard]] static bool luhn_valid(std::string_view number);
};

} // namespace doubleblind

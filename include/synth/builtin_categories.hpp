#pragma once

#include "registry/category_registry.hpp"
#include "synth/fake_data_provider.hpp"

#include <memory>

namespace doubleblind {

/**
 * @brief Register the standard PII categories backed by `provider`.
 *
 * email, full_name (alias name), first_name, last_name, username, company,
 * phone, ssn (alias national_id), address, city, postcode, credit_card,
 * ip_address, date_of_birth, free_text, numeric_id.
 *
 * free_text and numeric_id are format-preserving: they keep the original's
 * word count and digit count respectively.
 *
 * @throws DuplicateCategoryError if any of these tags is already registered
 */
void register_builtin_categories(CategoryRegistry& registry,
                                 std::shared_ptr<const IFakeDataProvider> provider);

/// Registry pre-populated with the built-in categories over BuiltinFakeDataProvider
[[nodiscard]] std::shared_ptr<CategoryRegistry> make_default_registry();

} // namespace doubleblind

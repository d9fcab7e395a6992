#ifndef REALMLINK_CORE_COMPAT_H
#define REALMLINK_CORE_COMPAT_H

// Project-wide aliases for optional/variant so call sites read the same
// regardless of where the vocabulary types come from.

#include <cstddef>
#include <optional>
#include <type_traits>
#include <variant>

namespace realmlink {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using bad_variant_access = std::bad_variant_access;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace realmlink

#endif  // REALMLINK_CORE_COMPAT_H

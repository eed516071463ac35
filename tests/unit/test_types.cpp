#include "fltfmt/fltfmt.hpp"

#include <type_traits>

using namespace fltfmt;

// --- Errors ---

static_assert(std::is_base_of_v<std::runtime_error, Error>);
static_assert(std::is_base_of_v<Error, SchemaError>);
static_assert(std::is_base_of_v<Error, EncodingError>);
static_assert(std::is_base_of_v<Error, NumeralError>);

// --- Format descriptions ---

// Only compile() makes a FormatSpec; once made it is a plain value.
static_assert(!std::is_default_constructible_v<FormatSpec>);
static_assert(std::is_copy_constructible_v<FormatSpec>);
static_assert(std::is_move_constructible_v<FormatSpec>);
static_assert(std::is_default_constructible_v<FormatParams>);

static_assert(std::is_same_v<decltype(formats::ieeeBinary64()),
                             const FormatSpec &>);
static_assert(std::is_same_v<decltype(FormatSpec::compile(FormatParams{})),
                             FormatSpec>);

// Exponent tables are indexed by significand convention.
static_assert(static_cast<int>(SignificandMode::Integral) == 0);
static_assert(static_cast<int>(SignificandMode::Fractional) == 1);
static_assert(static_cast<int>(SignificandMode::Scientific) == 2);

// --- Values ---

static_assert(std::is_default_constructible_v<FloatValue>);
static_assert(std::is_copy_assignable_v<FloatValue>);
static_assert(std::is_same_v<decltype(compareValues(
                                 std::declval<const FormatSpec &>(),
                                 FloatValue(), FloatValue())),
                             std::partial_ordering>);

// --- Codec surface ---

static_assert(std::is_same_v<decltype(pack(std::declval<const FormatSpec &>(),
                                           FloatValue())),
                             std::optional<EncodedBytes>>);
static_assert(std::is_same_v<decltype(unpack(
                                 std::declval<const FormatSpec &>(),
                                 EncodedBytes{})),
                             FloatValue>);
static_assert(std::is_same_v<decltype(encodeText(
                                 std::declval<const FormatSpec &>(), "1")),
                             std::optional<EncodedBytes>>);

// --- Rounding ---

static_assert(std::is_same_v<decltype(roundShiftRight(bits_t(), 2, 1,
                                                      RoundingMode::TiesAway)),
                             bits_t>);

int main() { return 0; }

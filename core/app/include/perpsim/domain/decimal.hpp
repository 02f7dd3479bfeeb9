#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <string>

namespace perpsim {

// -----------------------------------------------------------------------------
// Decimal - exact base-10 number used for every price, quantity and amount
// -----------------------------------------------------------------------------
//
// @brief  50-digit decimal floating type from Boost.Multiprecision.
//
// @details
// Balance, entry price and PnL are updated on every fill. Binary doubles
// would accumulate representation error across repeated increase/decrease
// cycles and break the "open then close at the same price leaves the balance
// unchanged" property. cpp_dec_float stores base-10 digits, so additions,
// subtractions and multiplications of the values we handle are exact and a
// division only rounds at the 50th significant digit.
//
// Expression templates are disabled (et_off): every operator returns a
// concrete Decimal, which keeps `auto` safe and error messages readable.
//
// Rounding to a fixed number of places happens only at reporting boundaries
// (snapshot JSON, log lines) and when normalizing feed input; the running
// engine state is never rounded.
// -----------------------------------------------------------------------------
using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<50>,
    boost::multiprecision::et_off>;

// -------------------------------------------------------------------------
// parseDecimal(text)
// -------------------------------------------------------------------------
// @brief  Parses a plain decimal literal ("101.5", "-3", "1e-4").
//
// @throws std::invalid_argument if the text is empty, contains anything
//         other than sign, digits, one '.', and an optional exponent, or
//         names a non-finite value ("nan", "inf").
// -------------------------------------------------------------------------
Decimal parseDecimal(const std::string& text);

// -------------------------------------------------------------------------
// quantize(value, places)
// -------------------------------------------------------------------------
// @brief  Rounds value to `places` digits after the decimal point using
//         round-half-to-even (banker's rounding).
//
// @param  places  Number of fractional digits to keep. Must be >= 0.
// -------------------------------------------------------------------------
Decimal quantize(const Decimal& value, int places);

// Lossy conversion for JSON output and logging only.
double toDouble(const Decimal& value);

// quantize() then toDouble(): the reporting-boundary rounding rule.
double roundForReport(const Decimal& value, int places = 2);

// Fixed-notation text with exactly `places` fractional digits.
std::string formatDecimal(const Decimal& value, int places);

}  // namespace perpsim

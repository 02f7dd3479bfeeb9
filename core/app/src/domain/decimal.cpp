#include "perpsim/domain/decimal.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace perpsim {

namespace {

// Accepts [+-]digits[.digits][(e|E)[+-]digits] with at least one mantissa
// digit. cpp_dec_float's own parser also accepts "inf" and "nan", which have
// no meaning for money.
bool isPlainDecimalLiteral(const std::string& text) {
  std::size_t i = 0;
  const std::size_t n = text.size();

  if (i < n && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }

  std::size_t mantissa_digits = 0;
  while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
    ++i;
    ++mantissa_digits;
  }
  if (i < n && text[i] == '.') {
    ++i;
    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
      ++i;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) {
    return false;
  }

  if (i < n && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < n && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    std::size_t exponent_digits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
      ++i;
      ++exponent_digits;
    }
    if (exponent_digits == 0) {
      return false;
    }
  }

  return i == n;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseDecimal
// -----------------------------------------------------------------------------
Decimal parseDecimal(const std::string& text) {
  if (!isPlainDecimalLiteral(text)) {
    throw std::invalid_argument("not a decimal number: '" + text + "'");
  }
  try {
    return Decimal(text);
  } catch (const std::runtime_error& e) {
    throw std::invalid_argument("not a decimal number: '" + text +
                                "' (" + e.what() + ")");
  }
}

// -----------------------------------------------------------------------------
// quantize: round-half-even at `places` fractional digits
// -----------------------------------------------------------------------------
Decimal quantize(const Decimal& value, int places) {
  if (places < 0) {
    throw std::invalid_argument("quantize: places must be >= 0");
  }

  // 10^places and 10^-places are both exact in base 10, so scaling up and
  // back down introduces no error of its own.
  const Decimal scale_up("1e" + std::to_string(places));
  const Decimal scale_down("1e-" + std::to_string(places));

  const Decimal scaled = value * scale_up;
  Decimal whole = boost::multiprecision::floor(scaled);
  const Decimal remainder = scaled - whole;
  const Decimal half("0.5");

  if (remainder > half) {
    whole += 1;
  } else if (remainder == half) {
    const Decimal halved = whole / 2;
    if (boost::multiprecision::floor(halved) != halved) {
      whole += 1;  // odd: round up to the even neighbour
    }
  }

  return whole * scale_down;
}

double toDouble(const Decimal& value) { return value.convert_to<double>(); }

double roundForReport(const Decimal& value, int places) {
  return toDouble(quantize(value, places));
}

std::string formatDecimal(const Decimal& value, int places) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(places)
      << toDouble(quantize(value, places));
  return out.str();
}

}  // namespace perpsim

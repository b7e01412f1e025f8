#pragma once

#include <optional>
#include <string>

// Price text for labels and summaries:
//   >= 1000  -> grouped integer ("43,210")
//   >= 1     -> up to 2 decimals ("1.5", "12.34")
//   else     -> up to 6 decimals ("0.000123")
// Missing or non-finite values print as "-".
std::string formatPrice(std::optional<double> value);

// Signed percentage with two decimals ("+1.25%", "-0.40%"), "-" when missing
std::string formatPercent(std::optional<double> value);

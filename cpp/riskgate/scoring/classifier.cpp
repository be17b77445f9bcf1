#include "riskgate/scoring/classifier.hpp"

#include "riskgate/core/error.hpp"

#include <cmath>
#include <sstream>

namespace riskgate {

BandMatch classify(double overall, const std::vector<Band>& bands) {
  if (!(std::isfinite(overall) && overall >= 0.0 && overall <= 1.0)) {
    std::ostringstream oss;
    oss << "classifier received overall=" << overall << " outside [0,1]";
    RISKGATE_THROW(ErrorCode::kInternalInvariant, oss.str());
  }

  validate_band_table(bands);

  const std::size_t last = bands.size() - 1;
  for (std::size_t i = 0; i < bands.size(); ++i) {
    const Band& b = bands[i];
    const bool top = (i == last);
    const bool inside = (overall >= b.low) && (top ? overall <= b.high : overall < b.high);
    if (inside) {
      BandMatch m;
      m.category = b.category;
      m.low = b.low;
      m.high = b.high;
      m.closed_high = top;
      return m;
    }
  }

  // Unreachable for a validated table: bands cover [0,1] exactly.
  RISKGATE_THROW(ErrorCode::kInternalInvariant, "validated band table failed to cover overall score");
}

}  // namespace riskgate

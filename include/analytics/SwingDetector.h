#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace swingfib {
namespace analytics {

// Per-bar output of swing detection.
//   markers:        -1 trough, +1 peak, 0 otherwise (confirmed pivots only)
//   turning_points: +1 where direction flips to up, -1 where it flips to down
struct SwingResult {
    std::vector<int> markers;
    std::vector<int> turning_points;
    std::vector<std::string> diagnostics;

    std::size_t pivotCount() const;
};

enum class SwingDetectorKind {
    REFERENCE,  // single pass state machine
    LEG_SCAN    // prefix-extremum passes per leg
};

// Zigzag style turning point detector over high/low series.
//
// A reversal is confirmed when price retraces by at least epsilon (relative)
// from the extreme of the current leg; the extreme then becomes a pivot.
// A bar's own high is never compared against its own low, and ties in the
// running extreme keep the earliest bar. The last extreme of the series is
// never confirmed and therefore never marked.
class ISwingDetector {
public:
    virtual ~ISwingDetector() = default;

    // Throws std::invalid_argument when highs and lows differ in length.
    // epsilon <= 0, non-finite input or fewer than 2 bars yield all-zero
    // output plus a diagnostic.
    SwingResult detect(const std::vector<double>& highs,
                       const std::vector<double>& lows,
                       double epsilon) const;

    virtual std::string name() const = 0;

protected:
    // Called with validated input; writes into pre-sized zeroed arrays.
    virtual void scan(const std::vector<double>& highs,
                      const std::vector<double>& lows,
                      double epsilon,
                      SwingResult& out) const = 0;
};

class IterativeSwingDetector : public ISwingDetector {
public:
    std::string name() const override { return "reference"; }

protected:
    void scan(const std::vector<double>& highs,
              const std::vector<double>& lows,
              double epsilon,
              SwingResult& out) const override;
};

// Resolves the seed from whole-series prefix min/max arrays, then each leg
// from blocked running-extremum passes (block doubles until the leg ends).
class LegScanSwingDetector : public ISwingDetector {
public:
    explicit LegScanSwingDetector(std::size_t initial_block = 64);

    std::string name() const override { return "leg_scan"; }

protected:
    void scan(const std::vector<double>& highs,
              const std::vector<double>& lows,
              double epsilon,
              SwingResult& out) const override;

private:
    std::size_t initial_block_;
};

std::unique_ptr<ISwingDetector> makeSwingDetector(SwingDetectorKind kind);

SwingDetectorKind swingDetectorKindFromString(const std::string& value);
std::string toString(SwingDetectorKind kind);

} // namespace analytics
} // namespace swingfib

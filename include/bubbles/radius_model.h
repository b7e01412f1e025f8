#pragma once

#include "bubbles/metric_extractor.h"
#include "bubbles/node.h"

#include <vector>

namespace bubbles {

// Which metric drives bubble size
enum class SizeMode { Cap, Percent, Volume };

// Radii for a whole batch, same order as metrics.
//
// Percent mode is a linear min-max map of |change| into [MIN_RADIUS, MAX_RADIUS].
// Cap and volume modes chain radii down the ranking: the largest value anchors at
// MAX_RADIUS * ANCHOR_SCALE and each next rank shrinks from its predecessor by an eased
// value ratio, then the whole batch is compressed by a spread-dependent global scale.
std::vector<double> computeRadii(std::vector<Metric> const& metrics, SizeMode mode);

// Linear percent-change sizing given the batch range
double percentRadius(double change, double min_change, double max_change);

// Rank chain over raw values (already floored at 1 by the caller or not, floored here)
std::vector<double> rankChainRadii(std::vector<double> const& raw_values);

// Spread-dependent compression: 0.72 for max/min <= 2, 1.0 for >= 12, linear between
double globalScaleForSpread(double spread);

// Logarithmic area mapping of a single value against a batch range.
// Used to size one instrument without the rest of its batch.
double logAreaRadius(double value, double min_value, double max_value);

// (radius - MIN_RADIUS) / (MAX_RADIUS - MIN_RADIUS), not clamped
double sizeFactorFor(double radius);

} // namespace bubbles

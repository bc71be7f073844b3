#include "sim/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace shutbox::sim {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double variance(const std::vector<double>& v) {
	if (v.size() < 2) {
		return 0.0;
	}

	const double m = mean(v);

	double accum = 0.0;
	for (const double x: v) {
		const double d = x - m;
		accum += d * d;
	}

	return accum / static_cast<double>(v.size() - 1);
}

double stddev(const std::vector<double>& v) {
	return std::sqrt(variance(v));
}

double quantile(std::vector<double> values, const double q) {
	if (values.empty()) {
		return 0.0;
	}
	std::sort(values.begin(), values.end());

	const double pos   = std::clamp(q, 0.0, 1.0) * static_cast<double>(values.size() - 1);
	const auto lower   = static_cast<std::size_t>(std::floor(pos));
	const auto upper   = static_cast<std::size_t>(std::ceil(pos));
	const double ratio = pos - static_cast<double>(lower);

	return values[lower] + (values[upper] - values[lower]) * ratio;
}

double median(std::vector<double> values) {
	return quantile(std::move(values), 0.5);
}

ScoreSummary summarize(const std::string& strategy, const std::vector<unsigned>& scores) {
	const std::vector<double> values(scores.begin(), scores.end());
	const auto shutouts = std::count(scores.begin(), scores.end(), 0u);

	return ScoreSummary{
	        .strategy    = strategy,
	        .runs        = scores.size(),
	        .mean        = mean(values),
	        .stdDev      = stddev(values),
	        .median      = median(values),
	        .p10         = quantile(values, 0.10),
	        .p25         = quantile(values, 0.25),
	        .p75         = quantile(values, 0.75),
	        .p90         = quantile(values, 0.90),
	        .min         = scores.empty() ? 0u : *std::min_element(scores.begin(), scores.end()),
	        .max         = scores.empty() ? 0u : *std::max_element(scores.begin(), scores.end()),
	        .shutoutRate = scores.empty() ? 0.0 : static_cast<double>(shutouts) / static_cast<double>(scores.size()),
	};
}

} // namespace shutbox::sim

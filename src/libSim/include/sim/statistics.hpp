#pragma once

#include <string>
#include <vector>

namespace shutbox::sim {

double mean(const std::vector<double>& v);
double variance(const std::vector<double>& v); //!< Sample variance (n - 1).
double stddev(const std::vector<double>& v);

//! Quantile q in [0, 1] with linear interpolation between closest ranks.
double quantile(std::vector<double> values, double q);
double median(std::vector<double> values);

//! Score distribution of one strategy. Lower scores are better.
struct ScoreSummary {
	std::string strategy;
	std::size_t runs;
	double mean;
	double stdDev;
	double median;
	double p10, p25, p75, p90;
	unsigned min;
	unsigned max;
	double shutoutRate; //!< Share of games finished with score 0, in [0, 1].
};

ScoreSummary summarize(const std::string& strategy, const std::vector<unsigned>& scores);

} // namespace shutbox::sim

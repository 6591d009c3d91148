#pragma once

#include <string>
#include <utility>
#include <vector>

namespace Tsnbench {

/**
 * Descriptive statistics over one set of latency samples (milliseconds).
 * jitter is the sample standard deviation and always equals stddev.
 */
struct PercentileStats {
	size_t count = 0;
	double min = 0.0;
	double max = 0.0;
	double avg = 0.0;
	double median = 0.0;
	double stddev = 0.0;
	double p50 = 0.0;
	double p90 = 0.0;
	double p95 = 0.0;
	double p99 = 0.0;
	double p99_9 = 0.0;
	double jitter = 0.0;
};

class LatencyStats {
public:
	/**
	 * Interpolated (R-7) percentile of an ascending-sorted series.
	 * @param sorted Samples sorted ascending, must not be empty
	 * @param p Percentile in [0, 100]
	 */
	static double Percentile(const std::vector<double>& sorted, double p);

	/**
	 * Computes the full summary. Throws InsufficientData on empty input.
	 * The input does not need to be sorted.
	 */
	static PercentileStats ComputeStats(const std::vector<double>& samples);

	// Sample (n-1) standard deviation; 0 for fewer than two samples.
	static double SampleStdDev(const std::vector<double>& samples);
};

/**
 * Named fields of a summary, keyed the way report and plot consumers expect
 * ("min", "max", "avg", "median", "stddev", "p50", ..., "p99.9", "jitter").
 */
std::vector<std::pair<std::string, double>> ToFields(const PercentileStats& stats);

} // namespace Tsnbench

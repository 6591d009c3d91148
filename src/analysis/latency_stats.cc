#include "latency_stats.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include "../common/errors.h"

namespace Tsnbench {

double LatencyStats::Percentile(const std::vector<double>& sorted, double p) {
	if (sorted.empty()) {
		throw InsufficientData("Percentile of an empty series");
	}
	if (!(p >= 0.0 && p <= 100.0)) {
		throw std::invalid_argument("Percentile must be within [0, 100]: " + std::to_string(p));
	}

	const size_t n = sorted.size();
	const double index = static_cast<double>(n - 1) * p / 100.0;
	const size_t floor_idx = static_cast<size_t>(std::floor(index));
	const size_t ceil_idx = floor_idx + 1;
	if (ceil_idx >= n) {
		return sorted[floor_idx];
	}
	const double frac = index - static_cast<double>(floor_idx);
	return sorted[floor_idx] * (1.0 - frac) + sorted[ceil_idx] * frac;
}

double LatencyStats::SampleStdDev(const std::vector<double>& samples) {
	const size_t n = samples.size();
	if (n < 2) {
		return 0.0;
	}
	const long double sum = std::accumulate(
		samples.begin(), samples.end(), static_cast<long double>(0.0L));
	const long double mean = sum / static_cast<long double>(n);
	long double sq = 0.0L;
	for (double v : samples) {
		const long double d = static_cast<long double>(v) - mean;
		sq += d * d;
	}
	return static_cast<double>(std::sqrt(sq / static_cast<long double>(n - 1)));
}

PercentileStats LatencyStats::ComputeStats(const std::vector<double>& samples) {
	if (samples.empty()) {
		throw InsufficientData("Cannot compute latency statistics without samples");
	}

	std::vector<double> sorted(samples);
	std::sort(sorted.begin(), sorted.end());

	PercentileStats s{};
	s.count = sorted.size();
	s.min = sorted.front();
	s.max = sorted.back();
	const long double sum = std::accumulate(
		sorted.begin(), sorted.end(), static_cast<long double>(0.0L));
	s.avg = static_cast<double>(sum / static_cast<long double>(s.count));

	s.p50 = Percentile(sorted, 50.0);
	s.median = s.p50;
	s.p90 = Percentile(sorted, 90.0);
	s.p95 = Percentile(sorted, 95.0);
	s.p99 = Percentile(sorted, 99.0);
	s.p99_9 = Percentile(sorted, 99.9);

	s.stddev = SampleStdDev(sorted);
	s.jitter = s.stddev;
	return s;
}

std::vector<std::pair<std::string, double>> ToFields(const PercentileStats& stats) {
	return {
		{"count", static_cast<double>(stats.count)},
		{"min", stats.min},
		{"max", stats.max},
		{"avg", stats.avg},
		{"median", stats.median},
		{"stddev", stats.stddev},
		{"p50", stats.p50},
		{"p90", stats.p90},
		{"p95", stats.p95},
		{"p99", stats.p99},
		{"p99.9", stats.p99_9},
		{"jitter", stats.jitter},
	};
}

} // namespace Tsnbench

/*
  The contents of this file are dedicated by all of its authors, including

    Michael S. Gashler,
    Eric Moyer,
    anonymous contributors,

  to the public domain (http://creativecommons.org/publicdomain/zero/1.0/).

  Note that some moral obligations still exist in the absence of legal ones.
  For example, it would still be dishonest to deliberately misrepresent the
  origin of a work. Although we impose no legal requirements to obtain a
  license, it is beseeming for those who build on the works of others to
  give back useful improvements, or find a way to pay it forward. If
  you would like to cite us, a published paper about Waffles can be found
  at http://jmlr.org/papers/volume12/gashler11a/gashler11a.pdf. If you find
  our code to be useful, the Waffles team would love to hear how you use it.
*/

#ifndef __HDISTANCECACHE_H__
#define __HDISTANCECACHE_H__

#include <vector>
#include <cstddef>

namespace HClasses {

class HMatrix;
class HDistanceMetric;

/// Lazily computes and remembers the distances between pairs of rows in a dataset.
/// Only the upper triangle is stored, in one flat array of n(n-1)/2 values.
/// The distance from a point to itself is always zero and is never stored.
/// A pair is measured with the metric at most once. Errors thrown by the
/// metric propagate to the caller, and the pair stays uncomputed.
/// This class is not thread-safe. Concurrent clustering runs should each use their own cache.
class HDistanceCache
{
protected:
	const HMatrix* m_pData;
	const HDistanceMetric* m_pMetric;
	size_t m_n;
	std::vector<double> m_values;
	size_t m_evaluations;
	size_t m_cachedCount;

public:
	/// Neither pData nor pMetric is copied or deleted. Both must outlive this object.
	HDistanceCache(const HMatrix* pData, const HDistanceMetric* pMetric);
	virtual ~HDistanceCache();

	/// Returns the number of points
	size_t size() const { return m_n; }

	/// Returns the data passed to the constructor
	const HMatrix* data() const { return m_pData; }

	/// Returns the metric passed to the constructor
	const HDistanceMetric* metric() const { return m_pMetric; }

	/// Returns the distance between points i and j, computing and storing it if necessary.
	double distance(size_t i, size_t j);

	/// Returns the squared distance between points i and j.
	double squaredDistance(size_t i, size_t j)
	{
		double d = distance(i, j);
		return d * d;
	}

	/// Returns true iff the distance between i and j is known without calling the metric.
	bool isCached(size_t i, size_t j) const;

	/// Computes every distance that is not yet known.
	void fillAll();

	/// Accepts a precomputed upper-triangular distance matrix, flattened row by row
	/// (the entry for i < j is at index(i, j, n)). Throws if the size is not n(n-1)/2.
	/// Negative or NaN entries are treated as not yet computed.
	void adopt(const std::vector<double>& values);

	/// Returns the number of times the metric has been called
	size_t metricEvaluations() const { return m_evaluations; }

	/// Returns the number of pairs whose distance is currently stored
	size_t cachedCount() const { return m_cachedCount; }

	/// Returns the position of pair (i, j), where i < j, in an upper-triangular array for n points.
	static size_t index(size_t i, size_t j, size_t n)
	{
		return i * n - i * (i + 1) / 2 + (j - i - 1);
	}

	/// Returns the number of values in an upper-triangular array for n points
	static size_t triangleSize(size_t n)
	{
		return n < 2 ? 0 : n * (n - 1) / 2;
	}

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();
};

} // namespace HClasses

#endif // __HDISTANCECACHE_H__

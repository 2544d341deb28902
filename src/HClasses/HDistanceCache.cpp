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

#include "HDistanceCache.h"
#include "HDistance.h"
#include "HMatrix.h"
#include "HRand.h"
#include "HError.h"
#include <cmath>
#include <algorithm>

namespace HClasses {

HDistanceCache::HDistanceCache(const HMatrix* pData, const HDistanceMetric* pMetric)
: m_pData(pData), m_pMetric(pMetric), m_n(pData->rows()), m_evaluations(0), m_cachedCount(0)
{
	m_values.resize(triangleSize(m_n), -1.0);
}

// virtual
HDistanceCache::~HDistanceCache()
{
}

double HDistanceCache::distance(size_t i, size_t j)
{
	if(i >= m_n || j >= m_n)
		throw Ex("Index out of range. Got ", to_str(i), " and ", to_str(j), " for " + to_str(m_n) + " points");
	if(i == j)
		return 0.0;
	if(j < i)
		std::swap(i, j);
	double& slot = m_values[index(i, j, m_n)];
	if(slot < 0.0)
	{
		double d = m_pMetric->distance(m_pData->row(i), m_pData->row(j));
		m_evaluations++;
		slot = d;
		m_cachedCount++;
	}
	return slot;
}

bool HDistanceCache::isCached(size_t i, size_t j) const
{
	if(i >= m_n || j >= m_n)
		return false;
	if(i == j)
		return true;
	if(j < i)
		std::swap(i, j);
	return m_values[index(i, j, m_n)] >= 0.0;
}

void HDistanceCache::fillAll()
{
	for(size_t i = 0; i + 1 < m_n; i++)
	{
		for(size_t j = i + 1; j < m_n; j++)
			distance(i, j);
	}
}

void HDistanceCache::adopt(const std::vector<double>& values)
{
	if(values.size() != m_values.size())
		throw Ex("Expected a distance matrix with ", to_str(m_values.size()), " values for ", to_str(m_n), " points. Got ", to_str(values.size()));
	m_cachedCount = 0;
	for(size_t i = 0; i < values.size(); i++)
	{
		double d = values[i];
		if(d >= 0.0 && d == d)
		{
			m_values[i] = d;
			m_cachedCount++;
		}
		else if(m_values[i] >= 0.0)
			m_cachedCount++;
	}
}

// static
void HDistanceCache::test()
{
	HRand rand(0);
	HMatrix data(12, 3);
	for(size_t i = 0; i < data.rows(); i++)
	{
		for(size_t j = 0; j < data.cols(); j++)
			data[i][j] = rand.normal();
	}
	HEuclideanDistance metric;
	HDistanceCache cache(&data, &metric);

	// The flat layout must cover every pair exactly once
	std::vector<bool> seen(triangleSize(12), false);
	for(size_t i = 0; i < 12; i++)
	{
		for(size_t j = i + 1; j < 12; j++)
		{
			size_t pos = index(i, j, 12);
			if(pos >= seen.size() || seen[pos])
				throw Ex("bad layout");
			seen[pos] = true;
		}
	}

	// Lazy fill, symmetry, and no recomputation
	TestEqual(0.0, cache.distance(5, 5), "diagonal");
	TestEqual((size_t)0, cache.metricEvaluations(), "diagonal is not measured");
	double d = cache.distance(7, 2);
	if(std::abs(d - metric.distance(data[2], data[7])) > 1e-12)
		throw Ex("wrong distance");
	if(!cache.isCached(2, 7))
		throw Ex("expected the pair to be cached");
	TestEqual(d, cache.distance(2, 7), "symmetric");
	TestEqual((size_t)1, cache.metricEvaluations(), "measured once");
	cache.fillAll();
	TestEqual(triangleSize(12), cache.metricEvaluations(), "fillAll measures each pair once");
	cache.fillAll();
	TestEqual(triangleSize(12), cache.metricEvaluations(), "second fillAll measures nothing");
	TestEqual(triangleSize(12), cache.cachedCount(), "cachedCount");

	// Adopting a partial external matrix
	HDistanceCache cache2(&data, &metric);
	std::vector<double> external(triangleSize(12), -1.0);
	external[index(0, 1, 12)] = 42.0;
	external[index(3, 4, 12)] = std::nan("");
	cache2.adopt(external);
	TestEqual(42.0, cache2.distance(1, 0), "adopted value wins");
	TestEqual((size_t)0, cache2.metricEvaluations(), "adopted values are not measured");
	if(cache2.isCached(3, 4))
		throw Ex("NaN entries should stay lazy");
	cache2.distance(3, 4);
	TestEqual((size_t)1, cache2.metricEvaluations(), "lazy entry measured");

	// Errors propagate
	HExpectException ee;
	bool threw = false;
	try
	{
		std::vector<double> wrongSize(5, 1.0);
		cache2.adopt(wrongSize);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("expected a wrong-sized matrix to be rejected");
	threw = false;
	HMatrix ragged(2);
	ragged.newRow().fill(0.0);
	HVec& r = ragged.newRow();
	r.fill(1.0);
	r.resize(3);
	r.fill(1.0);
	HDistanceCache cache3(&ragged, &metric);
	try
	{
		cache3.distance(0, 1);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("expected the metric error to propagate");
	if(cache3.isCached(0, 1))
		throw Ex("a failed measurement should not be stored");
	std::string message;
	try
	{
		cache.distance(3, 12);
	}
	catch(const Ex& e)
	{
		message = e.what();
	}
	TestContains("Got 3 and 12 for 12 points", message, "out-of-range pair");
}

} // namespace HClasses

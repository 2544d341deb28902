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

#include "HNeighborFinder.h"
#include "HDistanceCache.h"
#include "HDistance.h"
#include "HMatrix.h"
#include "HRand.h"
#include "HError.h"
#include <algorithm>
#include <cmath>

using std::vector;

namespace HClasses {

size_t HNeighborFinder::size() const
{
	return m_pCache->size();
}

/// Keeps the k nearest of the points offered to it in a max-heap ordered by
/// (distance, index), so the farthest kept neighbor is always at the front.
/// Between two points at the same distance, the one with the higher index is farther.
class HClosestNeighborFindingHelper
{
protected:
	size_t m_neighbors;
	std::vector<std::pair<double, size_t> > m_heap;

public:
	HClosestNeighborFindingHelper(size_t neighbors)
	: m_neighbors(neighbors)
	{
		HAssert(m_neighbors >= 1);
		m_heap.reserve(neighbors);
	}

	~HClosestNeighborFindingHelper()
	{
	}

	/// Keeps the point if the list is not full yet, or if it comes before the farthest kept neighbor
	void tryPoint(size_t index, double distance)
	{
		std::pair<double, size_t> candidate(distance, index);
		if(m_heap.size() < m_neighbors)
		{
			m_heap.push_back(candidate);
			std::push_heap(m_heap.begin(), m_heap.end());
			return;
		}
		if(!(candidate < m_heap.front()))
			return;
		std::pop_heap(m_heap.begin(), m_heap.end());
		m_heap.back() = candidate;
		std::push_heap(m_heap.begin(), m_heap.end());
	}

	/// Empties the heap into neighs and dists, from nearest to farthest
	void results(std::vector<size_t>& neighs, std::vector<double>& dists)
	{
		std::sort_heap(m_heap.begin(), m_heap.end());
		neighs.resize(m_heap.size());
		dists.resize(m_heap.size());
		for(size_t i = 0; i < m_heap.size(); i++)
		{
			dists[i] = m_heap[i].first;
			neighs[i] = m_heap[i].second;
		}
		m_heap.clear();
	}
};

// --------------------------------------------------------------------------------

HBruteForceNeighborFinder::HBruteForceNeighborFinder(HDistanceCache* pCache)
: HNeighborFinder(pCache)
{
}

// virtual
HBruteForceNeighborFinder::~HBruteForceNeighborFinder()
{
}

// virtual
size_t HBruteForceNeighborFinder::findNearest(size_t k, size_t pointIndex)
{
	if(k == 0)
	{
		m_neighs.clear();
		m_dists.clear();
		return 0;
	}
	HClosestNeighborFindingHelper helper(k);
	for(size_t i = 0; i < m_pCache->size(); i++)
	{
		if(i == pointIndex)
			continue;
		helper.tryPoint(i, m_pCache->distance(pointIndex, i));
	}
	helper.results(m_neighs, m_dists);
	return m_neighs.size();
}

// static
void HBruteForceNeighborFinder::test()
{
	HRand prng(0);
	HMatrix data(60, 2);
	for(size_t i = 0; i < data.rows(); i++)
	{
		data[i][0] = prng.uniform();
		data[i][1] = prng.uniform();
	}
	HEuclideanDistance metric;
	HDistanceCache cache(&data, &metric);
	HBruteForceNeighborFinder finder(&cache);
	for(size_t i = 0; i < data.rows(); i++)
	{
		size_t found = finder.findNearest(7, i);
		TestEqual((size_t)7, found, "neighbor count");

		// Compare against a full sort
		vector<std::pair<double, size_t> > all;
		for(size_t j = 0; j < data.rows(); j++)
		{
			if(j != i)
				all.push_back(std::make_pair(metric.distance(data[i], data[j]), j));
		}
		std::sort(all.begin(), all.end());
		for(size_t j = 0; j < found; j++)
		{
			TestEqual(all[j].second, finder.neighbor(j), "neighbor order");
			if(std::abs(all[j].first - finder.distance(j)) > 1e-12)
				throw Ex("wrong neighbor distance");
		}
	}

	// Ties go to the lower index
	HMatrix line({{0.0}, {1.0}, {-1.0}, {2.0}, {-2.0}});
	HDistanceCache cache2(&line, &metric);
	HBruteForceNeighborFinder finder2(&cache2);
	TestEqual((size_t)1, finder2.findNearest(1, 0), "one neighbor");
	TestEqual((size_t)1, finder2.neighbor(0), "tie goes to the lower index");
	TestEqual((size_t)3, finder2.findNearest(3, 0), "three neighbors");
	TestEqual((size_t)1, finder2.neighbor(0), "first");
	TestEqual((size_t)2, finder2.neighbor(1), "second");
	TestEqual((size_t)3, finder2.neighbor(2), "third");

	// A full list does not give up a lower index for a tied higher one
	HMatrix ties({{0.0, 0.0}, {5.0, 0.0}, {-5.0, 0.0}, {3.0, 0.0}});
	HDistanceCache cache3(&ties, &metric);
	HBruteForceNeighborFinder finder3(&cache3);
	TestEqual((size_t)2, finder3.findNearest(2, 0), "two neighbors");
	TestEqual((size_t)3, finder3.neighbor(0), "nearest");
	TestEqual((size_t)1, finder3.neighbor(1), "the lower of two tied indexes is kept");
	TestEqual(5.0, finder3.distance(1), "tied distance");
	TestEqual((size_t)1, finder3.findNearest(1, 3), "one neighbor");
	TestEqual((size_t)1, finder3.neighbor(0), "nearest to 3");

	// Asking for more neighbors than exist
	TestEqual((size_t)4, finder2.findNearest(10, 4), "capped at n-1");
}

} // namespace HClasses

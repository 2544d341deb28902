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

#include "HHubness.h"
#include "HNeighborFinder.h"
#include "HDistanceCache.h"
#include "HDistance.h"
#include "HMatrix.h"
#include "HRand.h"
#include "HError.h"
#include <algorithm>

using std::vector;

namespace HClasses {

HHubnessProfile::HHubnessProfile()
: m_neighborhoodSize(0)
{
}

HHubnessProfile::HHubnessProfile(const std::vector<size_t>& occurrences, size_t neighborhoodSize)
: m_occurrences(occurrences), m_neighborhoodSize(neighborhoodSize)
{
}

HHubnessProfile::~HHubnessProfile()
{
}

// static
HHubnessProfile HHubnessProfile::fromNeighborFinder(HNeighborFinder& finder, size_t k)
{
	if(k == 0)
		throw Ex("The neighborhood size must be at least 1");
	size_t n = finder.size();
	vector<size_t> occurrences(n, 0);
	for(size_t i = 0; i < n; i++)
	{
		size_t found = finder.findNearest(k, i);
		for(size_t j = 0; j < found; j++)
			occurrences[finder.neighbor(j)]++;
	}
	return HHubnessProfile(occurrences, k);
}

size_t HHubnessProfile::sum() const
{
	size_t s = 0;
	for(vector<size_t>::const_iterator it = m_occurrences.begin(); it != m_occurrences.end(); ++it)
		s += *it;
	return s;
}

size_t HHubnessProfile::biggestHub() const
{
	size_t best = INVALID_INDEX;
	for(size_t i = 0; i < m_occurrences.size(); i++)
	{
		if(best == INVALID_INDEX || m_occurrences[i] > m_occurrences[best])
			best = i;
	}
	return best;
}

// static
void HHubnessProfile::test()
{
	HRand prng(0);
	HMatrix data(80, 5);
	for(size_t i = 0; i < data.rows(); i++)
	{
		for(size_t j = 0; j < data.cols(); j++)
			data[i][j] = prng.normal();
	}
	HEuclideanDistance metric;
	HDistanceCache cache(&data, &metric);
	HBruteForceNeighborFinder finder(&cache);
	HHubnessProfile profile = HHubnessProfile::fromNeighborFinder(finder, 10);
	TestEqual((size_t)80, profile.size(), "size");
	TestEqual((size_t)800, profile.sum(), "occurrences sum to n*k");
	TestEqual((size_t)10, profile.neighborhoodSize(), "k");
	TestEqual((size_t)0, profile.occurrences(1000), "absent entries have no occurrences");
	size_t hub = profile.biggestHub();
	for(size_t i = 0; i < profile.size(); i++)
	{
		if(profile.occurrences(i) > profile.occurrences(hub))
			throw Ex("biggestHub is not the biggest");
	}

	// Three collinear points with k=1: 0 and 2 both pick 1, and 1 picks 0
	HMatrix line({{0.0}, {1.0}, {2.0}});
	HDistanceCache cache2(&line, &metric);
	HBruteForceNeighborFinder finder2(&cache2);
	HHubnessProfile p2 = HHubnessProfile::fromNeighborFinder(finder2, 1);
	TestEqual((size_t)1, p2.occurrences(0), "line 0");
	TestEqual((size_t)2, p2.occurrences(1), "line 1");
	TestEqual((size_t)0, p2.occurrences(2), "line 2");
	TestEqual((size_t)1, p2.biggestHub(), "line hub");
}

// --------------------------------------------------------------------------------

HLocalHubness::HLocalHubness(size_t k)
: m_k(k)
{
	if(k == 0)
		throw Ex("The neighborhood size must be at least 1");
}

HLocalHubness::~HLocalHubness()
{
}

size_t HLocalHubness::neighborCount(size_t memberCount) const
{
	if(memberCount < 2)
		return 0;
	return std::min(m_k, memberCount - 1);
}

size_t HLocalHubness::insertNeighbor(size_t* pNeighs, double* pDists, size_t count, size_t candidate, double dist)
{
	if(count == m_k)
	{
		// The list is full. Only a strictly closer candidate displaces the farthest one.
		if(dist >= pDists[count - 1])
			return count;
		count--;
	}
	size_t pos = count;
	while(pos > 0 && pDists[pos - 1] > dist)
	{
		pDists[pos] = pDists[pos - 1];
		pNeighs[pos] = pNeighs[pos - 1];
		pos--;
	}
	pDists[pos] = dist;
	pNeighs[pos] = candidate;
	return count + 1;
}

void HLocalHubness::compute(HDistanceCache& cache, const std::vector<size_t>& members, std::vector<size_t>& outOccurrences)
{
	size_t n = members.size();
	outOccurrences.assign(n, 0);
	if(n < 2)
		return;
	m_neighs.resize(m_k);
	m_dists.resize(m_k);
	for(size_t a = 0; a < n; a++)
	{
		size_t count = 0;
		for(size_t b = 0; b < n; b++)
		{
			if(b == a)
				continue;
			double d = cache.distance(members[a], members[b]);
			count = insertNeighbor(m_neighs.data(), m_dists.data(), count, b, d);
		}
		for(size_t j = 0; j < count; j++)
			outOccurrences[m_neighs[j]]++;
	}
}

// static
void HLocalHubness::test()
{
	HRand prng(1);
	HMatrix data(40, 3);
	for(size_t i = 0; i < data.rows(); i++)
	{
		for(size_t j = 0; j < data.cols(); j++)
			data[i][j] = prng.normal();
	}
	HEuclideanDistance metric;
	HDistanceCache cache(&data, &metric);

	// A cluster made of every other point
	vector<size_t> members;
	for(size_t i = 0; i < data.rows(); i += 2)
		members.push_back(i);
	HLocalHubness local(4);
	vector<size_t> occ;
	local.compute(cache, members, occ);
	TestEqual(members.size(), occ.size(), "aligned with members");
	size_t total = 0;
	for(size_t j = 0; j < occ.size(); j++)
		total += occ[j];
	TestEqual(members.size() * 4, total, "local occurrences sum to size*k");
	for(size_t i = 1; i < data.rows(); i += 2)
	{
		if(cache.isCached(i, 0))
			throw Ex("distances to non-members should not be measured");
	}

	// Must agree with a brute-force neighbor search over the sub-matrix
	HMatrix sub(3);
	for(size_t j = 0; j < members.size(); j++)
		sub.copyRow(data[members[j]]);
	HDistanceCache subCache(&sub, &metric);
	HBruteForceNeighborFinder finder(&subCache);
	HHubnessProfile expected = HHubnessProfile::fromNeighborFinder(finder, 4);
	for(size_t j = 0; j < occ.size(); j++)
		TestEqual(expected.occurrences(j), occ[j], "local matches brute force");

	// Small clusters
	vector<size_t> pair;
	pair.push_back(3);
	pair.push_back(9);
	local.compute(cache, pair, occ);
	TestEqual((size_t)1, occ[0], "pair 0");
	TestEqual((size_t)1, occ[1], "pair 1");
	TestEqual((size_t)1, local.neighborCount(2), "neighborCount of a pair");
	vector<size_t> single(1, 5);
	local.compute(cache, single, occ);
	TestEqual((size_t)0, occ[0], "single member");
}

} // namespace HClasses

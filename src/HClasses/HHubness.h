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

#ifndef __HHUBNESS_H__
#define __HHUBNESS_H__

#include <vector>
#include <cstddef>

namespace HClasses {

class HNeighborFinder;
class HDistanceCache;


/// Stores how many times each point occurs in the k-nearest-neighbor lists of the other points.
/// Clustering algorithms only read it, and use it as a selection weight.
class HHubnessProfile
{
protected:
	std::vector<size_t> m_occurrences;
	size_t m_neighborhoodSize;

public:
	/// Makes an empty profile
	HHubnessProfile();

	/// Wraps occurrence counts that were computed elsewhere. neighborhoodSize is the k
	/// that was used to compute them, or 0 if it is not known.
	HHubnessProfile(const std::vector<size_t>& occurrences, size_t neighborhoodSize = 0);

	~HHubnessProfile();

	/// Counts neighbor occurrences using the k-nearest neighbors of every point found by finder.
	/// When k is less than the number of points, the counts sum to (number of points * k).
	static HHubnessProfile fromNeighborFinder(HNeighborFinder& finder, size_t k);

	/// Returns the number of points covered by this profile
	size_t size() const { return m_occurrences.size(); }

	/// Returns the k used to build this profile (0 if unknown)
	size_t neighborhoodSize() const { return m_neighborhoodSize; }

	/// Returns the occurrence count of point i. Points outside of the profile have no occurrences.
	size_t occurrences(size_t i) const
	{
		return i < m_occurrences.size() ? m_occurrences[i] : 0;
	}

	/// Returns all of the occurrence counts
	const std::vector<size_t>& values() const { return m_occurrences; }

	/// Returns the sum of all occurrence counts
	size_t sum() const;

	/// Returns the index of the point with the most occurrences (the first one, if there is a tie)
	size_t biggestHub() const;

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();
};


/// Computes hubness inside one cluster. Every member gets a list of its k nearest
/// neighbors among the other members, maintained by sorted insertion into a
/// fixed-size array as the distances are read from the cache. The occurrence counts
/// derived from those lists are only meaningful within the cluster.
class HLocalHubness
{
protected:
	size_t m_k;
	std::vector<size_t> m_neighs;
	std::vector<double> m_dists;

public:
	HLocalHubness(size_t k);
	~HLocalHubness();

	/// Returns the neighborhood size
	size_t neighborhoodSize() const { return m_k; }

	/// Computes the local occurrence counts of the members. outOccurrences[j] is the number
	/// of times members[j] appears in the local neighbor lists of the other members.
	/// When the cluster has more than k members, the counts sum to (members.size() * k).
	void compute(HDistanceCache& cache, const std::vector<size_t>& members, std::vector<size_t>& outOccurrences);

	/// Returns the number of local neighbors found for the last computed member list.
	/// This is min(k, members.size() - 1).
	size_t neighborCount(size_t memberCount) const;

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();

protected:
	/// Inserts a candidate into a sorted list of at most m_k neighbors.
	/// Returns the new number of neighbors in the list.
	size_t insertNeighbor(size_t* pNeighs, double* pDists, size_t count, size_t candidate, double dist);
};


} // namespace HClasses

#endif // __HHUBNESS_H__

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

#ifndef __HNEIGHBORFINDER_H__
#define __HNEIGHBORFINDER_H__

#include <vector>
#include <cstddef>

namespace HClasses {

class HDistanceCache;


/// Finds the k-nearest neighbors of any point in a dataset.
class HNeighborFinder
{
protected:
	HDistanceCache* m_pCache;

public:
	/// pCache supplies the points and the distances between them. It is not deleted by this object.
	HNeighborFinder(HDistanceCache* pCache)
	: m_pCache(pCache)
	{
	}

	virtual ~HNeighborFinder()
	{
	}

	/// Returns the distance cache passed to the constructor of this object
	HDistanceCache* cache() { return m_pCache; }

	/// Returns the number of points
	size_t size() const;

	/// Finds the k-nearest neighbors of the specified point index.
	/// Returns the number of neighbors found, which is min(k, size() - 1).
	/// Call "neighbor" or "distance" to obtain the neighbors and distances that were found.
	virtual size_t findNearest(size_t k, size_t pointIndex) = 0;

	/// Returns the point index of the ith neighbor of the last point passed to "findNearest".
	/// (Behavior is undefined if findNearest has not yet been called.)
	virtual size_t neighbor(size_t i) = 0;

	/// Returns the distance to the ith neighbor of the last point passed to "findNearest".
	/// (Behavior is undefined if findNearest has not yet been called.)
	virtual double distance(size_t i) = 0;
};


/// Finds neighbors by measuring the distance to all points. This one should work properly even if
/// the distance metric does not support the triangle inequality.
/// Neighbors are reported from nearest to farthest. Among points at the same distance,
/// the lower index comes first and wins a place in the list.
class HBruteForceNeighborFinder : public HNeighborFinder
{
protected:
	std::vector<size_t> m_neighs;
	std::vector<double> m_dists;

public:
	HBruteForceNeighborFinder(HDistanceCache* pCache);
	virtual ~HBruteForceNeighborFinder();

	/// See the comment for HNeighborFinder::findNearest
	virtual size_t findNearest(size_t k, size_t pointIndex);

	/// See the comment for HNeighborFinder::neighbor
	virtual size_t neighbor(size_t i) { return m_neighs[i]; }

	/// See the comment for HNeighborFinder::distance
	virtual double distance(size_t i) { return m_dists[i]; }

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();
};


} // namespace HClasses

#endif // __HNEIGHBORFINDER_H__

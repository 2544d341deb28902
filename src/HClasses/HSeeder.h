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

#ifndef __HSEEDER_H__
#define __HSEEDER_H__

#include <vector>
#include <cstddef>

namespace HClasses {

class HMatrix;
class HDistanceMetric;
class HRand;


/// Picks the initial cluster representatives for a clustering algorithm.
class HClusterSeeder
{
public:
	HClusterSeeder() {}
	virtual ~HClusterSeeder() {}

	/// Puts count distinct row indexes of pData into out. Implementations must never
	/// return duplicates, and must throw if count exceeds the number of rows.
	virtual void seed(const HMatrix* pData, size_t count, const HDistanceMetric& metric, HRand& rand, std::vector<size_t>& out) = 0;

	/// Throws if seeds is not a list of count distinct indexes less than rows.
	static void checkSeeds(const std::vector<size_t>& seeds, size_t count, size_t rows);
};


/// Spreads the seeds out, as in k-means++. The first seed is a uniformly random row.
/// Each subsequent seed is drawn with probability proportional to the squared distance
/// to its closest seed so far. If every remaining row coincides with a seed, the next
/// seed is drawn uniformly from the rows that have not been picked yet.
class HPlusPlusSeeder : public HClusterSeeder
{
protected:
	std::vector<double> m_shortest;
	std::vector<double> m_cumulative;
	std::vector<bool> m_chosen;

public:
	HPlusPlusSeeder();
	virtual ~HPlusPlusSeeder();

	/// See the comment for HClusterSeeder::seed
	virtual void seed(const HMatrix* pData, size_t count, const HDistanceMetric& metric, HRand& rand, std::vector<size_t>& out);

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();
};


/// Always returns the same caller-supplied seeds.
class HFixedSeeder : public HClusterSeeder
{
protected:
	std::vector<size_t> m_seeds;

public:
	HFixedSeeder(const std::vector<size_t>& seeds);
	virtual ~HFixedSeeder();

	/// Copies the seeds given to the constructor into out. Throws if count does not match,
	/// or if the seeds are out of range or repeated.
	virtual void seed(const HMatrix* pData, size_t count, const HDistanceMetric& metric, HRand& rand, std::vector<size_t>& out);
};


} // namespace HClasses

#endif // __HSEEDER_H__

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

#ifndef __HHUBSELECTOR_H__
#define __HHUBSELECTOR_H__

#include <vector>
#include <cstddef>

namespace HClasses {

class HRand;


/// Maps an iteration index to the probability of selecting hubs deterministically.
/// The default schedule is a linear ramp that starts at 0 and reaches 1 at
/// iteration rampLength. Constant schedules are useful for reproducible experiments.
class HAnnealingSchedule
{
protected:
	size_t m_rampLength;
	double m_constant;

public:
	/// Makes a linear ramp. A ramp length of 0 means always deterministic.
	HAnnealingSchedule(size_t rampLength = 20);

	/// Makes a schedule that always returns p. Throws if p is not in [0, 1].
	static HAnnealingSchedule constant(double p);

	/// Returns the probability of a deterministic selection at the specified iteration.
	/// This is non-decreasing in iteration.
	double probability(size_t iteration) const;

	/// Returns the ramp length, or 0 for a constant schedule
	size_t rampLength() const { return m_rampLength; }

	/// Returns true iff this schedule was made with HAnnealingSchedule::constant
	bool isConstant() const { return m_constant >= 0.0; }

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();
};


/// Picks a representative point for a cluster, favoring points with high neighbor occurrence.
///
/// All methods take the member list of a cluster and the occurrence counts of those
/// members (weights[j] belongs to members[j]). The caller decides whether those counts
/// come from a global profile or from a per-cluster recomputation.
class HHubSelector
{
protected:
	HRand& m_rand;
	std::vector<double> m_cumulative;

public:
	/// rand is used for every random decision. It is not copied.
	HHubSelector(HRand& rand);
	~HHubSelector();

	/// Picks a hub. A cluster with one member returns that member without drawing any
	/// random numbers. Otherwise a uniform draw below deterministicProbability selects
	/// with selectDeterministic, and any other draw selects with selectStochastic.
	/// Returns a point index (an element of members). Throws if members is empty.
	size_t select(const std::vector<size_t>& members, const std::vector<size_t>& weights, double deterministicProbability);

	/// Draws one uniform number and returns true iff it is below deterministicProbability.
	bool drawDeterministic(double deterministicProbability);

	/// Returns the member with the strictly largest weight. If several members share
	/// the largest weight, the first of them in the list wins.
	size_t selectDeterministic(const std::vector<size_t>& members, const std::vector<size_t>& weights) const;

	/// Samples a member with probability proportional to the square of its weight.
	/// A member with a weight of zero is never picked, unless every weight is zero,
	/// in which case every member is equally likely.
	size_t selectStochastic(const std::vector<size_t>& members, const std::vector<size_t>& weights);

	/// Returns the smallest index j >= 1 such that cumulative[j] >= target.
	/// cumulative must be non-decreasing, and target must be no more than its last element.
	static size_t findIndex(const std::vector<double>& cumulative, double target);

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();

protected:
	void checkSizes(const std::vector<size_t>& members, const std::vector<size_t>& weights) const;
};


} // namespace HClasses

#endif // __HHUBSELECTOR_H__

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

#ifndef __HCONVERGENCE_H__
#define __HCONVERGENCE_H__

#include <cstddef>

namespace HClasses {

/// Decides when the squared error of a clustering has stopped changing.
class HConvergenceMonitor
{
protected:
	double m_threshold;
	size_t m_minIterations;

public:
	/// threshold is the largest relative change in error that still counts as converged.
	/// No iteration before minIterations is ever considered converged.
	HConvergenceMonitor(double threshold = 0.001, size_t minIterations = 20);

	/// Returns the threshold
	double threshold() const { return m_threshold; }

	/// Returns the minimum number of iterations
	size_t minIterations() const { return m_minIterations; }

	/// Returns true iff the error is a finite value that is not the "no error yet" sentinel.
	static bool isAcceptable(double error);

	/// Returns true iff iteration has reached the floor, both errors are acceptable, and
	/// |current / previous - 1| < threshold. Degenerate errors never converge. Two errors
	/// of exactly zero are treated as unchanged.
	bool hasConverged(double previous, double current, size_t iteration) const;

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();
};

} // namespace HClasses

#endif // __HCONVERGENCE_H__

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

#include "HConvergence.h"
#include "HError.h"
#include <cmath>
#include <cfloat>
#include <limits>

namespace HClasses {

HConvergenceMonitor::HConvergenceMonitor(double threshold, size_t minIterations)
: m_threshold(threshold), m_minIterations(minIterations)
{
	if(!(threshold > 0.0))
		throw Ex("The error threshold must be positive");
}

// static
bool HConvergenceMonitor::isAcceptable(double error)
{
	return error == error && error > -DBL_MAX && error < DBL_MAX;
}

bool HConvergenceMonitor::hasConverged(double previous, double current, size_t iteration) const
{
	if(iteration < m_minIterations)
		return false;
	if(!isAcceptable(previous) || !isAcceptable(current))
		return false;
	if(previous == 0.0)
		return current == 0.0;
	double change = std::abs(current / previous - 1.0);
	if(!isAcceptable(change))
		return false;
	return change < m_threshold;
}

// static
void HConvergenceMonitor::test()
{
	HConvergenceMonitor m(0.001, 5);
	if(m.hasConverged(100.0, 100.0, 4))
		throw Ex("converged before the floor");
	if(!m.hasConverged(100.0, 100.05, 5))
		throw Ex("expected a tiny increase to converge");
	if(!m.hasConverged(100.0, 99.95, 5))
		throw Ex("expected a tiny decrease to converge");
	if(m.hasConverged(100.0, 90.0, 50))
		throw Ex("a big decrease should not converge");
	if(m.hasConverged(100.0, 110.0, 50))
		throw Ex("a big increase should not converge");
	if(m.hasConverged(DBL_MAX, 100.0, 50))
		throw Ex("the sentinel should not converge");
	if(m.hasConverged(std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity(), 50))
		throw Ex("infinity should not converge");
	if(m.hasConverged(std::nan(""), 1.0, 50))
		throw Ex("NaN should not converge");
	if(m.hasConverged(1e-300, 1e300, 50))
		throw Ex("an overflowing ratio should not converge");
	if(!m.hasConverged(0.0, 0.0, 50))
		throw Ex("two zero errors are unchanged");
	if(m.hasConverged(0.0, 1.0, 50))
		throw Ex("growing from zero is a change");
	if(!HConvergenceMonitor::isAcceptable(0.0) || HConvergenceMonitor::isAcceptable(DBL_MAX))
		throw Ex("isAcceptable is wrong");
}

} // namespace HClasses

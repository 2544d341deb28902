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

#include "HDistance.h"
#include "HError.h"
#include "HRand.h"
#include <cmath>
#include <algorithm>

namespace HClasses {

void HDistanceMetric::checkSizes(const HVec& a, const HVec& b) const
{
	if(a.size() != b.size())
		throw Ex("unexpected size. ", name(), " got vectors of size ", to_str(a.size()), " and ", to_str(b.size()));
}

void HDistanceMetric_exerciseMetric(HDistanceMetric& metric)
{
	HRand rand(0);
	HVec a(7);
	HVec b(7);
	HVec c(7);
	for(size_t i = 0; i < 100; i++)
	{
		for(size_t j = 0; j < 7; j++)
		{
			a[j] = rand.normal();
			b[j] = rand.normal();
			c[j] = rand.normal();
		}
		double ab = metric.distance(a, b);
		double ba = metric.distance(b, a);
		if(std::abs(ab - ba) > 1e-12)
			throw Ex(metric.name(), " is not symmetric");
		if(ab < 0.0)
			throw Ex(metric.name(), " returned a negative distance");
		if(metric.distance(a, a) > 1e-6)
			throw Ex(metric.name(), " does not return zero for identical vectors");
		if(metric.squaredDistance(a, c) != metric(a, c))
			throw Ex(metric.name(), " is not consistent with its function operator");
	}
	HVec wrong(3);
	wrong.fill(0.0);
	HExpectException ee;
	bool threw = false;
	try
	{
		metric.squaredDistance(a, wrong);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex(metric.name(), " did not reject vectors of different sizes");
}

// static
void HDistanceMetric::test()
{
	HEuclideanDistance d1; HDistanceMetric_exerciseMetric(d1);
	HLNormDistance d2(1.4); HDistanceMetric_exerciseMetric(d2);
	HCosineDistance d3; HDistanceMetric_exerciseMetric(d3);

	HVec a({0.0, 0.0});
	HVec b({3.0, 4.0});
	TestEqual(25.0, d1.squaredDistance(a, b), "Euclidean");
	TestEqual(5.0, d1.distance(a, b), "Euclidean distance");
	HLNormDistance manhattan(1.0);
	if(std::abs(manhattan.distance(a, b) - 7.0) > 1e-12)
		throw Ex("Manhattan distance is wrong");
	HVec c({1.0, 0.0});
	HVec d({0.0, 2.0});
	if(std::abs(d3.distance(c, d) - 1.0) > 1e-12)
		throw Ex("orthogonal vectors should have a cosine distance of 1");
	HVec e({2.0, 0.0});
	if(d3.distance(c, e) > 1e-12)
		throw Ex("parallel vectors should have a cosine distance of 0");
	TestEqual(1.0, d3.distance(a, b), "zero vector");
}

// --------------------------------------------------------------------

// virtual
double HEuclideanDistance::squaredDistance(const HVec& a, const HVec& b) const
{
	checkSizes(a, b);
	return a.squaredDistance(b);
}

// --------------------------------------------------------------------

HLNormDistance::HLNormDistance(double norm)
: HDistanceMetric(), m_norm(norm)
{
	if(!(norm > 0.0))
		throw Ex("The norm must be positive");
}

// virtual
double HLNormDistance::squaredDistance(const HVec& a, const HVec& b) const
{
	checkSizes(a, b);
	double sum = 0;
	for(size_t i = 0; i < a.size(); i++)
		sum += pow(fabs(b[i] - a[i]), m_norm);
	double d = pow(sum, 1.0 / m_norm);
	return d * d;
}

// --------------------------------------------------------------------

// virtual
double HCosineDistance::squaredDistance(const HVec& a, const HVec& b) const
{
	checkSizes(a, b);
	double denom = sqrt(a.squaredMagnitude() * b.squaredMagnitude());
	double d = 1.0;
	if(denom > 0.0)
		d = std::max(0.0, 1.0 - a.dotProduct(b) / denom);
	return d * d;
}

} // namespace HClasses

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

#ifndef __HDISTANCE_H__
#define __HDISTANCE_H__

#include "HVec.h"
#include <cmath>

namespace HClasses {

/// This class enables you to define a distance (or dissimilarity) metric between two vectors.
/// Implementations must be deterministic and symmetric, and must throw
/// an Ex when the two vectors do not have the same size.
class HDistanceMetric
{
public:
	HDistanceMetric() {}
	virtual ~HDistanceMetric() {}

	static void test();

	/// Returns the name of this class
	virtual const char* name() const = 0;

	/// Computes the squared distance (or squared dissimilarity) between the two specified vectors
	virtual double squaredDistance(const HVec& a, const HVec& b) const = 0;

	/// Returns the distance between a and b. Do not override. Override squaredDistance instead.
	double distance(const HVec& a, const HVec& b) const
	{
		return std::sqrt(squaredDistance(a, b));
	}

	/// Return squaredDistance(a, b). Allows dissimilarity metrics to
	/// be used as function objects.
	inline double operator()(const HVec& a, const HVec& b) const
	{
		return squaredDistance(a, b);
	}

protected:
	/// Throws if a and b do not have the same size
	void checkSizes(const HVec& a, const HVec& b) const;
};


/// The Euclidean distance. This is the metric used when no other is specified.
class HEuclideanDistance : public HDistanceMetric
{
public:
	HEuclideanDistance() : HDistanceMetric() {}
	virtual ~HEuclideanDistance() {}

	/// Returns the name of this class
	virtual const char* name() const { return "HEuclideanDistance"; }

	/// Returns the squared Euclidean distance between a and b
	virtual double squaredDistance(const HVec& a, const HVec& b) const;
};


/// Interpolates between manhattan distance (norm=1), Euclidean
/// distance (norm=2), and higher-order Minkowski distances.
class HLNormDistance : public HDistanceMetric
{
protected:
	double m_norm;

public:
	HLNormDistance(double norm);
	virtual ~HLNormDistance() {}

	/// Returns the name of this class
	virtual const char* name() const { return "HLNormDistance"; }

	/// Returns the square of the distance (using the norm passed to the constructor) between a and b
	virtual double squaredDistance(const HVec& a, const HVec& b) const;
};


/// The distance is 1 minus the cosine of the angle between the two vectors with the origin.
/// If either vector is all zeros, the distance is 1.
class HCosineDistance : public HDistanceMetric
{
public:
	HCosineDistance() : HDistanceMetric() {}
	virtual ~HCosineDistance() {}

	/// Returns the name of this class
	virtual const char* name() const { return "HCosineDistance"; }

	/// Returns the square of (1 - cos(a, b))
	virtual double squaredDistance(const HVec& a, const HVec& b) const;
};

} // namespace HClasses

#endif // __HDISTANCE_H__

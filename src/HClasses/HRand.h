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

#ifndef __HRAND_H__
#define __HRAND_H__

#include <stdint.h>
#include <cstddef>

namespace HClasses {


/// This is a 64-bit pseudo-random number generator.
///
/// Every randomized algorithm in this library takes a reference to one of
/// these from its caller. Two generators constructed with the same seed
/// produce the same sequence, which is what makes the clustering tests
/// reproducible.
///
/// When subclassing it, overriding the next and setSeed methods will
/// be sufficient.
class HRand
{
protected:
	uint64_t m_a;
	uint64_t m_b;

public:
	/// Create a new random number generator with the given seed
	///
	/// \param seed the seed to use for generating numbers from the
	///        random number generator
	HRand(uint64_t seed);

	/// Destructor
	virtual ~HRand();

	/// Sets the seed
	virtual void setSeed(uint64_t seed);

	/// Returns an unsigned pseudo-random 64-bit value
	virtual uint64_t next()
	{
		m_a = 0x141F2B69ull * (m_a & 0x3ffffffffull) + (m_a >> 32);
		m_b = 0xC2785A6Bull * (m_b & 0x3ffffffffull) + (m_b >> 32);
		return m_a ^ m_b;
	}

	/// Returns a pseudo-random uint from a discrete uniform
	/// distribution in the range 0 to range-1 (inclusive).
	/// (This method guarantees the result will be drawn from
	/// a uniform distribution, whereas doing "next() % range"
	/// does not guarantee a truly uniform distribution.)
	///
	/// \param range one greater than the largest number that will be
	///        returned
	virtual uint64_t next(uint64_t range);

	/// Returns a pseudo-random double from 0 (inclusive)
	/// to 1 (exclusive). This uses 52 random bits for the
	/// mantissa, and discards the extra 12 random bits.
	virtual double uniform();

	/// Returns a pseudo-random double from \a min (inclusive)
	/// to \a max (exclusive).
	virtual double uniform(double min, double max){
		return uniform()*(max-min)+min;
	}

	/// Returns a random value from a standard normal distribution. (To
	/// convert it to a random value from an arbitrary normal distribution,
	/// just multiply the value this returns by the deviation (usually
	/// lowercase-sigma), then add the mean (usually mu).)
	virtual double normal();

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();
};


} // namespace HClasses

#endif // __HRAND_H__

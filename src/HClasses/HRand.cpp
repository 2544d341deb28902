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

#include "HRand.h"
#include "HError.h"
#include <cmath>
#include <vector>

namespace HClasses {

HRand::HRand(uint64_t seed)
{
	setSeed(seed);
}

// virtual
HRand::~HRand()
{
}

// virtual
void HRand::setSeed(uint64_t seed)
{
	m_b = 0xCA535ACA9535ACB2ull + seed;
	m_a = 0x6CCF6660A66C35E7ull + (seed << 24);
}

// virtual
uint64_t HRand::next(uint64_t range)
{
	if(range == 0)
		throw Ex("Expected a range greater than zero");

	// Rejection sampling over the smallest power-of-two mask that covers the range
	uint64_t mask = range - 1;
	mask |= (mask >> 1);
	mask |= (mask >> 2);
	mask |= (mask >> 4);
	mask |= (mask >> 8);
	mask |= (mask >> 16);
	mask |= (mask >> 32);
	while(true)
	{
		uint64_t n = next() & mask;
		if(n < range)
			return n;
	}
}

// virtual
double HRand::uniform()
{
	return (double)(next() & 0xfffffffffffffull) / 4503599627370496.0;
}

// virtual
double HRand::normal()
{
	// Marsaglia's polar method
	double x, y, mag;
	do
	{
		x = uniform() * 2 - 1;
		y = uniform() * 2 - 1;
		mag = x * x + y * y;
	} while(mag >= 1.0 || mag == 0.0);
	return y * sqrt(-2.0 * log(mag) / mag);
}

// static
void HRand::test()
{
	// Identical seeds must produce identical sequences
	HRand a(1234);
	HRand b(1234);
	for(size_t i = 0; i < 1000; i++)
	{
		if(a.next() != b.next())
			throw Ex("Generators with the same seed diverged");
	}

	// Different seeds should not
	HRand c(1235);
	size_t same = 0;
	for(size_t i = 0; i < 100; i++)
	{
		if(a.next() == c.next())
			same++;
	}
	if(same > 2)
		throw Ex("Generators with different seeds look correlated");

	// next(range) stays in range and hits every bin
	std::vector<size_t> bins(7, 0);
	for(size_t i = 0; i < 7000; i++)
	{
		uint64_t n = a.next(7);
		if(n >= 7)
			throw Ex("out of range");
		bins[(size_t)n]++;
	}
	for(size_t i = 0; i < 7; i++)
	{
		if(bins[i] < 800 || bins[i] > 1200)
			throw Ex("next(range) does not look uniform");
	}

	// uniform is in [0,1) with a mean near 0.5, normal has mean 0 and variance 1
	double sum = 0.0;
	double sumNormal = 0.0;
	double sumSqNormal = 0.0;
	for(size_t i = 0; i < 10000; i++)
	{
		double u = a.uniform();
		if(u < 0.0 || u >= 1.0)
			throw Ex("uniform out of range");
		sum += u;
		double z = a.normal();
		sumNormal += z;
		sumSqNormal += z * z;
	}
	if(std::abs(sum / 10000 - 0.5) > 0.02)
		throw Ex("uniform mean is off");
	if(std::abs(sumNormal / 10000) > 0.05)
		throw Ex("normal mean is off");
	if(std::abs(sumSqNormal / 10000 - 1.0) > 0.06)
		throw Ex("normal variance is off");

	{
		HExpectException ee;
		bool threw = false;
		try
		{
			a.next(0);
		}
		catch(const Ex&)
		{
			threw = true;
		}
		if(!threw)
			throw Ex("Expected next(0) to throw");
	}
}

} // namespace HClasses

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

#include "HHubSelector.h"
#include "HRand.h"
#include "HError.h"
#include <cmath>

using std::vector;

namespace HClasses {

HAnnealingSchedule::HAnnealingSchedule(size_t rampLength)
: m_rampLength(rampLength), m_constant(-1.0)
{
}

// static
HAnnealingSchedule HAnnealingSchedule::constant(double p)
{
	if(!(p >= 0.0 && p <= 1.0))
		throw Ex("Expected a probability between 0 and 1. Got ", to_str(p));
	HAnnealingSchedule s(0);
	s.m_constant = p;
	return s;
}

double HAnnealingSchedule::probability(size_t iteration) const
{
	if(m_constant >= 0.0)
		return m_constant;
	if(iteration >= m_rampLength)
		return 1.0;
	return (double)iteration / (double)m_rampLength;
}

// static
void HAnnealingSchedule::test()
{
	HAnnealingSchedule ramp(20);
	TestEqual(0.0, ramp.probability(0), "start of ramp");
	TestEqual(0.5, ramp.probability(10), "middle of ramp");
	TestEqual(1.0, ramp.probability(20), "end of ramp");
	TestEqual(1.0, ramp.probability(1000), "after the ramp");
	double prev = 0.0;
	for(size_t i = 0; i < 40; i++)
	{
		double p = ramp.probability(i);
		if(p < prev)
			throw Ex("the schedule should never decrease");
		prev = p;
	}
	HAnnealingSchedule none(0);
	TestEqual(1.0, none.probability(0), "empty ramp");
	HAnnealingSchedule c = HAnnealingSchedule::constant(0.25);
	TestEqual(0.25, c.probability(0), "constant");
	TestEqual(0.25, c.probability(99), "constant later");
	if(!c.isConstant() || ramp.isConstant())
		throw Ex("isConstant is wrong");

	HExpectException ee;
	bool threw = false;
	try
	{
		HAnnealingSchedule::constant(1.5);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("expected an out-of-range probability to be rejected");
}

// --------------------------------------------------------------------------------

HHubSelector::HHubSelector(HRand& rand)
: m_rand(rand)
{
}

HHubSelector::~HHubSelector()
{
}

void HHubSelector::checkSizes(const std::vector<size_t>& members, const std::vector<size_t>& weights) const
{
	if(members.size() == 0)
		throw Ex("Cannot select a hub from an empty cluster");
	if(weights.size() != members.size())
		throw Ex("Expected ", to_str(members.size()), " weights. Got ", to_str(weights.size()));
}

size_t HHubSelector::select(const std::vector<size_t>& members, const std::vector<size_t>& weights, double deterministicProbability)
{
	checkSizes(members, weights);
	if(members.size() == 1)
		return members[0];
	if(drawDeterministic(deterministicProbability))
		return selectDeterministic(members, weights);
	else
		return selectStochastic(members, weights);
}

bool HHubSelector::drawDeterministic(double deterministicProbability)
{
	return m_rand.uniform() < deterministicProbability;
}

size_t HHubSelector::selectDeterministic(const std::vector<size_t>& members, const std::vector<size_t>& weights) const
{
	checkSizes(members, weights);
	size_t maxIndex = 0;
	for(size_t j = 1; j < members.size(); j++)
	{
		if(weights[j] > weights[maxIndex])
			maxIndex = j;
	}
	return members[maxIndex];
}

size_t HHubSelector::selectStochastic(const std::vector<size_t>& members, const std::vector<size_t>& weights)
{
	checkSizes(members, weights);
	size_t n = members.size();

	// cumulative[j] is the total squared weight of the first j members
	m_cumulative.resize(n + 1);
	m_cumulative[0] = 0.0;
	for(size_t j = 0; j < n; j++)
	{
		double w = (double)weights[j];
		m_cumulative[j + 1] = m_cumulative[j] + w * w;
	}
	double total = m_cumulative[n];
	if(total <= 0.0)
		return members[(size_t)m_rand.next(n)];

	// Draw from (0, total], so a zero-width interval can never be hit
	double target = (1.0 - m_rand.uniform()) * total;
	return members[findIndex(m_cumulative, target) - 1];
}

// static
size_t HHubSelector::findIndex(const std::vector<double>& cumulative, double target)
{
	HAssert(cumulative.size() >= 2);
	size_t lo = 0;
	size_t hi = cumulative.size() - 1;
	while(hi - lo > 1)
	{
		size_t mid = (lo + hi) / 2;
		if(cumulative[mid] < target)
			lo = mid;
		else
			hi = mid;
	}
	return hi;
}

// static
void HHubSelector::test()
{
	HRand rand(0);
	HHubSelector selector(rand);
	vector<size_t> members;
	members.push_back(10);
	members.push_back(11);
	members.push_back(12);
	members.push_back(13);
	members.push_back(14);

	// Deterministic: the strict max, with ties going to the first member
	size_t w1[] = { 3, 7, 2, 7, 0 };
	vector<size_t> weights(w1, w1 + 5);
	TestEqual((size_t)11, selector.selectDeterministic(members, weights), "max with tie");
	for(size_t i = 0; i < 20; i++)
		TestEqual((size_t)11, selector.select(members, weights, 1.0), "probability 1 is always deterministic");
	vector<size_t> zeros(5, 0);
	TestEqual((size_t)10, selector.selectDeterministic(members, zeros), "all zero goes to the first member");

	// Binary search for the smallest index whose cumulative value reaches the target
	double c1[] = { 0.0, 1.0, 1.0, 5.0, 5.0, 9.0 };
	vector<double> cumulative(c1, c1 + 6);
	TestEqual((size_t)1, findIndex(cumulative, 1e-9), "first");
	TestEqual((size_t)1, findIndex(cumulative, 1.0), "boundary");
	TestEqual((size_t)3, findIndex(cumulative, 1.5), "skips zero-width");
	TestEqual((size_t)3, findIndex(cumulative, 5.0), "boundary 2");
	TestEqual((size_t)5, findIndex(cumulative, 9.0), "last");

	// Stochastic: zero-weight members are never picked, and the rest are picked in proportion to weight squared
	size_t w2[] = { 0, 1, 0, 2, 0 };
	vector<size_t> sparse(w2, w2 + 5);
	size_t hits[5] = { 0, 0, 0, 0, 0 };
	for(size_t i = 0; i < 10000; i++)
	{
		size_t chosen = selector.selectStochastic(members, sparse);
		if(chosen < 10 || chosen > 14)
			throw Ex("chose a non-member");
		hits[chosen - 10]++;
	}
	if(hits[0] != 0 || hits[2] != 0 || hits[4] != 0)
		throw Ex("chose a member with no occurrences");
	if(hits[1] < 1700 || hits[1] > 2300)
		throw Ex("expected about one fifth of the picks to go to the member with weight 1");
	for(size_t i = 0; i < 2000; i++)
	{
		size_t chosen = selector.select(members, sparse, 0.0);
		if(chosen != 11 && chosen != 13)
			throw Ex("probability 0 chose a member with no occurrences");
	}

	// Stochastic with every weight zero falls back to a uniform pick
	size_t uniformHits[5] = { 0, 0, 0, 0, 0 };
	for(size_t i = 0; i < 5000; i++)
		uniformHits[selector.selectStochastic(members, zeros) - 10]++;
	for(size_t i = 0; i < 5; i++)
	{
		if(uniformHits[i] < 800 || uniformHits[i] > 1200)
			throw Ex("the fallback should be uniform");
	}

	// A single member is returned without consuming any randomness
	HRand a(7);
	HRand b(7);
	HHubSelector sa(a);
	vector<size_t> single(1, 42);
	vector<size_t> singleWeight(1, 0);
	TestEqual((size_t)42, sa.select(single, singleWeight, 0.0), "singleton");
	TestEqual((size_t)42, sa.select(single, singleWeight, 1.0), "singleton");
	if(a.next() != b.next())
		throw Ex("the singleton case should not draw random numbers");

	// Same seed, same choices
	HRand r1(3);
	HRand r2(3);
	HHubSelector s1(r1);
	HHubSelector s2(r2);
	size_t w3[] = { 4, 1, 3, 2, 5 };
	vector<size_t> mixed(w3, w3 + 5);
	for(size_t i = 0; i < 100; i++)
		TestEqual(s1.select(members, mixed, 0.5), s2.select(members, mixed, 0.5), "reproducible");

	HExpectException ee;
	bool threw = false;
	try
	{
		vector<size_t> none;
		selector.select(none, none, 0.5);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("expected an empty cluster to be rejected");
}

} // namespace HClasses

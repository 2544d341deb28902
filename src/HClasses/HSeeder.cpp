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

#include "HSeeder.h"
#include "HHubSelector.h"
#include "HDistance.h"
#include "HMatrix.h"
#include "HRand.h"
#include "HError.h"
#include <cfloat>

using std::vector;

namespace HClasses {

// static
void HClusterSeeder::checkSeeds(const std::vector<size_t>& seeds, size_t count, size_t rows)
{
	if(seeds.size() != count)
		throw Ex("Expected ", to_str(count), " seeds. Got ", to_str(seeds.size()));
	vector<bool> used(rows, false);
	for(size_t i = 0; i < seeds.size(); i++)
	{
		if(seeds[i] >= rows)
			throw Ex("Seed ", to_str(seeds[i]), " is out of range for ", to_str(rows), " rows");
		if(used[seeds[i]])
			throw Ex("Row ", to_str(seeds[i]), " was used as a seed more than once");
		used[seeds[i]] = true;
	}
}

// --------------------------------------------------------------------------------

HPlusPlusSeeder::HPlusPlusSeeder()
: HClusterSeeder()
{
}

// virtual
HPlusPlusSeeder::~HPlusPlusSeeder()
{
}

// virtual
void HPlusPlusSeeder::seed(const HMatrix* pData, size_t count, const HDistanceMetric& metric, HRand& rand, std::vector<size_t>& out)
{
	size_t n = pData->rows();
	if(count > n)
		throw Ex("Cannot pick ", to_str(count), " distinct seeds from ", to_str(n), " rows");
	out.clear();
	if(count == 0)
		return;
	m_shortest.assign(n, DBL_MAX);
	m_cumulative.resize(n + 1);
	m_chosen.assign(n, false);
	size_t next = (size_t)rand.next(n);
	while(true)
	{
		out.push_back(next);
		m_chosen[next] = true;
		if(out.size() >= count)
			break;

		// Only the newest seed can bring a row closer to the seed set
		const HVec& newest = pData->row(next);
		m_cumulative[0] = 0.0;
		for(size_t j = 0; j < n; j++)
		{
			double w = 0.0;
			if(!m_chosen[j])
			{
				double d = metric.squaredDistance(pData->row(j), newest);
				if(d < m_shortest[j])
					m_shortest[j] = d;
				w = m_shortest[j];
			}
			m_cumulative[j + 1] = m_cumulative[j] + w;
		}
		double total = m_cumulative[n];
		if(total > 0.0 && total < DBL_MAX)
		{
			double target = (1.0 - rand.uniform()) * total;
			next = HHubSelector::findIndex(m_cumulative, target) - 1;
		}
		else
		{
			// Every remaining row coincides with a seed
			size_t r = (size_t)rand.next(n - out.size());
			for(next = 0; next < n; next++)
			{
				if(m_chosen[next])
					continue;
				if(r == 0)
					break;
				r--;
			}
		}
		HAssert(!m_chosen[next]);
	}
}

// static
void HPlusPlusSeeder::test()
{
	// Three tight groups far apart. Spreading the seeds should put one in each group.
	HRand rand(0);
	HMatrix data(30, 2);
	for(size_t i = 0; i < data.rows(); i++)
	{
		double cx = (double)(i % 3) * 100.0;
		data[i][0] = cx + rand.uniform();
		data[i][1] = rand.uniform();
	}
	HEuclideanDistance metric;
	HPlusPlusSeeder seeder;
	vector<size_t> seeds;
	for(size_t rep = 0; rep < 20; rep++)
	{
		seeder.seed(&data, 3, metric, rand, seeds);
		HClusterSeeder::checkSeeds(seeds, 3, data.rows());
		bool groups[3] = { false, false, false };
		for(size_t i = 0; i < seeds.size(); i++)
			groups[seeds[i] % 3] = true;
		if(!groups[0] || !groups[1] || !groups[2])
			throw Ex("expected one seed in each group");
	}

	// Duplicate points still yield distinct seeds
	HMatrix same(5, 2);
	for(size_t i = 0; i < same.rows(); i++)
		same[i].fill(1.0);
	seeder.seed(&same, 5, metric, rand, seeds);
	HClusterSeeder::checkSeeds(seeds, 5, same.rows());

	// Fixed seeds are validated
	vector<size_t> fixed;
	fixed.push_back(4);
	fixed.push_back(2);
	HFixedSeeder fs(fixed);
	fs.seed(&data, 2, metric, rand, seeds);
	TestEqual((size_t)4, seeds[0], "fixed 0");
	TestEqual((size_t)2, seeds[1], "fixed 1");
	HExpectException ee;
	bool threw = false;
	try
	{
		fs.seed(&data, 3, metric, rand, seeds);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("expected a seed count mismatch to throw");
	threw = false;
	try
	{
		fixed.push_back(4);
		HFixedSeeder dup(fixed);
		dup.seed(&data, 3, metric, rand, seeds);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("expected duplicate seeds to throw");
	threw = false;
	try
	{
		seeder.seed(&same, 6, metric, rand, seeds);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("expected too many seeds to throw");
}

// --------------------------------------------------------------------------------

HFixedSeeder::HFixedSeeder(const std::vector<size_t>& seeds)
: HClusterSeeder(), m_seeds(seeds)
{
}

// virtual
HFixedSeeder::~HFixedSeeder()
{
}

// virtual
void HFixedSeeder::seed(const HMatrix* pData, size_t count, const HDistanceMetric& metric, HRand& rand, std::vector<size_t>& out)
{
	checkSeeds(m_seeds, count, pData->rows());
	out = m_seeds;
}

} // namespace HClasses

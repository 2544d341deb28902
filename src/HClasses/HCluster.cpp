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

#include "HCluster.h"
#include "HDistance.h"
#include "HDistanceCache.h"
#include "HNeighborFinder.h"
#include "HConvergence.h"
#include "HSeeder.h"
#include "HReporter.h"
#include "HRand.h"
#include "HError.h"
#include <cmath>
#include <cfloat>
#include <algorithm>

using std::vector;

namespace HClasses {

HClusterer::HClusterer(size_t nClusterCount)
: m_clusterCount(nClusterCount), m_pMetric(NULL), m_ownMetric(false)
{
}

// virtual
HClusterer::~HClusterer()
{
	if(m_ownMetric)
		delete(m_pMetric);
}

void HClusterer::setMetric(HDistanceMetric* pMetric, bool own)
{
	if(m_ownMetric)
		delete(m_pMetric);
	m_pMetric = pMetric;
	m_ownMetric = own;
}

void HClusterer::ensureMetric()
{
	if(!m_pMetric)
		setMetric(new HEuclideanDistance(), true);
}

void HClusterer::checkClusterCount(const HMatrix* pData) const
{
	if(!pData || pData->rows() == 0)
		throw HInvalidConfigurationEx("there is no data to cluster");
	if(m_clusterCount == 0)
		throw HInvalidConfigurationEx("the number of clusters must be at least 1");
	if(m_clusterCount > pData->rows())
		throw HInvalidConfigurationEx("cannot make ", to_str(m_clusterCount), " clusters from ", to_str(pData->rows()) + " points");
}

// -----------------------------------------------------------------------------------------

HKMeans::HKMeans(size_t clusters, HRand* pRand)
: HClusterer(clusters), m_reps(1), m_maxIterations(100), m_error(0.0), m_pRand(pRand), m_pSeeder(NULL), m_ownSeeder(false)
{
}

// virtual
HKMeans::~HKMeans()
{
	if(m_ownSeeder)
		delete(m_pSeeder);
}

void HKMeans::setSeeder(HClusterSeeder* pSeeder, bool own)
{
	if(m_ownSeeder)
		delete(m_pSeeder);
	m_pSeeder = pSeeder;
	m_ownSeeder = own;
}

double HKMeans::assignClusters(const HMatrix* pData, std::vector<size_t>& clusters)
{
	double sse = 0.0;
	for(size_t i = 0; i < pData->rows(); i++)
	{
		double best = m_pMetric->squaredDistance(pData->row(i), m_centroids.row(0));
		size_t clust = 0;
		for(size_t j = 1; j < m_clusterCount; j++)
		{
			double d = m_pMetric->squaredDistance(pData->row(i), m_centroids.row(j));
			if(d < best)
			{
				clust = j;
				best = d;
			}
		}
		sse += best;
		clusters[i] = clust;
	}
	return sse;
}

void HKMeans::recomputeCentroids(const HMatrix* pData, const std::vector<size_t>& clusters)
{
	vector<vector<size_t> > members(m_clusterCount);
	for(size_t i = 0; i < pData->rows(); i++)
		members[clusters[i]].push_back(i);
	for(size_t i = 0; i < m_clusterCount; i++)
	{
		if(members[i].size() > 0)
			pData->centroid(m_centroids.row(i), members[i]);
	}
}

// virtual
void HKMeans::cluster(const HMatrix* pData)
{
	ensureMetric();
	checkClusterCount(pData);
	if(!m_pSeeder)
		setSeeder(new HPlusPlusSeeder(), true);
	vector<size_t> seeds;
	vector<size_t> clusters(pData->rows());
	HMatrix bestCentroids(pData->cols());
	double bestErr = DBL_MAX;
	for(size_t i = 0; i < std::max((size_t)1, m_reps); i++)
	{
		m_pSeeder->seed(pData, m_clusterCount, *m_pMetric, *m_pRand, seeds);
		HClusterSeeder::checkSeeds(seeds, m_clusterCount, pData->rows());
		m_centroids.resize(0, pData->cols());
		for(size_t j = 0; j < m_clusterCount; j++)
			m_centroids.copyRow(pData->row(seeds[j]));
		double d = DBL_MAX;
		double sse = DBL_MAX;
		for(size_t iters = 0; true; iters++)
		{
			d = assignClusters(pData, clusters);
			if((d >= sse && iters > 2) || iters + 1 >= m_maxIterations)
				break;
			recomputeCentroids(pData, clusters);
			sse = d;
		}
		if(d < bestErr || bestCentroids.rows() == 0)
		{
			bestErr = d;
			m_clusters = clusters;
			bestCentroids.copy(m_centroids);
		}
	}
	m_centroids.copy(bestCentroids);
	m_error = bestErr;
}

// virtual
size_t HKMeans::whichCluster(size_t index)
{
	if(index >= m_clusters.size())
		throw Ex("Row ", to_str(index), " is out of range");
	return m_clusters[index];
}

// -----------------------------------------------------------------------------------------

HClusterLoopState::HClusterLoopState()
: attempt(0), iteration(0), errorPrevious(DBL_MAX), errorCurrent(DBL_MAX), reassigned(0), converged(false)
{
}

void HClusterLoopState::reset(size_t att, size_t rows, size_t clusterCount, size_t cols)
{
	attempt = att;
	iteration = 0;
	errorPrevious = DBL_MAX;
	errorCurrent = DBL_MAX;
	reassigned = 0;
	converged = false;
	associations.assign(rows, INVALID_INDEX);
	hubIndexes.assign(clusterCount, INVALID_INDEX);
	centers.resize(clusterCount, cols);
	members.assign(clusterCount, vector<size_t>());
}

// -----------------------------------------------------------------------------------------

HHubnessClusterer::HHubnessClusterer(size_t nClusterCount, HRand* pRand, HubRepresentation representation, HubnessSource source)
: HClusterer(nClusterCount),
m_pRand(pRand),
m_representation(representation),
m_source(source),
m_neighborhoodSize(10),
m_schedule(20),
m_minIterations(20),
m_maxIterations(100),
m_errorThreshold(0.001),
m_maxRetries(10),
m_pSeeder(NULL),
m_ownSeeder(false),
m_pReporter(NULL),
m_hubnessSupplied(false),
m_pData(NULL),
m_bestError(DBL_MAX),
m_iterations(0),
m_attempts(0)
{
}

// virtual
HHubnessClusterer::~HHubnessClusterer()
{
	if(m_ownSeeder)
		delete(m_pSeeder);
}

void HHubnessClusterer::setSeeder(HClusterSeeder* pSeeder, bool own)
{
	if(m_ownSeeder)
		delete(m_pSeeder);
	m_pSeeder = pSeeder;
	m_ownSeeder = own;
}

void HHubnessClusterer::setProbabilisticIterations(size_t n)
{
	m_schedule = HAnnealingSchedule(n);
	m_minIterations = n;
}

void HHubnessClusterer::setHubness(const HHubnessProfile& profile)
{
	m_hubness = profile;
	m_hubnessSupplied = true;
}

void HHubnessClusterer::setDistanceMatrix(const std::vector<double>& values)
{
	m_suppliedDistances = values;
}

void HHubnessClusterer::checkConfiguration(const HMatrix* pData) const
{
	checkClusterCount(pData);
	if(m_neighborhoodSize == 0)
		throw HInvalidConfigurationEx("the neighborhood size must be at least 1");
	if(m_maxIterations == 0)
		throw HInvalidConfigurationEx("at least one iteration must be allowed");
	if(m_maxRetries == 0)
		throw HInvalidConfigurationEx("at least one attempt must be allowed");
	if(!(m_errorThreshold > 0.0))
		throw HInvalidConfigurationEx("the error threshold must be positive");
	if(!m_pRand)
		throw HInvalidConfigurationEx("a random number generator is required");
	if(m_hubnessSupplied && m_source == GLOBAL_PROFILE && m_hubness.size() != pData->rows())
		throw Ex("The hubness profile covers ", to_str(m_hubness.size()), " points, but the data has ", to_str(pData->rows()));
	if(m_suppliedDistances.size() > 0 && m_suppliedDistances.size() != HDistanceCache::triangleSize(pData->rows()))
		throw Ex("The distance matrix has ", to_str(m_suppliedDistances.size()), " values, but ", to_str(HDistanceCache::triangleSize(pData->rows())), " are needed");
}

// virtual
void HHubnessClusterer::cluster(const HMatrix* pData)
{
	ensureMetric();
	checkConfiguration(pData);
	m_pData = pData;
	m_bestAssociations.clear();
	m_bestHubIndexes.clear();
	m_bestCenters.resize(0, pData->cols());
	m_bestError = DBL_MAX;
	m_iterations = 0;
	m_attempts = 0;
	m_pCache.reset(new HDistanceCache(pData, m_pMetric));
	if(m_suppliedDistances.size() > 0)
		m_pCache->adopt(m_suppliedDistances);
	if(m_pReporter)
		m_pReporter->start(pData, m_clusterCount, m_maxIterations);

	if(clusterTrivially(pData))
	{
		if(m_pReporter)
		{
			HClusterStatus status;
			status.error = m_bestError;
			status.bestError = m_bestError;
			status.pHubIndexes = &m_bestHubIndexes;
			m_pReporter->stop(status);
		}
		return;
	}

	if(m_source == GLOBAL_PROFILE)
		prepareHubness();
	if(!m_pSeeder)
		setSeeder(new HPlusPlusSeeder(), true);
	HHubSelector selector(*m_pRand);
	HClusterLoopState state;
	for(size_t attempt = 1; attempt <= m_maxRetries; attempt++)
	{
		m_attempts = attempt;
		state.reset(attempt, pData->rows(), m_clusterCount, pData->cols());
		HClusterStepResult result = runAttempt(state, selector);
		if(result.succeeded())
		{
			m_iterations = state.iteration;
			if(m_pReporter)
			{
				HClusterStatus status;
				makeStatus(state, m_schedule.probability(state.iteration), state.converged, status);
				m_pReporter->stop(status);
			}
			return;
		}
		if(m_pReporter)
			m_pReporter->onRetry(attempt, std::string("cluster ") + to_str(result.cluster) + " became empty");
	}

	// Do not expose the state of a failed attempt
	m_bestAssociations.clear();
	m_bestHubIndexes.clear();
	m_bestCenters.resize(0, pData->cols());
	m_bestError = DBL_MAX;
	throw HUnableToFinishEx(m_maxRetries);
}

bool HHubnessClusterer::clusterTrivially(const HMatrix* pData)
{
	size_t n = pData->rows();
	if(m_clusterCount == 1)
	{
		m_bestAssociations.assign(n, 0);
		m_bestHubIndexes.assign(1, INVALID_INDEX);
		m_bestCenters.resize(1, pData->cols());
		pData->centroid(m_bestCenters.row(0));
		double err = 0.0;
		for(size_t i = 0; i < n; i++)
			err += m_pMetric->squaredDistance(pData->row(i), m_bestCenters.row(0));
		m_bestError = err;
		m_attempts = 1;
		return true;
	}
	if(m_clusterCount == n)
	{
		m_bestAssociations.resize(n);
		m_bestHubIndexes.resize(n);
		for(size_t i = 0; i < n; i++)
		{
			m_bestAssociations[i] = i;
			m_bestHubIndexes[i] = i;
		}
		m_bestCenters.copy(*pData);
		m_bestError = 0.0;
		m_attempts = 1;
		return true;
	}
	return false;
}

void HHubnessClusterer::prepareHubness()
{
	if(m_hubnessSupplied)
		return;
	HBruteForceNeighborFinder finder(m_pCache.get());
	m_hubness = HHubnessProfile::fromNeighborFinder(finder, m_neighborhoodSize);
}

HClusterStepResult HHubnessClusterer::runAttempt(HClusterLoopState& state, HHubSelector& selector)
{
	// Seed
	vector<size_t> seeds;
	m_pSeeder->seed(m_pData, m_clusterCount, *m_pMetric, *m_pRand, seeds);
	HClusterSeeder::checkSeeds(seeds, m_clusterCount, m_pData->rows());
	for(size_t c = 0; c < m_clusterCount; c++)
	{
		state.hubIndexes[c] = seeds[c];
		state.centers.row(c).copy(m_pData->row(seeds[c]));
	}

	// Initial assignment
	HClusterStepResult result = assign(state);
	if(!result.succeeded())
		return result;
	state.errorCurrent = computeError(state);
	snapshot(state);

	HConvergenceMonitor monitor(m_errorThreshold, m_minIterations);
	while(true)
	{
		if(m_pReporter && !m_pReporter->keepGoing())
			break;
		state.iteration++;
		double p = m_schedule.probability(state.iteration);
		result = updateHubs(state, selector, p);
		if(!result.succeeded())
			return result;
		result = assign(state);
		if(!result.succeeded())
			return result;
		state.errorPrevious = state.errorCurrent;
		state.errorCurrent = computeError(state);
		if(state.errorCurrent < m_bestError || m_bestError != m_bestError)
			snapshot(state);
		state.converged = monitor.hasConverged(state.errorPrevious, state.errorCurrent, state.iteration);
		if(m_pReporter)
		{
			HClusterStatus status;
			makeStatus(state, p, state.converged, status);
			m_pReporter->newStatus(status);
		}
		if(state.converged)
			break;
		if(state.reassigned == 0)
			break;
		if(state.iteration >= m_maxIterations)
			break;
	}
	return HClusterStepResult::success();
}

HClusterStepResult HHubnessClusterer::updateHubs(HClusterLoopState& state, HHubSelector& selector, double deterministicProbability)
{
	for(size_t c = 0; c < m_clusterCount; c++)
		state.members[c].clear();
	for(size_t i = 0; i < state.associations.size(); i++)
		state.members[state.associations[i]].push_back(i);

	HLocalHubness local(m_neighborhoodSize);
	vector<size_t> weights;
	for(size_t c = 0; c < m_clusterCount; c++)
	{
		const vector<size_t>& members = state.members[c];
		if(members.size() == 0)
			return HClusterStepResult::emptyCluster(c);
		size_t hub = INVALID_INDEX;
		if(members.size() == 1)
			hub = members[0];
		else if(m_source == LOCAL_RECOMPUTE && members.size() < m_neighborhoodSize + 2)
			hub = INVALID_INDEX; // too few members for a local neighborhood
		else
		{
			if(m_source == LOCAL_RECOMPUTE)
				local.compute(*m_pCache, members, weights);
			else
			{
				weights.resize(members.size());
				for(size_t j = 0; j < members.size(); j++)
					weights[j] = m_hubness.occurrences(members[j]);
			}
			if(m_representation == MEAN_WHEN_DETERMINISTIC)
			{
				if(!selector.drawDeterministic(deterministicProbability))
					hub = selector.selectStochastic(members, weights);
			}
			else
				hub = selector.select(members, weights, deterministicProbability);
		}
		state.hubIndexes[c] = hub;
		if(hub == INVALID_INDEX)
			m_pData->centroid(state.centers.row(c), members);
		else
			state.centers.row(c).copy(m_pData->row(hub));
	}
	return HClusterStepResult::success();
}

double HHubnessClusterer::distanceToCenter(const HClusterLoopState& state, size_t i, size_t c)
{
	size_t hub = state.hubIndexes[c];
	if(hub != INVALID_INDEX)
		return m_pCache->distance(i, hub);
	else
		return m_pMetric->distance(m_pData->row(i), state.centers.row(c));
}

HClusterStepResult HHubnessClusterer::assign(HClusterLoopState& state)
{
	size_t n = m_pData->rows();
	vector<size_t> hubOf(n, INVALID_INDEX);
	for(size_t c = 0; c < m_clusterCount; c++)
	{
		if(state.hubIndexes[c] != INVALID_INDEX)
			hubOf[state.hubIndexes[c]] = c;
	}
	vector<size_t> counts(m_clusterCount, 0);
	state.reassigned = 0;
	for(size_t i = 0; i < n; i++)
	{
		size_t best = hubOf[i];
		if(best == INVALID_INDEX)
		{
			best = 0;
			double bestDist = distanceToCenter(state, i, 0);
			for(size_t c = 1; c < m_clusterCount; c++)
			{
				double d = distanceToCenter(state, i, c);
				if(d < bestDist)
				{
					bestDist = d;
					best = c;
				}
			}
		}
		if(best != state.associations[i])
			state.reassigned++;
		state.associations[i] = best;
		counts[best]++;
	}
	for(size_t c = 0; c < m_clusterCount; c++)
	{
		if(counts[c] == 0)
			return HClusterStepResult::emptyCluster(c);
	}
	return HClusterStepResult::success();
}

double HHubnessClusterer::computeError(const HClusterLoopState& state)
{
	double error = 0.0;
	for(size_t i = 0; i < state.associations.size(); i++)
	{
		size_t c = state.associations[i];
		size_t hub = state.hubIndexes[c];
		if(hub != INVALID_INDEX)
			error += m_pCache->squaredDistance(i, hub);
		else
			error += m_pMetric->squaredDistance(m_pData->row(i), state.centers.row(c));
	}
	return error;
}

void HHubnessClusterer::snapshot(const HClusterLoopState& state)
{
	m_bestError = state.errorCurrent;
	m_bestAssociations = state.associations;
	m_bestHubIndexes = state.hubIndexes;
	m_bestCenters.copy(state.centers);
}

void HHubnessClusterer::makeStatus(const HClusterLoopState& state, double deterministicProbability, bool converged, HClusterStatus& status) const
{
	status.attempt = state.attempt;
	status.iteration = state.iteration;
	status.deterministicProbability = deterministicProbability;
	status.error = state.errorCurrent;
	status.bestError = m_bestError;
	status.reassigned = state.reassigned;
	status.converged = converged;
	status.pHubIndexes = &state.hubIndexes;
	status.pMembers = &state.members;
}

// virtual
size_t HHubnessClusterer::whichCluster(size_t nVector)
{
	if(nVector >= m_bestAssociations.size())
		throw Ex("Row ", to_str(nVector), " is out of range");
	return m_bestAssociations[nVector];
}

void HHubnessClusterer::getMinimizingClusters(std::vector<std::vector<size_t> >& out) const
{
	out.assign(m_bestHubIndexes.size(), vector<size_t>());
	for(size_t i = 0; i < m_bestAssociations.size(); i++)
		out[m_bestAssociations[i]].push_back(i);
}

void HHubnessClusterer::assignPointsToModelClusters(const HMatrix& points, std::vector<size_t>& out) const
{
	if(m_bestCenters.rows() == 0)
		throw Ex("There is no model. Call cluster first.");
	if(points.cols() != m_bestCenters.cols())
		throw HInvalidConfigurationEx("expected points with ", to_str(m_bestCenters.cols()), " values. Got ", to_str(points.cols()));
	out.resize(points.rows());
	for(size_t i = 0; i < points.rows(); i++)
	{
		size_t best = 0;
		double bestDist = m_pMetric->distance(points.row(i), m_bestCenters.row(0));
		for(size_t c = 1; c < m_bestCenters.rows(); c++)
		{
			double d = m_pMetric->distance(points.row(i), m_bestCenters.row(c));
			if(d < bestDist)
			{
				bestDist = d;
				best = c;
			}
		}
		out[i] = best;
	}
}

// -----------------------------------------------------------------------------------------

// Makes three well-separated blobs of 200 points. Point i belongs to blob i % 3.
void HCluster_makeBlobs(HMatrix& data, std::vector<size_t>& labels, HRand& rand)
{
	const double cx[3] = { 0.0, 20.0, 0.0 };
	const double cy[3] = { 0.0, 0.0, 20.0 };
	data.resize(200, 2);
	labels.resize(200);
	for(size_t i = 0; i < 200; i++)
	{
		labels[i] = i % 3;
		data[i][0] = cx[labels[i]] + rand.normal();
		data[i][1] = cy[labels[i]] + rand.normal();
	}
}

template<class E>
bool HCluster_clusteringThrows(HClusterer& clusterer, const HMatrix* pData)
{
	HExpectException ee;
	try
	{
		clusterer.cluster(pData);
	}
	catch(const E&)
	{
		return true;
	}
	return false;
}

// static
void HKMeans::test()
{
	HRand rand(0);
	HMatrix data;
	vector<size_t> labels;
	HCluster_makeBlobs(data, labels, rand);
	vector<size_t> seeds;
	seeds.push_back(0);
	seeds.push_back(1);
	seeds.push_back(2);
	HKMeans km(3, &rand);
	km.setSeeder(new HFixedSeeder(seeds), true);
	km.cluster(&data);
	for(size_t i = 0; i < data.rows(); i++)
	{
		if(km.whichCluster(i) != labels[i])
			throw Ex("Row ", to_str(i), " was put in the wrong cluster");
	}
	double sse = 0.0;
	for(size_t i = 0; i < data.rows(); i++)
		sse += data[i].squaredDistance(km.centroids()[labels[i]]);
	if(std::abs(sse - km.sumSquaredError()) > 1e-6 * sse)
		throw Ex("sumSquaredError does not measure the final clustering");

	// Another random seeding should find the same partition
	HKMeans km2(3, &rand);
	km2.setReps(3);
	km2.cluster(&data);
	for(size_t i = 0; i < data.rows(); i++)
	{
		if(km2.whichCluster(i) != km2.whichCluster(labels[i]))
			throw Ex("Seeding with the plus-plus seeder broke a blob apart");
	}

	HKMeans tooMany(201, &rand);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(tooMany, &data))
		throw Ex("Expected too many clusters to be rejected");
	HKMeans none(0, &rand);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(none, &data))
		throw Ex("Expected zero clusters to be rejected");
}

class HTestStatusRecorder : public HClusterReporter
{
public:
	std::vector<double> m_errors;
	std::vector<std::vector<size_t> > m_hubs;
	size_t m_retries;
	size_t m_stops;
	size_t m_stopAfter;

	HTestStatusRecorder(size_t stopAfter = INVALID_INDEX)
	: HClusterReporter(), m_retries(0), m_stops(0), m_stopAfter(stopAfter)
	{
	}

	virtual ~HTestStatusRecorder()
	{
	}

	virtual void newStatus(const HClusterStatus& status)
	{
		m_errors.push_back(status.error);
		m_hubs.push_back(*status.pHubIndexes);
	}

	virtual void onRetry(size_t attempt, const std::string& reason)
	{
		m_retries++;
	}

	virtual void stop(const HClusterStatus& status)
	{
		m_stops++;
	}

	virtual bool keepGoing()
	{
		return m_errors.size() < m_stopAfter;
	}
};

// Checks each hub against the occurrence counts of the members it was chosen from
class HTestHubChecker : public HClusterReporter
{
public:
	const HHubnessClusterer* m_pClusterer;
	bool m_deterministic;
	size_t m_checked;

	HTestHubChecker(const HHubnessClusterer* pClusterer, bool deterministic)
	: HClusterReporter(), m_pClusterer(pClusterer), m_deterministic(deterministic), m_checked(0)
	{
	}

	virtual ~HTestHubChecker()
	{
	}

	virtual void newStatus(const HClusterStatus& status)
	{
		const HHubnessProfile& profile = m_pClusterer->hubness();
		for(size_t c = 0; c < status.pMembers->size(); c++)
		{
			const vector<size_t>& members = (*status.pMembers)[c];
			size_t hub = (*status.pHubIndexes)[c];
			if(members.size() < 2)
				continue;
			if(std::find(members.begin(), members.end(), hub) == members.end())
				throw Ex("The hub of cluster ", to_str(c), " is not one of its members");
			if(m_deterministic)
			{
				size_t best = members[0];
				for(size_t j = 1; j < members.size(); j++)
				{
					if(profile.occurrences(members[j]) > profile.occurrences(best))
						best = members[j];
				}
				TestEqual(best, hub, "deterministic hub is the first member with the most occurrences");
			}
			else
			{
				size_t total = 0;
				for(size_t j = 0; j < members.size(); j++)
					total += profile.occurrences(members[j]);
				if(total > 0 && profile.occurrences(hub) == 0)
					throw Ex("A point that never occurs as a neighbor was picked as a hub");
			}
			m_checked++;
		}
	}
};

// Measures the distance between integer-valued points. Any other pair is 1 apart.
class HTestIntegerMetric : public HDistanceMetric
{
public:
	HTestIntegerMetric() : HDistanceMetric() {}
	virtual ~HTestIntegerMetric() {}

	virtual const char* name() const { return "HTestIntegerMetric"; }

	virtual double squaredDistance(const HVec& a, const HVec& b) const
	{
		if(a[0] == std::floor(a[0]) && b[0] == std::floor(b[0]))
			return (a[0] - b[0]) * (a[0] - b[0]);
		return 1.0;
	}
};

void HHubnessClusterer_testConfiguration(const HMatrix& data)
{
	HRand rand(0);
	HGlobalHubnessClusterer tooMany(201, &rand);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(tooMany, &data))
		throw Ex("Expected too many clusters to be rejected");
	HGlobalHubnessClusterer none(0, &rand);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(none, &data))
		throw Ex("Expected zero clusters to be rejected");
	HMatrix empty(2);
	HGlobalHubnessClusterer noData(3, &rand);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(noData, &empty))
		throw Ex("Expected empty data to be rejected");
	HLocalHubnessClusterer noNeighbors(3, &rand);
	noNeighbors.setNeighborhoodSize(0);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(noNeighbors, &data))
		throw Ex("Expected a neighborhood size of 0 to be rejected");
	HGlobalHubnessKMeans noRetries(3, &rand);
	noRetries.setMaxRetries(0);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(noRetries, &data))
		throw Ex("Expected 0 attempts to be rejected");
	HGlobalHubnessKMeans noThreshold(3, &rand);
	noThreshold.setErrorThreshold(0.0);
	if(!HCluster_clusteringThrows<HInvalidConfigurationEx>(noThreshold, &data))
		throw Ex("Expected a threshold of 0 to be rejected");
	HGlobalHubnessClusterer wrongProfile(3, &rand);
	vector<size_t> occ(10, 1);
	wrongProfile.setHubness(HHubnessProfile(occ, 10));
	if(!HCluster_clusteringThrows<Ex>(wrongProfile, &data))
		throw Ex("Expected a profile of the wrong size to be rejected");
	HGlobalHubnessClusterer wrongMatrix(3, &rand);
	wrongMatrix.setDistanceMatrix(vector<double>(7, 1.0));
	if(!HCluster_clusteringThrows<Ex>(wrongMatrix, &data))
		throw Ex("Expected a distance matrix of the wrong size to be rejected");
	TestEqual((size_t)0, wrongMatrix.getClusterAssociations().size(), "nothing is produced from a bad configuration");

	HGlobalHubnessKMeans ramp(3, &rand);
	ramp.setProbabilisticIterations(5);
	TestEqual((size_t)5, ramp.schedule().rampLength(), "ramp length");
	TestEqual(0.2, ramp.schedule().probability(1), "first update");
	TestEqual(1.0, ramp.schedule().probability(5), "deterministic at the end of the ramp");
}

void HHubnessClusterer_testTrivial(const HMatrix& data)
{
	HRand rand(0);
	HGlobalHubnessClusterer one(1, &rand);
	one.cluster(&data);
	HVec mean;
	data.centroid(mean);
	double err = 0.0;
	for(size_t i = 0; i < data.rows(); i++)
	{
		TestEqual((size_t)0, one.whichCluster(i), "one cluster");
		err += data[i].squaredDistance(mean);
	}
	TestEqual(INVALID_INDEX, one.hubIndexes()[0], "a single cluster is represented by its mean");
	if(std::abs(err - one.bestError()) > 1e-9 * err)
		throw Ex("Wrong error for a single cluster");

	HMatrix few({{0.0, 0.0}, {1.0, 0.0}, {5.0, 5.0}, {2.0, 7.0}, {9.0, 1.0}});
	HLocalHubnessClusterer each(5, &rand);
	each.cluster(&few);
	for(size_t i = 0; i < few.rows(); i++)
	{
		TestEqual(i, each.whichCluster(i), "every point in its own cluster");
		TestEqual(i, each.hubIndexes()[i], "every point is its own hub");
	}
	TestEqual(0.0, each.bestError(), "no error with a cluster per point");
}

void HHubnessClusterer_testValidity(const HMatrix& data, const vector<size_t>& seeds)
{
	for(size_t variant = 0; variant < 3; variant++)
	{
		HRand rand(1234);
		std::unique_ptr<HHubnessClusterer> pClusterer;
		if(variant == 0)
			pClusterer.reset(new HGlobalHubnessClusterer(3, &rand));
		else if(variant == 1)
			pClusterer.reset(new HGlobalHubnessKMeans(3, &rand));
		else
			pClusterer.reset(new HLocalHubnessClusterer(3, &rand));
		HTestStatusRecorder recorder;
		pClusterer->setReporter(&recorder);
		pClusterer->setSeeder(new HFixedSeeder(seeds), true);
		pClusterer->cluster(&data);
		TestEqual(data.rows(), pClusterer->getClusterAssociations().size(), "every point is assigned");
		for(size_t i = 0; i < data.rows(); i++)
		{
			if(pClusterer->whichCluster(i) >= 3)
				throw Ex("Invalid cluster index");
		}
		if(recorder.m_errors.size() == 0)
			throw Ex("Expected at least one iteration");
		for(size_t j = 0; j < recorder.m_errors.size(); j++)
		{
			if(pClusterer->bestError() > recorder.m_errors[j])
				throw Ex("The best error is worse than the error of iteration ", to_str(j + 1));
		}
		TestEqual(pClusterer->iterations(), recorder.m_errors.size(), "one status per iteration");
		TestEqual((size_t)1, recorder.m_stops, "stop is reported once");
		vector<vector<size_t> > clusters;
		pClusterer->getMinimizingClusters(clusters);
		size_t total = 0;
		for(size_t c = 0; c < clusters.size(); c++)
			total += clusters[c].size();
		TestEqual(data.rows(), total, "the clusters partition the data");
	}
}

void HHubnessClusterer_testDeterminism(const HMatrix& data, const vector<size_t>& seeds)
{
	for(size_t s = 0; s < 2; s++)
	{
		HAnnealingSchedule schedule = (s == 0 ? HAnnealingSchedule::constant(0.0) : HAnnealingSchedule::constant(1.0));
		HRand rand1(77);
		HRand rand2(77);
		HGlobalHubnessClusterer a(3, &rand1);
		HGlobalHubnessClusterer b(3, &rand2);
		HHubHistoryReporter ha;
		HHubHistoryReporter hb;
		a.setReporter(&ha);
		b.setReporter(&hb);
		a.setSchedule(schedule);
		b.setSchedule(schedule);
		a.setSeeder(new HFixedSeeder(seeds), true);
		b.setSeeder(new HFixedSeeder(seeds), true);
		a.cluster(&data);
		b.cluster(&data);
		if(ha.history() != hb.history())
			throw Ex("Identical random seeds gave different hub histories");
		if(a.getClusterAssociations() != b.getClusterAssociations())
			throw Ex("Identical random seeds gave different clusters");

		// Check the hub rules while running again with the same seed
		HRand rand3(77);
		HGlobalHubnessClusterer c(3, &rand3);
		HTestHubChecker hubChecker(&c, s == 1);
		c.setReporter(&hubChecker);
		c.setSchedule(schedule);
		c.setSeeder(new HFixedSeeder(seeds), true);
		c.cluster(&data);
		if(hubChecker.m_checked == 0)
			throw Ex("No hubs were checked");
		if(c.getClusterAssociations() != a.getClusterAssociations())
			throw Ex("The reporter changed the outcome");
	}
}

void HHubnessClusterer_testSingleton()
{
	HRand dataRand(5);
	HMatrix data(21, 2);
	for(size_t i = 0; i < 20; i++)
	{
		data[i][0] = dataRand.normal();
		data[i][1] = dataRand.normal();
	}
	data[20][0] = 100.0;
	data[20][1] = 100.0;
	vector<size_t> seeds;
	seeds.push_back(0);
	seeds.push_back(20);

	HRand rand(9);
	HGlobalHubnessClusterer ghpc(2, &rand);
	HTestStatusRecorder recorder;
	ghpc.setReporter(&recorder);
	ghpc.setSeeder(new HFixedSeeder(seeds), true);
	ghpc.cluster(&data);
	for(size_t j = 0; j < recorder.m_hubs.size(); j++)
		TestEqual((size_t)20, recorder.m_hubs[j][1], "a singleton cluster keeps its only member as the hub");
	TestEqual((size_t)20, ghpc.hubIndexes()[1], "final singleton hub");
	TestEqual((size_t)1, ghpc.whichCluster(20), "the outlier");
	for(size_t i = 0; i < 20; i++)
		TestEqual((size_t)0, ghpc.whichCluster(i), "the blob");
	TestEqual((size_t)1, ghpc.attempts(), "no retries");

	HGlobalHubnessKMeans ghpkm(2, &rand);
	ghpkm.setSchedule(HAnnealingSchedule::constant(1.0));
	ghpkm.setSeeder(new HFixedSeeder(seeds), true);
	ghpkm.cluster(&data);
	TestEqual(INVALID_INDEX, ghpkm.hubIndexes()[0], "the blob is represented by its mean");
	TestEqual((size_t)20, ghpkm.hubIndexes()[1], "a singleton is represented by its point");
	TestEqual((size_t)1, ghpkm.attempts(), "no retries");
}

void HHubnessClusterer_testLocalFallback()
{
	HRand dataRand(3);
	HMatrix data(45, 2);
	for(size_t i = 0; i < 40; i++)
	{
		data[i][0] = dataRand.normal();
		data[i][1] = dataRand.normal();
	}
	data[0][0] = 4.0;
	data[0][1] = 4.0;
	for(size_t i = 40; i < 45; i++)
	{
		data[i][0] = 50.0 + dataRand.normal();
		data[i][1] = 50.0 + dataRand.normal();
	}
	data[40][0] = 51.0;
	data[40][1] = 50.0;
	vector<size_t> seeds;
	seeds.push_back(0);
	seeds.push_back(40);

	HRand rand(11);
	HLocalHubnessClusterer lhpc(2, &rand);
	lhpc.setNeighborhoodSize(10);
	HTestStatusRecorder recorder;
	lhpc.setReporter(&recorder);
	lhpc.setSeeder(new HFixedSeeder(seeds), true);
	lhpc.cluster(&data);
	for(size_t j = 0; j < recorder.m_hubs.size(); j++)
	{
		TestEqual(INVALID_INDEX, recorder.m_hubs[j][1], "a cluster smaller than k+2 uses its mean");
		if(recorder.m_hubs[j][0] == INVALID_INDEX)
			throw Ex("A big enough cluster should be represented by a hub");
	}
	TestEqual(INVALID_INDEX, lhpc.hubIndexes()[1], "final small cluster");
	vector<size_t> small;
	for(size_t i = 40; i < 45; i++)
		small.push_back(i);
	HVec mean;
	data.centroid(mean, small);
	if(mean.squaredDistance(lhpc.centers()[1]) > 1e-12)
		throw Ex("The small cluster should be centered on its mean");
	for(size_t i = 40; i < 45; i++)
		TestEqual((size_t)1, lhpc.whichCluster(i), "small cluster members");
}

void HHubnessClusterer_testRetries()
{
	HMatrix data(4, 1);
	data[0][0] = 0.0;
	data[1][0] = 1.0;
	data[2][0] = 10.0;
	data[3][0] = 11.0;
	vector<size_t> seeds;
	seeds.push_back(0);
	seeds.push_back(2);

	// Every mean lands between integers, so all points tie and fall into cluster 0
	HRand rand(0);
	HGlobalHubnessKMeans ghpkm(2, &rand);
	ghpkm.setMetric(new HTestIntegerMetric(), true);
	ghpkm.setNeighborhoodSize(2);
	ghpkm.setSchedule(HAnnealingSchedule::constant(1.0));
	ghpkm.setSeeder(new HFixedSeeder(seeds), true);
	ghpkm.setMaxRetries(3);
	HTestStatusRecorder recorder;
	ghpkm.setReporter(&recorder);
	size_t attempts = 0;
	{
		HExpectException ee;
		try
		{
			ghpkm.cluster(&data);
		}
		catch(const HUnableToFinishEx& e)
		{
			attempts = e.attempts();
		}
	}
	TestEqual((size_t)3, attempts, "attempts before giving up");
	TestEqual((size_t)3, recorder.m_retries, "every failed attempt is reported");
	TestEqual((size_t)0, ghpkm.getClusterAssociations().size(), "no partial result");
	TestEqual((size_t)0, ghpkm.hubIndexes().size(), "no partial hubs");
}

void HHubnessClusterer_testStopWhenNothingMoves(const HMatrix& data, const vector<size_t>& seeds)
{
	// Every hub stays in its blob, so the first update moves no point
	HRand rand(0);
	HGlobalHubnessClusterer ghpc(3, &rand);
	HTestStatusRecorder recorder;
	ghpc.setReporter(&recorder);
	ghpc.setSchedule(HAnnealingSchedule::constant(1.0));
	ghpc.setSeeder(new HFixedSeeder(seeds), true);
	ghpc.cluster(&data);
	TestEqual((size_t)1, ghpc.iterations(), "no reassignment ends the run before the iteration floor");
	TestEqual((size_t)1, recorder.m_errors.size(), "one status");

	HGlobalHubnessKMeans ghpkm(3, &rand);
	ghpkm.setMinIterations(50);
	ghpkm.setSchedule(HAnnealingSchedule::constant(1.0));
	ghpkm.setSeeder(new HFixedSeeder(seeds), true);
	ghpkm.cluster(&data);
	TestEqual((size_t)1, ghpkm.iterations(), "the floor only applies to convergence");
}

void HHubnessClusterer_testCancellation()
{
	// Random hubs in a uniform cloud move points in every iteration
	HRand dataRand(17);
	HMatrix cloud(150, 2);
	for(size_t i = 0; i < cloud.rows(); i++)
	{
		cloud[i][0] = dataRand.uniform();
		cloud[i][1] = dataRand.uniform();
	}
	HRand rand(0);
	HGlobalHubnessClusterer ghpc(3, &rand);
	HTestStatusRecorder recorder(3);
	ghpc.setReporter(&recorder);
	ghpc.setSchedule(HAnnealingSchedule::constant(0.0));
	ghpc.cluster(&cloud);
	TestEqual((size_t)3, ghpc.iterations(), "stopped by the reporter");
	TestEqual(cloud.rows(), ghpc.getClusterAssociations().size(), "a stopped run still has a result");

	HGlobalHubnessClusterer stopped(3, &rand);
	HTestStatusRecorder never(0);
	stopped.setReporter(&never);
	stopped.cluster(&cloud);
	TestEqual((size_t)0, stopped.iterations(), "stopped before the first update");
	TestEqual((size_t)3, stopped.hubIndexes().size(), "the seeds are the result");
	TestEqual(cloud.rows(), stopped.getClusterAssociations().size(), "the initial assignment is the result");
}

void HHubnessClusterer_testCache(const HMatrix& data, const vector<size_t>& seeds)
{
	HEuclideanDistance metric;
	vector<double> full(HDistanceCache::triangleSize(data.rows()));
	for(size_t i = 0; i < data.rows(); i++)
	{
		for(size_t j = i + 1; j < data.rows(); j++)
			full[HDistanceCache::index(i, j, data.rows())] = metric.distance(data[i], data[j]);
	}
	HRand rand(0);
	HGlobalHubnessClusterer ghpc(3, &rand);
	ghpc.setDistanceMatrix(full);
	ghpc.setSeeder(new HFixedSeeder(seeds), true);
	ghpc.cluster(&data);
	TestEqual((size_t)0, ghpc.distanceCache()->metricEvaluations(), "supplied distances are never measured again");

	HLocalHubnessClusterer lhpc(3, &rand);
	lhpc.setSeeder(new HFixedSeeder(seeds), true);
	lhpc.cluster(&data);
	if(lhpc.distanceCache()->metricEvaluations() > HDistanceCache::triangleSize(data.rows()))
		throw Ex("A pair was measured more than once");
	TestEqual(lhpc.distanceCache()->metricEvaluations(), lhpc.distanceCache()->cachedCount(), "every measurement is kept");
}

void HHubnessClusterer_testSuppliedProfile(const HMatrix& data, const vector<size_t>& seeds)
{
	vector<size_t> occ(data.rows(), 1);
	occ[3] = 100;
	occ[4] = 100;
	occ[5] = 100;
	HRand rand(0);
	HGlobalHubnessClusterer ghpc(3, &rand);
	ghpc.setHubness(HHubnessProfile(occ, 10));
	ghpc.setSchedule(HAnnealingSchedule::constant(1.0));
	ghpc.setSeeder(new HFixedSeeder(seeds), true);
	HHubHistoryReporter history;
	ghpc.setReporter(&history);
	ghpc.cluster(&data);
	vector<size_t> expected;
	expected.push_back(3);
	expected.push_back(4);
	expected.push_back(5);
	if(history.history().size() == 0)
		throw Ex("Expected at least one hub update");
	TestEqual(expected, history.history()[0], "hubs picked with the supplied profile");
}

void HHubnessClusterer_testIdempotence(const HMatrix& data, const vector<size_t>& seeds)
{
	HRand rand(21);
	HGlobalHubnessClusterer first(3, &rand);
	first.setSchedule(HAnnealingSchedule::constant(1.0));
	first.setSeeder(new HFixedSeeder(seeds), true);
	first.cluster(&data);
	size_t t = first.iterations();
	if(t >= 100)
		throw Ex("Expected the run to stop before the iteration limit");
	for(size_t extra = 0; extra < 2; extra++)
	{
		rand.setSeed(21);
		HGlobalHubnessClusterer again(3, &rand);
		again.setSchedule(HAnnealingSchedule::constant(1.0));
		again.setSeeder(new HFixedSeeder(seeds), true);
		again.setMaxIterations(t + 10 * extra);
		again.cluster(&data);
		if(again.getClusterAssociations() != first.getClusterAssociations() || again.hubIndexes() != first.hubIndexes())
			throw Ex("Allowing more iterations after convergence changed the result");
		TestEqual(first.bestError(), again.bestError(), "same best error");
	}
}

void HHubnessClusterer_testQuality(const HMatrix& data, const vector<size_t>& labels, const vector<size_t>& seeds)
{
	HRand rand(0);
	HKMeans km(3, &rand);
	km.setSeeder(new HFixedSeeder(seeds), true);
	km.cluster(&data);
	double sse = km.sumSquaredError();

	// The schedule is fully deterministic from the first update
	HGlobalHubnessKMeans ghpkm(3, &rand);
	ghpkm.setSchedule(HAnnealingSchedule::constant(1.0));
	ghpkm.setSeeder(new HFixedSeeder(seeds), true);
	ghpkm.cluster(&data);
	if(ghpkm.bestError() > 1.05 * sse)
		throw Ex("Hubness-proportional K-means should be about as good as K-means. Got ", to_str(ghpkm.bestError()), ". Expected ", to_str(sse));

	const double cx[3] = { 0.0, 20.0, 0.0 };
	const double cy[3] = { 0.0, 0.0, 20.0 };
	HGlobalHubnessClusterer ghpc(3, &rand);
	ghpc.setSchedule(HAnnealingSchedule::constant(1.0));
	ghpc.setSeeder(new HFixedSeeder(seeds), true);
	ghpc.cluster(&data);
	if(ghpc.bestError() > 1.3 * sse)
		throw Ex("Hub points should be close to the means. Got ", to_str(ghpc.bestError()), ". Expected about ", to_str(sse));
	for(size_t c = 0; c < 3; c++)
	{
		size_t hub = ghpc.hubIndexes()[c];
		size_t blob = labels[hub];
		if(ghpc.whichCluster(blob) != c)
			throw Ex("Cluster ", to_str(c), " has a hub from another blob");
		double dx = data[hub][0] - cx[blob];
		double dy = data[hub][1] - cy[blob];
		if(dx * dx + dy * dy > 2.5 * 2.5)
			throw Ex("The hub of cluster ", to_str(c), " is too far from the middle of its blob");
	}

	HLocalHubnessClusterer lhpc(3, &rand);
	lhpc.setSchedule(HAnnealingSchedule::constant(1.0));
	lhpc.setSeeder(new HFixedSeeder(seeds), true);
	lhpc.cluster(&data);
	if(lhpc.bestError() > 1.3 * sse)
		throw Ex("Local hubs should be close to the means. Got ", to_str(lhpc.bestError()), ". Expected about ", to_str(sse));

	// The blob centers go to the clusters of their blobs
	HMatrix probes({{0.0, 0.0}, {20.0, 0.0}, {0.0, 20.0}});
	vector<size_t> out;
	ghpc.assignPointsToModelClusters(probes, out);
	for(size_t j = 0; j < 3; j++)
		TestEqual(ghpc.whichCluster(j), out[j], "blob center assigned to its blob's cluster");
	HMatrix wide({{0.0, 0.0, 0.0}});
	bool threw = false;
	{
		HExpectException ee;
		try
		{
			ghpc.assignPointsToModelClusters(wide, out);
		}
		catch(const HInvalidConfigurationEx&)
		{
			threw = true;
		}
	}
	if(!threw)
		throw Ex("Expected points of the wrong width to be rejected");
}

// static
void HHubnessClusterer::test()
{
	HRand rand(0);
	HMatrix data;
	vector<size_t> labels;
	HCluster_makeBlobs(data, labels, rand);
	vector<size_t> seeds;
	seeds.push_back(0);
	seeds.push_back(1);
	seeds.push_back(2);

	HHubnessClusterer_testConfiguration(data);
	HHubnessClusterer_testTrivial(data);
	HHubnessClusterer_testValidity(data, seeds);
	HHubnessClusterer_testDeterminism(data, seeds);
	HHubnessClusterer_testSingleton();
	HHubnessClusterer_testLocalFallback();
	HHubnessClusterer_testRetries();
	HHubnessClusterer_testStopWhenNothingMoves(data, seeds);
	HHubnessClusterer_testCancellation();
	HHubnessClusterer_testCache(data, seeds);
	HHubnessClusterer_testSuppliedProfile(data, seeds);
	HHubnessClusterer_testIdempotence(data, seeds);
	HHubnessClusterer_testQuality(data, labels, seeds);
}

} // namespace HClasses

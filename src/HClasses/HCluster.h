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

#ifndef __HCLUSTER_H__
#define __HCLUSTER_H__

#include "HMatrix.h"
#include "HHubness.h"
#include "HHubSelector.h"
#include <vector>
#include <memory>

namespace HClasses {

class HDistanceMetric;
class HDistanceCache;
class HClusterSeeder;
class HClusterReporter;
struct HClusterStatus;
class HRand;


/// The base class for clustering algorithms. Classes that inherit from this
/// class must implement a method named "cluster" which performs clustering, and
/// a method named "whichCluster" which reports which cluster the specified row
/// is determined to be a member of.
class HClusterer
{
protected:
	size_t m_clusterCount;
	HDistanceMetric* m_pMetric;
	bool m_ownMetric;

public:
	HClusterer(size_t nClusterCount);
	virtual ~HClusterer();

	/// If own is true, then this object will delete pMetric when it is destroyed.
	/// If no metric is set, the Euclidean distance is used.
	void setMetric(HDistanceMetric* pMetric, bool own);

	/// Returns the metric, or NULL if none has been set yet
	const HDistanceMetric* metric() const { return m_pMetric; }

	/// Return the number of clusters
	size_t clusterCount() const { return m_clusterCount; }

	/// Performs clustering.
	virtual void cluster(const HMatrix* pData) = 0;

	/// Reports which cluster the specified row is a member of.
	virtual size_t whichCluster(size_t nVector) = 0;

protected:
	/// Sets the metric to the Euclidean distance if no metric was specified
	void ensureMetric();

	/// Throws HInvalidConfigurationEx if pData is empty, or if the cluster count is 0 or exceeds the number of rows.
	void checkClusterCount(const HMatrix* pData) const;
};


/// An implementation of the K-means clustering algorithm (Lloyd's algorithm).
/// Seeds are chosen with an HClusterSeeder, which defaults to HPlusPlusSeeder.
class HKMeans : public HClusterer
{
protected:
	HMatrix m_centroids;
	std::vector<size_t> m_clusters;
	size_t m_reps;
	size_t m_maxIterations;
	double m_error;
	HRand* m_pRand;
	HClusterSeeder* m_pSeeder;
	bool m_ownSeeder;

public:
	HKMeans(size_t nClusters, HRand* pRand);
	virtual ~HKMeans();

	/// Performs clustering
	virtual void cluster(const HMatrix* pData);

	/// Identifies the cluster of the specified row
	virtual size_t whichCluster(size_t nVector);

	/// Returns the cluster of every row
	const std::vector<size_t>& getClusterAssociations() const { return m_clusters; }

	/// Returns a k x d matrix, where each row is one of the k centroids.
	const HMatrix& centroids() const { return m_centroids; }

	/// Returns the sum-squared-distance between each row and its centroid.
	double sumSquaredError() const { return m_error; }

	/// Specify the number of times to cluster the data. The best clustering (as measured
	/// by the sum-squared-difference between each point and its cluster-centroid) will be kept.
	void setReps(size_t r) { m_reps = r; }

	/// Sets the largest number of iterations per repetition
	void setMaxIterations(size_t n) { m_maxIterations = n; }

	/// Sets the seeding procedure. If own is true, this object will delete pSeeder.
	void setSeeder(HClusterSeeder* pSeeder, bool own);

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();

protected:
	/// Assigns each row to the cluster of the nearest centroid. Ties go to the lower cluster index.
	/// Returns the sum-squared-distance of each row with its centroid.
	double assignClusters(const HMatrix* pData, std::vector<size_t>& clusters);

	/// Computes new centroids for each cluster. An empty cluster keeps its old centroid.
	void recomputeCentroids(const HMatrix* pData, const std::vector<size_t>& clusters);
};


/// Tells the retry loop whether a step of a clustering attempt can be continued.
struct HClusterStepResult
{
	enum Code
	{
		SUCCESS,
		EMPTY_CLUSTER,
	};

	Code code;
	size_t cluster;

	HClusterStepResult(Code c = SUCCESS, size_t clust = INVALID_INDEX)
	: code(c), cluster(clust)
	{
	}

	static HClusterStepResult success() { return HClusterStepResult(SUCCESS); }
	static HClusterStepResult emptyCluster(size_t clust) { return HClusterStepResult(EMPTY_CLUSTER, clust); }

	bool succeeded() const { return code == SUCCESS; }
};


/// Everything that changes from one iteration of a clustering attempt to the next.
struct HClusterLoopState
{
	size_t attempt;
	size_t iteration;
	double errorPrevious;
	double errorCurrent;
	size_t reassigned;
	bool converged;
	std::vector<size_t> associations;
	std::vector<size_t> hubIndexes;
	HMatrix centers;
	std::vector<std::vector<size_t> > members;

	HClusterLoopState();
	void reset(size_t attempt, size_t rows, size_t clusterCount, size_t cols);
};


/// A partitional clustering algorithm that represents each cluster with a "hub",
/// a point that occurs frequently in the k-nearest-neighbor lists of other points.
/// In early iterations hubs are sampled with probability proportional to the square
/// of their neighbor occurrence counts. An annealing schedule gradually switches to
/// always picking the member with the most occurrences.
///
/// Two policies select the variant:
/// the representation of a cluster (HUB_POINT always uses a real point,
/// MEAN_WHEN_DETERMINISTIC uses the mean of the members whenever the schedule picks
/// the deterministic branch), and the source of the occurrence counts (GLOBAL_PROFILE
/// uses one profile for the whole dataset, LOCAL_RECOMPUTE recomputes the k-nearest
/// neighbors inside every cluster in every iteration, and uses the mean of any
/// cluster smaller than k+2).
///
/// The result is the lowest-error configuration seen during the run, which is not
/// necessarily the configuration of the last iteration. If an attempt ends up with an
/// empty cluster, clustering starts over from new seeds, up to setMaxRetries times.
class HHubnessClusterer : public HClusterer
{
public:
	enum HubRepresentation
	{
		HUB_POINT,
		MEAN_WHEN_DETERMINISTIC,
	};

	enum HubnessSource
	{
		GLOBAL_PROFILE,
		LOCAL_RECOMPUTE,
	};

protected:
	HRand* m_pRand;
	HubRepresentation m_representation;
	HubnessSource m_source;
	size_t m_neighborhoodSize;
	HAnnealingSchedule m_schedule;
	size_t m_minIterations;
	size_t m_maxIterations;
	double m_errorThreshold;
	size_t m_maxRetries;
	HClusterSeeder* m_pSeeder;
	bool m_ownSeeder;
	HClusterReporter* m_pReporter;

	HHubnessProfile m_hubness;
	bool m_hubnessSupplied;
	std::vector<double> m_suppliedDistances;
	const HMatrix* m_pData;
	std::unique_ptr<HDistanceCache> m_pCache;

	std::vector<size_t> m_bestAssociations;
	std::vector<size_t> m_bestHubIndexes;
	HMatrix m_bestCenters;
	double m_bestError;
	size_t m_iterations;
	size_t m_attempts;

public:
	/// pRand is used for seeding and for every stochastic decision. It is not deleted by this object.
	HHubnessClusterer(size_t nClusterCount, HRand* pRand, HubRepresentation representation, HubnessSource source);
	virtual ~HHubnessClusterer();

	/// Performs clustering. Throws HInvalidConfigurationEx without doing any work if
	/// the configuration cannot work for pData, and HUnableToFinishEx if every attempt
	/// ended with an empty cluster.
	virtual void cluster(const HMatrix* pData);

	/// Returns the cluster of the specified row in the best configuration
	virtual size_t whichCluster(size_t nVector);

	/// Returns the cluster of every row in the best configuration
	const std::vector<size_t>& getClusterAssociations() const { return m_bestAssociations; }

	/// Returns the squared error of the best configuration
	double bestError() const { return m_bestError; }

	/// Returns the members of each cluster in the best configuration
	void getMinimizingClusters(std::vector<std::vector<size_t> >& out) const;

	/// Returns the hub index of each cluster in the best configuration.
	/// A cluster represented by a mean has INVALID_INDEX.
	const std::vector<size_t>& hubIndexes() const { return m_bestHubIndexes; }

	/// Returns the center of each cluster in the best configuration
	const HMatrix& centers() const { return m_bestCenters; }

	/// Returns the number of iterations run by the successful attempt
	size_t iterations() const { return m_iterations; }

	/// Returns the number of attempts used by the last call to cluster
	size_t attempts() const { return m_attempts; }

	/// Assigns each row of points to the nearest center of the best configuration.
	/// Ties go to the lower cluster index. Throws if clustering has not been done, and
	/// HInvalidConfigurationEx if the points do not have the same width as the training data.
	void assignPointsToModelClusters(const HMatrix& points, std::vector<size_t>& out) const;

	/// Returns the occurrence profile used by the last run with a global profile
	const HHubnessProfile& hubness() const { return m_hubness; }

	/// Returns the distance cache of the last run, or NULL
	const HDistanceCache* distanceCache() const { return m_pCache.get(); }

	/// Supplies neighbor occurrence counts so they do not need to be computed.
	/// The profile must cover every row of the data passed to cluster.
	void setHubness(const HHubnessProfile& profile);

	/// Supplies precomputed distances as a flattened upper triangle (see HDistanceCache::adopt).
	/// Pairs with negative or NaN values are measured with the metric when needed.
	void setDistanceMatrix(const std::vector<double>& values);

	/// Sets the neighborhood size k. The default is 10.
	void setNeighborhoodSize(size_t k) { m_neighborhoodSize = k; }

	/// Returns the neighborhood size
	size_t neighborhoodSize() const { return m_neighborhoodSize; }

	/// Sets both the length of the linear annealing ramp and the minimum number of
	/// iterations before convergence is checked. The default is 20.
	void setProbabilisticIterations(size_t n);

	/// Replaces the annealing schedule
	void setSchedule(const HAnnealingSchedule& schedule) { m_schedule = schedule; }

	/// Returns the annealing schedule
	const HAnnealingSchedule& schedule() const { return m_schedule; }

	/// Sets the iteration before which convergence is never declared
	void setMinIterations(size_t n) { m_minIterations = n; }

	/// Sets the largest number of iterations per attempt. The default is 100.
	void setMaxIterations(size_t n) { m_maxIterations = n; }

	/// Sets the relative change in error below which the error has converged. The default is 0.001.
	void setErrorThreshold(double t) { m_errorThreshold = t; }

	/// Sets the number of attempts to make before giving up. The default is 10.
	void setMaxRetries(size_t n) { m_maxRetries = n; }

	/// Sets the seeding procedure. If own is true, this object will delete pSeeder.
	/// The default is HPlusPlusSeeder.
	void setSeeder(HClusterSeeder* pSeeder, bool own);

	/// Sets a reporter to receive progress notifications. It is not deleted by this object.
	void setReporter(HClusterReporter* pReporter) { m_pReporter = pReporter; }

	/// Performs unit tests for this class. Throws an exception if there is a failure.
	static void test();

protected:
	/// Throws HInvalidConfigurationEx if clustering pData cannot work
	void checkConfiguration(const HMatrix* pData) const;

	/// Handles one cluster, and as many clusters as rows. Returns false if the configuration is not trivial.
	bool clusterTrivially(const HMatrix* pData);

	/// Makes sure the occurrence profile covers the data
	void prepareHubness();

	/// Runs one attempt from new seeds to termination
	HClusterStepResult runAttempt(HClusterLoopState& state, HHubSelector& selector);

	/// Picks a new hub or center for every cluster
	HClusterStepResult updateHubs(HClusterLoopState& state, HHubSelector& selector, double deterministicProbability);

	/// Assigns every point to the nearest hub or center. A point that is the hub of a
	/// cluster always belongs to that cluster. Reports an empty cluster if one occurs.
	HClusterStepResult assign(HClusterLoopState& state);

	/// Returns the sum of squared distances between each point and the center of its cluster
	double computeError(const HClusterLoopState& state);

	/// Returns the distance between point i and the representative of cluster c
	double distanceToCenter(const HClusterLoopState& state, size_t i, size_t c);

	/// Copies the state into the best configuration
	void snapshot(const HClusterLoopState& state);

	/// Fills in a status record for the reporter
	void makeStatus(const HClusterLoopState& state, double deterministicProbability, bool converged, HClusterStatus& status) const;
};


/// Global hubness-proportional clustering. Every cluster is represented by a real point
/// picked with occurrence counts from one profile of the whole dataset.
class HGlobalHubnessClusterer : public HHubnessClusterer
{
public:
	HGlobalHubnessClusterer(size_t nClusterCount, HRand* pRand)
	: HHubnessClusterer(nClusterCount, pRand, HUB_POINT, GLOBAL_PROFILE)
	{
	}

	virtual ~HGlobalHubnessClusterer() {}
};


/// Global hubness-proportional K-means. Stochastic iterations pick a hub with the global
/// occurrence counts. Deterministic iterations use the mean of the members instead.
class HGlobalHubnessKMeans : public HHubnessClusterer
{
public:
	HGlobalHubnessKMeans(size_t nClusterCount, HRand* pRand)
	: HHubnessClusterer(nClusterCount, pRand, MEAN_WHEN_DETERMINISTIC, GLOBAL_PROFILE)
	{
	}

	virtual ~HGlobalHubnessKMeans() {}
};


/// Local hubness-proportional clustering. Occurrence counts are recomputed inside every
/// cluster in every iteration. Clusters smaller than k+2 are represented by their mean.
class HLocalHubnessClusterer : public HHubnessClusterer
{
public:
	HLocalHubnessClusterer(size_t nClusterCount, HRand* pRand)
	: HHubnessClusterer(nClusterCount, pRand, HUB_POINT, LOCAL_RECOMPUTE)
	{
	}

	virtual ~HLocalHubnessClusterer() {}
};


} // namespace HClasses

#endif // __HCLUSTER_H__

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

#ifndef __HREPORTER_H__
#define __HREPORTER_H__

#include <vector>
#include <string>
#include <iostream>
#include <cstddef>

namespace HClasses {

class HMatrix;


/// A snapshot of the state of a clustering run, passed to reporters after every iteration.
/// pMembers holds the cluster members that the hubs in pHubIndexes were selected from.
struct HClusterStatus
{
	size_t attempt;
	size_t iteration;
	double deterministicProbability;
	double error;
	double bestError;
	size_t reassigned;
	bool converged;
	const std::vector<size_t>* pHubIndexes;
	const std::vector<std::vector<size_t> >* pMembers;

	HClusterStatus()
	: attempt(0), iteration(0), deterministicProbability(0.0), error(0.0), bestError(0.0), reassigned(0), converged(false), pHubIndexes(NULL), pMembers(NULL)
	{
	}
};


/// Receives progress notifications from a clustering algorithm. All of the
/// notification methods do nothing by default.
class HClusterReporter
{
public:
	HClusterReporter() {}
	virtual ~HClusterReporter() {}

	/// Called once before clustering begins
	virtual void start(const HMatrix* pData, size_t clusterCount, size_t maxIterations) {}

	/// Called after the hubs of every iteration have been selected and the points reassigned
	virtual void newStatus(const HClusterStatus& status) {}

	/// Called when an attempt is abandoned and clustering starts over from new seeds
	virtual void onRetry(size_t attempt, const std::string& reason) {}

	/// Called once after clustering finishes successfully
	virtual void stop(const HClusterStatus& status) {}

	/// Checked before every iteration. Returning false stops the run early, and the
	/// best configuration found so far becomes the result.
	virtual bool keepGoing() { return true; }
};


/// Writes one line of progress per iteration to a stream
class HStreamReporter : public HClusterReporter
{
protected:
	std::ostream& m_stream;

public:
	HStreamReporter(std::ostream& stream = std::cerr);
	virtual ~HStreamReporter();

	virtual void start(const HMatrix* pData, size_t clusterCount, size_t maxIterations);
	virtual void newStatus(const HClusterStatus& status);
	virtual void onRetry(size_t attempt, const std::string& reason);
	virtual void stop(const HClusterStatus& status);
};


/// Records the hub indexes chosen in every iteration of the successful attempt.
/// A synthetic center is recorded as INVALID_INDEX.
class HHubHistoryReporter : public HClusterReporter
{
protected:
	std::vector<std::vector<size_t> > m_history;

public:
	HHubHistoryReporter();
	virtual ~HHubHistoryReporter();

	virtual void start(const HMatrix* pData, size_t clusterCount, size_t maxIterations);
	virtual void newStatus(const HClusterStatus& status);
	virtual void onRetry(size_t attempt, const std::string& reason);

	/// Returns the hub indexes of each iteration, in order
	const std::vector<std::vector<size_t> >& history() const { return m_history; }
};


/// Forwards every notification to a list of reporters. Takes ownership of the reporters added to it.
class HReporterChain : public HClusterReporter
{
protected:
	std::vector<HClusterReporter*> m_reporters;

public:
	HReporterChain();
	virtual ~HReporterChain();

	/// Adds a reporter to the chain. The chain deletes it when the chain is deleted.
	void add(HClusterReporter* toAdd);

	virtual void start(const HMatrix* pData, size_t clusterCount, size_t maxIterations);
	virtual void newStatus(const HClusterStatus& status);
	virtual void onRetry(size_t attempt, const std::string& reason);
	virtual void stop(const HClusterStatus& status);

	/// Returns false if any reporter in the chain returns false
	virtual bool keepGoing();

	/// Performs unit tests for the reporters. Throws an exception if there is a failure.
	static void test();
};


} // namespace HClasses

#endif // __HREPORTER_H__

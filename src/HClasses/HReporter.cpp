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

#include "HReporter.h"
#include "HMatrix.h"
#include "HError.h"
#include <sstream>

namespace HClasses {

HStreamReporter::HStreamReporter(std::ostream& stream)
: HClusterReporter(), m_stream(stream)
{
}

// virtual
HStreamReporter::~HStreamReporter()
{
}

// virtual
void HStreamReporter::start(const HMatrix* pData, size_t clusterCount, size_t maxIterations)
{
	m_stream << "Clustering " << pData->rows() << " points into " << clusterCount << " clusters (at most " << maxIterations << " iterations)\n";
	m_stream.flush();
}

// virtual
void HStreamReporter::newStatus(const HClusterStatus& status)
{
	std::streamsize oldPrecision = m_stream.precision(8);
	m_stream << "attempt " << status.attempt << ", iteration " << status.iteration
		<< ", p(det)=" << status.deterministicProbability
		<< ", error=" << status.error
		<< ", best=" << status.bestError
		<< ", moved=" << status.reassigned;
	if(status.converged)
		m_stream << ", converged";
	m_stream << "\n";
	m_stream.precision(oldPrecision);
	m_stream.flush();
}

// virtual
void HStreamReporter::onRetry(size_t attempt, const std::string& reason)
{
	m_stream << "attempt " << attempt << " failed (" << reason << "). Starting over with new seeds.\n";
	m_stream.flush();
}

// virtual
void HStreamReporter::stop(const HClusterStatus& status)
{
	std::streamsize oldPrecision = m_stream.precision(8);
	m_stream << "Finished after " << status.iteration << " iterations. Best error: " << status.bestError << "\n";
	m_stream.precision(oldPrecision);
	m_stream.flush();
}

// --------------------------------------------------------------------------------

HHubHistoryReporter::HHubHistoryReporter()
: HClusterReporter()
{
}

// virtual
HHubHistoryReporter::~HHubHistoryReporter()
{
}

// virtual
void HHubHistoryReporter::start(const HMatrix* pData, size_t clusterCount, size_t maxIterations)
{
	m_history.clear();
}

// virtual
void HHubHistoryReporter::newStatus(const HClusterStatus& status)
{
	if(status.pHubIndexes)
		m_history.push_back(*status.pHubIndexes);
}

// virtual
void HHubHistoryReporter::onRetry(size_t attempt, const std::string& reason)
{
	m_history.clear();
}

// --------------------------------------------------------------------------------

HReporterChain::HReporterChain()
: HClusterReporter()
{
}

// virtual
HReporterChain::~HReporterChain()
{
	for(std::vector<HClusterReporter*>::iterator r = m_reporters.begin(); r != m_reporters.end(); ++r)
		delete(*r);
}

void HReporterChain::add(HClusterReporter* toAdd)
{
	m_reporters.push_back(toAdd);
}

// virtual
void HReporterChain::start(const HMatrix* pData, size_t clusterCount, size_t maxIterations)
{
	for(std::vector<HClusterReporter*>::iterator r = m_reporters.begin(); r != m_reporters.end(); ++r)
		(*r)->start(pData, clusterCount, maxIterations);
}

// virtual
void HReporterChain::newStatus(const HClusterStatus& status)
{
	for(std::vector<HClusterReporter*>::iterator r = m_reporters.begin(); r != m_reporters.end(); ++r)
		(*r)->newStatus(status);
}

// virtual
void HReporterChain::onRetry(size_t attempt, const std::string& reason)
{
	for(std::vector<HClusterReporter*>::iterator r = m_reporters.begin(); r != m_reporters.end(); ++r)
		(*r)->onRetry(attempt, reason);
}

// virtual
void HReporterChain::stop(const HClusterStatus& status)
{
	for(std::vector<HClusterReporter*>::iterator r = m_reporters.begin(); r != m_reporters.end(); ++r)
		(*r)->stop(status);
}

// virtual
bool HReporterChain::keepGoing()
{
	bool go = true;
	for(std::vector<HClusterReporter*>::iterator r = m_reporters.begin(); r != m_reporters.end(); ++r)
	{
		if(!(*r)->keepGoing())
			go = false;
	}
	return go;
}

class HStopImmediatelyReporter : public HClusterReporter
{
public:
	virtual bool keepGoing() { return false; }
};

// static
void HReporterChain::test()
{
	std::ostringstream os;
	HHubHistoryReporter* pHistory = new HHubHistoryReporter();
	HReporterChain chain;
	chain.add(new HStreamReporter(os));
	chain.add(pHistory);
	HMatrix data(4, 2);
	chain.start(&data, 2, 10);
	std::vector<size_t> hubs;
	hubs.push_back(3);
	hubs.push_back(INVALID_INDEX);
	HClusterStatus status;
	status.attempt = 1;
	status.iteration = 1;
	status.error = 2.5;
	status.bestError = 2.5;
	status.reassigned = 1;
	status.pHubIndexes = &hubs;
	chain.newStatus(status);
	status.iteration = 2;
	status.converged = true;
	chain.newStatus(status);
	chain.stop(status);
	TestEqual((size_t)2, pHistory->history().size(), "history length");
	TestEqual((size_t)3, pHistory->history()[0][0], "history hub");
	TestContains("4 points into 2 clusters", os.str(), "start line");
	TestContains("iteration 2", os.str(), "status line");
	TestContains("converged", os.str(), "converged flag");
	TestContains("Best error: 2.5", os.str(), "stop line");
	chain.onRetry(1, "empty cluster");
	TestEqual((size_t)0, pHistory->history().size(), "history is cleared on retry");
	TestContains("attempt 1 failed (empty cluster)", os.str(), "retry line");
	if(!chain.keepGoing())
		throw Ex("expected the chain to keep going");
	chain.add(new HStopImmediatelyReporter());
	if(chain.keepGoing())
		throw Ex("expected the chain to stop when one reporter stops");
}

} // namespace HClasses

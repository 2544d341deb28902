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

#include <stdio.h>
#include <string.h>
#include <exception>
#include <string>
#include <list>
#include <sstream>
#include <iostream>
#include <algorithm>
#include "../HClasses/HCluster.h"
#include "../HClasses/HConvergence.h"
#include "../HClasses/HDistance.h"
#include "../HClasses/HDistanceCache.h"
#include "../HClasses/HError.h"
#include "../HClasses/HHubness.h"
#include "../HClasses/HHubSelector.h"
#include "../HClasses/HMatrix.h"
#include "../HClasses/HNeighborFinder.h"
#include "../HClasses/HRand.h"
#include "../HClasses/HReporter.h"
#include "../HClasses/HSeeder.h"
#include "../HClasses/HTime.h"
#include "../HClasses/HVec.h"

using namespace HClasses;
using std::cerr;
using std::cout;
using std::string;

typedef void (*TestFunc)();

#define PERF_FILE_CHARS 9

class HTestHarness
{
protected:
	std::ostringstream m_testTimes;
	size_t m_failures;

	///A test will only be run if its name contains one of the
	///testNameSubstr strings.  Any string contains the empty string as
	///a substring, so the empty string matches all strings.
	std::list<std::string> m_testNameSubstr;

public:
	///Create a test harness that runs tests matching the substrings
	///passed on the command line. If no substrings are given, all tests are run.
	HTestHarness(int argc, char**argv)
	: m_failures(0)
	{
		if(argc < 2){
			m_testNameSubstr.push_back("");
		}else{
			for(int i = 1; i < argc; ++i){
				m_testNameSubstr.push_back(argv[i]);
			}
		}

		m_testTimes.flags(std::ios::showpoint | std::ios::skipws | std::ios::dec | std::ios::fixed | std::ios::left);
		m_testTimes.width(PERF_FILE_CHARS);
		m_testTimes.precision(PERF_FILE_CHARS - 3);
		string s;
		HTime::appendTimeStampValue(&s, "-", " ", ":", false);
		m_testTimes << s;
	}

	~HTestHarness()
	{
	}

	size_t failures() const { return m_failures; }

	void logTime(const char* szTestName, bool passed, double secs)
	{
		m_testTimes << ",";

		// Record PERF_FILE_CHARS letters of the test name (skipping the first letter, because it is usually 'H')
		size_t n = std::min((size_t)PERF_FILE_CHARS, strlen(szTestName + 1));
		char buf[PERF_FILE_CHARS + 1];
		for(size_t j = 0; j < PERF_FILE_CHARS - n; j++)
			buf[j] = ' ';
		memcpy(buf + PERF_FILE_CHARS - n, szTestName + 1, n);
		buf[PERF_FILE_CHARS] = '\0';
		m_testTimes << buf << "=";
		if(passed)
		{
			if(secs < 10)
				m_testTimes << "0";
			m_testTimes << secs;
		}
		else
			m_testTimes << "FAILED";
	}

	///Return true iff testName contains one of the strings passed on the command line.
	bool willRunTest(std::string testName) const{
		std::list<std::string>::const_iterator pat;
		for(pat = m_testNameSubstr.begin(); pat != m_testNameSubstr.end(); ++pat){
			if(testName.find(*pat) != std::string::npos){
				return true;
			}
		}
		return false;
	}

	void printTestName(const char* szTestName)
	{
		cout << szTestName;
		size_t nSpaces = (size_t)70 - strlen(szTestName);
		for( ; nSpaces > 0; nSpaces--)
			cout << " ";
		cout.flush();
	}

	bool runTest(const char* szTestName, TestFunc pTest)
	{
		if(willRunTest(szTestName))
		{
			printTestName(szTestName);
			bool passed = false;
			double beginTime = HTime::seconds();
			try
			{
				pTest();
				passed = true;
			}
			catch(const std::exception& e)
			{
				cout << "\n" << e.what() << "\n\n";
			}
			double endTime = HTime::seconds();
			logTime(szTestName, passed, endTime - beginTime);
			if(passed)
				cout << "Passed\n";
			else
			{
				cout << "FAILED!!!\n";
				m_failures++;
			}
			return passed;
		}
		else
			return true;
	}

	void runAllTests()
	{
		runTest("HAnnealingSchedule", HAnnealingSchedule::test);
		runTest("HBruteForceNeighborFinder", HBruteForceNeighborFinder::test);
		runTest("HConvergenceMonitor", HConvergenceMonitor::test);
		runTest("HDistanceCache", HDistanceCache::test);
		runTest("HDistanceMetric", HDistanceMetric::test);
		runTest("HHubnessClusterer", HHubnessClusterer::test);
		runTest("HHubnessProfile", HHubnessProfile::test);
		runTest("HHubSelector", HHubSelector::test);
		runTest("HKMeans", HKMeans::test);
		runTest("HLocalHubness", HLocalHubness::test);
		runTest("HMatrix", HMatrix::test);
		runTest("HPlusPlusSeeder", HPlusPlusSeeder::test);
		runTest("HRand", HRand::test);
		runTest("HReporterChain", HReporterChain::test);
		runTest("HVec", HVec::test);

		cout << m_testTimes.str() << "\n";
		cout << "Done.\n";
		cout.flush();
	}
};

int main(int argc, char *argv[])
{
	if(argc < 2){
	  std::cout <<
	    "(Optionally, you can run specific tests by passing a string as an argument. "
		"Only tests containing the string will be executed.)\n";
	}

	int nRet = 0;
	try
	{
		HTestHarness harness(argc, argv);
		harness.runAllTests();
		if(harness.failures() > 0)
			nRet = 1;
	}
	catch(const std::exception& e)
	{
		cerr << e.what() << "\n";
		nRet = 1;
	}

	return nRet;
}

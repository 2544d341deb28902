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

#include "HError.h"
#include <exception>
#include <signal.h>
#include <string>
#include <iostream>

using std::string;
using std::cerr;

namespace HClasses {

bool g_exceptionExpected = false;

void Ex::setMessage(std::string message)
{
	m_message = message;
#ifdef _DEBUG
	if(!g_exceptionExpected)
	{
		// Stop in the debugger
		cerr << "Unexpected exception: " << m_message << "\nRaising SIGINT...";
		cerr.flush();
		raise(SIGINT);
	}
#endif
}

const char* Ex::what() const throw()
{
	return m_message.c_str();
}



HExpectException::HExpectException()
{
	m_prev = g_exceptionExpected;
	g_exceptionExpected = true;
}

HExpectException::~HExpectException()
{
	g_exceptionExpected = m_prev;
}



void TestContains(std::string expectedSubstring, std::string got,
                  std::string descr){
	using std::endl;
	if(got.find(expectedSubstring) == std::string::npos){
		std::cerr
			<< endl
			<< "Substring match failed: " << descr << endl
			<< endl
			<< "Expected substring: " << expectedSubstring << endl
			<< "Got               : " << got << endl
			;
		throw Ex("Substring match test failed: ", descr);
	}
}



void HAssertFailed(const char* filename, int line)
{
	cerr << "Debug Assert Failed in " << filename << ":" << line << std::endl;
	cerr.flush();
	raise(SIGINT);
}

void HAssertFailed(const char* filename, int line, const char* message)
{
	cerr << "Debug Assert Failed in " << filename << ":" << line << std::endl;
	cerr << "Message: " << message << std::endl;
	cerr.flush();
	raise(SIGINT);
}


} // namespace HClasses

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

#include "HTime.h"
#include <time.h>
#include <sys/time.h>
#include <stdio.h>

namespace HClasses {

// static
double HTime::seconds()
{
	struct timeval tp;
	gettimeofday(&tp, NULL);
	return ((double)tp.tv_sec + (double)tp.tv_usec * 1e-6);
}

// static
void HTime::appendTimeStampValue(std::string* pS, const char* sep1, const char* sep2, const char* sep3, bool bGreenwichMeanTime)
{
	time_t t = time(NULL);
	struct tm thetime;
	if(bGreenwichMeanTime)
		gmtime_r(&t, &thetime);
	else
		localtime_r(&t, &thetime);
	char buf[64];
	snprintf(buf, sizeof(buf), "%04d%s%02d%s%02d%s%02d%s%02d%s%02d",
		thetime.tm_year + 1900, sep1, thetime.tm_mon + 1, sep1, thetime.tm_mday, sep2,
		thetime.tm_hour, sep3, thetime.tm_min, sep3, thetime.tm_sec);
	pS->append(buf);
}

} // namespace HClasses

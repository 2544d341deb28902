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

#ifndef __HERROR_H__
#define __HERROR_H__

#include <string>
#include <sstream>
#include <iostream>
#include <vector>
#include <utility>


namespace HClasses {


///\brief Convert another type that has a stream-insertion operator <<
///to a string
template<typename T>
std::string to_str(const T& n)
{
	std::ostringstream os;
	os.precision(14);
	os << n;
	return os.str();
}

//Forward declaration of the container overloads
template<typename T>
std::string to_str(const std::vector<T>& v);

///\brief Convert an stl container-like object to a string
template<typename T>
std::string to_str(T begin, T end, std::string spec = "")
{
	std::ostringstream os;
	os.precision(14);
	os << "[" << spec;
	if(spec != ""){
	  os << ":";
	}
	while(begin != end){
	  os << to_str(*begin); ++begin;
	  if(begin != end){ os << ","; }
	}
	os << "]";
	return os.str();
}

///\brief Convert a vector to a string (nested containers are converted recursively)
template<typename T>
std::string to_str(const std::vector<T>& v){
  return to_str(v.begin(), v.end(),"vector");
}


///\brief The class of all exceptions thrown by this library
/// A simple exception object that wraps a string message
class Ex : public std::exception
{
protected:
	std::string m_message;

public:
	typedef std::string s;
	Ex(s a) { setMessage(a); }
	Ex(s a, s b) { setMessage(a + b); }
	Ex(s a, s b, s c) { setMessage(a + b + c); }
	Ex(s a, s b, s c, s d) { setMessage(a + b + c + d); }
	Ex(s a, s b, s c, s d, s e) { setMessage(a + b + c + d + e); }
	Ex(s a, s b, s c, s d, s e, s f) { setMessage(a + b + c + d + e + f); }

	virtual ~Ex() throw()
	{
	}

	/// Sets the message on the exception. (This method is called by all constructors of this object.)
	void setMessage(std::string message);

	/// Returns the error message corresponding to this exception
	virtual const char* what() const throw();
};


/// Thrown before any work is done when a clusterer is asked to do something
/// impossible, such as producing more clusters than there are points.
/// Retrying with the same settings will fail the same way.
class HInvalidConfigurationEx : public Ex
{
public:
	HInvalidConfigurationEx(s a) : Ex("Invalid configuration: ", a) {}
	HInvalidConfigurationEx(s a, s b) : Ex("Invalid configuration: ", a, b) {}
	HInvalidConfigurationEx(s a, s b, s c) : Ex("Invalid configuration: ", a, b, c) {}
	HInvalidConfigurationEx(s a, s b, s c, s d) : Ex("Invalid configuration: ", a, b, c, d) {}
	virtual ~HInvalidConfigurationEx() throw() {}
};


/// Thrown when every clustering attempt ended with an empty cluster
class HUnableToFinishEx : public Ex
{
protected:
	size_t m_attempts;

public:
	HUnableToFinishEx(size_t attempts)
	: Ex("Unable to finish clustering: every one of ", to_str(attempts), " attempts produced an empty cluster"), m_attempts(attempts)
	{
	}

	virtual ~HUnableToFinishEx() throw() {}

	/// Returns the number of attempts that were made
	size_t attempts() const { return m_attempts; }
};


#define INVALID_INDEX ((size_t)-1)


void HAssertFailed(const char* filename, int line);
void HAssertFailed(const char* filename, int line, const char* message);

#ifdef _DEBUG
#define HASSERT_HELPER1(x)\
	{\
		if(!(x))\
			HAssertFailed(__FILE__, __LINE__);\
	}
#define HASSERT_HELPER2(x, msg)\
	{\
		if(!(x))\
			HAssertFailed(__FILE__, __LINE__, msg);\
	}
#else // _DEBUG
#define HASSERT_HELPER1(x) ((void)0)
#define HASSERT_HELPER2(x, msg) ((void)0)
#endif // else _DEBUG

#define COUNT_HASSERT_ARGS_IMPL2(_1, _2, count, ...) \
   count
#define COUNT_HASSERT_ARGS_IMPL(args) \
   COUNT_HASSERT_ARGS_IMPL2 args
#define COUNT_HASSERT_ARGS(...) \
   COUNT_HASSERT_ARGS_IMPL((__VA_ARGS__, 2, 1, 0))
 /* Pick the right helper macro to invoke. */
#define HASSERT_CHOOSE_HELPER2(count) HASSERT_HELPER##count
#define HASSERT_CHOOSE_HELPER1(count) HASSERT_CHOOSE_HELPER2(count)
#define HASSERT_CHOOSE_HELPER(count) HASSERT_CHOOSE_HELPER1(count)
 /* The actual macro. */
#define HASSERT_GLUE(x, y) x y
#define HAssert(...) \
   HASSERT_GLUE(HASSERT_CHOOSE_HELPER(COUNT_HASSERT_ARGS(__VA_ARGS__)), \
               (__VA_ARGS__))



///\brief Instantiating an object of this class specifies that any exceptions thrown
/// during the life of this object should be treated as "expected".
class HExpectException
{
protected:
	bool m_prev;

public:
	HExpectException();
	~HExpectException();
};


///\brief Verify that \a expected and \a got are equal for test code. Unlike HAssert, this check does not disappear in optimized builds.
///
///If expected==got then does nothing.  Otherwise prints to stderr:
///
///<pre>
///Test for equality failed: ---------test_descr goes here ---------------
///
///Expected: ------------expected goes here---------------
///Got     : ------------got goes here     ---------------
///</pre>
///
///Then it throws an Ex.
///
///\param expected The value expected from specifications
///
///\param got      The value actually produced by the code
///
///\param test_descr A short description that lets a human find the
///                  failing check in the code.
template<class T1, class T2>
void TestEqual(const T1& expected, const T2& got, std::string test_descr)
{
	using std::endl;
	if(!(expected == got)){
		std::cerr
			<< endl
			<< "Test for equality failed: " << test_descr << endl
			<< endl
			<< "Expected: " << HClasses::to_str(expected) << endl
			<< "Got     : " << HClasses::to_str(got) << endl
			;
		throw Ex("Test for equality failed: ", test_descr);
	}
}


///\brief Verify that \a expectedSubstring is a substring of \a got for test code.
///Throws an Ex (after printing both strings to stderr) if it is not.
void TestContains(std::string expectedSubstring, std::string got,
                  std::string desc);

} // namespace HClasses

#endif // __HERROR_H__

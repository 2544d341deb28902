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

#include "HVec.h"
#include "HError.h"
#include <cmath>
#include <sstream>
#include <algorithm>

namespace HClasses {

HVec::HVec(size_t n)
: m_size(n)
{
	if(n == 0)
		m_data = NULL;
	else
		m_data = new double[n];
}

HVec::HVec(int n)
: m_size(n)
{
	if(n < 0)
		throw Ex("Expected a non-negative size");
	if(n == 0)
		m_data = NULL;
	else
		m_data = new double[n];
}

HVec::HVec(const std::initializer_list<double>& list)
: m_size(list.size())
{
	if(list.size() == 0)
		m_data = nullptr;
	else
		m_data = new double[list.size()];
	size_t i = 0;
	for(const double* it = list.begin(); it != list.end(); ++it)
		m_data[i++] = *it;
}

HVec::~HVec()
{
	delete[] m_data;
}

void HVec::resize(size_t n)
{
	if(m_size == n)
		return;
	delete[] m_data;
	m_size = n;
	if(n == 0)
		m_data = NULL;
	else
		m_data = new double[n];
}

void HVec::fill(const double val, size_t startPos, size_t elements)
{
	size_t endPos = std::min(startPos + elements, m_size);
	if(elements == (size_t)-1)
		endPos = m_size;
	for(size_t i = startPos; i < endPos; i++)
		m_data[i] = val;
}

HVec& HVec::operator+=(const HVec& that)
{
	HAssert(size() == that.size());
	for(size_t i = 0; i < m_size; i++)
		(*this)[i] += that[i];
	return *this;
}

HVec& HVec::operator*=(double scalar)
{
	for(size_t i = 0; i < m_size; i++)
		(*this)[i] *= scalar;
	return *this;
}

void HVec::copy(const HVec& orig)
{
	resize(orig.size());
	for(size_t i = 0; i < m_size; i++)
		m_data[i] = orig[i];
}

double HVec::squaredMagnitude() const
{
	double s = 0.0;
	for(size_t i = 0; i < m_size; i++)
	{
		double d = (*this)[i];
		s += (d * d);
	}
	return s;
}

double HVec::squaredDistance(const HVec& that) const
{
	HAssert(size() == that.size());
	double s = 0.0;
	for(size_t i = 0; i < m_size; i++)
	{
		double d = (*this)[i] - that[i];
		s += (d * d);
	}
	return s;
}

double HVec::dotProduct(const HVec& that) const
{
	HAssert(size() == that.size());
	double s = 0.0;
	for(size_t i = 0; i < m_size; i++)
		s += ((*this)[i] * that[i]);
	return s;
}

double HVec::sum() const
{
	double s = 0.0;
	for(size_t i = 0; i < m_size; i++)
		s += (*this)[i];
	return s;
}

void HVec::print(std::ostream& stream, char separator) const
{
	std::streamsize oldPrecision = stream.precision(14);
	if(m_size > 0)
		stream << (*this)[0];
	for(size_t i = 1; i < m_size; i++)
		stream << separator << (*this)[i];
	stream.precision(oldPrecision);
}

std::string HVec::to_str(char separator) const
{
	std::ostringstream ss;
	print(ss, separator);
	return ss.str();
}

// static
void HVec::test()
{
	HVec a({1.0, 2.0, 3.0});
	HVec b(3);
	b.fill(1.0);
	TestEqual(3.0, b.sum(), "fill");
	TestEqual(14.0, a.squaredMagnitude(), "squaredMagnitude");
	TestEqual(5.0, a.squaredDistance(b), "squaredDistance");
	TestEqual(6.0, a.dotProduct(b), "dotProduct");
	a += b;
	TestEqual(9.0, a.sum(), "+=");
	a *= 0.5;
	TestEqual(4.5, a.sum(), "*=");
	HVec c;
	c.copy(a);
	TestEqual((size_t)3, c.size(), "copy size");
	TestEqual(2.0, c[2], "copy value");
	TestEqual(std::string("1,1.5,2"), c.to_str(), "to_str");
	b.fill(7.0, 1);
	TestEqual(15.0, b.sum(), "partial fill");
}

} // namespace HClasses

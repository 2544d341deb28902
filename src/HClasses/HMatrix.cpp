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

#include "HMatrix.h"
#include "HError.h"
#include <cmath>

namespace HClasses {

HMatrix::HMatrix(size_t rowCount, size_t colCount)
: m_cols(colCount)
{
	newRows(rowCount);
}

HMatrix::HMatrix(size_t colCount)
: m_cols(colCount)
{
}

HMatrix::HMatrix(const std::initializer_list<std::initializer_list<double> >& list)
: m_cols(0)
{
	if(list.size() > 0)
		m_cols = list.begin()->size();
	for(const std::initializer_list<double>* it = list.begin(); it != list.end(); ++it)
	{
		if(it->size() != m_cols)
			throw Ex("Every row should have ", to_str(m_cols), " values. Found a row with ", to_str(it->size()));
		HVec& r = newRow();
		size_t j = 0;
		for(const double* v = it->begin(); v != it->end(); ++v)
			r[j++] = *v;
	}
}

HMatrix::~HMatrix()
{
	flush();
}

void HMatrix::resize(size_t rowCount, size_t colCount)
{
	flush();
	m_cols = colCount;
	newRows(rowCount);
}

void HMatrix::flush()
{
	for(size_t i = 0; i < rows(); i++)
		delete(m_rows[i]);
	m_rows.clear();
}

HVec& HMatrix::newRow()
{
	HVec* pNewVec = new HVec(m_cols);
	m_rows.push_back(pNewVec);
	return *pNewVec;
}

void HMatrix::newRows(size_t nRows)
{
	m_rows.reserve(m_rows.size() + nRows);
	for(size_t i = 0; i < nRows; i++)
		newRow();
}

HVec& HMatrix::copyRow(const HVec& r)
{
	if(r.size() != m_cols)
		throw Ex("Mismatching size. Expected ", to_str(m_cols), " values. Got ", to_str(r.size()));
	HVec& dest = newRow();
	dest.copy(r);
	return dest;
}

void HMatrix::copy(const HMatrix& that)
{
	if(&that == this)
		return;
	flush();
	m_cols = that.cols();
	for(size_t i = 0; i < that.rows(); i++)
		copyRow(that[i]);
}

void HMatrix::centroid(HVec& outCentroid) const
{
	outCentroid.resize(m_cols);
	outCentroid.fill(0.0);
	if(rows() == 0)
		return;
	for(size_t i = 0; i < rows(); i++)
		outCentroid += row(i);
	outCentroid *= (1.0 / rows());
}

void HMatrix::centroid(HVec& outCentroid, const std::vector<size_t>& indexes) const
{
	if(indexes.size() == 0)
		throw Ex("Cannot compute the centroid of an empty set of rows");
	outCentroid.resize(m_cols);
	outCentroid.fill(0.0);
	for(std::vector<size_t>::const_iterator it = indexes.begin(); it != indexes.end(); ++it)
		outCentroid += row(*it);
	outCentroid *= (1.0 / indexes.size());
}

// static
void HMatrix::test()
{
	HMatrix m({{0.0, 0.0}, {2.0, 0.0}, {2.0, 4.0}, {0.0, 4.0}});
	TestEqual((size_t)4, m.rows(), "rows");
	TestEqual((size_t)2, m.cols(), "cols");
	HVec c;
	m.centroid(c);
	TestEqual(1.0, c[0], "centroid x");
	TestEqual(2.0, c[1], "centroid y");
	std::vector<size_t> some;
	some.push_back(1);
	some.push_back(2);
	m.centroid(c, some);
	TestEqual(2.0, c[0], "subset centroid x");
	TestEqual(2.0, c[1], "subset centroid y");

	HMatrix n(2);
	n.copy(m);
	n[3][1] = 9.0;
	TestEqual(4.0, m[3][1], "deep copy");
	TestEqual(9.0, n[3][1], "copy is writable");

	HExpectException ee;
	bool threw = false;
	try
	{
		HVec wrong({1.0, 2.0, 3.0});
		n.copyRow(wrong);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("Expected a width mismatch to throw");
	threw = false;
	try
	{
		std::vector<size_t> none;
		m.centroid(c, none);
	}
	catch(const Ex&)
	{
		threw = true;
	}
	if(!threw)
		throw Ex("Expected an empty centroid to throw");
}

} // namespace HClasses
